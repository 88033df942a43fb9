//
// View of an indexed_reader with a moved base offset
//

#include <algorithm>

#include "shifted_reader.hh"

namespace indexio {

    shifted_reader::shifted_reader(indexed_reader* parent, std::int64_t shift)
        : m_parent(parent)
        , m_shift(shift) {
        THROW_CONFIG_UNLESS(m_parent, "Shifted reader requires a parent reader");
        THROW_CONFIG_IF(m_shift < 0, "Base offset shift must not be negative (", m_shift, ")");
        set_byte_order(m_parent->get_byte_order());
    }

    std::int64_t shifted_reader::get_length() {
        // Parent may be shorter than the shift
        return std::max<std::int64_t>(0, m_parent->get_length() - m_shift);
    }

    std::optional<std::int64_t> shifted_reader::known_length() const {
        auto parent_length = m_parent->known_length();
        if (!parent_length) {
            return std::nullopt;
        }
        return std::max<std::int64_t>(0, *parent_length - m_shift);
    }

    bool shifted_reader::is_valid_index(std::int64_t index, std::int64_t bytes_requested) {
        if (!end_offset(index, bytes_requested)) {
            return false;
        }
        if (index > max_index - m_shift) {
            return false;
        }
        return m_parent->is_valid_index(index + m_shift, bytes_requested);
    }

    void shifted_reader::validate_index(std::int64_t index, std::int64_t bytes_requested) {
        check_request(index, bytes_requested);

        if (!is_valid_index(index, bytes_requested)) {
            throw bounds_error(index, bytes_requested, known_length());
        }
    }

    std::vector<std::byte> shifted_reader::get_bytes(std::int64_t index, std::int64_t count) {
        validate_index(index, count);
        return m_parent->get_bytes(index + m_shift, count);
    }

    std::byte shifted_reader::get_byte(std::int64_t index) {
        return m_parent->get_byte(index + m_shift);
    }

    std::int64_t shifted_reader::to_unshifted_offset(std::int64_t local_offset) const {
        if (local_offset > max_index - m_shift) {
            throw bounds_error(build_error_msg("Local offset ", local_offset, " shifted by ", m_shift,
                                               " exceeds maximum range of signed 64 bit integers"),
                               local_offset, 0, known_length());
        }
        return m_parent->to_unshifted_offset(local_offset + m_shift);
    }

} // namespace indexio
