//
// Typed accessors shared by all indexed readers
//

#include <algorithm>

#include <indexio/indexed_reader.hh>
#include "shifted_reader.hh"

namespace indexio {

    void indexed_reader::check_request(std::int64_t index, std::int64_t bytes_requested) {
        if (index < 0) {
            throw bounds_error(build_error_msg("Attempt to read from buffer using a negative index (", index, ")"),
                               index, bytes_requested, std::nullopt);
        }
        if (bytes_requested < 0) {
            throw bounds_error(build_error_msg("Number of requested bytes must be zero or greater (", bytes_requested, ")"),
                               index, bytes_requested, std::nullopt);
        }
        if (!end_offset(index, bytes_requested)) {
            throw bounds_error(build_error_msg("Number of requested bytes summed with starting index exceed maximum range "
                                               "of signed 64 bit integers (requested index: ", index,
                                               ", requested count: ", bytes_requested, ")"),
                               index, bytes_requested, std::nullopt);
        }
    }

    std::optional<std::int64_t> indexed_reader::end_offset(std::int64_t index, std::int64_t bytes_requested) {
        if (index < 0 || bytes_requested < 0) {
            return std::nullopt;
        }
        if (bytes_requested == 0) {
            return index - 1;
        }
        if (index > max_index - (bytes_requested - 1)) {
            return std::nullopt;
        }
        return index + (bytes_requested - 1);
    }

    std::unique_ptr<indexed_reader> indexed_reader::with_shifted_base_offset(std::int64_t shift) {
        return std::make_unique<shifted_reader>(this, shift);
    }

    std::uint8_t indexed_reader::get_uint8(std::int64_t index) {
        validate_index(index, 1);
        return std::to_integer<std::uint8_t>(get_byte(index));
    }

    std::int8_t indexed_reader::get_int8(std::int64_t index) {
        validate_index(index, 1);
        return static_cast<std::int8_t>(std::to_integer<std::uint8_t>(get_byte(index)));
    }

    std::uint16_t indexed_reader::get_uint16(std::int64_t index) {
        return read_value<std::uint16_t>(index);
    }

    std::int16_t indexed_reader::get_int16(std::int64_t index) {
        return read_value<std::int16_t>(index);
    }

    std::int32_t indexed_reader::get_int24(std::int64_t index) {
        validate_index(index, 3);

        auto b0 = std::to_integer<std::int32_t>(get_byte(index));
        auto b1 = std::to_integer<std::int32_t>(get_byte(index + 1));
        auto b2 = std::to_integer<std::int32_t>(get_byte(index + 2));

        if (get_byte_order() == byte_order::big) {
            return (b0 << 16) | (b1 << 8) | b2;
        }
        return (b2 << 16) | (b1 << 8) | b0;
    }

    std::uint32_t indexed_reader::get_uint32(std::int64_t index) {
        return read_value<std::uint32_t>(index);
    }

    std::int32_t indexed_reader::get_int32(std::int64_t index) {
        return read_value<std::int32_t>(index);
    }

    std::int64_t indexed_reader::get_int64(std::int64_t index) {
        return read_value<std::int64_t>(index);
    }

    float indexed_reader::get_s15_fixed16(std::int64_t index) {
        auto raw = read_value<std::int32_t>(index);
        return static_cast<float>(static_cast<double>(raw) / 65536.0);
    }

    float indexed_reader::get_float32(std::int64_t index) {
        return read_value<float>(index);
    }

    double indexed_reader::get_double64(std::int64_t index) {
        return read_value<double>(index);
    }

    std::string indexed_reader::get_string(std::int64_t index, std::int64_t bytes_requested) {
        auto bytes = get_bytes(index, bytes_requested);
        return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    std::string indexed_reader::get_null_terminated_string(std::int64_t index, std::int64_t max_length) {
        auto bytes = get_bytes(index, max_length);
        auto nul = std::find(bytes.begin(), bytes.end(), std::byte{0});
        return std::string(reinterpret_cast<const char*>(bytes.data()),
                           static_cast<std::size_t>(nul - bytes.begin()));
    }

} // namespace indexio
