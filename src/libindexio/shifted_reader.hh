//
// View of an indexed_reader with a moved base offset
//

#pragma once

#include <indexio/indexed_reader.hh>

namespace indexio {

    // Maps local index i to parent index i + shift.
    // Does not own the parent.
    class shifted_reader : public indexed_reader {
    public:
        shifted_reader(indexed_reader* parent, std::int64_t shift);
        ~shifted_reader() override = default;

        shifted_reader(const shifted_reader&) = delete;
        shifted_reader& operator = (const shifted_reader&) = delete;

        std::int64_t get_length() override;
        [[nodiscard]] std::optional<std::int64_t> known_length() const override;
        std::vector<std::byte> get_bytes(std::int64_t index, std::int64_t count) override;
        void validate_index(std::int64_t index, std::int64_t bytes_requested) override;
        bool is_valid_index(std::int64_t index, std::int64_t bytes_requested) override;
        [[nodiscard]] std::int64_t to_unshifted_offset(std::int64_t local_offset) const override;

    protected:
        std::byte get_byte(std::int64_t index) override;

    private:
        indexed_reader* m_parent;
        std::int64_t m_shift;
    };

} // namespace indexio
