/**
 * @file indexed_reader.hh
 * @brief Abstract interface for random-access reading of byte data
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <indexio/export_indexio.h>
#include <indexio/byte_order.hh>
#include <indexio/exceptions.hh>

namespace indexio {

    /**
     * @class indexed_reader
     * @brief Random-access reader contract used by format parsers
     *
     * Implementations provide bounds checking, range reads and length
     * discovery. Typed accessors decode multi-byte values in the reader's
     * current byte order (big-endian unless changed) and validate their
     * range before touching any data.
     */
    class INDEXIO_EXPORT indexed_reader {
    public:
        /**
         * @brief Largest addressable offset
         *
         * The end offset of a request (index + count - 1) may not exceed it.
         */
        static constexpr std::int64_t max_index = std::numeric_limits<std::int64_t>::max();

        virtual ~indexed_reader() = default;

        /**
         * @brief Get the total number of bytes available
         *
         * May need to consume the whole underlying source.
         */
        virtual std::int64_t get_length() = 0;

        /**
         * @brief Get the length if it is already known without further reads
         */
        [[nodiscard]] virtual std::optional<std::int64_t> known_length() const = 0;

        /**
         * @brief Copy @p count bytes starting at @p index
         * @throws bounds_error if the range is not available
         */
        virtual std::vector<std::byte> get_bytes(std::int64_t index, std::int64_t count) = 0;

        /**
         * @brief Throw bounds_error unless [index, index + bytes_requested) is available
         */
        virtual void validate_index(std::int64_t index, std::int64_t bytes_requested) = 0;

        /**
         * @brief Check whether [index, index + bytes_requested) is available
         */
        virtual bool is_valid_index(std::int64_t index, std::int64_t bytes_requested) = 0;

        /**
         * @brief Translate a local offset to an offset in the outermost reader
         * @throws bounds_error if the translated offset would exceed max_index
         */
        [[nodiscard]] virtual std::int64_t to_unshifted_offset(std::int64_t local_offset) const = 0;

        /**
         * @brief Create a view whose index 0 is at @p shift in this reader
         *
         * The view refers to this reader, which must outlive it.
         * @throws config_error if @p shift is negative
         */
        [[nodiscard]] std::unique_ptr<indexed_reader> with_shifted_base_offset(std::int64_t shift);

        void set_byte_order(byte_order bo) { m_byte_order = bo; }
        [[nodiscard]] byte_order get_byte_order() const { return m_byte_order; }

        // Typed accessors
        std::uint8_t get_uint8(std::int64_t index);
        std::int8_t get_int8(std::int64_t index);
        std::uint16_t get_uint16(std::int64_t index);
        std::int16_t get_int16(std::int64_t index);

        /**
         * @brief Read a 24-bit unsigned value, returned in the low bits of an int32
         */
        std::int32_t get_int24(std::int64_t index);

        std::uint32_t get_uint32(std::int64_t index);
        std::int32_t get_int32(std::int64_t index);
        std::int64_t get_int64(std::int64_t index);

        /**
         * @brief Read a signed 16.16 fixed point number
         */
        float get_s15_fixed16(std::int64_t index);

        float get_float32(std::int64_t index);
        double get_double64(std::int64_t index);

        /**
         * @brief Read @p bytes_requested raw bytes as a string
         */
        std::string get_string(std::int64_t index, std::int64_t bytes_requested);

        /**
         * @brief Read a string that ends at the first NUL or after @p max_length bytes
         *
         * All @p max_length bytes must be available.
         */
        std::string get_null_terminated_string(std::int64_t index, std::int64_t max_length);

    protected:
        /**
         * @brief Unchecked single byte access
         *
         * The caller must have validated @p index first.
         */
        virtual std::byte get_byte(std::int64_t index) = 0;

        /**
         * @brief Throw bounds_error for a negative index, a negative count
         *        or an end offset beyond max_index
         */
        static void check_request(std::int64_t index, std::int64_t bytes_requested);

        /**
         * @brief Compute index + bytes_requested - 1 without overflow
         * @return End offset, or nullopt if the arguments are malformed
         *         or the end lies beyond max_index
         */
        static std::optional<std::int64_t> end_offset(std::int64_t index, std::int64_t bytes_requested);

    private:
        friend class shifted_reader;

        template<typename T>
        T read_value(std::int64_t index) {
            validate_index(index, static_cast<std::int64_t>(sizeof(T)));

            std::array<std::byte, sizeof(T)> buff;
            for (std::size_t i = 0; i < sizeof(T); i++) {
                buff[i] = get_byte(index + static_cast<std::int64_t>(i));
            }

            T value;
            std::memcpy(&value, buff.data(), sizeof(T));
            if constexpr (sizeof(T) > 1) {
                if (!byte_order_native(m_byte_order)) {
                    value = swap_byte_order(value);
                }
            }
            return value;
        }

    private:
        byte_order m_byte_order = byte_order::big;
    };

} // namespace indexio
