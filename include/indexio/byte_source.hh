/**
 * @file byte_source.hh
 * @brief Forward-only byte sources consumed by capturing readers
 */

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <vector>

#include <indexio/export_indexio.h>
#include <indexio/exceptions.hh>

namespace indexio {

    /**
     * @class byte_source
     * @brief Sequential, non-rewindable source of bytes
     *
     * The only operation is reading forward. There is no seek and no
     * rewind, and the total size is not known up front.
     */
    class INDEXIO_EXPORT byte_source {
    public:
        virtual ~byte_source() = default;

        /**
         * @brief Read up to @p size bytes into @p dst
         * @return Number of bytes actually read, 0 at end of data
         * @throws io_error if the underlying source fails
         */
        virtual std::size_t read(void* dst, std::size_t size) = 0;
    };

    /**
     * @class istream_source
     * @brief Byte source over an already-open std::istream
     *
     * Holds a reference only; the caller keeps the stream alive and
     * closes it.
     */
    class INDEXIO_EXPORT istream_source : public byte_source {
    public:
        explicit istream_source(std::istream& is);
        ~istream_source() override = default;

        std::size_t read(void* dst, std::size_t size) override;

    private:
        std::istream& m_stream;
    };

    /**
     * @class memory_source
     * @brief Byte source over an in-memory buffer
     *
     * @p max_read limits the bytes returned by a single read() call
     * (0 means unlimited), which lets callers model sources that deliver
     * data in short pieces.
     */
    class INDEXIO_EXPORT memory_source : public byte_source {
    public:
        explicit memory_source(std::vector<std::byte> data, std::size_t max_read = 0);
        ~memory_source() override = default;

        std::size_t read(void* dst, std::size_t size) override;

        [[nodiscard]] std::size_t consumed() const { return m_position; }
        [[nodiscard]] std::size_t read_calls() const { return m_read_calls; }

    private:
        std::vector<std::byte> m_data;
        std::size_t m_max_read;
        std::size_t m_position;
        std::size_t m_read_calls;
    };

} // namespace indexio
