//
// Forward-only byte source implementations
//

#include <istream>
#include <algorithm>
#include <cstring>

#include <indexio/byte_source.hh>

namespace indexio {
    // istream_source implementation
    istream_source::istream_source(std::istream& is) : m_stream(is) {}

    std::size_t istream_source::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        // A stream that already hit EOF simply has nothing more to give
        if (m_stream.eof()) {
            return 0;
        }

        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state");

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed after ", bytes_read, " of ", size, " bytes");
        return bytes_read;
    }

    // memory_source implementation
    memory_source::memory_source(std::vector<std::byte> data, std::size_t max_read)
        : m_data(std::move(data))
        , m_max_read(max_read)
        , m_position(0)
        , m_read_calls(0) {}

    std::size_t memory_source::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in memory_source::read");

        m_read_calls++;

        std::size_t available = m_data.size() - m_position;
        if (size == 0 || available == 0) {
            return 0;
        }

        size = std::min(size, available);
        if (m_max_read != 0) {
            size = std::min(size, m_max_read);
        }

        std::memcpy(dst, m_data.data() + m_position, size);
        m_position += size;
        return size;
    }
}
