//
// Random-access reader over a forward-only byte source
//

#include <algorithm>
#include <cstring>

#include <indexio/capturing_reader.hh>

namespace indexio {

    namespace {
        reader_options options_with_chunk_size(std::int64_t chunk_size) {
            reader_options options;
            options.chunk_size = chunk_size;
            return options;
        }
    }

    capturing_reader::capturing_reader(std::unique_ptr<byte_source> source, std::int64_t chunk_size)
        : capturing_reader(std::move(source), options_with_chunk_size(chunk_size)) {}

    capturing_reader::capturing_reader(std::unique_ptr<byte_source> source, const reader_options& options)
        : m_source(std::move(source))
        , m_chunk_size(options.chunk_size)
        , m_on_diagnostic(options.on_diagnostic)
        , m_stream_finished(false) {
        THROW_CONFIG_UNLESS(m_source, "Byte source must not be null");
        THROW_CONFIG_IF(m_chunk_size <= 0, "Chunk size must be greater than zero (got ", m_chunk_size, ")");
        THROW_CONFIG_IF(m_chunk_size > options.max_chunk_size,
                        "Chunk size ", m_chunk_size, " exceeds maximum allowed ", options.max_chunk_size);
    }

    std::int64_t capturing_reader::get_length() {
        // Probing the last addressable offset drains the source
        is_valid_index(max_index, 1);
        return m_stream_length.value();
    }

    void capturing_reader::validate_index(std::int64_t index, std::int64_t bytes_requested) {
        check_request(index, bytes_requested);

        if (!is_valid_index(index, bytes_requested)) {
            diagnostic(index, "bounds",
                       build_error_msg("Requested ", bytes_requested, " bytes at index ", index,
                                       " but stream length is ", m_stream_length.value_or(-1)));
            throw bounds_error(index, bytes_requested, m_stream_length);
        }
    }

    bool capturing_reader::is_valid_index(std::int64_t index, std::int64_t bytes_requested) {
        auto end_index = end_offset(index, bytes_requested);
        if (!end_index) {
            return false;
        }

        if (m_stream_finished) {
            return *end_index < *m_stream_length;
        }

        // A zero byte request at index 0 has end_index -1, which still maps to chunk 0
        std::int64_t chunk_index = *end_index / m_chunk_size;
        while (chunk_index >= static_cast<std::int64_t>(m_chunks.size())) {
            capture_chunk();
            if (m_stream_finished) {
                return *end_index < *m_stream_length;
            }
        }
        return true;
    }

    void capturing_reader::capture_chunk() {
        const std::int64_t chunk_start = static_cast<std::int64_t>(m_chunks.size()) * m_chunk_size;

        std::vector<std::byte> chunk(static_cast<std::size_t>(m_chunk_size));
        std::size_t total_read = 0;

        while (total_read != chunk.size()) {
            std::size_t wanted = chunk.size() - total_read;
            std::size_t bytes_read = m_source->read(chunk.data() + total_read, wanted);
            THROW_IO_IF(bytes_read > wanted, "Source returned ", bytes_read, " bytes for a read of ", wanted);

            if (bytes_read == 0) {
                // The source has ended, which may be fine for the caller
                m_stream_finished = true;
                m_stream_length = chunk_start + static_cast<std::int64_t>(total_read);
                chunk.resize(total_read);
                m_chunks.push_back(std::move(chunk));

                diagnostic(*m_stream_length, "end_of_stream",
                           build_error_msg("Source ended after ", *m_stream_length, " bytes in chunk ",
                                           m_chunks.size() - 1));
                return;
            }
            total_read += bytes_read;
        }

        m_chunks.push_back(std::move(chunk));
        diagnostic(chunk_start, "capture",
                   build_error_msg("Captured chunk ", m_chunks.size() - 1, " (", m_chunk_size, " bytes)"));
    }

    std::byte capturing_reader::get_byte(std::int64_t index) {
        const auto chunk_index = static_cast<std::size_t>(index / m_chunk_size);
        const auto inner_index = static_cast<std::size_t>(index % m_chunk_size);
        return m_chunks[chunk_index][inner_index];
    }

    std::vector<std::byte> capturing_reader::get_bytes(std::int64_t index, std::int64_t count) {
        validate_index(index, count);

        std::vector<std::byte> bytes(static_cast<std::size_t>(count));
        std::int64_t remaining = count;
        std::int64_t from_index = index;
        std::size_t to_index = 0;

        while (remaining != 0) {
            const auto from_chunk_index = static_cast<std::size_t>(from_index / m_chunk_size);
            const std::int64_t from_inner_index = from_index % m_chunk_size;
            const std::int64_t length = std::min(remaining, m_chunk_size - from_inner_index);

            const auto& chunk = m_chunks[from_chunk_index];
            std::memcpy(bytes.data() + to_index, chunk.data() + from_inner_index, static_cast<std::size_t>(length));

            remaining -= length;
            from_index += length;
            to_index += static_cast<std::size_t>(length);
        }

        return bytes;
    }

    void capturing_reader::diagnostic(std::int64_t offset, std::string_view category, const std::string& message) const {
        if (m_on_diagnostic) {
            m_on_diagnostic(offset, category, message);
        }
    }

} // namespace indexio
