/**
 * @file capturing_reader.hh
 * @brief Random-access reader over a forward-only byte source
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <indexio/export_indexio.h>
#include <indexio/indexed_reader.hh>
#include <indexio/byte_source.hh>
#include <indexio/reader_options.hh>

namespace indexio {

    /**
     * @class capturing_reader
     * @brief Indexed reader that captures a stream in fixed-size chunks
     *
     * Data is pulled from the source only when a request needs it, one
     * chunk at a time and strictly in order. Every captured chunk is kept,
     * so any offset that was reached once can be read again without
     * touching the source. The total length becomes known when the source
     * reports end of data, and is fixed from then on.
     *
     * Not thread safe. Memory grows with the amount of the source consumed;
     * get_length() consumes all of it.
     */
    class INDEXIO_EXPORT capturing_reader : public indexed_reader {
    public:
        /**
         * @brief Create a reader over @p source
         * @param source Forward-only source, owned by the reader
         * @param chunk_size Bytes captured per chunk
         * @throws config_error if @p source is null, @p chunk_size <= 0 or
         *         @p chunk_size exceeds default_max_chunk_size
         */
        explicit capturing_reader(std::unique_ptr<byte_source> source,
                                  std::int64_t chunk_size = default_chunk_size);

        /**
         * @brief Create a reader over @p source with explicit options
         * @throws config_error if @p source is null or the options are invalid
         */
        capturing_reader(std::unique_ptr<byte_source> source, const reader_options& options);

        ~capturing_reader() override = default;

        capturing_reader(const capturing_reader&) = delete;
        capturing_reader& operator = (const capturing_reader&) = delete;

        /**
         * @brief Read to the end of the source to determine its length
         *
         * Expensive: every remaining byte of the source is captured.
         */
        std::int64_t get_length() override;

        [[nodiscard]] std::optional<std::int64_t> known_length() const override { return m_stream_length; }

        std::vector<std::byte> get_bytes(std::int64_t index, std::int64_t count) override;

        /**
         * @brief Ensure [index, index + bytes_requested) is captured
         * @throws bounds_error if the arguments are malformed or the source
         *         ends before the range is covered
         */
        void validate_index(std::int64_t index, std::int64_t bytes_requested) override;

        /**
         * @brief Capture chunks until the range is covered or the source ends
         * @return True if the whole range is available
         */
        bool is_valid_index(std::int64_t index, std::int64_t bytes_requested) override;

        [[nodiscard]] std::int64_t to_unshifted_offset(std::int64_t local_offset) const override {
            return local_offset;
        }

        [[nodiscard]] std::int64_t chunk_size() const { return m_chunk_size; }
        [[nodiscard]] std::size_t chunk_count() const { return m_chunks.size(); }
        [[nodiscard]] bool is_stream_finished() const { return m_stream_finished; }

    protected:
        std::byte get_byte(std::int64_t index) override;

    private:
        // Capture the next chunk; marks the stream finished on a short chunk
        void capture_chunk();

        void diagnostic(std::int64_t offset, std::string_view category, const std::string& message) const;

    private:
        std::unique_ptr<byte_source> m_source;
        std::int64_t m_chunk_size;
        reader_options::diagnostic_handler m_on_diagnostic;

        std::vector<std::vector<std::byte>> m_chunks;
        bool m_stream_finished;
        std::optional<std::int64_t> m_stream_length;
    };

} // namespace indexio
