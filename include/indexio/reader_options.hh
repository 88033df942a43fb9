/**
 * @file reader_options.hh
 * @brief Construction options for capturing readers
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace indexio {

    /**
     * @brief Default number of bytes captured from a source per chunk
     */
    inline constexpr std::int64_t default_chunk_size = 2 * 1024;

    /**
     * @brief Default upper limit for the chunk size
     */
    inline constexpr std::int64_t default_max_chunk_size = std::int64_t(64) << 20;  // 64MB

    /**
     * @struct reader_options
     * @brief Configuration options for a capturing reader
     *
     * Controls the capture granularity and where diagnostics go.
     */
    struct reader_options {
        /**
         * @brief Number of bytes pulled from the source per chunk
         *
         * Must be strictly positive. Constant for the reader's lifetime.
         */
        std::int64_t chunk_size = default_chunk_size;

        /**
         * @brief Largest accepted chunk size in bytes
         *
         * Every capture allocates a full chunk up front, so a chunk size
         * above this limit is rejected at construction. Default is 64MB.
         */
        std::int64_t max_chunk_size = default_max_chunk_size;

        /**
         * @typedef diagnostic_handler
         * @brief Callback function type for reader diagnostics
         * @param offset Stream offset the event refers to
         * @param category Event category ("capture", "end_of_stream", "bounds")
         * @param message Human-readable message
         */
        using diagnostic_handler = std::function<void(
            std::int64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional diagnostic callback
         *
         * If set, will be called when chunks are captured, when the end
         * of the source is reached and before bounds errors are thrown.
         * If not set, diagnostics are silently dropped.
         */
        diagnostic_handler on_diagnostic;
    };

} // namespace indexio
