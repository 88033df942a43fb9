/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for indexio
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the indexio library.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <sstream>

#include <indexio/export_indexio.h>

namespace indexio {

    /**
     * @class indexio_error
     * @brief Base exception class for all indexio errors
     *
     * All indexio exceptions derive from this class, making it easy
     * to catch every library error with a single catch block.
     */
    class INDEXIO_EXPORT indexio_error : public std::runtime_error {
    public:
        explicit indexio_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown by byte sources when the underlying stream fails.
     * Readers propagate it unchanged.
     */
    class INDEXIO_EXPORT io_error : public indexio_error {
    public:
        explicit io_error(const std::string& msg)
            : indexio_error(msg) {}
    };

    /**
     * @class config_error
     * @brief Exception for invalid construction arguments
     *
     * Thrown when a reader is created without a source or with
     * a chunk size outside of (0, max_chunk_size].
     */
    class INDEXIO_EXPORT config_error : public indexio_error {
    public:
        explicit config_error(const std::string& msg)
            : indexio_error(msg) {}
    };

    /**
     * @class bounds_error
     * @brief Exception for reads outside of the available data
     *
     * Carries the offending index, the number of requested bytes and,
     * once the end of the source has been seen, the stream length.
     */
    class INDEXIO_EXPORT bounds_error : public indexio_error {
    public:
        bounds_error(std::int64_t index, std::int64_t bytes_requested,
                     std::optional<std::int64_t> stream_length);

        bounds_error(const std::string& msg, std::int64_t index, std::int64_t bytes_requested,
                     std::optional<std::int64_t> stream_length)
            : indexio_error(msg)
            , m_index(index)
            , m_bytes_requested(bytes_requested)
            , m_stream_length(stream_length) {}

        [[nodiscard]] std::int64_t index() const noexcept { return m_index; }
        [[nodiscard]] std::int64_t bytes_requested() const noexcept { return m_bytes_requested; }
        [[nodiscard]] std::optional<std::int64_t> stream_length() const noexcept { return m_stream_length; }

    private:
        std::int64_t m_index;
        std::int64_t m_bytes_requested;
        std::optional<std::int64_t> m_stream_length;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::indexio::io_error(::indexio::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_CONFIG
     * @brief Throw a config_error with formatted message
     */
    #define THROW_CONFIG(...) \
        throw ::indexio::config_error(::indexio::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_CONFIG_IF(condition, ...) \
        do { if (condition) THROW_CONFIG(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_CONFIG_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_CONFIG(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace indexio
