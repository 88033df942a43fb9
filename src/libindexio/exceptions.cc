//
// Out-of-line members of the exception hierarchy
//

#include <indexio/exceptions.hh>

namespace indexio {

    namespace {
        std::string end_of_data_message(std::int64_t index, std::int64_t bytes_requested,
                                        const std::optional<std::int64_t>& stream_length) {
            if (!stream_length) {
                return build_error_msg("Attempt to read beyond available data (requested index: ", index,
                                       ", requested count: ", bytes_requested, ", stream length unknown)");
            }
            return build_error_msg("Attempt to read from beyond end of underlying data source (requested index: ", index,
                                   ", requested count: ", bytes_requested,
                                   ", stream length: ", *stream_length,
                                   ", max index: ", *stream_length - 1, ")");
        }
    }

    bounds_error::bounds_error(std::int64_t index, std::int64_t bytes_requested,
                               std::optional<std::int64_t> stream_length)
        : indexio_error(end_of_data_message(index, bytes_requested, stream_length))
        , m_index(index)
        , m_bytes_requested(bytes_requested)
        , m_stream_length(stream_length) {}

} // namespace indexio
