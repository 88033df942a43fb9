/**
 * @file stream_probe.cpp
 * @brief Random-access inspection of a file or of standard input
 *
 * Reads the input through a capturing reader, so it works the same for
 * pipes as for regular files. Each OFFSET:COUNT argument is printed as a
 * hex dump; --length reads the whole input and prints its size.
 *
 * Usage: stream_probe [--chunk N] [--length] [--verbose] [-f FILE] OFFSET:COUNT...
 */

#include <indexio/capturing_reader.hh>
#include <indexio/byte_source.hh>
#include <indexio/exceptions.hh>
#include <indexio/reader_options.hh>
#include <iostream>
#include <fstream>
#include <iomanip>
#include <memory>
#include <new>
#include <string_view>
#include <string>
#include <vector>

namespace {

    struct probe_range {
        std::int64_t offset;
        std::int64_t count;
    };

    void print_usage(const char* argv0) {
        std::cerr << "Usage: " << argv0
                  << " [--chunk N] [--length] [--verbose] [-f FILE] OFFSET:COUNT...\n";
    }

    bool parse_range(const std::string& arg, probe_range& range) {
        auto colon = arg.find(':');
        if (colon == std::string::npos) {
            return false;
        }
        try {
            range.offset = std::stoll(arg.substr(0, colon));
            range.count = std::stoll(arg.substr(colon + 1));
        } catch (const std::exception&) {
            return false;
        }
        return true;
    }

    void hex_dump(std::int64_t base, const std::vector<std::byte>& bytes) {
        const std::size_t per_line = 16;
        for (std::size_t i = 0; i < bytes.size(); i += per_line) {
            std::cout << std::hex << std::setw(8) << std::setfill('0') << (base + static_cast<std::int64_t>(i)) << "  ";
            for (std::size_t j = i; j < i + per_line && j < bytes.size(); j++) {
                std::cout << std::setw(2) << std::to_integer<int>(bytes[j]) << ' ';
            }
            std::cout << std::dec << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    indexio::reader_options options;
    std::string filename;
    bool show_length = false;
    bool verbose = false;
    std::vector<probe_range> ranges;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--chunk" && i + 1 < argc) {
            try {
                options.chunk_size = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid chunk size: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--length") {
            show_length = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "-f" && i + 1 < argc) {
            filename = argv[++i];
        } else {
            probe_range range{};
            if (!parse_range(arg, range)) {
                print_usage(argv[0]);
                return 1;
            }
            ranges.push_back(range);
        }
    }

    if (options.chunk_size > options.max_chunk_size) {
        std::cerr << "Chunk size " << options.chunk_size << " exceeds the limit of "
                  << options.max_chunk_size << " bytes\n";
        return 1;
    }

    if (ranges.empty() && !show_length) {
        print_usage(argv[0]);
        return 1;
    }

    if (verbose) {
        options.on_diagnostic = [](std::int64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "[" << category << " @" << offset << "] " << message << "\n";
        };
    }

    std::ifstream file;
    if (!filename.empty()) {
        file.open(filename, std::ios::binary);
        if (!file) {
            std::cerr << "Failed to open file: " << filename << "\n";
            return 1;
        }
    }
    std::istream& input = filename.empty() ? std::cin : file;

    try {
        indexio::capturing_reader reader(std::make_unique<indexio::istream_source>(input), options);

        for (const auto& range : ranges) {
            std::cout << "Range " << range.offset << ":" << range.count << "\n";
            try {
                hex_dump(range.offset, reader.get_bytes(range.offset, range.count));
            } catch (const indexio::bounds_error& e) {
                std::cout << "  unavailable: " << e.what() << "\n";
            }
        }

        if (show_length) {
            std::cout << "Length: " << reader.get_length() << " bytes\n";
        }
    } catch (const indexio::indexio_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::bad_alloc&) {
        std::cerr << "Error: out of memory while capturing input\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
