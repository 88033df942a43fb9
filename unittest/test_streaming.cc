//
// Test streaming verification - ensure the reader only consumes its source forward
//

#include <doctest/doctest.h>
#include <indexio/capturing_reader.hh>
#include <indexio/byte_source.hh>
#include <indexio/exceptions.hh>
#include <algorithm>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <vector>
#include "test_utils.hh"

using namespace indexio;

// Forward-only stream wrapper that detects seeks
class ForwardOnlyStream : public std::streambuf {
public:
    explicit ForwardOnlyStream(std::streambuf* underlying)
        : m_underlying(underlying)
        , m_max_pos(0)
        , m_seek_attempted(false) {
        setg(nullptr, nullptr, nullptr);
    }

    bool seek_detected() const { return m_seek_attempted; }
    std::streamsize max_position_reached() const { return m_max_pos; }

protected:
    int_type underflow() override {
        if (gptr() < egptr()) {
            return traits_type::to_int_type(*gptr());
        }

        int_type ch = m_underlying->sbumpc();
        if (ch != traits_type::eof()) {
            m_buffer = traits_type::to_char_type(ch);
            setg(&m_buffer, &m_buffer, &m_buffer + 1);
            m_max_pos += 1;
        }
        return ch;
    }

    std::streamsize xsgetn(char_type* s, std::streamsize count) override {
        std::streamsize read = m_underlying->sgetn(s, count);
        m_max_pos += read;
        return read;
    }

    pos_type seekoff(off_type, std::ios_base::seekdir, std::ios_base::openmode) override {
        m_seek_attempted = true;
        return pos_type(off_type(-1));
    }

    pos_type seekpos(pos_type, std::ios_base::openmode) override {
        m_seek_attempted = true;
        return pos_type(off_type(-1));
    }

private:
    std::streambuf* m_underlying;
    std::streamsize m_max_pos;
    bool m_seek_attempted;
    char m_buffer;
};

// Stream buffer that fails on any read reaching past fail_after bytes
class failing_streambuf : public std::streambuf {
public:
    failing_streambuf(const std::string& data, std::size_t fail_after)
        : m_data(data)
        , m_fail_after(fail_after)
        , m_pos(0) {
        setg(nullptr, nullptr, nullptr);
    }

protected:
    int_type underflow() override {
        throw std::runtime_error("simulated device failure");
    }

    std::streamsize xsgetn(char_type* s, std::streamsize count) override {
        // Requests reaching past the failure point fail as a whole
        if (m_pos + static_cast<std::size_t>(count) > m_fail_after) {
            throw std::runtime_error("simulated device failure");
        }
        std::size_t to_read = std::min(static_cast<std::size_t>(count), m_data.size() - m_pos);
        std::memcpy(s, m_data.data() + m_pos, to_read);
        m_pos += to_read;
        return static_cast<std::streamsize>(to_read);
    }

private:
    std::string m_data;
    std::size_t m_fail_after;
    std::size_t m_pos;
};

// Byte source that raises io_error after delivering a fixed number of bytes
class failing_source : public byte_source {
public:
    failing_source(std::vector<std::byte> data, std::size_t fail_after)
        : m_inner(std::move(data))
        , m_remaining(fail_after) {}

    std::size_t read(void* dst, std::size_t size) override {
        THROW_IO_IF(m_remaining == 0, "device unplugged");
        std::size_t actual = m_inner.read(dst, std::min(size, m_remaining));
        m_remaining -= actual;
        return actual;
    }

private:
    memory_source m_inner;
    std::size_t m_remaining;
};

TEST_CASE("Streaming - reader never seeks its stream") {
    std::string content(10000, '\0');
    for (std::size_t i = 0; i < content.size(); i++) {
        content[i] = static_cast<char>(i * 7);
    }
    std::istringstream base(content);
    ForwardOnlyStream forward(base.rdbuf());
    std::istream stream(&forward);

    capturing_reader reader(std::make_unique<istream_source>(stream), 1024);

    SUBCASE("random order reads") {
        CHECK(reader.get_uint8(5000) == static_cast<std::uint8_t>(content[5000]));
        CHECK(reader.get_uint8(10) == static_cast<std::uint8_t>(content[10]));
        auto bytes = reader.get_bytes(1020, 10);
        CHECK(std::memcmp(bytes.data(), content.data() + 1020, 10) == 0);
        CHECK(reader.get_uint8(3) == static_cast<std::uint8_t>(content[3]));

        CHECK_FALSE(forward.seek_detected());
        // Only the chunks up to offset 5000 have been pulled
        CHECK(forward.max_position_reached() == 5 * 1024);
    }

    SUBCASE("length discovery") {
        CHECK(reader.get_length() == 10000);
        CHECK_FALSE(forward.seek_detected());
        CHECK(forward.max_position_reached() == 10000);

        auto tail = reader.get_bytes(9990, 10);
        CHECK(std::memcmp(tail.data(), content.data() + 9990, 10) == 0);
    }
}

TEST_CASE("Streaming - source failures propagate") {
    SUBCASE("io_error from the source reaches the caller") {
        capturing_reader reader(std::make_unique<failing_source>(make_sequential(1000), 300), 128);

        CHECK(reader.get_uint8(200) == 200);
        CHECK_THROWS_AS(reader.get_uint8(400), io_error);
        CHECK_FALSE(reader.is_stream_finished());
    }

    SUBCASE("failing std::istream surfaces as io_error") {
        failing_streambuf buf(std::string(1000, 'x'), 100);
        std::istream stream(&buf);
        capturing_reader reader(std::make_unique<istream_source>(stream), 64);

        CHECK(reader.get_uint8(10) == 'x');
        CHECK_THROWS_AS(reader.get_bytes(0, 200), io_error);
    }
}
