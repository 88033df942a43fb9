//
// Tests for the typed accessors of indexed_reader
//

#include <doctest/doctest.h>
#include <indexio/capturing_reader.hh>
#include <indexio/byte_order.hh>
#include <indexio/exceptions.hh>
#include <vector>
#include "test_utils.hh"

using namespace indexio;

namespace {
    std::vector<std::byte> bytes_of(std::initializer_list<int> values) {
        std::vector<std::byte> data;
        for (int v : values) {
            data.push_back(static_cast<std::byte>(v));
        }
        return data;
    }
}

TEST_CASE("indexed_reader - integer accessors") {
    // Chunk size 3 makes most multi-byte values straddle a chunk boundary
    memory_fixture fx(bytes_of({0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0xFF, 0xFE}), 3);
    auto& reader = *fx.reader;

    SUBCASE("big endian by default") {
        CHECK(reader.get_byte_order() == byte_order::big);
        CHECK(reader.get_uint8(0) == 0x01);
        CHECK(reader.get_uint16(0) == 0x0102);
        CHECK(reader.get_int24(0) == 0x010203);
        CHECK(reader.get_uint32(0) == 0x01020304u);
        CHECK(reader.get_int32(1) == 0x02030405);
        CHECK(reader.get_int64(0) == 0x0102030405060708LL);
    }

    SUBCASE("little endian") {
        reader.set_byte_order(byte_order::little);
        CHECK(reader.get_uint16(0) == 0x0201);
        CHECK(reader.get_int24(0) == 0x030201);
        CHECK(reader.get_uint32(0) == 0x04030201u);
        CHECK(reader.get_int64(0) == 0x0807060504030201LL);
    }

    SUBCASE("signed values") {
        CHECK(reader.get_uint8(8) == 0xFF);
        CHECK(reader.get_int8(8) == -1);
        CHECK(reader.get_int16(8) == -2);
        CHECK(reader.get_uint16(8) == 0xFFFE);

        reader.set_byte_order(byte_order::little);
        CHECK(reader.get_int16(8) == static_cast<std::int16_t>(0xFEFF));
    }

    SUBCASE("24 bit values are not sign extended") {
        CHECK(reader.get_int24(7) == 0x08FFFE);
    }

    SUBCASE("accessors validate their range") {
        CHECK_THROWS_AS(reader.get_uint8(10), bounds_error);
        CHECK_THROWS_AS(reader.get_uint16(9), bounds_error);
        CHECK_THROWS_AS(reader.get_int24(8), bounds_error);
        CHECK_THROWS_AS(reader.get_uint32(7), bounds_error);
        CHECK_THROWS_AS(reader.get_int64(3), bounds_error);
        CHECK_THROWS_AS(reader.get_int8(-1), bounds_error);
        CHECK(reader.get_int64(2) == 0x030405060708FFFELL);
    }
}

TEST_CASE("indexed_reader - floating point accessors") {
    SUBCASE("big endian") {
        memory_fixture fx(bytes_of({0x3F, 0x80, 0x00, 0x00,
                                    0x3F, 0xF0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}), 5);
        CHECK(fx.reader->get_float32(0) == doctest::Approx(1.0f));
        CHECK(fx.reader->get_double64(4) == doctest::Approx(1.0));
    }

    SUBCASE("little endian") {
        memory_fixture fx(bytes_of({0x00, 0x00, 0x20, 0xC1}), 2);
        fx.reader->set_byte_order(byte_order::little);
        CHECK(fx.reader->get_float32(0) == doctest::Approx(-10.0f));
    }

    SUBCASE("s15.16 fixed point") {
        memory_fixture fx(bytes_of({0x00, 0x01, 0x80, 0x00,
                                    0xFF, 0xFF, 0x00, 0x00,
                                    0x00, 0x00, 0x40, 0x00}), 4);
        CHECK(fx.reader->get_s15_fixed16(0) == doctest::Approx(1.5f));
        CHECK(fx.reader->get_s15_fixed16(4) == doctest::Approx(-1.0f));
        CHECK(fx.reader->get_s15_fixed16(8) == doctest::Approx(0.25f));
    }
}

TEST_CASE("indexed_reader - string accessors") {
    memory_fixture fx(to_bytes(std::string("hello\0world", 11)), 4);
    auto& reader = *fx.reader;

    SUBCASE("raw strings keep embedded NULs") {
        CHECK(reader.get_string(0, 5) == "hello");
        CHECK(reader.get_string(0, 11) == std::string("hello\0world", 11));
        CHECK(reader.get_string(3, 0).empty());
    }

    SUBCASE("null terminated strings") {
        CHECK(reader.get_null_terminated_string(0, 11) == "hello");
        CHECK(reader.get_null_terminated_string(6, 5) == "world");
        CHECK(reader.get_null_terminated_string(0, 3) == "hel");
        CHECK(reader.get_null_terminated_string(5, 6).empty());
    }

    SUBCASE("strings past the end") {
        CHECK_THROWS_AS(reader.get_string(6, 6), bounds_error);
        CHECK_THROWS_AS(reader.get_null_terminated_string(6, 10), bounds_error);
    }
}
