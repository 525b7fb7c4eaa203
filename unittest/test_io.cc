#include <doctest/doctest.h>
#include <psd/io.hh>

#include <sstream>

#include "test_utils.hh"

using namespace psd;

TEST_SUITE("IO") {
    TEST_CASE("memory_reader reads in both byte orders") {
        auto data = bytes({0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC});
        memory_reader r(data);

        CHECK(r.size() == 6);
        CHECK(r.read<std::uint16_t>(byte_order::big) == 0x1234);
        CHECK(r.read<std::uint16_t>(byte_order::little) == 0x7856);
        CHECK(r.tell() == 4);
        CHECK(r.remaining() == 2);
    }

    TEST_CASE("memory_reader reports truncation") {
        auto data = bytes({0x01, 0x02, 0x03});
        memory_reader r(data);

        SUBCASE("short primitive read") {
            CHECK_THROWS_AS(r.read<std::uint32_t>(byte_order::big), decode_error);
        }

        SUBCASE("short exact read") {
            r.skip(1);
            CHECK_THROWS_AS(r.read_exact(3), decode_error);
        }

        SUBCASE("seek beyond the buffer") {
            CHECK_THROWS_AS(r.seek(4, reader_base::set), io_error);
        }
    }

    TEST_CASE("peek_fourcc leaves the position unchanged") {
        auto data = ascii("8BIMLayr");
        memory_reader r(data);
        r.skip(4);

        fourcc key;
        REQUIRE(r.peek_fourcc(key));
        CHECK(key == "Layr"_4cc);
        CHECK(r.tell() == 4);

        r.skip(2);
        CHECK_FALSE(r.peek_fourcc(key));
    }

    TEST_CASE("stream reader") {
        std::string text("ABCDEFGH");
        std::istringstream is(text);
        reader r(is);

        CHECK(r.size() == 8);
        CHECK(r.read_fourcc() == "ABCD"_4cc);
        r.seek(6, reader_base::set);
        CHECK(r.remaining() == 2);
        CHECK_THROWS_AS(r.read_exact(4), decode_error);
    }

    TEST_CASE("memory_writer appends and overwrites") {
        std::vector<std::byte> buffer = bytes({0xFF});
        memory_writer w(buffer);

        CHECK(w.tell() == 1);
        w.write(std::uint16_t{0x0102}, byte_order::big);
        w.write(std::uint16_t{0x0102}, byte_order::little);
        CHECK(buffer == bytes({0xFF, 0x01, 0x02, 0x02, 0x01}));

        w.seek(1);
        w.write(std::uint8_t{0xAA}, byte_order::big);
        CHECK(buffer == bytes({0xFF, 0xAA, 0x02, 0x02, 0x01}));
        CHECK(w.tell() == 2);
    }

    TEST_CASE("writer padding") {
        std::vector<std::byte> buffer;
        memory_writer w(buffer);
        w.write_fourcc("abc"_4cc);
        w.write(std::uint8_t{1}, byte_order::big);

        CHECK(w.pad(0, 4) == 3);
        CHECK(buffer.size() == 8);
        CHECK(w.pad(0, 4) == 0);
        CHECK(w.pad(0, 1) == 0);
        CHECK(buffer == bytes({'a', 'b', 'c', ' ', 1, 0, 0, 0}));
    }

    TEST_CASE("size_placeholder patches the payload size") {
        SUBCASE("big-endian 4 byte field") {
            std::vector<std::byte> buffer;
            memory_writer w(buffer);
            {
                size_placeholder size(w, byte_order::big, 4);
                CHECK(size.payload_start() == 4);
                w.write_zeros(5);
                CHECK(size.patch() == 5);
            }
            CHECK(w.tell() == 9);
            CHECK(buffer == bytes({0, 0, 0, 5, 0, 0, 0, 0, 0}));
        }

        SUBCASE("little-endian 8 byte field") {
            std::vector<std::byte> buffer;
            memory_writer w(buffer);
            size_placeholder size(w, byte_order::little, 8);
            w.write_zeros(258);
            CHECK(size.patch() == 258);
            CHECK(buffer.size() == 266);
            CHECK(buffer[0] == std::byte{0x02});
            CHECK(buffer[1] == std::byte{0x01});
            CHECK(buffer[7] == std::byte{0x00});
        }

        SUBCASE("2 byte field overflow") {
            std::vector<std::byte> buffer;
            memory_writer w(buffer);
            size_placeholder size(w, byte_order::big, 2);
            w.write_zeros(70000);
            CHECK_THROWS_AS(size.patch(), encode_error);
        }

        SUBCASE("invalid width") {
            std::vector<std::byte> buffer;
            memory_writer w(buffer);
            CHECK_THROWS_AS(size_placeholder(w, byte_order::big, 3), encode_error);
        }
    }

    TEST_CASE("stream_writer seeks back to patch") {
        std::ostringstream os;
        stream_writer w(os);
        w.write_fourcc("8BIM"_4cc);
        size_placeholder size(w, byte_order::big, 4);
        w.write_fourcc("data"_4cc);
        size.patch();

        std::string expected("8BIM\0\0\0\x04" "data", 12);
        CHECK(os.str() == expected);
    }
}
