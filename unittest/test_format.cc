#include <doctest/doctest.h>
#include <psd/format.hh>
#include <psd/keys.hh>

#include <sstream>

#include "test_utils.hh"

using namespace psd;

namespace {
    const psd_format BE32{psd_format::variant::be32};
    const psd_format LE32{psd_format::variant::le32};
    const psd_format BE64{psd_format::variant::be64};
    const psd_format LE64{psd_format::variant::le64};
}

TEST_SUITE("Format") {
    TEST_CASE("Detection from the signature") {
        CHECK(psd_format::from_signature("8BIM"_4cc) == BE32);
        CHECK(psd_format::from_signature("MIB8"_4cc) == LE32);
        CHECK(psd_format::from_signature("8B64"_4cc) == BE64);
        CHECK(psd_format::from_signature("46B8"_4cc) == LE64);

        CHECK(psd_format::is_signature("46B8"_4cc));
        CHECK_FALSE(psd_format::is_signature("8BPS"_4cc));
        CHECK_THROWS_AS(psd_format::from_signature("8BPS"_4cc), format_error);
    }

    TEST_CASE("Variant properties") {
        CHECK(psd_format{} == BE32);

        CHECK(BE32.get_byte_order() == byte_order::big);
        CHECK(LE32.get_byte_order() == byte_order::little);
        CHECK(BE64.get_byte_order() == byte_order::big);
        CHECK(LE64.get_byte_order() == byte_order::little);

        CHECK(BE32.signature() == "8BIM"_4cc);
        CHECK(LE64.signature() == "46B8"_4cc);

        CHECK(BE32.string_encoding() == text_encoding::utf16_be);
        CHECK(LE32.string_encoding() == text_encoding::utf16_le);

        CHECK(BE32.count_field_width() == 2);
        CHECK(LE64.count_field_width() == 4);

        CHECK(LE32.size_field_width() == 4);
        CHECK(BE64.size_field_width() == 8);

        std::ostringstream os;
        os << LE32;
        CHECK(os.str() == "<psd_format MIB8>");
    }

    TEST_CASE("Size field width depends on variant and key") {
        for (const auto& key : {keys::USER_MASK, keys::LAYER, keys::LAYER_16, keys::LAYER_32,
                                keys::SAVING_MERGED_TRANSPARENCY, keys::ALPHA, keys::FILTER_MASK,
                                keys::LINKED_LAYER_2, keys::FILTER_EFFECTS, keys::PIXEL_SOURCE_DATA_CC15}) {
            CHECK(BE32.size_field_width(key) == 4);
            CHECK(LE32.size_field_width(key) == 4);
            CHECK(BE64.size_field_width(key) == 8);
            CHECK(LE64.size_field_width(key) == 8);
        }

        for (const auto& key : {keys::UNICODE_LAYER_NAME, keys::LAYER_ID, keys::PATTERNS, keys::TEXT_ENGINE_DATA}) {
            CHECK(BE64.size_field_width(key) == 4);
            CHECK(LE64.size_field_width(key) == 4);
        }
    }

    TEST_CASE("Size fields") {
        SUBCASE("8 byte size under BE64") {
            std::vector<std::byte> buffer;
            memory_writer w(buffer);
            BE64.write_size(w, 0x0102, keys::LAYER);
            CHECK(buffer == bytes({0, 0, 0, 0, 0, 0, 1, 2}));

            memory_reader r(buffer);
            CHECK(BE64.read_size(r, keys::LAYER) == 0x0102);
        }

        SUBCASE("4 byte size for other keys under LE64") {
            std::vector<std::byte> buffer;
            memory_writer w(buffer);
            LE64.write_size(w, 0x0102, keys::LAYER_ID);
            CHECK(buffer == bytes({2, 1, 0, 0}));
        }

        SUBCASE("plain size follows the variant") {
            std::vector<std::byte> buffer;
            memory_writer w(buffer);
            LE64.write_size(w, 7);
            LE32.write_size(w, 7);
            CHECK(buffer.size() == 12);

            memory_reader r(buffer);
            CHECK(LE64.read_size(r) == 7);
            CHECK(LE32.read_size(r) == 7);
        }

        SUBCASE("overflow of a 4 byte field") {
            std::vector<std::byte> buffer;
            memory_writer w(buffer);
            CHECK_THROWS_AS(BE32.write_size(w, 0x100000000ULL, keys::LAYER), encode_error);
        }
    }

    TEST_CASE("Keys are reversed by little-endian variants") {
        std::vector<std::byte> buffer;
        memory_writer w(buffer);
        BE32.write_key(w, "luni"_4cc);
        LE32.write_key(w, "luni"_4cc);
        CHECK(buffer == ascii("luniinul"));

        memory_reader r(buffer);
        CHECK(BE32.read_key(r) == "luni"_4cc);
        CHECK(LE32.read_key(r) == "luni"_4cc);
    }

    TEST_CASE("Primitive pack and unpack") {
        std::vector<std::byte> buffer;
        memory_writer w(buffer);
        LE32.write_values(w, std::int16_t{-2}, std::uint32_t{1}, std::uint8_t{9});
        CHECK(buffer == bytes({0xFE, 0xFF, 1, 0, 0, 0, 9}));

        memory_reader r(buffer);
        CHECK(LE32.read<std::int16_t>(r) == -2);
        CHECK(LE32.read<std::uint32_t>(r) == 1);
        CHECK(LE32.read<std::uint8_t>(r) == 9);

        std::vector<std::byte> rect;
        memory_writer rw(rect);
        BE32.write_values(rw, std::int32_t{1}, std::int32_t{2}, std::int32_t{3}, std::int32_t{4});
        memory_reader rr(rect);
        auto values = BE32.read_array<std::int32_t, 4>(rr);
        CHECK((values == std::array<std::int32_t, 4>{1, 2, 3, 4}));
    }

    TEST_CASE("Unicode strings") {
        SUBCASE("big-endian") {
            std::vector<std::byte> buffer;
            memory_writer w(buffer);
            BE32.write_unicode(w, u"Ab");
            CHECK(buffer == bytes({0, 0, 0, 2, 0, 'A', 0, 'b'}));
            memory_reader r(buffer);
            CHECK(BE32.read_unicode(r) == u"Ab");
        }

        SUBCASE("little-endian") {
            std::vector<std::byte> buffer;
            memory_writer w(buffer);
            LE64.write_unicode(w, u"é");
            CHECK(buffer == bytes({1, 0, 0, 0, 0xE9, 0}));
            memory_reader r(buffer);
            CHECK(LE64.read_unicode(r) == u"é");
        }

        SUBCASE("count past the data") {
            auto data = bytes({0, 0, 0, 9, 0, 'A'});
            memory_reader r(data);
            CHECK_THROWS_AS(BE32.read_unicode(r), decode_error);
        }
    }

    TEST_CASE("Pascal strings") {
        SUBCASE("padded to 4 bytes") {
            std::vector<std::byte> buffer;
            memory_writer w(buffer);
            CHECK(write_pascal_string(w, "Layer", 4) == 8);
            CHECK(buffer == bytes({5, 'L', 'a', 'y', 'e', 'r', 0, 0}));

            memory_reader r(buffer);
            CHECK(read_pascal_string(r, 4) == "Layer");
            CHECK(r.tell() == 8);
        }

        SUBCASE("empty string padded to 2 bytes") {
            std::vector<std::byte> buffer;
            memory_writer w(buffer);
            CHECK(write_pascal_string(w, "", 2) == 2);
            CHECK(buffer == bytes({0, 0}));
        }

        SUBCASE("truncated to 255 bytes") {
            std::vector<std::byte> buffer;
            memory_writer w(buffer);
            CHECK(write_pascal_string(w, std::string(300, 'x'), 1) == 256);
            memory_reader r(buffer);
            CHECK(read_pascal_string(r, 1).size() == 255);
        }
    }
}
