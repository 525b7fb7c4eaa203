#include <doctest/doctest.h>
#include <psd/tagged_list.hh>
#include <psd/keys.hh>

#include <algorithm>
#include <stdexcept>

#include "test_utils.hh"

using namespace psd;

namespace {
    const psd_format BE32{psd_format::variant::be32};
    const psd_format LE32{psd_format::variant::le32};
    const psd_format BE64{psd_format::variant::be64};
    const psd_format LE64{psd_format::variant::le64};

    std::vector<std::byte> encode(const std::vector<structure>& structures, const psd_format& format) {
        std::vector<std::byte> out;
        memory_writer w(out);
        write_structures(w, format, {}, 4, structures);
        return out;
    }

    std::vector<structure> decode(const std::vector<std::byte>& data, const psd_format& format) {
        memory_reader r(data);
        return read_structures(r, format, data.size());
    }

    word_value layer_name_source(std::string_view text) {
        word_value v{keys::LAYER_NAME_SOURCE_SETTING, {}};
        auto raw = ascii(text);
        std::copy(raw.begin(), raw.end(), v.value.begin());
        return v;
    }

    std::vector<structure> every_leaf() {
        color overlay;
        overlay.space = color_space::rgb;
        overlay.components = {65535, 0, 32768, 0};

        metadata_settings metadata;
        metadata.items.push_back({"cust"_4cc, true, bytes({1, 2, 3})});
        metadata.items.push_back({"mlst"_4cc, false, {}});

        return {
            string_value{keys::UNICODE_LAYER_NAME, u"Layer été"},
            boolean_value{keys::KNOCKOUT_SETTING, true},
            boolean_value{keys::TRANSPARENCY_SHAPES_LAYER, false},
            integer_value{keys::LAYER_ID, 7},
            integer_value{keys::LAYER_VERSION, -3},
            layer_name_source("layr"),
            exposure{1.5f, -0.25f, 2.2f},
            reference_point{10.5, -4.0},
            section_divider{keys::SECTION_DIVIDER_SETTING, section_divider_type::open_folder,
                            blend_mode::PASS_THROUGH, 1u},
            section_divider{keys::NESTED_SECTION_DIVIDER_SETTING, section_divider_type::bounding_section_divider,
                            std::nullopt, std::nullopt},
            sheet_color{sheet_color_type::violet},
            metadata,
            text_engine_data{bytes({0x0A, 0x0A, 0x3C, 0x3C, 0x2F, 0x45, 0x6E})},
            user_mask{overlay, 50, 128},
            filter_mask{overlay, 100}
        };
    }
}

TEST_SUITE("Leaf structures") {
    TEST_CASE("Every leaf survives each format variant") {
        const auto structures = every_leaf();
        for (const auto& format : {BE32, LE32, BE64, LE64}) {
            CAPTURE(format);
            auto data = encode(structures, format);
            CHECK(data.size() % 4 == 0);
            CHECK(decode(data, format) == structures);
        }
    }

    TEST_CASE("Boolean layout") {
        auto data = encode({boolean_value{keys::KNOCKOUT_SETTING, true}}, BE32);
        blob_builder expected;
        expected.tag("8BIM").tag("knko").be32(4).u8(1).zeros(3);
        CHECK(data == expected.data());
    }

    TEST_CASE("Integer layout in little-endian") {
        auto data = encode({integer_value{keys::LAYER_ID, 0x01020304}}, LE32);
        blob_builder expected;
        expected.tag("MIB8").tag("diyl").le32(4).le32(0x01020304);
        CHECK(data == expected.data());
    }

    TEST_CASE("Unicode string layout") {
        auto data = encode({string_value{keys::UNICODE_LAYER_NAME, u"abc"}}, BE32);
        blob_builder expected;
        expected.tag("8BIM").tag("luni").be32(10).be32(3).be16('a').be16('b').be16('c').zeros(2);
        CHECK(data == expected.data());
    }

    TEST_CASE("Sheet color layout") {
        auto data = encode({sheet_color{sheet_color_type::red}}, BE32);
        blob_builder expected;
        expected.tag("8BIM").tag("lclr").be32(8).be16(1).zeros(6);
        CHECK(data == expected.data());
    }

    TEST_CASE("Exposure") {
        SUBCASE("layout") {
            auto data = encode({exposure{1.0f, 0.0f, 1.0f}}, BE32);
            blob_builder expected;
            expected.tag("8BIM").tag("expA").be32(14).be16(1).be32(0x3F800000).be32(0).be32(0x3F800000).zeros(2);
            CHECK(data == expected.data());
        }

        SUBCASE("only version 1 is understood") {
            blob_builder b;
            b.tag("8BIM").tag("expA").be32(14).be16(2).be32(0x3F800000).be32(0).be32(0x3F800000).zeros(2);
            CHECK_THROWS_AS(decode(b.data(), BE32), decode_error);
        }
    }

    TEST_CASE("Section divider") {
        SUBCASE("kind only") {
            blob_builder b;
            b.tag("8BIM").tag("lsct").be32(4).be32(2);
            auto structures = decode(b.data(), BE32);
            REQUIRE(structures.size() == 1);
            const auto& divider = structures[0].as<section_divider>();
            CHECK(divider.kind == section_divider_type::closed_folder);
            CHECK_FALSE(divider.blend_mode.has_value());
            CHECK_FALSE(divider.sub_type.has_value());
            CHECK(encode(structures, BE32) == b.data());
        }

        SUBCASE("blend mode") {
            blob_builder b;
            b.tag("8BIM").tag("lsct").be32(12).be32(1).tag("8BIM").tag("norm");
            auto structures = decode(b.data(), BE32);
            const auto& divider = structures[0].as<section_divider>();
            CHECK(divider.kind == section_divider_type::open_folder);
            CHECK(divider.blend_mode == blend_mode::NORMAL);
            CHECK_FALSE(divider.sub_type.has_value());
            CHECK(encode(structures, BE32) == b.data());
        }

        SUBCASE("blend mode in little-endian") {
            blob_builder b;
            b.tag("MIB8").tag("tcsl").le32(12).le32(1).tag("MIB8").tag("mron");
            auto structures = decode(b.data(), LE32);
            CHECK(structures[0].as<section_divider>().blend_mode == blend_mode::NORMAL);
            CHECK(encode(structures, LE32) == b.data());
        }

        SUBCASE("sub type") {
            blob_builder b;
            b.tag("8BIM").tag("lsdk").be32(16).be32(3).tag("8BIM").tag("pass").be32(1);
            auto structures = decode(b.data(), BE32);
            const auto& divider = structures[0].as<section_divider>();
            CHECK(divider.key == keys::NESTED_SECTION_DIVIDER_SETTING);
            CHECK(divider.sub_type == 1u);
            CHECK(encode(structures, BE32) == b.data());
        }

        SUBCASE("sub type without blend mode cannot be written") {
            section_divider divider;
            divider.sub_type = 0;
            CHECK_THROWS_AS(encode({divider}, BE32), encode_error);
        }
    }

    TEST_CASE("Metadata setting layout") {
        metadata_settings metadata;
        metadata.items.push_back({"cust"_4cc, true, bytes({9, 8, 7})});
        auto data = encode({metadata}, BE32);

        blob_builder expected;
        expected.tag("8BIM").tag("shmd").be32(23)
                .be32(1)
                .tag("8BIM").tag("cust").u8(1).zeros(3).be32(3).raw(bytes({9, 8, 7}))
                .zeros(1);
        CHECK(data == expected.data());
    }

    TEST_CASE("User mask widens its size field in 64-bit variants") {
        user_mask mask;
        mask.overlay.space = color_space::gray;
        mask.overlay.components = {1, 2, 3, 4};
        mask.opacity = 100;

        auto data = encode({mask}, BE64);
        blob_builder expected;
        expected.tag("8B64").tag("LMsk").be64(14)
                .be16(8).be16(1).be16(2).be16(3).be16(4)
                .be16(100).u8(128).zeros(1)
                .zeros(2);
        CHECK(data == expected.data());

        auto structures = decode(data, BE64);
        REQUIRE(structures.size() == 1);
        CHECK(structures[0].key() == keys::USER_MASK);
        CHECK(structures[0].as<user_mask>() == mask);
    }

    TEST_CASE("Lab colour components are signed") {
        user_mask mask;
        mask.overlay.space = color_space::lab;
        mask.overlay.set_signed_component(0, 10000);
        mask.overlay.set_signed_component(1, -12800);
        mask.overlay.set_signed_component(2, 12700);
        mask.overlay.set_signed_component(3, -1);
        CHECK(mask.overlay.components[1] == 0xCE00);
        CHECK(mask.overlay.components[3] == 0xFFFF);

        auto data = encode({mask}, BE32);
        blob_builder expected;
        expected.tag("8BIM").tag("LMsk").be32(14)
                .be16(7).be16(10000).be16(0xCE00).be16(12700).be16(0xFFFF)
                .be16(0).u8(128).zeros(1)
                .zeros(2);
        CHECK(data == expected.data());

        for (const auto& format : {BE32, LE32, BE64, LE64}) {
            CAPTURE(format);
            auto structures = decode(encode({mask}, format), format);
            REQUIRE(structures.size() == 1);
            const auto& overlay = structures[0].as<user_mask>().overlay;
            CHECK(overlay.space == color_space::lab);
            CHECK(overlay.signed_component(0) == 10000);
            CHECK(overlay.signed_component(1) == -12800);
            CHECK(overlay.signed_component(2) == 12700);
            CHECK(overlay.signed_component(3) == -1);
        }
        CHECK_THROWS_AS(mask.overlay.signed_component(4), std::out_of_range);
    }

    TEST_CASE("Opaque payloads keep their bytes") {
        auto data = encode({text_engine_data{ascii("<< /EngineDict >>")}}, LE32);
        auto structures = decode(data, LE32);
        REQUIRE(structures.size() == 1);
        CHECK(structures[0].key() == keys::TEXT_ENGINE_DATA);
        CHECK(structures[0].as<text_engine_data>().data == ascii("<< /EngineDict >>"));

        auto name_source = decode(encode({layer_name_source("rtcl")}, LE32), LE32);
        CHECK(name_source[0].as<word_value>().value == layer_name_source("rtcl").value);
    }

    TEST_CASE("Structure keys") {
        CHECK(structure(exposure{}).key() == keys::EXPOSURE);
        CHECK(structure(reference_point{}).key() == keys::REFERENCE_POINT);
        CHECK(structure(sheet_color{}).key() == keys::SHEET_COLOR_SETTING);
        CHECK(structure(metadata_settings{}).key() == keys::METADATA_SETTING);
        CHECK(structure(text_engine_data{}).key() == keys::TEXT_ENGINE_DATA);
        CHECK(structure(user_mask{}).key() == keys::USER_MASK);
        CHECK(structure(filter_mask{}).key() == keys::FILTER_MASK);
        CHECK(structure(layer_list{}).key() == keys::LAYER);
        CHECK(structure(empty_structure{"zero"_4cc}).key() == "zero"_4cc);
        CHECK(structure(integer_value{keys::LAYER_VERSION, 1}).key() == keys::LAYER_VERSION);
    }
}
