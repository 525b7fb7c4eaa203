#include <doctest/doctest.h>
#include <psd/image_source_data.hh>
#include <psd/keys.hh>

#include <functional>
#include <sstream>

#include "test_utils.hh"

using namespace psd;

namespace {
    // Signature, empty layer list, default user mask and a layer id
    std::vector<std::byte> complete_document() {
        blob_builder b;
        b.raw(image_source_data_literal());
        b.tag("8BIM").tag("Layr").be32(2).be16(0).zeros(2);
        b.tag("8BIM").tag("LMsk").be32(14)
         .be16(0xFFFF).be16(0).be16(0).be16(0).be16(0)
         .be16(0).u8(128).zeros(1)
         .zeros(2);
        b.tag("8BIM").tag("lyid").be32(4).be32(5);
        return b.data();
    }

    std::string to_string(const std::vector<std::byte>& data) {
        return {reinterpret_cast<const char*>(data.data()), data.size()};
    }
}

TEST_SUITE("Image source data") {
    TEST_CASE("Signature and tag number") {
        CHECK(image_source_data::TIFF_TAG == 37724);
        CHECK(image_source_data::SIGNATURE.size() == 36);
        CHECK(ascii(image_source_data::SIGNATURE) == image_source_data_literal());
    }

    TEST_CASE("Blocks without the signature are rejected") {
        SUBCASE("wrong text") {
            auto data = image_source_data_literal();
            data[0] = std::byte{'a'};
            CHECK_THROWS_AS(image_source_data::from_bytes(data), format_error);
        }

        SUBCASE("too short") {
            CHECK_THROWS_AS(image_source_data::from_bytes(ascii("Adobe Photoshop")), format_error);
        }

        SUBCASE("unknown format signature after the literal") {
            blob_builder b;
            b.raw(image_source_data_literal()).tag("8BPS").be32(0);
            CHECK_THROWS_AS(image_source_data::from_bytes(b.data()), format_error);
        }
    }

    TEST_CASE("Signature alone is an empty document") {
        warning_tracker tracker;
        read_options options;
        options.on_warning = std::ref(tracker);

        auto doc = image_source_data::from_bytes(image_source_data_literal(), options);
        CHECK(doc.empty());
        CHECK(doc.format() == psd_format{psd_format::variant::be32});
        CHECK(doc.layers() == nullptr);
        CHECK(tracker.warnings.empty());
        CHECK(doc.to_bytes() == image_source_data_literal());
    }

    TEST_CASE("Complete document round trips byte identical") {
        warning_tracker tracker;
        read_options options;
        options.on_warning = std::ref(tracker);

        const auto data = complete_document();
        auto doc = image_source_data::from_bytes(data, options, "layers.tif");
        CHECK(tracker.warnings.empty());
        CHECK(doc.name() == "layers.tif");
        REQUIRE(doc.structures().size() == 3);
        REQUIRE(doc.layers() != nullptr);
        CHECK(doc.layers()->layers.empty());
        REQUIRE(doc.user_mask() != nullptr);
        CHECK(doc.user_mask()->flag == 128);
        CHECK(doc.to_bytes() == data);
    }

    TEST_CASE("Missing layer list and user mask are substituted") {
        blob_builder b;
        b.raw(image_source_data_literal());
        b.tag("8BIM").tag("lyid").be32(4).be32(5);

        warning_tracker tracker;
        read_options options;
        options.on_warning = std::ref(tracker);

        auto doc = image_source_data::from_bytes(b.data(), options);
        CHECK(tracker.count_category("missing_structure") == 2);
        REQUIRE(doc.structures().size() == 3);
        CHECK(doc.structures()[0].is<layer_list>());
        CHECK(doc.structures()[1].is<psd::user_mask>());
        CHECK(doc.structures()[2].key() == keys::LAYER_ID);
        CHECK(*doc.user_mask() == psd::user_mask{});

        // the substituted structures are written out
        CHECK(doc.to_bytes() == complete_document());
    }

    TEST_CASE("Only the missing user mask is substituted") {
        blob_builder b;
        b.raw(image_source_data_literal());
        b.tag("8BIM").tag("lyid").be32(4).be32(5);
        b.tag("8BIM").tag("Layr").be32(2).be16(0).zeros(2);

        warning_tracker tracker;
        read_options options;
        options.on_warning = std::ref(tracker);

        auto doc = image_source_data::from_bytes(b.data(), options);
        CHECK(tracker.count_category("missing_structure") == 1);
        REQUIRE(doc.structures().size() == 3);
        CHECK(doc.structures()[1].is<layer_list>());
        CHECK(doc.structures()[2].is<psd::user_mask>());
    }

    TEST_CASE("Little-endian documents") {
        blob_builder b;
        b.raw(image_source_data_literal());
        b.tag("MIB8").tag("ryaL").le32(2).le16(0).zeros(2);
        b.tag("MIB8").tag("ksML").le32(14)
         .le16(0xFFFF).le16(0).le16(0).le16(0).le16(0)
         .le16(0).u8(128).zeros(1)
         .zeros(2);
        b.tag("MIB8").tag("diyl").le32(4).le32(5);

        auto doc = image_source_data::from_bytes(b.data());
        CHECK(doc.format() == psd_format{psd_format::variant::le32});
        CHECK(doc.to_bytes() == b.data());

        // same tree as the big-endian document
        auto big = image_source_data::from_bytes(complete_document());
        CHECK(doc == big);
        CHECK(doc.to_bytes(big.format()) == complete_document());
    }

    TEST_CASE("Converting drops unknown records of the source format") {
        blob_builder b;
        b.raw(complete_document());
        b.tag("8BIM").tag("zzzz").be32(4).be32(0xDEADBEEF);

        auto doc = image_source_data::from_bytes(b.data());
        REQUIRE(doc.structures().size() == 4);
        CHECK(doc.to_bytes() == b.data());

        warning_tracker tracker;
        write_options options;
        options.on_warning = std::ref(tracker);
        auto converted = doc.to_bytes(psd_format{psd_format::variant::le64}, options);
        CHECK(tracker.count_category("foreign_unknown") == 1);

        auto reread = image_source_data::from_bytes(converted);
        CHECK(reread.format() == psd_format{psd_format::variant::le64});
        CHECK(reread.structures().size() == 3);
    }

    TEST_CASE("Documents are edited in place") {
        auto doc = image_source_data::from_bytes(complete_document());

        layer l;
        l.rect = {0, 0, 2, 2};
        l.name = "Added";
        channel c;
        c.data = make_plane(2, 2, sample_type::u8);
        l.channels.push_back(c);
        doc.layers()->layers.push_back(l);
        doc.user_mask()->opacity = 50;

        auto reread = image_source_data::from_bytes(doc.to_bytes());
        CHECK(reread == doc);
        REQUIRE(reread.layers()->layers.size() == 1);
        CHECK(reread.layers()->layers[0].name == "Added");
        CHECK(reread.user_mask()->opacity == 50);
    }

    TEST_CASE("Name does not take part in equality") {
        auto a = image_source_data::from_bytes(complete_document(), {}, "a.tif");
        auto b = image_source_data::from_bytes(complete_document(), {}, "b.tif");
        CHECK(a == b);
    }

    TEST_CASE("Reading from a stream") {
        std::istringstream is(to_string(complete_document()));
        auto doc = image_source_data::from_stream(is);
        CHECK(doc == image_source_data::from_bytes(complete_document()));
    }

    TEST_CASE("TIFF tag") {
        auto doc = image_source_data::from_bytes(complete_document());
        auto tag = doc.tifftag();
        CHECK(tag.code == 37724);
        CHECK(tag.type == 7);
        CHECK(tag.write_once);
        CHECK(tag.value == complete_document());
        CHECK(tag.count == tag.value.size());
    }
}
