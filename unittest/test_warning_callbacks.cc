//
// Test warning callback functionality across different scenarios
//

#include <doctest/doctest.h>
#include <psd/image_source_data.hh>
#include <psd/tagged_list.hh>
#include <psd/keys.hh>

#include <functional>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace psd;

namespace {
    // Layer list whose single layer carries an unrecognised info record
    std::vector<std::byte> document_with_unknown_layer_info() {
        layer l;
        l.info = {integer_value{keys::LAYER_ID, 1},
                  unknown_structure{"qqqq"_4cc, psd_format{}, bytes({1, 2})}};
        layer_list list;
        list.layers.push_back(l);

        image_source_data doc(psd_format{}, {list, psd::user_mask{}});
        return doc.to_bytes();
    }
}

TEST_CASE("Warning callbacks - skipped_unknown") {
    SUBCASE("Unknown records inside layer info") {
        warning_tracker tracker;
        read_options opts;
        opts.preserve_unknown = false;
        opts.on_warning = std::ref(tracker);

        auto doc = image_source_data::from_bytes(document_with_unknown_layer_info(), opts);

        CHECK(tracker.count_category("skipped_unknown") == 1);
        CHECK(tracker.warnings[0].message.find("qqqq") != std::string::npos);
        REQUIRE(doc.layers() != nullptr);
        CHECK(doc.layers()->layers[0].info.size() == 1);
    }

    SUBCASE("Preserved unknown records do not warn") {
        warning_tracker tracker;
        read_options opts;
        opts.on_warning = std::ref(tracker);

        auto doc = image_source_data::from_bytes(document_with_unknown_layer_info(), opts);
        CHECK(tracker.warnings.empty());
        CHECK(doc.layers()->layers[0].info.size() == 2);
    }
}

TEST_CASE("Warning callbacks - foreign_unknown") {
    auto doc = image_source_data::from_bytes(document_with_unknown_layer_info());

    std::vector<std::string> categories;
    write_options opts;
    opts.on_warning = [&categories](std::uint64_t, std::string_view category, std::string_view) {
        categories.emplace_back(category);
    };

    auto converted = doc.to_bytes(psd_format{psd_format::variant::le32}, opts);
    REQUIRE(categories.size() == 1);
    CHECK(categories[0] == "foreign_unknown");

    auto reread = image_source_data::from_bytes(converted);
    CHECK(reread.layers()->layers[0].info.size() == 1);
}

TEST_CASE("Warning callbacks - size_overrun") {
    blob_builder b;
    b.tag("8BIM").tag("lyid").be32(4).be32(1);
    b.tag("8BIM").tag("zzzz").be32(1000).be32(0);

    warning_tracker tracker;
    read_options opts;
    opts.on_warning = std::ref(tracker);

    memory_reader r(b.data());
    auto structures = read_structures(r, psd_format{}, b.size(), opts);
    CHECK(structures.size() == 2);
    REQUIRE(tracker.count_category("size_overrun") == 1);
    CHECK(tracker.warnings[0].offset == 16);
    CHECK(tracker.warnings[0].message.find("1000") != std::string::npos);
}

TEST_CASE("Warning callbacks - missing_structure") {
    warning_tracker tracker;
    read_options opts;
    opts.on_warning = std::ref(tracker);

    blob_builder b;
    b.raw(image_source_data_literal());
    b.tag("8BIM").tag("lyvr").be32(4).be32(120);

    auto doc = image_source_data::from_bytes(b.data(), opts);
    CHECK(tracker.count_category("missing_structure") == 2);
    for (const auto& w : tracker.warnings) {
        CHECK(w.offset == b.size());
    }
    CHECK(doc.layers() != nullptr);
    CHECK(doc.user_mask() != nullptr);
}

TEST_CASE("Warning callbacks - no handler") {
    SUBCASE("Reading") {
        read_options opts;
        opts.preserve_unknown = false;
        CHECK_NOTHROW(image_source_data::from_bytes(document_with_unknown_layer_info(), opts));
    }

    SUBCASE("Writing") {
        auto doc = image_source_data::from_bytes(document_with_unknown_layer_info());
        CHECK_NOTHROW((void)doc.to_bytes(psd_format{psd_format::variant::be64}));
    }
}
