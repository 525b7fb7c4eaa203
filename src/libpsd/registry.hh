//
// Created by igor on 06/09/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include <psd/fourcc.hh>
#include <psd/format.hh>
#include <psd/io.hh>
#include <psd/options.hh>
#include <psd/structure.hh>

namespace psd::detail {

    // State shared by the decoders of one tagged block tree
    struct decode_context {
        reader_base& r;
        const psd_format& format;
        const read_options& options;
        int depth;
    };

    struct encode_context {
        writer_base& w;
        const psd_format& format;
        const write_options& options;
    };

    // Decodes the payload of a record; the reader is positioned at its start
    using decoder_fn = structure (*)(decode_context& ctx, const fourcc& key, std::uint64_t size);

    /**
     * @brief Decoder registered for a key
     * @return nullptr for keys without a decoder
     */
    decoder_fn find_decoder(const fourcc& key);

    std::vector<structure> read_tagged_list(decode_context& ctx, std::uint64_t end_offset, std::size_t alignment);

    void write_tagged_list(encode_context& ctx, const std::vector<structure>& structures, std::size_t alignment);

    // Payload writer of any record kind
    void write_payload(encode_context& ctx, const structure& s);

    // Leaf records
    structure read_string_value(decode_context& ctx, const fourcc& key, std::uint64_t size);
    structure read_boolean_value(decode_context& ctx, const fourcc& key, std::uint64_t size);
    structure read_integer_value(decode_context& ctx, const fourcc& key, std::uint64_t size);
    structure read_word_value(decode_context& ctx, const fourcc& key, std::uint64_t size);
    structure read_exposure(decode_context& ctx, const fourcc& key, std::uint64_t size);
    structure read_reference_point(decode_context& ctx, const fourcc& key, std::uint64_t size);
    structure read_section_divider(decode_context& ctx, const fourcc& key, std::uint64_t size);
    structure read_sheet_color(decode_context& ctx, const fourcc& key, std::uint64_t size);
    structure read_metadata_settings(decode_context& ctx, const fourcc& key, std::uint64_t size);
    structure read_text_engine_data(decode_context& ctx, const fourcc& key, std::uint64_t size);
    structure read_user_mask(decode_context& ctx, const fourcc& key, std::uint64_t size);
    structure read_filter_mask(decode_context& ctx, const fourcc& key, std::uint64_t size);
    structure read_pattern_block(decode_context& ctx, const fourcc& key, std::uint64_t size);
    structure read_layer_list(decode_context& ctx, const fourcc& key, std::uint64_t size);

    void write_leaf(encode_context& ctx, const string_value& v);
    void write_leaf(encode_context& ctx, const boolean_value& v);
    void write_leaf(encode_context& ctx, const integer_value& v);
    void write_leaf(encode_context& ctx, const word_value& v);
    void write_leaf(encode_context& ctx, const exposure& v);
    void write_leaf(encode_context& ctx, const reference_point& v);
    void write_leaf(encode_context& ctx, const section_divider& v);
    void write_leaf(encode_context& ctx, const sheet_color& v);
    void write_leaf(encode_context& ctx, const metadata_settings& v);
    void write_leaf(encode_context& ctx, const text_engine_data& v);
    void write_leaf(encode_context& ctx, const user_mask& v);
    void write_leaf(encode_context& ctx, const filter_mask& v);
    void write_leaf(encode_context& ctx, const pattern_block& v);
    void write_leaf(encode_context& ctx, const layer_list& v);

    // Layer mask record inside the layer extra data
    layer_mask read_layer_mask(reader_base& r, const psd_format& format);
    void write_layer_mask(writer_base& w, const psd_format& format, const layer_mask& mask);

} // namespace psd::detail
