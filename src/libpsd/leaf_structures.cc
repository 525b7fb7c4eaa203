//
// Created by igor on 06/09/2025.
//

#include "registry.hh"

#include <psd/exceptions.hh>

#include <algorithm>
#include <limits>

namespace psd::detail {

    namespace {
        color read_color(reader_base& r, const psd_format& format) {
            color c;
            c.space = static_cast<color_space>(format.read<std::int16_t>(r));
            c.components = format.read_array<std::uint16_t, 4>(r);
            return c;
        }

        void write_color(writer_base& w, const psd_format& format, const color& c) {
            format.write(w, static_cast<std::int16_t>(c.space));
            for (auto component : c.components) {
                format.write(w, component);
            }
        }
    }

    structure read_string_value(decode_context& ctx, const fourcc& key, std::uint64_t) {
        return string_value{key, ctx.format.read_unicode(ctx.r)};
    }

    structure read_boolean_value(decode_context& ctx, const fourcc& key, std::uint64_t) {
        return boolean_value{key, ctx.format.read<std::uint8_t>(ctx.r) != 0};
    }

    structure read_integer_value(decode_context& ctx, const fourcc& key, std::uint64_t) {
        return integer_value{key, ctx.format.read<std::int32_t>(ctx.r)};
    }

    structure read_word_value(decode_context& ctx, const fourcc& key, std::uint64_t) {
        word_value v{key, {}};
        auto bytes = ctx.r.read_exact(4);
        std::copy(bytes.begin(), bytes.end(), v.value.begin());
        return v;
    }

    structure read_exposure(decode_context& ctx, const fourcc&, std::uint64_t) {
        auto& r = ctx.r;
        auto version = ctx.format.read<std::uint16_t>(r);
        THROW_DECODE_IF(version != 1, "Unsupported exposure version ", version);
        exposure v;
        v.exposure_value = ctx.format.read<float>(r);
        v.offset = ctx.format.read<float>(r);
        v.gamma = ctx.format.read<float>(r);
        return v;
    }

    structure read_reference_point(decode_context& ctx, const fourcc&, std::uint64_t) {
        reference_point v;
        v.x = ctx.format.read<double>(ctx.r);
        v.y = ctx.format.read<double>(ctx.r);
        return v;
    }

    structure read_section_divider(decode_context& ctx, const fourcc& key, std::uint64_t size) {
        auto& r = ctx.r;
        section_divider v;
        v.key = key;
        v.kind = static_cast<section_divider_type>(ctx.format.read<std::uint32_t>(r));
        if (size >= 12) {
            r.skip(4); // signature
            v.blend_mode = ctx.format.read_key(r);
        }
        if (size >= 16) {
            v.sub_type = ctx.format.read<std::uint32_t>(r);
        }
        return v;
    }

    structure read_sheet_color(decode_context& ctx, const fourcc&, std::uint64_t) {
        return sheet_color{static_cast<sheet_color_type>(ctx.format.read<std::uint16_t>(ctx.r))};
    }

    structure read_metadata_settings(decode_context& ctx, const fourcc&, std::uint64_t) {
        auto& r = ctx.r;
        metadata_settings v;
        auto count = ctx.format.read<std::uint32_t>(r);
        for (std::uint32_t i = 0; i < count; i++) {
            metadata_item item;
            r.skip(4); // signature
            item.key = ctx.format.read_key(r);
            item.copy_on_sheet_duplication = ctx.format.read<std::uint8_t>(r) != 0;
            r.skip(3);
            auto length = ctx.format.read<std::uint32_t>(r);
            item.data = r.read_exact(length);
            v.items.push_back(std::move(item));
        }
        return v;
    }

    structure read_text_engine_data(decode_context& ctx, const fourcc&, std::uint64_t size) {
        return text_engine_data{ctx.r.read_exact(static_cast<std::size_t>(size))};
    }

    structure read_user_mask(decode_context& ctx, const fourcc&, std::uint64_t) {
        user_mask v;
        v.overlay = read_color(ctx.r, ctx.format);
        v.opacity = ctx.format.read<std::uint16_t>(ctx.r);
        v.flag = ctx.format.read<std::uint8_t>(ctx.r);
        return v;
    }

    structure read_filter_mask(decode_context& ctx, const fourcc&, std::uint64_t) {
        filter_mask v;
        v.overlay = read_color(ctx.r, ctx.format);
        v.opacity = ctx.format.read<std::uint16_t>(ctx.r);
        return v;
    }

    void write_leaf(encode_context& ctx, const string_value& v) {
        ctx.format.write_unicode(ctx.w, v.value);
    }

    void write_leaf(encode_context& ctx, const boolean_value& v) {
        ctx.format.write<std::uint8_t>(ctx.w, v.value ? 1 : 0);
        ctx.w.write_zeros(3);
    }

    void write_leaf(encode_context& ctx, const integer_value& v) {
        ctx.format.write(ctx.w, v.value);
    }

    void write_leaf(encode_context& ctx, const word_value& v) {
        ctx.w.write(v.value.data(), v.value.size());
    }

    void write_leaf(encode_context& ctx, const exposure& v) {
        ctx.format.write_values(ctx.w, std::uint16_t{1}, v.exposure_value, v.offset, v.gamma);
    }

    void write_leaf(encode_context& ctx, const reference_point& v) {
        ctx.format.write_values(ctx.w, v.x, v.y);
    }

    void write_leaf(encode_context& ctx, const section_divider& v) {
        THROW_ENCODE_IF(v.sub_type && !v.blend_mode, "Section divider sub type requires a blend mode");
        ctx.format.write(ctx.w, static_cast<std::uint32_t>(v.kind));
        if (v.blend_mode) {
            ctx.w.write_fourcc(ctx.format.signature());
            ctx.format.write_key(ctx.w, *v.blend_mode);
        }
        if (v.sub_type) {
            ctx.format.write(ctx.w, *v.sub_type);
        }
    }

    void write_leaf(encode_context& ctx, const sheet_color& v) {
        ctx.format.write(ctx.w, static_cast<std::uint16_t>(v.value));
        ctx.w.write_zeros(6);
    }

    void write_leaf(encode_context& ctx, const metadata_settings& v) {
        auto& w = ctx.w;
        THROW_ENCODE_IF(v.items.size() > std::numeric_limits<std::uint32_t>::max(), "Too many metadata items");
        ctx.format.write(w, static_cast<std::uint32_t>(v.items.size()));
        for (const auto& item : v.items) {
            w.write_fourcc(ctx.format.signature());
            ctx.format.write_key(w, item.key);
            ctx.format.write<std::uint8_t>(w, item.copy_on_sheet_duplication ? 1 : 0);
            w.write_zeros(3);
            size_placeholder length(w, ctx.format.get_byte_order(), 4);
            w.write_bytes(item.data);
            length.patch();
        }
    }

    void write_leaf(encode_context& ctx, const text_engine_data& v) {
        ctx.w.write_bytes(v.data);
    }

    void write_leaf(encode_context& ctx, const user_mask& v) {
        write_color(ctx.w, ctx.format, v.overlay);
        ctx.format.write_values(ctx.w, v.opacity, v.flag);
        ctx.w.write_zeros(1);
    }

    void write_leaf(encode_context& ctx, const filter_mask& v) {
        write_color(ctx.w, ctx.format, v.overlay);
        ctx.format.write(ctx.w, v.opacity);
    }

} // namespace psd::detail
