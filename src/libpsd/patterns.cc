//
// Created by igor on 07/09/2025.
//

#include "registry.hh"

#include <psd/exceptions.hh>

#include <algorithm>
#include <limits>

namespace psd::detail {

    namespace {
        constexpr std::uint32_t PATTERN_VERSION = 1;
        constexpr std::uint32_t VMAL_VERSION = 3;
        constexpr std::size_t COLOR_TABLE_SIZE = 768;

        sample_type pixel_depth_type(std::uint16_t pixel_depth) {
            switch (pixel_depth) {
                case 8:
                    return sample_type::u8;
                case 16:
                    return sample_type::u16;
                case 32:
                    return sample_type::f32;
                default:
                    THROW_DECODE("Unsupported pattern pixel depth ", pixel_depth);
            }
        }

        rectangle read_rect(reader_base& r, const psd_format& format) {
            auto v = format.read_array<std::int32_t, 4>(r);
            return {v[0], v[1], v[2], v[3]};
        }

        void write_rect(writer_base& w, const psd_format& format, const rectangle& rc) {
            format.write_values(w, rc.top, rc.left, rc.bottom, rc.right);
        }

        std::optional<virtual_memory_array> read_array(decode_context& ctx) {
            auto& r = ctx.r;
            const auto& format = ctx.format;

            auto written = format.read<std::uint32_t>(r);
            if (written == 0) {
                return std::nullopt;
            }
            auto length = format.read<std::uint32_t>(r);
            if (length == 0) {
                return std::nullopt;
            }
            const std::uint64_t end = r.tell() + length;

            virtual_memory_array a;
            a.depth = format.read<std::uint32_t>(r);
            a.rect = read_rect(r, format);
            a.pixel_depth = format.read<std::uint16_t>(r);
            auto code = format.read<std::uint8_t>(r);
            THROW_DECODE_UNLESS(is_valid_compression(code), "Invalid pattern compression kind ", static_cast<int>(code));
            a.kind = static_cast<compression>(code);
            THROW_DECODE_IF(r.tell() > end, "Pattern channel header runs past its ", length, " byte array");

            auto payload = r.read_exact(static_cast<std::size_t>(end - r.tell()));
            a.data = decode_plane(payload, a.kind, a.rect.rows(), a.rect.cols(), pixel_depth_type(a.pixel_depth), format);
            return a;
        }

        pattern read_pattern(decode_context& ctx) {
            auto& r = ctx.r;
            const auto& format = ctx.format;
            pattern p;

            auto version = format.read<std::uint32_t>(r);
            THROW_DECODE_IF(version != PATTERN_VERSION, "Unsupported pattern version ", version);
            p.mode = static_cast<image_mode>(format.read<std::uint32_t>(r));
            p.vertical = format.read<std::int16_t>(r);
            p.horizontal = format.read<std::int16_t>(r);
            p.name = format.read_unicode(r);
            p.id = read_pascal_string(r, 1);
            if (p.mode == image_mode::indexed) {
                p.color_table = r.read_exact(COLOR_TABLE_SIZE);
            }

            auto vmal_version = format.read<std::uint32_t>(r);
            THROW_DECODE_IF(vmal_version != VMAL_VERSION, "Unsupported virtual memory array list version ", vmal_version);
            auto vmal_length = format.read<std::uint32_t>(r);
            const std::uint64_t vmal_end = r.tell() + vmal_length;
            p.rect = read_rect(r, format);
            auto channel_count = format.read<std::uint32_t>(r);
            // user mask and sheet mask follow the channels
            for (std::uint64_t i = 0; i < static_cast<std::uint64_t>(channel_count) + 2; i++) {
                THROW_DECODE_IF(r.tell() >= vmal_end, "Pattern declares ", channel_count,
                                " channels but its array list ends at offset ", vmal_end);
                p.channels.push_back(read_array(ctx));
            }
            r.seek(vmal_end, reader_base::set);
            return p;
        }

        void write_array(encode_context& ctx, const std::optional<virtual_memory_array>& a) {
            auto& w = ctx.w;
            const auto& format = ctx.format;

            if (!a) {
                format.write<std::uint32_t>(w, 0);
                return;
            }
            const auto type = pixel_depth_type(a->pixel_depth);
            THROW_ENCODE_IF(a->data.type() != type, "Pattern channel samples do not match pixel depth ", a->pixel_depth);
            THROW_ENCODE_IF(a->data.rows() != a->rect.rows() || a->data.cols() != a->rect.cols(),
                            "Pattern channel plane does not match its rectangle ", a->rect);

            format.write<std::uint32_t>(w, 1);
            size_placeholder length(w, format.get_byte_order(), 4);
            format.write(w, a->depth);
            write_rect(w, format, a->rect);
            format.write(w, a->pixel_depth);
            auto kind = ctx.options.compression_override.value_or(a->kind);
            format.write(w, static_cast<std::uint8_t>(kind));
            w.write_bytes(encode_plane(a->data, kind, format));
            length.patch();
        }

        void write_pattern(encode_context& ctx, const pattern& p) {
            auto& w = ctx.w;
            const auto& format = ctx.format;

            format.write_values(w, PATTERN_VERSION, static_cast<std::uint32_t>(p.mode), p.vertical, p.horizontal);
            format.write_unicode(w, p.name);
            write_pascal_string(w, p.id, 1);
            if (p.mode == image_mode::indexed) {
                THROW_ENCODE_IF(p.color_table.size() != COLOR_TABLE_SIZE, "Indexed pattern colour table has ",
                                p.color_table.size(), " bytes, expected ", COLOR_TABLE_SIZE);
                w.write_bytes(p.color_table);
            }

            format.write(w, VMAL_VERSION);
            size_placeholder vmal_length(w, format.get_byte_order(), 4);
            write_rect(w, format, p.rect);
            const std::size_t channel_count = std::max<std::size_t>(p.channels.size(), 2) - 2;
            THROW_ENCODE_IF(channel_count > std::numeric_limits<std::uint32_t>::max(), "Too many pattern channels");
            format.write(w, static_cast<std::uint32_t>(channel_count));
            static const std::optional<virtual_memory_array> absent;
            for (std::size_t i = 0; i < channel_count + 2; i++) {
                write_array(ctx, i < p.channels.size() ? p.channels[i] : absent);
            }
            vmal_length.patch();
        }
    }

    structure read_pattern_block(decode_context& ctx, const fourcc& key, std::uint64_t size) {
        auto& r = ctx.r;
        const std::uint64_t end = r.tell() + size;
        pattern_block block;
        block.key = key;

        while (r.tell() + 4 <= end) {
            auto length = ctx.format.read<std::uint32_t>(r);
            const std::uint64_t start = r.tell();
            THROW_DECODE_IF(start + length > end, "Pattern of ", length, " bytes at offset ", start,
                            " runs past its record");
            if (length == 0) {
                break;
            }
            block.patterns.push_back(read_pattern(ctx));
            const std::uint64_t padded = (static_cast<std::uint64_t>(length) + 3) / 4 * 4;
            r.seek(std::min(start + padded, end), reader_base::set);
        }
        return block;
    }

    void write_leaf(encode_context& ctx, const pattern_block& block) {
        auto& w = ctx.w;
        for (const auto& p : block.patterns) {
            size_placeholder length(w, ctx.format.get_byte_order(), 4);
            write_pattern(ctx, p);
            length.patch();
            w.pad(length.payload_start(), 4);
        }
    }

} // namespace psd::detail
