//
// Created by igor on 07/09/2025.
//

#include "registry.hh"

#include <psd/exceptions.hh>

#include <algorithm>
#include <cstdlib>
#include <limits>

namespace psd {

    layer::layer() = default;
    layer::layer(const layer& other) = default;
    layer::layer(layer&& other) noexcept = default;
    layer& layer::operator=(const layer& other) = default;
    layer& layer::operator=(layer&& other) noexcept = default;
    layer::~layer() = default;

    const channel* layer::find_channel(std::int16_t id) const {
        auto it = std::find_if(channels.begin(), channels.end(),
                               [id](const channel& c) { return c.id == id; });
        return it != channels.end() ? &*it : nullptr;
    }

    rectangle layer::channel_rect(std::int16_t id) const {
        if (id == channel_ids::USER_LAYER_MASK) {
            return mask.rect.value_or(rectangle{});
        }
        if (id == channel_ids::REAL_USER_LAYER_MASK) {
            if (mask.real) {
                return mask.real->rect;
            }
            return mask.rect.value_or(rectangle{});
        }
        return rect;
    }

    bool layer::operator==(const layer& o) const {
        return rect == o.rect &&
               channels == o.channels &&
               mask == o.mask &&
               opacity == o.opacity &&
               blend_mode == o.blend_mode &&
               clip == o.clip &&
               flags == o.flags &&
               blending_ranges == o.blending_ranges &&
               name == o.name &&
               info == o.info;
    }

    bool is_layer_list_key(const fourcc& key) {
        return key == keys::LAYER || key == keys::LAYER_16 || key == keys::LAYER_32;
    }

    sample_type layer_list_sample_type(const fourcc& key) {
        if (key == keys::LAYER) {
            return sample_type::u8;
        }
        if (key == keys::LAYER_16) {
            return sample_type::u16;
        }
        if (key == keys::LAYER_32) {
            return sample_type::f32;
        }
        THROW_DECODE("Key ", key, " is not a layer list key");
    }

    sample_type layer_list::type() const {
        return layer_list_sample_type(key);
    }

    rectangle layer_list::bounds() const {
        rectangle result;
        auto extend = [&result](const rectangle& rc) {
            result.bottom = std::max(result.bottom, rc.bottom);
            result.right = std::max(result.right, rc.right);
        };
        for (const auto& l : layers) {
            extend(l.rect);
            if (l.mask.rect) {
                extend(*l.mask.rect);
            }
            if (l.mask.real) {
                extend(l.mask.real->rect);
            }
        }
        return result;
    }

    bool layer_list::operator==(const layer_list& o) const {
        return key == o.key && has_transparency == o.has_transparency && layers == o.layers;
    }

    namespace detail {
        namespace {
            struct channel_header {
                std::int16_t id;
                std::uint64_t length;
            };

            layer read_layer_record(decode_context& ctx, std::vector<channel_header>& headers) {
                auto& r = ctx.r;
                const auto& format = ctx.format;
                layer l;

                auto rc = format.read_array<std::int32_t, 4>(r);
                l.rect = {rc[0], rc[1], rc[2], rc[3]};

                auto channel_count = format.read<std::uint16_t>(r);
                headers.reserve(channel_count);
                for (std::uint16_t i = 0; i < channel_count; i++) {
                    channel_header h{};
                    h.id = format.read<std::int16_t>(r);
                    h.length = format.read_size(r);
                    headers.push_back(h);
                }

                auto signature = r.read_fourcc();
                THROW_DECODE_IF(signature != format.signature(), "Layer blend signature ", signature,
                                " does not match format ", format.name(), " at offset ", r.tell() - 4);
                l.blend_mode = format.read_key(r);
                l.opacity = format.read<std::uint8_t>(r);
                l.clip = static_cast<clipping>(format.read<std::uint8_t>(r));
                l.flags = format.read<std::uint8_t>(r);
                r.skip(1); // filler

                auto extra_size = format.read<std::uint32_t>(r);
                const std::uint64_t extra_end = r.tell() + extra_size;

                l.mask = read_layer_mask(r, format);

                auto ranges_size = format.read<std::uint32_t>(r);
                THROW_DECODE_IF(ranges_size % 4 != 0, "Blending ranges of ", ranges_size,
                                " bytes are not a multiple of 4");
                THROW_DECODE_IF(r.tell() + ranges_size > extra_end, "Blending ranges run past the layer extra data");
                for (std::uint32_t i = 0; i < ranges_size / 4; i++) {
                    l.blending_ranges.push_back(format.read<std::int32_t>(r));
                }

                l.name = read_pascal_string(r, 4);

                if (r.tell() < extra_end) {
                    decode_context nested{r, format, ctx.options, ctx.depth + 1};
                    l.info = read_tagged_list(nested, extra_end, 2);
                }
                r.seek(extra_end, reader_base::set);
                return l;
            }

            channel read_channel_image(decode_context& ctx, const layer& l, const channel_header& h, sample_type type) {
                auto& r = ctx.r;
                auto shape = l.channel_rect(h.id);

                channel c;
                c.id = h.id;
                if (h.length == 0) {
                    THROW_DECODE_UNLESS(shape.empty(), "Channel ", h.id, " of a non empty layer has no image data");
                    c.data = plane(shape.rows(), shape.cols(), type);
                    return c;
                }
                THROW_DECODE_IF(h.length < 2, "Channel ", h.id, " image data of ", h.length, " bytes is truncated");

                auto code = ctx.format.read<std::uint16_t>(r);
                THROW_DECODE_UNLESS(is_valid_compression(code), "Invalid compression kind ", code,
                                    " for channel ", h.id, " at offset ", r.tell() - 2);
                c.kind = static_cast<compression>(code);

                auto payload = r.read_exact(static_cast<std::size_t>(h.length - 2));
                c.data = decode_plane(payload, c.kind, shape.rows(), shape.cols(), type, ctx.format);
                return c;
            }

            // Compression code followed by the encoded plane
            std::vector<std::byte> encode_channel(encode_context& ctx, const layer& l, const channel& c,
                                                  sample_type type) {
                auto shape = l.channel_rect(c.id);
                THROW_ENCODE_IF(c.data.type() != type, "Channel ", c.id, " samples do not match the layer list type");
                THROW_ENCODE_IF(c.data.rows() != shape.rows() || c.data.cols() != shape.cols(),
                                "Channel ", c.id, " plane of ", c.data.rows(), "x", c.data.cols(),
                                " does not match its rectangle ", shape);

                auto kind = ctx.options.compression_override.value_or(c.kind);
                std::vector<std::byte> block;
                memory_writer bw(block);
                ctx.format.write(bw, static_cast<std::uint16_t>(kind));
                bw.write_bytes(encode_plane(c.data, kind, ctx.format));
                return block;
            }

            void write_layer_record(encode_context& ctx, const layer& l,
                                    const std::vector<std::vector<std::byte>>& blocks) {
                auto& w = ctx.w;
                const auto& format = ctx.format;

                format.write_values(w, l.rect.top, l.rect.left, l.rect.bottom, l.rect.right);
                THROW_ENCODE_IF(l.channels.size() > std::numeric_limits<std::uint16_t>::max(), "Too many channels");
                format.write(w, static_cast<std::uint16_t>(l.channels.size()));
                for (std::size_t i = 0; i < l.channels.size(); i++) {
                    format.write(w, l.channels[i].id);
                    format.write_size(w, blocks[i].size());
                }

                w.write_fourcc(format.signature());
                format.write_key(w, l.blend_mode);
                format.write_values(w, l.opacity, static_cast<std::uint8_t>(l.clip), l.flags);
                w.write_zeros(1);

                size_placeholder extra(w, format.get_byte_order(), 4);
                write_layer_mask(w, format, l.mask);

                size_placeholder ranges(w, format.get_byte_order(), 4);
                for (auto value : l.blending_ranges) {
                    format.write(w, value);
                }
                ranges.patch();

                write_pascal_string(w, l.name, 4);
                write_tagged_list(ctx, l.info, 2);
                extra.patch();
            }
        }

        structure read_layer_list(decode_context& ctx, const fourcc& key, std::uint64_t) {
            auto& r = ctx.r;
            layer_list list;
            list.key = key;
            const auto type = list.type();

            auto count = ctx.format.read<std::int16_t>(r);
            list.has_transparency = count < 0;
            const int layer_count = std::abs(static_cast<int>(count));

            std::vector<std::vector<channel_header>> headers(static_cast<std::size_t>(layer_count));
            list.layers.reserve(headers.size());
            for (auto& layer_headers : headers) {
                list.layers.push_back(read_layer_record(ctx, layer_headers));
            }

            // Image data of all channels follows the layer records
            for (std::size_t i = 0; i < list.layers.size(); i++) {
                auto& l = list.layers[i];
                for (const auto& h : headers[i]) {
                    const std::uint64_t start = r.tell();
                    l.channels.push_back(read_channel_image(ctx, l, h, type));
                    r.seek(start + h.length, reader_base::set);
                }
            }
            return list;
        }

        void write_leaf(encode_context& ctx, const layer_list& list) {
            auto& w = ctx.w;
            const std::uint64_t start = w.tell();
            const auto type = layer_list_sample_type(list.key);

            THROW_ENCODE_IF(list.layers.size() > static_cast<std::size_t>(std::numeric_limits<std::int16_t>::max()),
                            "Too many layers: ", list.layers.size());
            auto count = static_cast<std::int16_t>(list.layers.size());
            ctx.format.write(w, static_cast<std::int16_t>(list.has_transparency ? -count : count));

            std::vector<std::vector<std::vector<std::byte>>> blocks;
            blocks.reserve(list.layers.size());
            for (const auto& l : list.layers) {
                auto& layer_blocks = blocks.emplace_back();
                for (const auto& c : l.channels) {
                    layer_blocks.push_back(encode_channel(ctx, l, c, type));
                }
                write_layer_record(ctx, l, layer_blocks);
            }

            for (const auto& layer_blocks : blocks) {
                for (const auto& block : layer_blocks) {
                    w.write_bytes(block);
                }
            }
            w.pad(start, 2);
        }
    } // namespace detail

} // namespace psd
