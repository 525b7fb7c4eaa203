//
// Created by igor on 06/09/2025.
//

#include <psd/tagged_list.hh>
#include <psd/exceptions.hh>

#include "registry.hh"

#include <algorithm>
#include <string>
#include <type_traits>
#include <variant>

namespace psd {
    namespace detail {
        namespace {
            std::uint64_t round_up(std::uint64_t value, std::size_t alignment) {
                if (alignment <= 1) {
                    return value;
                }
                return (value + alignment - 1) / alignment * alignment;
            }
        }

        std::vector<structure> read_tagged_list(decode_context& ctx, std::uint64_t end_offset, std::size_t alignment) {
            THROW_DECODE_IF(ctx.depth > ctx.options.max_depth,
                            "Tagged lists nested deeper than ", ctx.options.max_depth, " levels");

            auto& r = ctx.r;
            const auto signature = ctx.format.signature();
            std::vector<structure> result;

            while (r.tell() + 4 <= end_offset) {
                fourcc sig;
                if (!r.peek_fourcc(sig) || sig != signature) {
                    break;
                }

                const std::uint64_t record_offset = r.tell();
                r.skip(4);
                const fourcc key = ctx.format.read_key(r);
                const std::uint64_t size = ctx.format.read_size(r, key);
                const std::uint64_t start = r.tell();
                const std::uint64_t available = start < end_offset ? end_offset - start : 0;
                const bool overrun = size > available;

                if (overrun) {
                    THROW_DECODE_IF(ctx.options.strict_sizes, "Record ", key, " at offset ", record_offset,
                                    " declares ", size, " bytes, only ", available, " remain in its list");
                    warn(ctx.options.on_warning, record_offset, "size_overrun",
                         build_error_msg("Record ", key, " declares ", size, " bytes, only ", available,
                                         " remain in its list"));
                }

                if (size == 0) {
                    result.emplace_back(empty_structure{key});
                } else if (auto decoder = find_decoder(key)) {
                    result.push_back(decoder(ctx, key, size));
                } else if (ctx.options.preserve_unknown) {
                    auto length = static_cast<std::size_t>(std::min(size, available));
                    result.emplace_back(unknown_structure{key, ctx.format, r.read_exact(length)});
                } else {
                    warn(ctx.options.on_warning, record_offset, "skipped_unknown",
                         build_error_msg("Skipped record ", key, " of ", size, " bytes"));
                }

                if (overrun) {
                    r.seek(end_offset, reader_base::set);
                    break;
                }
                r.seek(std::min(start + round_up(size, alignment), end_offset), reader_base::set);
            }
            return result;
        }

        void write_payload(encode_context& ctx, const structure& s) {
            std::visit([&ctx](const auto& value) {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, unknown_structure>) {
                    ctx.w.write_bytes(value.data);
                } else if constexpr (std::is_same_v<T, empty_structure>) {
                    // no payload
                } else {
                    write_leaf(ctx, value);
                }
            }, s.value());
        }

        void write_tagged_list(encode_context& ctx, const std::vector<structure>& structures, std::size_t alignment) {
            auto& w = ctx.w;
            const auto signature = ctx.format.signature();

            for (const auto& s : structures) {
                if (const auto* unknown = s.get_if<unknown_structure>()) {
                    if (!ctx.options.emit_unknown) {
                        continue;
                    }
                    if (unknown->format != ctx.format) {
                        warn(ctx.options.on_warning, w.tell(), "foreign_unknown",
                             build_error_msg("Dropped record ", unknown->key, " read as ", unknown->format.name(),
                                             ", cannot write it as ", ctx.format.name()));
                        continue;
                    }
                }

                const fourcc key = s.key();
                w.write_fourcc(signature);
                ctx.format.write_key(w, key);

                size_placeholder size(w, ctx.format.get_byte_order(), ctx.format.size_field_width(key));
                write_payload(ctx, s);
                size.patch();
                w.pad(size.payload_start(), alignment);
            }
        }
    } // namespace detail

    std::vector<structure> read_structures(reader_base& r, const psd_format& format, std::uint64_t end_offset,
                                           const read_options& options, std::size_t alignment) {
        detail::decode_context ctx{r, format, options, 0};
        return detail::read_tagged_list(ctx, end_offset, alignment);
    }

    std::uint64_t write_structures(writer_base& w, const psd_format& format, const write_options& options,
                                   std::size_t alignment, const std::vector<structure>& structures) {
        const std::uint64_t start = w.tell();
        detail::encode_context ctx{w, format, options};
        detail::write_tagged_list(ctx, structures, alignment);
        return w.tell() - start;
    }

    bool has_decoder(const fourcc& key) {
        return detail::find_decoder(key) != nullptr;
    }

} // namespace psd
