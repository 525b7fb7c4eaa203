//
// Created by igor on 08/09/2025.
//

#include <psd/image_resources.hh>
#include <psd/format.hh>
#include <psd/exceptions.hh>

#include <algorithm>
#include <istream>
#include <limits>
#include <type_traits>

namespace psd {

    namespace {
        constexpr auto RESOURCE_SIGNATURE = "8BIM"_4cc;
        // signature, id, empty name and length; the least a block of another signature must hold
        constexpr std::uint64_t BLOCK_HEADER_SIZE = 12;
        constexpr std::uint32_t THUMBNAIL_HEADER_SIZE = 28;

        // Resource blocks use the big-endian layout of the '8BIM' variant
        constexpr psd_format resource_format{psd_format::variant::be32};

        resource_payload read_payload(std::uint16_t id, const std::vector<std::byte>& data) {
            memory_reader r(data);
            const auto& f = resource_format;

            switch (id) {
                case static_cast<std::uint16_t>(resource_id::alpha_names_pascal): {
                    resource_pascal_strings v;
                    while (r.remaining() > 0) {
                        v.values.push_back(read_pascal_string(r, 1));
                    }
                    return v;
                }
                case static_cast<std::uint16_t>(resource_id::caption_pascal):
                case static_cast<std::uint16_t>(resource_id::clipping_path_name):
                    return resource_pascal_string{read_pascal_string(r, 1)};
                case static_cast<std::uint16_t>(resource_id::background_color): {
                    resource_color v;
                    v.value.space = static_cast<color_space>(f.read<std::int16_t>(r));
                    v.value.components = f.read_array<std::uint16_t, 4>(r);
                    return v;
                }
                case static_cast<std::uint16_t>(resource_id::thumbnail_resource_ps4):
                case static_cast<std::uint16_t>(resource_id::thumbnail_resource): {
                    resource_thumbnail v;
                    v.format = f.read<std::uint32_t>(r);
                    v.width = f.read<std::uint32_t>(r);
                    v.height = f.read<std::uint32_t>(r);
                    v.width_bytes = f.read<std::uint32_t>(r);
                    v.total_size = f.read<std::uint32_t>(r);
                    r.skip(4); // compressed size
                    v.bits_per_pixel = f.read<std::uint16_t>(r);
                    v.planes = f.read<std::uint16_t>(r);
                    v.data = r.read_exact(static_cast<std::size_t>(r.remaining()));
                    return v;
                }
                case static_cast<std::uint16_t>(resource_id::unicode_alpha_names): {
                    resource_unicode_strings v;
                    while (r.remaining() >= 4) {
                        v.values.push_back(f.read_unicode(r));
                    }
                    return v;
                }
                case static_cast<std::uint16_t>(resource_id::version_info): {
                    resource_version_info v;
                    v.version = f.read<std::uint32_t>(r);
                    v.has_real_merged_data = f.read<std::uint8_t>(r) != 0;
                    v.writer_name = f.read_unicode(r);
                    v.reader_name = f.read_unicode(r);
                    v.file_version = f.read<std::uint32_t>(r);
                    return v;
                }
                case static_cast<std::uint16_t>(resource_id::workflow_url):
                case static_cast<std::uint16_t>(resource_id::auto_save_file_path):
                case static_cast<std::uint16_t>(resource_id::auto_save_format):
                    return resource_unicode_string{f.read_unicode(r)};
                default:
                    return resource_bytes{data};
            }
        }

        void write_payload(writer_base& w, const resource_payload& payload) {
            const auto& f = resource_format;
            std::visit([&w, &f](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, resource_unicode_string>) {
                    f.write_unicode(w, v.value);
                } else if constexpr (std::is_same_v<T, resource_unicode_strings>) {
                    for (const auto& s : v.values) {
                        f.write_unicode(w, s);
                    }
                } else if constexpr (std::is_same_v<T, resource_pascal_string>) {
                    write_pascal_string(w, v.value, 1);
                } else if constexpr (std::is_same_v<T, resource_pascal_strings>) {
                    for (const auto& s : v.values) {
                        write_pascal_string(w, s, 1);
                    }
                } else if constexpr (std::is_same_v<T, resource_color>) {
                    f.write(w, static_cast<std::int16_t>(v.value.space));
                    for (auto component : v.value.components) {
                        f.write(w, component);
                    }
                } else if constexpr (std::is_same_v<T, resource_version_info>) {
                    f.write(w, v.version);
                    f.write<std::uint8_t>(w, v.has_real_merged_data ? 1 : 0);
                    f.write_unicode(w, v.writer_name);
                    f.write_unicode(w, v.reader_name);
                    f.write(w, v.file_version);
                } else if constexpr (std::is_same_v<T, resource_thumbnail>) {
                    THROW_ENCODE_IF(v.data.size() > std::numeric_limits<std::uint32_t>::max() - THUMBNAIL_HEADER_SIZE,
                                    "Thumbnail data too large");
                    f.write_values(w, v.format, v.width, v.height, v.width_bytes, v.total_size,
                                   static_cast<std::uint32_t>(v.data.size()), v.bits_per_pixel, v.planes);
                    w.write_bytes(v.data);
                } else {
                    w.write_bytes(v.data);
                }
            }, payload);
        }
    }

    resource_id resource_kind(std::uint16_t id) {
        if (id >= 2000 && id <= 2997) {
            return resource_id::path_info;
        }
        if (id >= 4000 && id <= 4999) {
            return resource_id::plugin_resource;
        }
        return static_cast<resource_id>(id);
    }

    image_resources::image_resources(std::vector<resource_block> blocks, std::string name)
        : m_blocks(std::move(blocks)), m_name(std::move(name)) {}

    image_resources image_resources::from_bytes(const std::byte* data, std::size_t size,
                                                const read_options& options, std::string name) {
        memory_reader r(data, size);
        std::vector<resource_block> blocks;

        while (r.remaining() >= 4) {
            fourcc signature;
            const bool is_block = r.peek_fourcc(signature) &&
                                  (signature == RESOURCE_SIGNATURE ||
                                   (signature.is_printable() && r.remaining() >= BLOCK_HEADER_SIZE));
            if (!is_block) {
                warn(options.on_warning, r.tell(), "skipped_unknown",
                     build_error_msg("Skipped ", r.remaining(), " bytes after the last resource block"));
                break;
            }
            r.skip(4);

            resource_block block;
            block.signature = signature;
            block.id = r.read<std::uint16_t>(byte_order::big);
            block.name = read_pascal_string(r, 2);
            auto length = r.read<std::uint32_t>(byte_order::big);
            auto bytes = r.read_exact(length);
            if (length % 2 != 0 && r.remaining() > 0) {
                r.skip(1);
            }
            if (signature == RESOURCE_SIGNATURE) {
                block.payload = read_payload(block.id, bytes);
            } else {
                block.payload = resource_bytes{std::move(bytes)};
            }
            blocks.push_back(std::move(block));
        }
        return image_resources(std::move(blocks), std::move(name));
    }

    image_resources image_resources::from_bytes(const std::vector<std::byte>& data,
                                                const read_options& options, std::string name) {
        return from_bytes(data.data(), data.size(), options, std::move(name));
    }

    image_resources image_resources::from_stream(std::istream& is, const read_options& options, std::string name) {
        reader r(is);
        auto data = r.read_exact(static_cast<std::size_t>(r.remaining()));
        return from_bytes(data, options, std::move(name));
    }

    std::vector<std::byte> image_resources::to_bytes() const {
        std::vector<std::byte> result;
        memory_writer w(result);
        write(w);
        return result;
    }

    std::uint64_t image_resources::write(writer_base& w) const {
        const std::uint64_t start = w.tell();
        for (const auto& block : m_blocks) {
            w.write_fourcc(block.signature);
            w.write(block.id, byte_order::big);
            write_pascal_string(w, block.name, 2);
            size_placeholder size(w, byte_order::big, 4);
            write_payload(w, block.payload);
            size.patch();
            w.pad(size.payload_start(), 2);
        }
        return w.tell() - start;
    }

    tiff_tag image_resources::tifftag() const {
        tiff_tag tag;
        tag.code = TIFF_TAG;
        tag.value = to_bytes();
        tag.count = tag.value.size();
        return tag;
    }

    const resource_block* image_resources::find(std::uint16_t id) const {
        auto it = std::find_if(m_blocks.begin(), m_blocks.end(),
                               [id](const resource_block& b) { return b.id == id; });
        return it != m_blocks.end() ? &*it : nullptr;
    }

    const resource_block* image_resources::find(resource_id id) const {
        auto it = std::find_if(m_blocks.begin(), m_blocks.end(),
                               [id](const resource_block& b) { return b.kind() == id; });
        return it != m_blocks.end() ? &*it : nullptr;
    }

} // namespace psd
