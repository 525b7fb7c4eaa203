//
// Created by igor on 08/09/2025.
//

#include <psd/image_source_data.hh>
#include <psd/tagged_list.hh>
#include <psd/exceptions.hh>
#include <psd/keys.hh>

#include <algorithm>
#include <cstring>
#include <istream>

namespace psd {

    namespace {
        template<typename Vector>
        auto find_layer_list(Vector& structures) {
            return std::find_if(structures.begin(), structures.end(), [](const structure& s) {
                return s.template is<layer_list>();
            });
        }

        // The document always carries a layer list followed by a user mask
        void add_defaults(std::vector<structure>& structures, std::uint64_t offset, const warning_handler& on_warning) {
            auto layers = find_layer_list(structures);
            if (layers == structures.end()) {
                warn(on_warning, offset, "missing_structure", "No layer list, using an empty one");
                layers = structures.insert(structures.begin(), structure(layer_list{}));
            }
            if (!find_structure(structures, keys::USER_MASK)) {
                warn(on_warning, offset, "missing_structure", "No user mask, using the default one");
                structures.insert(layers + 1, structure(user_mask{}));
            }
        }
    }

    image_source_data::image_source_data(psd_format format, std::vector<structure> structures, std::string name)
        : m_format(format), m_structures(std::move(structures)), m_name(std::move(name)) {}

    image_source_data image_source_data::from_bytes(const std::byte* data, std::size_t size,
                                                    const read_options& options, std::string name) {
        THROW_FORMAT_IF(size < SIGNATURE.size() || std::memcmp(data, SIGNATURE.data(), SIGNATURE.size()) != 0,
                        "Not an ImageSourceData block: missing '", SIGNATURE.substr(0, SIGNATURE.size() - 1), "'");

        memory_reader r(data, size);
        r.seek(SIGNATURE.size(), reader_base::set);
        if (r.remaining() == 0) {
            return {psd_format{}, {}, std::move(name)};
        }

        fourcc signature;
        THROW_FORMAT_UNLESS(r.peek_fourcc(signature), "ImageSourceData block too short for a record signature");
        auto format = psd_format::from_signature(signature);

        auto structures = read_structures(r, format, r.size(), options, 4);
        add_defaults(structures, r.tell(), options.on_warning);
        return {format, std::move(structures), std::move(name)};
    }

    image_source_data image_source_data::from_bytes(const std::vector<std::byte>& data,
                                                    const read_options& options, std::string name) {
        return from_bytes(data.data(), data.size(), options, std::move(name));
    }

    image_source_data image_source_data::from_stream(std::istream& is, const read_options& options, std::string name) {
        reader r(is);
        auto data = r.read_exact(static_cast<std::size_t>(r.remaining()));
        return from_bytes(data, options, std::move(name));
    }

    std::vector<std::byte> image_source_data::to_bytes(const write_options& options) const {
        return to_bytes(m_format, options);
    }

    std::vector<std::byte> image_source_data::to_bytes(const psd_format& format, const write_options& options) const {
        std::vector<std::byte> result;
        memory_writer w(result);
        write(w, format, options);
        return result;
    }

    std::uint64_t image_source_data::write(writer_base& w, const write_options& options) const {
        return write(w, m_format, options);
    }

    std::uint64_t image_source_data::write(writer_base& w, const psd_format& format, const write_options& options) const {
        const std::uint64_t start = w.tell();
        w.write(SIGNATURE.data(), SIGNATURE.size());
        write_structures(w, format, options, 4, m_structures);
        return w.tell() - start;
    }

    tiff_tag image_source_data::tifftag(const write_options& options) const {
        tiff_tag tag;
        tag.code = TIFF_TAG;
        tag.value = to_bytes(options);
        tag.count = tag.value.size();
        return tag;
    }

    const layer_list* image_source_data::layers() const {
        auto it = find_layer_list(m_structures);
        return it != m_structures.end() ? &it->as<layer_list>() : nullptr;
    }

    layer_list* image_source_data::layers() {
        auto it = find_layer_list(m_structures);
        return it != m_structures.end() ? &it->as<layer_list>() : nullptr;
    }

    const psd::user_mask* image_source_data::user_mask() const {
        const auto* s = find_structure(m_structures, keys::USER_MASK);
        return s ? s->get_if<psd::user_mask>() : nullptr;
    }

    psd::user_mask* image_source_data::user_mask() {
        auto* s = find_structure(m_structures, keys::USER_MASK);
        return s ? s->get_if<psd::user_mask>() : nullptr;
    }

} // namespace psd
