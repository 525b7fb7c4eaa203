//
// Created by igor on 03/09/2025.
//

#include <psd/format.hh>
#include <psd/keys.hh>
#include <psd/exceptions.hh>

#include <algorithm>
#include <limits>

namespace psd {

    namespace {
        constexpr auto BE32 = "8BIM"_4cc;
        constexpr auto LE32 = "MIB8"_4cc;
        constexpr auto BE64 = "8B64"_4cc;
        constexpr auto LE64 = "46B8"_4cc;

        // Records whose size field widens to 8 bytes in the 64-bit variants
        constexpr std::array<fourcc, 13> large_record_keys = {
            keys::USER_MASK,
            keys::LAYER_16,
            keys::LAYER_32,
            keys::LAYER,
            keys::SAVING_MERGED_TRANSPARENCY_16,
            keys::SAVING_MERGED_TRANSPARENCY_32,
            keys::SAVING_MERGED_TRANSPARENCY,
            keys::ALPHA,
            keys::FILTER_MASK,
            keys::LINKED_LAYER_2,
            keys::FILTER_EFFECTS_2,
            keys::FILTER_EFFECTS,
            keys::PIXEL_SOURCE_DATA_CC15
        };
    }

    psd_format psd_format::from_signature(const fourcc& signature) {
        if (signature == BE32) {
            return psd_format(variant::be32);
        }
        if (signature == LE32) {
            return psd_format(variant::le32);
        }
        if (signature == BE64) {
            return psd_format(variant::be64);
        }
        if (signature == LE64) {
            return psd_format(variant::le64);
        }
        THROW_FORMAT("Unrecognized format signature ", signature);
    }

    bool psd_format::is_signature(const fourcc& signature) {
        return signature == BE32 || signature == LE32 || signature == BE64 || signature == LE64;
    }

    fourcc psd_format::signature() const {
        switch (m_variant) {
            case variant::be32:
                return BE32;
            case variant::le32:
                return LE32;
            case variant::be64:
                return BE64;
            case variant::le64:
                return LE64;
        }
        return BE32;
    }

    std::string psd_format::name() const {
        return signature().to_string();
    }

    std::size_t psd_format::size_field_width(const fourcc& key) const {
        if (!is_64bit()) {
            return 4;
        }
        return std::find(large_record_keys.begin(), large_record_keys.end(), key) != large_record_keys.end() ? 8 : 4;
    }

    std::uint64_t psd_format::read_size(reader_base& r) const {
        if (is_64bit()) {
            return read<std::uint64_t>(r);
        }
        return read<std::uint32_t>(r);
    }

    std::uint64_t psd_format::read_size(reader_base& r, const fourcc& key) const {
        if (size_field_width(key) == 8) {
            return read<std::uint64_t>(r);
        }
        return read<std::uint32_t>(r);
    }

    void psd_format::write_size(writer_base& w, std::uint64_t value) const {
        if (is_64bit()) {
            write<std::uint64_t>(w, value);
            return;
        }
        THROW_ENCODE_IF(value > std::numeric_limits<std::uint32_t>::max(),
                        "Size ", value, " does not fit the ", name(), " size field");
        write<std::uint32_t>(w, static_cast<std::uint32_t>(value));
    }

    void psd_format::write_size(writer_base& w, std::uint64_t value, const fourcc& key) const {
        if (size_field_width(key) == 8) {
            write<std::uint64_t>(w, value);
            return;
        }
        THROW_ENCODE_IF(value > std::numeric_limits<std::uint32_t>::max(),
                        "Size ", value, " of ", key, " does not fit a 4 byte size field");
        write<std::uint32_t>(w, static_cast<std::uint32_t>(value));
    }

    fourcc psd_format::read_key(reader_base& r) const {
        fourcc key = r.read_fourcc();
        return get_byte_order() == byte_order::big ? key : key.reversed();
    }

    void psd_format::write_key(writer_base& w, const fourcc& key) const {
        w.write_fourcc(get_byte_order() == byte_order::big ? key : key.reversed());
    }

    std::u16string psd_format::read_unicode(reader_base& r) const {
        auto count = read<std::uint32_t>(r);
        THROW_DECODE_IF(count > r.remaining() / 2, "Unicode string of ", count,
                        " code units exceeds the remaining data at offset ", r.tell());
        std::u16string value(count, u'\0');
        for (auto& unit : value) {
            unit = static_cast<char16_t>(read<std::uint16_t>(r));
        }
        return value;
    }

    void psd_format::write_unicode(writer_base& w, const std::u16string& value) const {
        THROW_ENCODE_IF(value.size() > std::numeric_limits<std::uint32_t>::max(), "Unicode string too long");
        write<std::uint32_t>(w, static_cast<std::uint32_t>(value.size()));
        for (char16_t unit : value) {
            write<std::uint16_t>(w, static_cast<std::uint16_t>(unit));
        }
    }

    std::ostream& operator<<(std::ostream& os, const psd_format& f) {
        return os << "<psd_format " << f.name() << ">";
    }

    std::string read_pascal_string(reader_base& r, std::size_t alignment) {
        auto length = r.read<std::uint8_t>(byte_order::big);
        auto data = r.read_exact(length);
        std::string value(reinterpret_cast<const char*>(data.data()), data.size());
        if (alignment > 1) {
            std::size_t total = length + 1u;
            r.skip((alignment - total % alignment) % alignment);
        }
        return value;
    }

    std::size_t write_pascal_string(writer_base& w, const std::string& value, std::size_t alignment) {
        std::size_t length = std::min<std::size_t>(value.size(), 255);
        std::uint64_t start = w.tell();
        w.write(static_cast<std::uint8_t>(length), byte_order::big);
        w.write(value.data(), length);
        w.pad(start, alignment);
        return static_cast<std::size_t>(w.tell() - start);
    }

} // namespace psd
