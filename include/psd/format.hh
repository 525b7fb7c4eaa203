/**
 * @file format.hh
 * @brief Format variant governing byte order and size field widths
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <ostream>

#include <psd/export_psd.h>
#include <psd/byte_order.hh>
#include <psd/fourcc.hh>
#include <psd/io.hh>

namespace psd {

    /**
     * @enum text_encoding
     * @brief Encoding of unicode strings inside tagged blocks
     */
    enum class text_encoding {
        utf16_be,
        utf16_le
    };

    /**
     * @class psd_format
     * @brief One of the four format variants of a tagged block tree
     *
     * The variant determines the byte order of every structural integer and
     * whether size fields are 4 or 8 bytes wide. Every structure of a decoded
     * tree was produced under a single variant and is re-encoded under one.
     *
     * Sample data of channels and patterns is not governed by the variant:
     * it is big-endian on the wire in all cases.
     */
    class PSD_EXPORT psd_format {
    public:
        enum class variant {
            be32, ///< '8BIM'
            le32, ///< 'MIB8'
            be64, ///< '8B64'
            le64  ///< '46B8'
        };

        constexpr psd_format() = default;
        constexpr explicit psd_format(variant v) : m_variant(v) {}

        /**
         * @brief Detect the variant from an on-wire signature
         * @throws format_error if the signature is not one of the four variants
         */
        static psd_format from_signature(const fourcc& signature);

        /**
         * @brief Check whether four bytes are one of the variant signatures
         */
        static bool is_signature(const fourcc& signature);

        [[nodiscard]] constexpr variant kind() const { return m_variant; }

        /**
         * @brief The signature as it appears on the wire
         */
        [[nodiscard]] fourcc signature() const;

        [[nodiscard]] constexpr byte_order get_byte_order() const {
            return (m_variant == variant::be32 || m_variant == variant::be64) ? byte_order::big
                                                                              : byte_order::little;
        }

        [[nodiscard]] constexpr bool is_64bit() const {
            return m_variant == variant::be64 || m_variant == variant::le64;
        }

        /**
         * @brief Width of plain length fields (channel data lengths)
         * @return 8 under the 64-bit variants, 4 otherwise
         */
        [[nodiscard]] constexpr std::size_t size_field_width() const {
            return is_64bit() ? 8 : 4;
        }

        /**
         * @brief Width of the size field of a tagged record
         * @param key Record key
         * @return 8 for keys of the large-record allow-list under the 64-bit variants, 4 otherwise
         */
        [[nodiscard]] std::size_t size_field_width(const fourcc& key) const;

        /**
         * @brief Width of the per scanline counts of RLE compressed planes
         */
        [[nodiscard]] constexpr std::size_t count_field_width() const {
            return is_64bit() ? 4 : 2;
        }

        [[nodiscard]] constexpr text_encoding string_encoding() const {
            return get_byte_order() == byte_order::big ? text_encoding::utf16_be : text_encoding::utf16_le;
        }

        [[nodiscard]] std::string name() const;

        // Primitive pack/unpack in the variant's byte order
        template<typename T>
        T read(reader_base& r) const {
            return r.template read<T>(get_byte_order());
        }

        template<typename T, std::size_t N>
        std::array<T, N> read_array(reader_base& r) const {
            std::array<T, N> values;
            for (auto& v : values) {
                v = read<T>(r);
            }
            return values;
        }

        template<typename T>
        void write(writer_base& w, T value) const {
            w.write(value, get_byte_order());
        }

        template<typename... T>
        void write_values(writer_base& w, T... values) const {
            (write(w, values), ...);
        }

        // Size fields
        std::uint64_t read_size(reader_base& r) const;
        std::uint64_t read_size(reader_base& r, const fourcc& key) const;
        void write_size(writer_base& w, std::uint64_t value) const;
        void write_size(writer_base& w, std::uint64_t value, const fourcc& key) const;

        // Keys are stored byte-reversed by the little-endian variants
        fourcc read_key(reader_base& r) const;
        void write_key(writer_base& w, const fourcc& key) const;

        // Unicode string: 4 byte count of UTF-16 code units, then the units
        std::u16string read_unicode(reader_base& r) const;
        void write_unicode(writer_base& w, const std::u16string& value) const;

        bool operator==(const psd_format& other) const { return m_variant == other.m_variant; }
        bool operator!=(const psd_format& other) const { return m_variant != other.m_variant; }

        friend PSD_EXPORT std::ostream& operator<<(std::ostream& os, const psd_format& f);

    private:
        variant m_variant = variant::be32;
    };

    // Pascal string: length byte followed by at most 255 bytes
    PSD_EXPORT std::string read_pascal_string(reader_base& r, std::size_t alignment);
    PSD_EXPORT std::size_t write_pascal_string(writer_base& w, const std::string& value, std::size_t alignment);

} // namespace psd
