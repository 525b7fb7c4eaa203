/**
 * @file image_source_data.hh
 * @brief Layer and mask block stored in the ImageSourceData TIFF tag
 * @author Igor
 * @date 08/09/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <psd/export_psd.h>
#include <psd/format.hh>
#include <psd/io.hh>
#include <psd/options.hh>
#include <psd/structure.hh>
#include <psd/types.hh>

namespace psd {

    /**
     * @class image_source_data
     * @brief Decoded ImageSourceData blob
     *
     * The blob starts with a fixed literal, followed by a 4 byte aligned
     * tagged list running to the end of the blob. The format variant is
     * taken from the signature of the first record.
     *
     * Decoding guarantees a layer list and a user mask: when the blob has
     * none, empty defaults are inserted and a "missing_structure" warning is
     * reported.
     *
     * Equality compares the records only. The name and the format variant
     * do not take part.
     */
    class PSD_EXPORT image_source_data {
    public:
        static constexpr std::uint16_t TIFF_TAG = 37724;
        static constexpr std::string_view SIGNATURE{"Adobe Photoshop Document Data Block\0", 36};

        image_source_data() = default;
        image_source_data(psd_format format, std::vector<structure> structures, std::string name = {});

        /**
         * @brief Decode a blob
         * @param data Tag value
         * @param size Number of bytes
         * @param options Read options
         * @param name Display name (e.g. the source file)
         * @throws format_error if the literal or the format signature is wrong
         * @throws decode_error for malformed records
         */
        static image_source_data from_bytes(const std::byte* data, std::size_t size,
                                            const read_options& options = {}, std::string name = {});

        static image_source_data from_bytes(const std::vector<std::byte>& data,
                                            const read_options& options = {}, std::string name = {});

        /**
         * @brief Decode a blob from the current stream position to the end of the stream
         */
        static image_source_data from_stream(std::istream& is, const read_options& options = {},
                                             std::string name = {});

        /**
         * @brief Encode under the stored format variant
         */
        [[nodiscard]] std::vector<std::byte> to_bytes(const write_options& options = {}) const;

        /**
         * @brief Encode under another format variant
         *
         * Unknown records of the stored variant cannot be converted and are
         * dropped with a "foreign_unknown" warning.
         */
        [[nodiscard]] std::vector<std::byte> to_bytes(const psd_format& format, const write_options& options = {}) const;

        /**
         * @brief Write the blob to a seekable sink
         * @return Number of bytes written
         */
        std::uint64_t write(writer_base& w, const write_options& options = {}) const;
        std::uint64_t write(writer_base& w, const psd_format& format, const write_options& options = {}) const;

        /**
         * @brief Tag entry for a TIFF writer
         */
        [[nodiscard]] tiff_tag tifftag(const write_options& options = {}) const;

        [[nodiscard]] const psd_format& format() const { return m_format; }
        [[nodiscard]] const std::string& name() const { return m_name; }

        [[nodiscard]] const std::vector<structure>& structures() const { return m_structures; }
        [[nodiscard]] std::vector<structure>& structures() { return m_structures; }

        [[nodiscard]] bool empty() const { return m_structures.empty(); }

        /**
         * @brief First layer list record
         * @return nullptr if there is none
         */
        [[nodiscard]] const layer_list* layers() const;
        [[nodiscard]] layer_list* layers();

        /**
         * @brief User mask record
         * @return nullptr if there is none
         */
        [[nodiscard]] const psd::user_mask* user_mask() const;
        [[nodiscard]] psd::user_mask* user_mask();

        bool operator==(const image_source_data& other) const { return m_structures == other.m_structures; }
        bool operator!=(const image_source_data& other) const { return !(*this == other); }

    private:
        psd_format m_format;
        std::vector<structure> m_structures;
        std::string m_name;
    };

} // namespace psd
