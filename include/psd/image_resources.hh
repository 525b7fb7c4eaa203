/**
 * @file image_resources.hh
 * @brief Image resource blocks stored in the ImageResources TIFF tag
 * @author Igor
 * @date 08/09/2025
 *
 * Resource blocks are always big-endian, whatever the format variant of
 * the layer and mask block. Each block is made of a signature (usually
 * '8BIM'), a 2 byte id, a Pascal name padded to an even length, a 4 byte size and the
 * data padded to an even length.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

#include <psd/export_psd.h>
#include <psd/fourcc.hh>
#include <psd/io.hh>
#include <psd/options.hh>
#include <psd/types.hh>

namespace psd {

    /**
     * @enum resource_id
     * @brief Known image resource identifiers
     */
    enum class resource_id : std::uint16_t {
        resolution_info = 1005,
        alpha_names_pascal = 1006,
        display_info_obsolete = 1007,
        caption_pascal = 1008,
        border_info = 1009,
        background_color = 1010,
        print_flags = 1011,
        grayscale_halftoning_info = 1012,
        color_halftoning_info = 1013,
        duotone_halftoning_info = 1014,
        grayscale_transfer_function = 1015,
        color_transfer_functions = 1016,
        duotone_transfer_functions = 1017,
        duotone_image_info = 1018,
        effective_bw = 1019,
        eps_options = 1021,
        quick_mask_info = 1022,
        layer_state_info = 1024,
        working_path = 1025,
        layer_group_info = 1026,
        iptc_naa = 1028,
        image_mode_raw = 1029,
        jpeg_quality = 1030,
        grid_and_guides_info = 1032,
        thumbnail_resource_ps4 = 1033,
        copyright_flag = 1034,
        url = 1035,
        thumbnail_resource = 1036,
        global_angle = 1037,
        color_samplers_resource_obsolete = 1038,
        icc_profile = 1039,
        watermark = 1040,
        icc_untagged_profile = 1041,
        effects_visible = 1042,
        spot_halftone = 1043,
        idseed_number = 1044,
        unicode_alpha_names = 1045,
        indexed_color_table_count = 1046,
        transparency_index = 1047,
        global_altitude = 1049,
        slices = 1050,
        workflow_url = 1051,
        jump_to_xpep = 1052,
        alpha_identifiers = 1053,
        url_list = 1054,
        version_info = 1057,
        exif_data_1 = 1058,
        exif_data_3 = 1059,
        xmp_metadata = 1060,
        caption_digest = 1061,
        print_scale = 1062,
        pixel_aspect_ratio = 1064,
        layer_comps = 1065,
        alternate_duotone_colors = 1066,
        alternate_spot_colors = 1067,
        layer_selection_ids = 1069,
        hdr_toning_info = 1070,
        print_info_cs2 = 1071,
        layer_groups_enabled_id = 1072,
        color_samplers_resource = 1073,
        measurement_scale = 1074,
        timeline_info = 1075,
        sheet_disclosure = 1076,
        display_info = 1077,
        onion_skins = 1078,
        count_info = 1080,
        print_info_cs5 = 1082,
        print_style = 1083,
        macintosh_nsprintinfo = 1084,
        windows_devmode = 1085,
        auto_save_file_path = 1086,
        auto_save_format = 1087,
        path_selection_state = 1088,
        path_info = 2000,            ///< ids 2000 to 2997
        clipping_path_name = 2999,
        origin_path_info = 3000,
        plugin_resource = 4000,      ///< ids 4000 to 4999
        image_ready_variables = 7000,
        image_ready_data_sets = 7001,
        image_ready_default_selected_state = 7002,
        image_ready_7_rollover_expanded_state = 7003,
        image_ready_rollover_expanded_state = 7004,
        image_ready_save_layer_settings = 7005,
        image_ready_version = 7006,
        lightroom_workflow = 8000,
        print_flags_info = 10000
    };

    /**
     * @brief Canonical kind of a resource id
     *
     * Path ids 2000 to 2997 fold to path_info, plug-in ids 4000 to 4999 to
     * plugin_resource. Other ids are returned unchanged.
     */
    PSD_EXPORT resource_id resource_kind(std::uint16_t id);

    struct resource_unicode_string {
        std::u16string value;

        bool operator==(const resource_unicode_string& o) const { return value == o.value; }
    };

    struct resource_unicode_strings {
        std::vector<std::u16string> values;

        bool operator==(const resource_unicode_strings& o) const { return values == o.values; }
    };

    struct resource_pascal_string {
        std::string value;

        bool operator==(const resource_pascal_string& o) const { return value == o.value; }
    };

    struct resource_pascal_strings {
        std::vector<std::string> values;

        bool operator==(const resource_pascal_strings& o) const { return values == o.values; }
    };

    struct resource_color {
        color value;

        bool operator==(const resource_color& o) const { return value == o.value; }
    };

    struct resource_version_info {
        std::uint32_t version = 1;
        bool has_real_merged_data = true;
        std::u16string writer_name;
        std::u16string reader_name;
        std::uint32_t file_version = 1;

        bool operator==(const resource_version_info& o) const {
            return version == o.version && has_real_merged_data == o.has_real_merged_data &&
                   writer_name == o.writer_name && reader_name == o.reader_name &&
                   file_version == o.file_version;
        }
    };

    /**
     * @struct resource_thumbnail
     * @brief Thumbnail resource with its JFIF data
     *
     * The compressed size field is derived from the data when written.
     */
    struct resource_thumbnail {
        std::uint32_t format = 1;    ///< 1 = kJpegRGB, 0 = kRawRGB
        std::uint32_t width = 0;
        std::uint32_t height = 0;
        std::uint32_t width_bytes = 0;
        std::uint32_t total_size = 0;
        std::uint16_t bits_per_pixel = 24;
        std::uint16_t planes = 1;
        std::vector<std::byte> data;

        bool operator==(const resource_thumbnail& o) const {
            return format == o.format && width == o.width && height == o.height &&
                   width_bytes == o.width_bytes && total_size == o.total_size &&
                   bits_per_pixel == o.bits_per_pixel && planes == o.planes && data == o.data;
        }
    };

    struct resource_bytes {
        std::vector<std::byte> data;

        bool operator==(const resource_bytes& o) const { return data == o.data; }
    };

    using resource_payload = std::variant<
        resource_unicode_string,
        resource_unicode_strings,
        resource_pascal_string,
        resource_pascal_strings,
        resource_color,
        resource_version_info,
        resource_thumbnail,
        resource_bytes
    >;

    /**
     * @struct resource_block
     * @brief One image resource
     *
     * The id is kept exactly as read, use resource_kind() to classify it.
     * Blocks signed other than '8BIM' ('MeSa', 'PHUT', ...) have their own
     * id spaces and always keep a resource_bytes payload.
     */
    struct resource_block {
        std::uint16_t id = 0;
        std::string name;
        resource_payload payload;
        fourcc signature = "8BIM"_4cc;

        [[nodiscard]] resource_id kind() const { return resource_kind(id); }

        bool operator==(const resource_block& o) const {
            return signature == o.signature && id == o.id && name == o.name && payload == o.payload;
        }
        bool operator!=(const resource_block& o) const { return !(*this == o); }
    };

    /**
     * @class image_resources
     * @brief Decoded ImageResources blob
     *
     * Equality compares the blocks, the display name does not take part.
     */
    class PSD_EXPORT image_resources {
    public:
        static constexpr std::uint16_t TIFF_TAG = 34377;

        image_resources() = default;
        explicit image_resources(std::vector<resource_block> blocks, std::string name = {});

        /**
         * @brief Decode a blob
         * @throws decode_error for truncated or malformed blocks
         */
        static image_resources from_bytes(const std::byte* data, std::size_t size,
                                          const read_options& options = {}, std::string name = {});

        static image_resources from_bytes(const std::vector<std::byte>& data,
                                          const read_options& options = {}, std::string name = {});

        static image_resources from_stream(std::istream& is, const read_options& options = {},
                                           std::string name = {});

        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        /**
         * @brief Write the blocks to a seekable sink
         * @return Number of bytes written
         */
        std::uint64_t write(writer_base& w) const;

        [[nodiscard]] tiff_tag tifftag() const;

        [[nodiscard]] const std::vector<resource_block>& blocks() const { return m_blocks; }
        [[nodiscard]] std::vector<resource_block>& blocks() { return m_blocks; }

        [[nodiscard]] const std::string& name() const { return m_name; }

        /**
         * @brief First block with an id
         * @return nullptr if there is none
         */
        [[nodiscard]] const resource_block* find(std::uint16_t id) const;
        [[nodiscard]] const resource_block* find(resource_id id) const;

        bool operator==(const image_resources& other) const { return m_blocks == other.m_blocks; }
        bool operator!=(const image_resources& other) const { return !(*this == other); }

    private:
        std::vector<resource_block> m_blocks;
        std::string m_name;
    };

} // namespace psd
