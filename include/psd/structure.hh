/**
 * @file structure.hh
 * @brief Tagged records of the layer and mask block
 * @author Igor
 * @date 05/09/2025
 *
 * Every record of a tagged list decodes into a @ref structure: a closed
 * variant over the leaf kinds known to the registry, plus an opaque
 * unknown kind and an empty kind for zero sized records.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <psd/export_psd.h>
#include <psd/fourcc.hh>
#include <psd/keys.hh>
#include <psd/types.hh>
#include <psd/format.hh>
#include <psd/plane.hh>
#include <psd/compression.hh>
#include <psd/layers.hh>

namespace psd {

    // Keyed unicode string ('luni')
    struct string_value {
        fourcc key = keys::UNICODE_LAYER_NAME;
        std::u16string value;

        bool operator==(const string_value& o) const { return key == o.key && value == o.value; }
    };

    // Boolean stored in a 4 byte field
    struct boolean_value {
        fourcc key;
        bool value = false;

        bool operator==(const boolean_value& o) const { return key == o.key && value == o.value; }
    };

    struct integer_value {
        fourcc key;
        std::int32_t value = 0;

        bool operator==(const integer_value& o) const { return key == o.key && value == o.value; }
    };

    // Four raw bytes, such as the layer name source ('lnsr')
    struct word_value {
        fourcc key;
        std::array<std::byte, 4> value{};

        bool operator==(const word_value& o) const { return key == o.key && value == o.value; }
    };

    // Exposure adjustment ('expA')
    struct exposure {
        float exposure_value = 0.0f;
        float offset = 0.0f;
        float gamma = 1.0f;

        bool operator==(const exposure& o) const {
            return exposure_value == o.exposure_value && offset == o.offset && gamma == o.gamma;
        }
    };

    // Reference point of layer effects ('fxrp')
    struct reference_point {
        double x = 0.0;
        double y = 0.0;

        bool operator==(const reference_point& o) const { return x == o.x && y == o.y; }
    };

    /**
     * @struct section_divider
     * @brief Group boundary ('lsct' or 'lsdk')
     *
     * The blend mode is present in records of at least 12 bytes, the sub
     * type in records of at least 16 bytes.
     */
    struct section_divider {
        fourcc key = keys::SECTION_DIVIDER_SETTING;
        section_divider_type kind = section_divider_type::other;
        std::optional<fourcc> blend_mode;
        std::optional<std::uint32_t> sub_type;

        bool operator==(const section_divider& o) const {
            return key == o.key && kind == o.kind && blend_mode == o.blend_mode && sub_type == o.sub_type;
        }
    };

    // Layer colour in the layers panel ('lclr')
    struct sheet_color {
        sheet_color_type value = sheet_color_type::none;

        bool operator==(const sheet_color& o) const { return value == o.value; }
    };

    struct metadata_item {
        fourcc key;
        bool copy_on_sheet_duplication = false;
        std::vector<std::byte> data;

        bool operator==(const metadata_item& o) const {
            return key == o.key && copy_on_sheet_duplication == o.copy_on_sheet_duplication && data == o.data;
        }
    };

    // Metadata setting ('shmd'); item data is opaque
    struct metadata_settings {
        std::vector<metadata_item> items;

        bool operator==(const metadata_settings& o) const { return items == o.items; }
    };

    /**
     * @struct virtual_memory_array
     * @brief One written channel of a pattern
     */
    struct virtual_memory_array {
        std::uint32_t depth = 8;
        rectangle rect;
        std::uint16_t pixel_depth = 8;
        compression kind = compression::raw;
        plane data;

        bool operator==(const virtual_memory_array& o) const {
            return depth == o.depth && rect == o.rect && pixel_depth == o.pixel_depth && data == o.data;
        }
    };

    /**
     * @struct pattern
     * @brief A pattern with its image channels
     *
     * Channels are followed by a user mask and a sheet mask array; channels
     * that were not written are empty optionals.
     */
    struct pattern {
        image_mode mode = image_mode::rgb;
        std::int16_t vertical = 0;
        std::int16_t horizontal = 0;
        std::u16string name;
        std::string id;
        std::vector<std::byte> color_table;      ///< 768 bytes, indexed mode only
        rectangle rect;
        std::vector<std::optional<virtual_memory_array>> channels;

        bool operator==(const pattern& o) const {
            return mode == o.mode && vertical == o.vertical && horizontal == o.horizontal &&
                   name == o.name && id == o.id && color_table == o.color_table &&
                   rect == o.rect && channels == o.channels;
        }
    };

    // Patterns ('Patt', 'Pat2' or 'Pat3')
    struct pattern_block {
        fourcc key = keys::PATTERNS;
        std::vector<pattern> patterns;

        bool operator==(const pattern_block& o) const { return key == o.key && patterns == o.patterns; }
    };

    // Text engine descriptor ('Txt2'), kept as is
    struct text_engine_data {
        std::vector<std::byte> data;

        bool operator==(const text_engine_data& o) const { return data == o.data; }
    };

    /**
     * @struct unknown_structure
     * @brief Record without a registered decoder
     *
     * The payload is kept with the format it was read under and is only
     * written back under that same format.
     */
    struct unknown_structure {
        fourcc key;
        psd_format format;
        std::vector<std::byte> data;

        bool operator==(const unknown_structure& o) const {
            return key == o.key && format == o.format && data == o.data;
        }
    };

    // Zero sized record
    struct empty_structure {
        fourcc key;

        bool operator==(const empty_structure& o) const { return key == o.key; }
    };

    /**
     * @class structure
     * @brief A decoded tagged record
     */
    class PSD_EXPORT structure {
    public:
        using value_type = std::variant<
            string_value,
            boolean_value,
            integer_value,
            word_value,
            exposure,
            reference_point,
            section_divider,
            sheet_color,
            metadata_settings,
            pattern_block,
            text_engine_data,
            layer_list,
            user_mask,
            filter_mask,
            unknown_structure,
            empty_structure
        >;

        template<typename T,
                 typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, structure>>>
        structure(T&& value) : m_value(std::forward<T>(value)) {}

        /**
         * @brief Key the record is written under
         */
        [[nodiscard]] fourcc key() const;

        template<typename T>
        [[nodiscard]] bool is() const { return std::holds_alternative<T>(m_value); }

        template<typename T>
        [[nodiscard]] const T& as() const { return std::get<T>(m_value); }

        template<typename T>
        [[nodiscard]] T& as() { return std::get<T>(m_value); }

        template<typename T>
        [[nodiscard]] const T* get_if() const { return std::get_if<T>(&m_value); }

        template<typename T>
        [[nodiscard]] T* get_if() { return std::get_if<T>(&m_value); }

        [[nodiscard]] const value_type& value() const { return m_value; }
        [[nodiscard]] value_type& value() { return m_value; }

        bool operator==(const structure& o) const { return m_value == o.m_value; }
        bool operator!=(const structure& o) const { return !(*this == o); }

    private:
        value_type m_value;
    };

    /**
     * @brief Find the first record with a key
     * @return nullptr if no record has the key
     */
    PSD_EXPORT const structure* find_structure(const std::vector<structure>& structures, const fourcc& key);

    PSD_EXPORT structure* find_structure(std::vector<structure>& structures, const fourcc& key);

} // namespace psd
