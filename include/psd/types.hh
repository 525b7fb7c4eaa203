/**
 * @file types.hh
 * @brief Small value types shared by layers, masks and leaf records
 * @author Igor
 * @date 05/09/2025
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <ostream>
#include <vector>

namespace psd {

    /**
     * @struct rectangle
     * @brief Bounds of a layer or mask in document coordinates
     *
     * A rectangle with bottom < top or right < left is empty.
     */
    struct rectangle {
        std::int32_t top = 0;
        std::int32_t left = 0;
        std::int32_t bottom = 0;
        std::int32_t right = 0;

        [[nodiscard]] std::size_t rows() const {
            return bottom > top ? static_cast<std::size_t>(static_cast<std::int64_t>(bottom) - top) : 0;
        }

        [[nodiscard]] std::size_t cols() const {
            return right > left ? static_cast<std::size_t>(static_cast<std::int64_t>(right) - left) : 0;
        }

        [[nodiscard]] bool empty() const { return rows() == 0 || cols() == 0; }

        bool operator==(const rectangle& o) const {
            return top == o.top && left == o.left && bottom == o.bottom && right == o.right;
        }
        bool operator!=(const rectangle& o) const { return !(*this == o); }

        friend std::ostream& operator<<(std::ostream& os, const rectangle& r) {
            return os << "(" << r.top << ", " << r.left << ", " << r.bottom << ", " << r.right << ")";
        }
    };

    // Channel identifiers below zero
    namespace channel_ids {
        inline constexpr std::int16_t TRANSPARENCY_MASK = -1;
        inline constexpr std::int16_t USER_LAYER_MASK = -2;
        inline constexpr std::int16_t REAL_USER_LAYER_MASK = -3;
    }

    enum class clipping : std::uint8_t {
        base = 0,
        non_base = 1
    };

    // Layer record flags
    namespace layer_flags {
        inline constexpr std::uint8_t TRANSPARENCY_PROTECTED = 1;
        inline constexpr std::uint8_t VISIBLE = 2;
        inline constexpr std::uint8_t OBSOLETE = 4;
        inline constexpr std::uint8_t PHOTOSHOP5 = 8;   ///< tells if bit 4 has info
        inline constexpr std::uint8_t IRRELEVANT = 16;  ///< pixel data irrelevant to appearance of document
    }

    // Layer mask flags
    namespace mask_flags {
        inline constexpr std::uint8_t RELATIVE = 1;  ///< position relative to layer
        inline constexpr std::uint8_t DISABLED = 2;
        inline constexpr std::uint8_t INVERT = 4;    ///< invert layer mask when blending (obsolete)
        inline constexpr std::uint8_t RENDERED = 8;  ///< user mask came from rendering other data
        inline constexpr std::uint8_t APPLIED = 16;  ///< user and/or vector masks have parameters applied
    }

    // Layer mask parameter flags
    namespace mask_parameter_flags {
        inline constexpr std::uint8_t USER_DENSITY = 1;    ///< 1 byte
        inline constexpr std::uint8_t USER_FEATHER = 2;    ///< 8 byte double
        inline constexpr std::uint8_t VECTOR_DENSITY = 4;  ///< 1 byte
        inline constexpr std::uint8_t VECTOR_FEATHER = 8;  ///< 8 byte double
    }

    enum class color_space : std::int16_t {
        dummy = -1,
        rgb = 0,
        hsb = 1,
        cmyk = 2,
        pantone = 3,
        focoltone = 4,
        trumatch = 5,
        toyo = 6,
        lab = 7,
        gray = 8,
        wide_cmyk = 9,
        hks = 10,
        dic = 11,
        total_ink = 12,
        monitor_rgb = 13,
        duotone = 14,
        opacity = 15,
        web = 16,
        gray_float = 17,
        rgb_float = 18,
        opacity_float = 19
    };

    /**
     * @struct color
     * @brief Colour space code with four 16 bit components
     *
     * Components are kept as stored. They are signed for the Lab space,
     * where signed_component() gives their value.
     */
    struct color {
        color_space space = color_space::dummy;
        std::array<std::uint16_t, 4> components{};

        // Component reinterpreted as a two's complement value
        [[nodiscard]] std::int16_t signed_component(std::size_t index) const {
            return static_cast<std::int16_t>(components.at(index));
        }

        void set_signed_component(std::size_t index, std::int16_t value) {
            components.at(index) = static_cast<std::uint16_t>(value);
        }

        bool operator==(const color& o) const { return space == o.space && components == o.components; }
        bool operator!=(const color& o) const { return !(*this == o); }
    };

    enum class image_mode : std::uint32_t {
        bitmap = 0,
        grayscale = 1,
        indexed = 2,
        rgb = 3,
        cmyk = 4,
        multichannel = 7,
        duotone = 8,
        lab = 9
    };

    enum class section_divider_type : std::uint32_t {
        other = 0,
        open_folder = 1,
        closed_folder = 2,
        bounding_section_divider = 3
    };

    enum class sheet_color_type : std::uint16_t {
        none = 0,
        red = 1,
        orange = 2,
        yellow = 3,
        green = 4,
        blue = 5,
        violet = 6,
        gray = 7
    };

    /**
     * @struct tiff_tag
     * @brief Tag entry handed to a TIFF writer
     *
     * Both blobs are stored as UNDEFINED (7) data of one byte per count,
     * written once per page.
     */
    struct tiff_tag {
        std::uint16_t code = 0;
        std::uint16_t type = 7;
        std::uint64_t count = 0;
        std::vector<std::byte> value;
        bool write_once = true;
    };

} // namespace psd
