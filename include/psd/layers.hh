/**
 * @file layers.hh
 * @brief Layer, channel and mask model of the layer list records
 * @author Igor
 * @date 05/09/2025
 *
 * A layer list ('Layr', 'Lr16' or 'Lr32') holds layer records. Every layer
 * owns its channels, an optional mask and a nested list of tagged records
 * which may in turn hold further layer lists. The nested list is declared
 * here against an incomplete @ref structure; include psd/structure.hh to
 * inspect it.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <psd/export_psd.h>
#include <psd/fourcc.hh>
#include <psd/keys.hh>
#include <psd/types.hh>
#include <psd/plane.hh>
#include <psd/compression.hh>

namespace psd {

    class structure;

    /**
     * @struct channel
     * @brief One compressed raster plane of a layer
     *
     * The compression kind only selects the on-wire representation and does
     * not take part in equality.
     */
    struct PSD_EXPORT channel {
        std::int16_t id = 0;                     ///< plane index, or one of channel_ids
        compression kind = compression::raw;
        plane data;

        bool operator==(const channel& o) const { return id == o.id && data == o.data; }
        bool operator!=(const channel& o) const { return !(*this == o); }
    };

    /**
     * @struct real_mask
     * @brief Rendered user mask trailer of a layer mask record
     */
    struct real_mask {
        std::uint8_t flags = 0;
        std::uint8_t background = 0;
        rectangle rect;

        bool operator==(const real_mask& o) const {
            return flags == o.flags && background == o.background && rect == o.rect;
        }
        bool operator!=(const real_mask& o) const { return !(*this == o); }
    };

    /**
     * @struct layer_mask
     * @brief Layer mask and adjustment layer data
     *
     * A mask is present when it has a rectangle. The parameter flags byte of
     * the record is derived from the optional density and feather fields,
     * the real mask trailer is written when @ref real is set.
     *
     * mask_flags::APPLIED is derived as well: it is written exactly when a
     * parameter field is set, cleared on read and ignored by comparison.
     */
    struct PSD_EXPORT layer_mask {
        std::optional<rectangle> rect;
        std::uint8_t default_color = 0;
        std::uint8_t flags = 0;                  ///< mask_flags bits except APPLIED
        std::optional<std::uint8_t> user_mask_density;
        std::optional<double> user_mask_feather;
        std::optional<std::uint8_t> vector_mask_density;
        std::optional<double> vector_mask_feather;
        std::optional<real_mask> real;

        [[nodiscard]] bool has_mask() const { return rect.has_value(); }

        // Parameter flags byte implied by the optional fields
        [[nodiscard]] std::uint8_t parameter_flags() const;

        bool operator==(const layer_mask& o) const;
        bool operator!=(const layer_mask& o) const { return !(*this == o); }
    };

    /**
     * @struct layer
     * @brief A layer record with its channels and additional information
     */
    struct PSD_EXPORT layer {
        layer();
        layer(const layer& other);
        layer(layer&& other) noexcept;
        layer& operator=(const layer& other);
        layer& operator=(layer&& other) noexcept;
        ~layer();

        rectangle rect;
        std::vector<channel> channels;
        layer_mask mask;
        std::uint8_t opacity = 255;
        fourcc blend_mode = psd::blend_mode::NORMAL;
        clipping clip = clipping::base;
        std::uint8_t flags = 0;                  ///< layer_flags bits
        std::vector<std::int32_t> blending_ranges;
        std::string name;
        std::vector<structure> info;             ///< tagged records, 2 byte aligned

        /**
         * @brief Find a channel by its identifier
         * @return nullptr if the layer has no such channel
         */
        [[nodiscard]] const channel* find_channel(std::int16_t id) const;

        /**
         * @brief Rectangle giving the shape of a channel's plane
         *
         * User mask channels take the mask rectangle, real user mask
         * channels the real mask rectangle if there is one. All other
         * channels take the layer rectangle.
         */
        [[nodiscard]] rectangle channel_rect(std::int16_t id) const;

        bool operator==(const layer& o) const;
        bool operator!=(const layer& o) const { return !(*this == o); }
    };

    /**
     * @struct layer_list
     * @brief Ordered layers of one sample depth
     *
     * The key selects the sample type of every channel: 'Layr' for 8 bit,
     * 'Lr16' for 16 bit and 'Lr32' for 32 bit float samples.
     */
    struct PSD_EXPORT layer_list {
        fourcc key = keys::LAYER;
        std::vector<layer> layers;
        bool has_transparency = false;           ///< first alpha channel holds merged transparency

        /**
         * @brief Sample type selected by the key
         * @throws decode_error if the key is not a layer list key
         */
        [[nodiscard]] sample_type type() const;

        /**
         * @brief Document extent spanned by the layers
         *
         * Top and left are 0. Bottom and right are the largest values over
         * every layer rectangle and every mask and real mask rectangle, or 0
         * when no rectangle reaches past the origin.
         */
        [[nodiscard]] rectangle bounds() const;

        bool operator==(const layer_list& o) const;
        bool operator!=(const layer_list& o) const { return !(*this == o); }
    };

    /**
     * @brief Check whether a key names a layer list record
     */
    PSD_EXPORT bool is_layer_list_key(const fourcc& key);

    /**
     * @brief Sample type of the channels of a layer list record
     * @throws decode_error if the key is not a layer list key
     */
    PSD_EXPORT sample_type layer_list_sample_type(const fourcc& key);

    /**
     * @struct user_mask
     * @brief Document wide user mask ('LMsk')
     */
    struct user_mask {
        color overlay;
        std::uint16_t opacity = 0;
        std::uint8_t flag = 128;

        bool operator==(const user_mask& o) const {
            return overlay == o.overlay && opacity == o.opacity && flag == o.flag;
        }
        bool operator!=(const user_mask& o) const { return !(*this == o); }
    };

    /**
     * @struct filter_mask
     * @brief Filter effects mask ('FMsk')
     */
    struct filter_mask {
        color overlay;
        std::uint16_t opacity = 0;

        bool operator==(const filter_mask& o) const { return overlay == o.overlay && opacity == o.opacity; }
        bool operator!=(const filter_mask& o) const { return !(*this == o); }
    };

} // namespace psd
