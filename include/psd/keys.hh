/**
 * @file keys.hh
 * @brief Well known record keys and blend mode keys
 * @author Igor
 * @date 03/09/2025
 *
 * Keys are given in big-endian character order. The little-endian format
 * variants store them reversed, which psd_format::read_key and
 * psd_format::write_key take care of.
 */

#pragma once

#include <psd/fourcc.hh>

namespace psd {

    namespace keys {
        inline constexpr fourcc ALPHA = "Alph"_4cc;
        inline constexpr fourcc ANIMATION_EFFECTS = "anFX"_4cc;
        inline constexpr fourcc ANNOTATIONS = "Anno"_4cc;
        inline constexpr fourcc ARTBOARD_DATA = "artb"_4cc;
        inline constexpr fourcc ARTBOARD_DATA_2 = "artd"_4cc;
        inline constexpr fourcc ARTBOARD_DATA_3 = "abdd"_4cc;
        inline constexpr fourcc BLACK_AND_WHITE = "blwh"_4cc;
        inline constexpr fourcc BLEND_CLIPPING_ELEMENTS = "clbl"_4cc;
        inline constexpr fourcc BLEND_INTERIOR_ELEMENTS = "infx"_4cc;
        inline constexpr fourcc BRIGHTNESS_AND_CONTRAST = "brit"_4cc;
        inline constexpr fourcc CHANNEL_BLENDING_RESTRICTIONS_SETTING = "brst"_4cc;
        inline constexpr fourcc CHANNEL_MIXER = "mixr"_4cc;
        inline constexpr fourcc COLOR_BALANCE = "blnc"_4cc;
        inline constexpr fourcc COLOR_LOOKUP = "clrL"_4cc;
        inline constexpr fourcc COMPOSITOR_INFO = "cinf"_4cc;
        inline constexpr fourcc CONTENT_GENERATOR_EXTRA_DATA = "CgEd"_4cc;
        inline constexpr fourcc CURVES = "curv"_4cc;
        inline constexpr fourcc EFFECTS_LAYER = "lrFX"_4cc;
        inline constexpr fourcc EXPOSURE = "expA"_4cc;
        inline constexpr fourcc FILTER_EFFECTS = "FXid"_4cc;
        inline constexpr fourcc FILTER_EFFECTS_2 = "FEid"_4cc;
        inline constexpr fourcc FILTER_MASK = "FMsk"_4cc;
        inline constexpr fourcc FOREIGN_EFFECT_ID = "ffxi"_4cc;
        inline constexpr fourcc GRADIENT_FILL_SETTING = "GdFl"_4cc;
        inline constexpr fourcc GRADIENT_MAP = "grdm"_4cc;
        inline constexpr fourcc HUE_SATURATION = "hue2"_4cc;
        inline constexpr fourcc HUE_SATURATION_PS4 = "hue "_4cc;
        inline constexpr fourcc INVERT = "nvrt"_4cc;
        inline constexpr fourcc KNOCKOUT_SETTING = "knko"_4cc;
        inline constexpr fourcc LAYER = "Layr"_4cc;
        inline constexpr fourcc LAYER_16 = "Lr16"_4cc;
        inline constexpr fourcc LAYER_32 = "Lr32"_4cc;
        inline constexpr fourcc LAYER_ID = "lyid"_4cc;
        inline constexpr fourcc LAYER_MASK_AS_GLOBAL_MASK = "lmgm"_4cc;
        inline constexpr fourcc LAYER_NAME_SOURCE_SETTING = "lnsr"_4cc;
        inline constexpr fourcc LAYER_VERSION = "lyvr"_4cc;
        inline constexpr fourcc LEVELS = "levl"_4cc;
        inline constexpr fourcc LINKED_LAYER = "lnkD"_4cc;
        inline constexpr fourcc LINKED_LAYER_2 = "lnk2"_4cc;
        inline constexpr fourcc LINKED_LAYER_3 = "lnk3"_4cc;
        inline constexpr fourcc LINKED_LAYER_EXTERNAL = "lnkE"_4cc;
        inline constexpr fourcc METADATA_SETTING = "shmd"_4cc;
        inline constexpr fourcc NESTED_SECTION_DIVIDER_SETTING = "lsdk"_4cc;
        inline constexpr fourcc OBJECT_BASED_EFFECTS_LAYER_INFO = "lfx2"_4cc;
        inline constexpr fourcc PATTERNS = "Patt"_4cc;
        inline constexpr fourcc PATTERNS_2 = "Pat2"_4cc;
        inline constexpr fourcc PATTERNS_3 = "Pat3"_4cc;
        inline constexpr fourcc PATTERN_DATA = "shpa"_4cc;
        inline constexpr fourcc PATTERN_FILL_SETTING = "PtFl"_4cc;
        inline constexpr fourcc PHOTO_FILTER = "phfl"_4cc;
        inline constexpr fourcc PIXEL_SOURCE_DATA = "PxSc"_4cc;
        inline constexpr fourcc PIXEL_SOURCE_DATA_CC15 = "PxSD"_4cc;
        inline constexpr fourcc PLACED_LAYER = "plLd"_4cc;
        inline constexpr fourcc PLACED_LAYER_CS3 = "PlLd"_4cc;
        inline constexpr fourcc POSTERIZE = "post"_4cc;
        inline constexpr fourcc PROTECTED_SETTING = "lspf"_4cc;
        inline constexpr fourcc REFERENCE_POINT = "fxrp"_4cc;
        inline constexpr fourcc SAVING_MERGED_TRANSPARENCY = "Mtrn"_4cc;
        inline constexpr fourcc SAVING_MERGED_TRANSPARENCY_2 = "MTrn"_4cc;
        inline constexpr fourcc SAVING_MERGED_TRANSPARENCY_16 = "Mt16"_4cc;
        inline constexpr fourcc SAVING_MERGED_TRANSPARENCY_32 = "Mt32"_4cc;
        inline constexpr fourcc SECTION_DIVIDER_SETTING = "lsct"_4cc;
        inline constexpr fourcc SELECTIVE_COLOR = "selc"_4cc;
        inline constexpr fourcc SHEET_COLOR_SETTING = "lclr"_4cc;
        inline constexpr fourcc SMART_OBJECT_LAYER_DATA = "SoLd"_4cc;
        inline constexpr fourcc SMART_OBJECT_LAYER_DATA_CC15 = "SoLE"_4cc;
        inline constexpr fourcc SOLID_COLOR_SHEET_SETTING = "SoCo"_4cc;
        inline constexpr fourcc TEXT_ENGINE_DATA = "Txt2"_4cc;
        inline constexpr fourcc THRESHOLD = "thrs"_4cc;
        inline constexpr fourcc TRANSPARENCY_SHAPES_LAYER = "tsly"_4cc;
        inline constexpr fourcc TYPE_TOOL_INFO = "tySh"_4cc;
        inline constexpr fourcc TYPE_TOOL_OBJECT_SETTING = "TySh"_4cc;
        inline constexpr fourcc UNICODE_LAYER_NAME = "luni"_4cc;
        inline constexpr fourcc UNICODE_PATH_NAME = "pths"_4cc;
        inline constexpr fourcc USER_MASK = "LMsk"_4cc;
        inline constexpr fourcc USING_ALIGNED_RENDERING = "sn2P"_4cc;
        inline constexpr fourcc VECTOR_MASK_AS_GLOBAL_MASK = "vmgm"_4cc;
        inline constexpr fourcc VECTOR_MASK_SETTING = "vmsk"_4cc;
        inline constexpr fourcc VECTOR_MASK_SETTING_CS6 = "vsms"_4cc;
        inline constexpr fourcc VECTOR_ORIGINATION_DATA = "vogk"_4cc;
        inline constexpr fourcc VECTOR_STROKE_DATA = "vstk"_4cc;
        inline constexpr fourcc VECTOR_STROKE_CONTENT_DATA = "vscg"_4cc;
        inline constexpr fourcc VIBRANCE = "vibA"_4cc;
    }

    namespace blend_mode {
        inline constexpr fourcc PASS_THROUGH = "pass"_4cc;
        inline constexpr fourcc NORMAL = "norm"_4cc;
        inline constexpr fourcc DISSOLVE = "diss"_4cc;
        inline constexpr fourcc DARKEN = "dark"_4cc;
        inline constexpr fourcc MULTIPLY = "mul "_4cc;
        inline constexpr fourcc COLOR_BURN = "idiv"_4cc;
        inline constexpr fourcc LINEAR_BURN = "lbrn"_4cc;
        inline constexpr fourcc DARKER_COLOR = "dkCl"_4cc;
        inline constexpr fourcc LIGHTEN = "lite"_4cc;
        inline constexpr fourcc SCREEN = "scrn"_4cc;
        inline constexpr fourcc COLOR_DODGE = "div "_4cc;
        inline constexpr fourcc LINEAR_DODGE = "lddg"_4cc;
        inline constexpr fourcc LIGHTER_COLOR = "lgCl"_4cc;
        inline constexpr fourcc OVERLAY = "over"_4cc;
        inline constexpr fourcc SOFT_LIGHT = "sLit"_4cc;
        inline constexpr fourcc HARD_LIGHT = "hLit"_4cc;
        inline constexpr fourcc VIVID_LIGHT = "vLit"_4cc;
        inline constexpr fourcc LINEAR_LIGHT = "lLit"_4cc;
        inline constexpr fourcc PIN_LIGHT = "pLit"_4cc;
        inline constexpr fourcc HARD_MIX = "hMix"_4cc;
        inline constexpr fourcc DIFFERENCE = "diff"_4cc;
        inline constexpr fourcc EXCLUSION = "smud"_4cc;
        inline constexpr fourcc SUBTRACT = "fsub"_4cc;
        inline constexpr fourcc DIVIDE = "fdiv"_4cc;
        inline constexpr fourcc HUE = "hue "_4cc;
        inline constexpr fourcc SATURATION = "sat "_4cc;
        inline constexpr fourcc COLOR = "colr"_4cc;
        inline constexpr fourcc LUMINOSITY = "lum "_4cc;
    }

} // namespace psd
