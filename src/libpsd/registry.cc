//
// Created by igor on 06/09/2025.
//

#include "registry.hh"

#include <psd/keys.hh>

#include <unordered_map>

namespace psd::detail {

    namespace {
        using registry_map = std::unordered_map<fourcc, decoder_fn, fourcc_hash>;

        registry_map build_registry() {
            registry_map m;

            m.emplace(keys::UNICODE_LAYER_NAME, &read_string_value);

            for (const auto& key : {keys::BLEND_CLIPPING_ELEMENTS,
                                    keys::BLEND_INTERIOR_ELEMENTS,
                                    keys::KNOCKOUT_SETTING,
                                    keys::TRANSPARENCY_SHAPES_LAYER,
                                    keys::LAYER_MASK_AS_GLOBAL_MASK,
                                    keys::VECTOR_MASK_AS_GLOBAL_MASK}) {
                m.emplace(key, &read_boolean_value);
            }

            for (const auto& key : {keys::LAYER_ID,
                                    keys::LAYER_VERSION,
                                    keys::PROTECTED_SETTING,
                                    keys::USING_ALIGNED_RENDERING}) {
                m.emplace(key, &read_integer_value);
            }

            m.emplace(keys::LAYER_NAME_SOURCE_SETTING, &read_word_value);
            m.emplace(keys::EXPOSURE, &read_exposure);
            m.emplace(keys::REFERENCE_POINT, &read_reference_point);
            m.emplace(keys::SECTION_DIVIDER_SETTING, &read_section_divider);
            m.emplace(keys::NESTED_SECTION_DIVIDER_SETTING, &read_section_divider);
            m.emplace(keys::SHEET_COLOR_SETTING, &read_sheet_color);
            m.emplace(keys::METADATA_SETTING, &read_metadata_settings);

            m.emplace(keys::PATTERNS, &read_pattern_block);
            m.emplace(keys::PATTERNS_2, &read_pattern_block);
            m.emplace(keys::PATTERNS_3, &read_pattern_block);

            m.emplace(keys::TEXT_ENGINE_DATA, &read_text_engine_data);

            m.emplace(keys::LAYER, &read_layer_list);
            m.emplace(keys::LAYER_16, &read_layer_list);
            m.emplace(keys::LAYER_32, &read_layer_list);

            m.emplace(keys::USER_MASK, &read_user_mask);
            m.emplace(keys::FILTER_MASK, &read_filter_mask);
            return m;
        }

        const registry_map& registry() {
            static const registry_map instance = build_registry();
            return instance;
        }
    }

    decoder_fn find_decoder(const fourcc& key) {
        const auto& m = registry();
        auto it = m.find(key);
        return it != m.end() ? it->second : nullptr;
    }

} // namespace psd::detail
