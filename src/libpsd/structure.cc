//
// Created by igor on 06/09/2025.
//

#include <psd/structure.hh>

#include <algorithm>
#include <type_traits>
#include <utility>

namespace psd {

    namespace {
        template<typename T>
        fourcc fixed_key() {
            if constexpr (std::is_same_v<T, exposure>) {
                return keys::EXPOSURE;
            } else if constexpr (std::is_same_v<T, reference_point>) {
                return keys::REFERENCE_POINT;
            } else if constexpr (std::is_same_v<T, sheet_color>) {
                return keys::SHEET_COLOR_SETTING;
            } else if constexpr (std::is_same_v<T, metadata_settings>) {
                return keys::METADATA_SETTING;
            } else if constexpr (std::is_same_v<T, text_engine_data>) {
                return keys::TEXT_ENGINE_DATA;
            } else if constexpr (std::is_same_v<T, user_mask>) {
                return keys::USER_MASK;
            } else {
                static_assert(std::is_same_v<T, filter_mask>, "record kind without a fixed key");
                return keys::FILTER_MASK;
            }
        }

        template<typename T, typename = void>
        struct has_key_member : std::false_type {};

        template<typename T>
        struct has_key_member<T, std::void_t<decltype(std::declval<const T&>().key)>> : std::true_type {};
    }

    fourcc structure::key() const {
        return std::visit([](const auto& value) -> fourcc {
            using T = std::decay_t<decltype(value)>;
            if constexpr (has_key_member<T>::value) {
                return value.key;
            } else {
                return fixed_key<T>();
            }
        }, m_value);
    }

    const structure* find_structure(const std::vector<structure>& structures, const fourcc& key) {
        auto it = std::find_if(structures.begin(), structures.end(),
                               [&key](const structure& s) { return s.key() == key; });
        return it != structures.end() ? &*it : nullptr;
    }

    structure* find_structure(std::vector<structure>& structures, const fourcc& key) {
        auto it = std::find_if(structures.begin(), structures.end(),
                               [&key](const structure& s) { return s.key() == key; });
        return it != structures.end() ? &*it : nullptr;
    }

} // namespace psd
