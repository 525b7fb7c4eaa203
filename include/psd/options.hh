/**
 * @file options.hh
 * @brief Read and write options for tagged blocks
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <functional>
#include <optional>
#include <string_view>
#include <cstdint>

namespace psd {

    enum class compression : std::uint16_t;

    /**
     * @typedef warning_handler
     * @brief Callback function type for handling warnings
     * @param offset Blob offset where warning occurred
     * @param category Warning category (e.g., "skipped_unknown", "missing_structure")
     * @param message Human-readable warning message
     */
    using warning_handler = std::function<void(
        std::uint64_t offset,
        std::string_view category,
        std::string_view message
    )>;

    /**
     * @struct read_options
     * @brief Configuration options for decoding tagged blocks
     */
    struct read_options {
        /**
         * @brief Reject records whose declared size runs past their list
         *
         * When false, the declared size is trusted and the walk seeks past
         * it, which ends the list. When true, such a record is a decode_error.
         */
        bool strict_sizes = false;

        /**
         * @brief Keep unrecognised keys as opaque unknown structures
         *
         * When false, unrecognised records are skipped with a warning.
         */
        bool preserve_unknown = true;

        /**
         * @brief Maximum nesting depth of tagged lists
         *
         * Layer info may itself carry layer lists. Default is 16 levels.
         */
        int max_depth = 16;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during decoding.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

    /**
     * @struct write_options
     * @brief Configuration options for encoding tagged blocks
     */
    struct write_options {
        /**
         * @brief Compression applied to every channel instead of its own
         */
        std::optional<compression> compression_override;

        /**
         * @brief Write preserved unknown structures
         *
         * Unknown structures read under a different format variant are
         * dropped with a warning regardless of this flag.
         */
        bool emit_unknown = true;

        warning_handler on_warning;
    };

    // Helper used by readers and writers to report a diagnostic
    inline void warn(const warning_handler& handler, std::uint64_t offset,
                     std::string_view category, std::string_view message) {
        if (handler) {
            handler(offset, category, message);
        }
    }

} // namespace psd
