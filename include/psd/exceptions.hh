/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PSD tag library
 * @author Igor
 * @date 02/09/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace psd {

    /**
     * @class psd_error
     * @brief Base exception class for all library errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch all codec errors with a single catch block.
     */
    class psd_error : public std::runtime_error {
    public:
        explicit psd_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for stream failures
     *
     * Thrown when the underlying stream reports an error or a seek fails.
     */
    class io_error : public psd_error {
    public:
        explicit io_error(const std::string& msg)
            : psd_error(msg) {}
    };

    /**
     * @class format_error
     * @brief Exception for unrecognised blobs
     *
     * Thrown for a bad leading signature or an unknown format variant.
     */
    class format_error : public psd_error {
    public:
        explicit format_error(const std::string& msg)
            : psd_error(msg) {}
    };

    /**
     * @class decode_error
     * @brief Exception for malformed data
     *
     * Thrown for truncated reads, invalid compression kinds,
     * unsupported element types and inconsistent fields.
     */
    class decode_error : public psd_error {
    public:
        explicit decode_error(const std::string& msg)
            : psd_error(msg) {}
    };

    /**
     * @class encode_error
     * @brief Exception for values that cannot be written
     */
    class encode_error : public psd_error {
    public:
        explicit encode_error(const std::string& msg)
            : psd_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    #define THROW_IO(...) \
        throw ::psd::io_error(::psd::build_error_msg(__VA_ARGS__))

    #define THROW_FORMAT(...) \
        throw ::psd::format_error(::psd::build_error_msg(__VA_ARGS__))

    #define THROW_DECODE(...) \
        throw ::psd::decode_error(::psd::build_error_msg(__VA_ARGS__))

    #define THROW_ENCODE(...) \
        throw ::psd::encode_error(::psd::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_FORMAT_IF(condition, ...) \
        do { if (condition) THROW_FORMAT(__VA_ARGS__); } while(0)

    #define THROW_DECODE_IF(condition, ...) \
        do { if (condition) THROW_DECODE(__VA_ARGS__); } while(0)

    #define THROW_ENCODE_IF(condition, ...) \
        do { if (condition) THROW_ENCODE(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_FORMAT_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_FORMAT(__VA_ARGS__); } while(0)

    #define THROW_DECODE_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_DECODE(__VA_ARGS__); } while(0)

    #define THROW_ENCODE_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_ENCODE(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace psd
