/**
 * @file byte_order.hh
 * @brief Byte order (endianness) utilities for tagged blocks
 * @author Igor
 * @date 02/09/2025
 */

#pragma once

#include <psd/endian.hh>

namespace psd {
    /**
     * @enum byte_order
     * @brief Byte order (endianness) for reading/writing multi-byte values
     */
    enum class byte_order {
        little, ///< Little-endian (MIB8, 46B8 variants)
        big     ///< Big-endian (8BIM, 8B64 variants, image resources, sample data)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
     *
     * This is used to determine if byte swapping is needed when reading
     * or writing multi-byte values.
     */
    inline bool byte_order_native(byte_order bo) {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }

    /**
     * @brief Convert a value between host order and the given byte order
     *
     * The conversion is symmetric, so the same call is used for encoding
     * and decoding.
     */
    template<typename T>
    T to_byte_order(T value, byte_order bo) noexcept {
        if constexpr (sizeof(T) > 1) {
            if (!byte_order_native(bo)) {
                return swap_byte_order(value);
            }
        }
        return value;
    }
}
