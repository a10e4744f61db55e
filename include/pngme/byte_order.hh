/**
 * @file byte_order.hh
 * @brief Byte order (endianness) utilities for PNG chunk fields
 * @date 02/09/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <pngme/endian.hh>

namespace pngme {
    /**
     * @enum byte_order
     * @brief Byte order (endianness) for reading/writing multi-byte values
     */
    enum class byte_order {
        little, ///< Little-endian
        big     ///< Big-endian (network order, used by every PNG integer field)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
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
     * @brief Store an unsigned 32-bit value in the given byte order
     * @param dst Pointer to at least 4 writable bytes
     * @param value Value to store
     * @param bo Byte order to store in
     */
    inline void store_u32(std::byte* dst, std::uint32_t value, byte_order bo = byte_order::big) {
        if (!byte_order_native(bo)) {
            value = swap32(value);
        }
        std::memcpy(dst, &value, sizeof(value));
    }
}
