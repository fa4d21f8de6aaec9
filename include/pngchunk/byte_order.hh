/**
 * @file byte_order.hh
 * @brief Byte order utilities for reading and writing chunk fields
 *
 * PNG stores every multi-byte integer in network (big-endian) order.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <pngchunk/endian.hh>

namespace pngchunk {
    /**
     * @enum byte_order
     * @brief Byte order (endianness) for reading/writing multi-byte values
     */
    enum class byte_order {
        little, ///< Little-endian
        big     ///< Big-endian (network order, used by PNG)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
     */
    constexpr bool byte_order_native(byte_order bo) noexcept {
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
     * @brief Decode a 32-bit field stored at @p src in the given byte order
     * @param src Pointer to at least 4 readable bytes
     * @param bo Byte order of the stored value
     */
    inline std::uint32_t load_u32(const std::byte* src, byte_order bo) noexcept {
        std::uint32_t value;
        std::memcpy(&value, src, sizeof(value));
        return byte_order_native(bo) ? value : swap32(value);
    }

    // Encode @p value at @p dst, which must have room for 4 bytes
    inline void store_u32(std::byte* dst, std::uint32_t value, byte_order bo) noexcept {
        if (!byte_order_native(bo)) {
            value = swap32(value);
        }
        std::memcpy(dst, &value, sizeof(value));
    }
}
