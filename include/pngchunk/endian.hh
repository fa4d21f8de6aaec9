//
// Host byte order detection and byte swapping
//

#pragma once

#include <cstdint>

#include <pngchunk/pngchunk_config.h>

namespace pngchunk {
    // Platform endianness detection using CMake-generated config
#if LIBPNGCHUNK_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    constexpr std::uint32_t swap32(std::uint32_t x) noexcept {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }
}
