/**
 * @file crc.hh
 * @brief CRC-32 used by PNG chunk records
 *
 * The checksum is CRC-32/ISO-HDLC (reflected polynomial 0x04C11DB7,
 * initial value and final xor 0xFFFFFFFF), the same CRC that zlib and
 * gzip compute. For a chunk it covers the type bytes followed by the
 * payload, never the length field.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {
    class chunk_type;

    /**
     * @brief Compute or continue a CRC-32
     * @param data Bytes to checksum (may be null when size is 0)
     * @param size Number of bytes
     * @param seed CRC of the preceding bytes, 0 to start a new checksum
     * @return CRC of the preceding bytes followed by @p data
     */
    PNGCHUNK_EXPORT std::uint32_t crc32(const void* data, std::size_t size, std::uint32_t seed = 0) noexcept;

    /**
     * @brief CRC stored in a chunk footer
     * @return crc32 over the four type bytes followed by the payload
     */
    PNGCHUNK_EXPORT std::uint32_t chunk_crc(const chunk_type& type, const void* payload, std::size_t size) noexcept;

} // namespace pngchunk
