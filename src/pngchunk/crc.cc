//
// CRC-32 on top of zlib
//

#include <pngchunk/crc.hh>
#include <pngchunk/chunk_type.hh>

#include <algorithm>
#include <limits>

#include <zlib.h>

namespace pngchunk {

    std::uint32_t crc32(const void* data, std::size_t size, std::uint32_t seed) noexcept {
        uLong crc = seed;
        auto ptr = static_cast<const Bytef*>(data);

        // zlib takes the length as uInt, feed larger buffers in slices
        constexpr std::size_t max_slice = std::numeric_limits<uInt>::max();
        while (size > 0) {
            auto slice = std::min(size, max_slice);
            crc = ::crc32(crc, ptr, static_cast<uInt>(slice));
            ptr += slice;
            size -= slice;
        }
        return static_cast<std::uint32_t>(crc);
    }

    std::uint32_t chunk_crc(const chunk_type& type, const void* payload, std::size_t size) noexcept {
        auto type_bytes = type.bytes();
        auto crc = crc32(type_bytes.data(), type_bytes.size());
        return crc32(payload, size, crc);
    }

} // namespace pngchunk
