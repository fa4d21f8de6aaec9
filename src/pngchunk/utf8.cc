//
// Strict UTF-8 validation for text views of chunk bytes
//

#include "utf8.hh"

#include <pngchunk/exceptions.hh>

namespace pngchunk {

    namespace {
        inline bool is_continuation(unsigned char c) {
            return (c & 0xC0) == 0x80;
        }
    }

    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size) noexcept {
        std::size_t i = 0;
        while (i < size) {
            auto c = std::to_integer<unsigned char>(data[i]);

            if (c < 0x80) {
                // 1 byte: 0xxxxxxx
                i++;
                continue;
            }

            std::size_t len;
            unsigned char lo = 0x80;  // bounds for the second byte
            unsigned char hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                // 2 bytes: 110xxxxx 10xxxxxx
                len = 2;
            } else if (c >= 0xE0 && c <= 0xEF) {
                // 3 bytes: 1110xxxx 10xxxxxx 10xxxxxx
                len = 3;
                if (c == 0xE0) {
                    lo = 0xA0;  // overlong
                } else if (c == 0xED) {
                    hi = 0x9F;  // UTF-16 surrogates
                }
            } else if (c >= 0xF0 && c <= 0xF4) {
                // 4 bytes: 11110xxx 10xxxxxx 10xxxxxx 10xxxxxx
                len = 4;
                if (c == 0xF0) {
                    lo = 0x90;  // overlong
                } else if (c == 0xF4) {
                    hi = 0x8F;  // above U+10FFFF
                }
            } else {
                // stray continuation byte, 0xC0/0xC1 or 0xF5..0xFF
                return i;
            }

            if (size - i < len) {
                return i;
            }

            auto second = std::to_integer<unsigned char>(data[i + 1]);
            if (second < lo || second > hi) {
                return i;
            }
            for (std::size_t k = 2; k < len; k++) {
                if (!is_continuation(std::to_integer<unsigned char>(data[i + k]))) {
                    return i;
                }
            }
            i += len;
        }
        return std::nullopt;
    }

    void ensure_utf8(const std::byte* data, std::size_t size, const char* what) {
        if (auto bad = find_invalid_utf8(data, size)) {
            throw invalid_utf8_error(
                build_error_msg(what, " is not valid UTF-8: invalid byte 0x", std::hex,
                                std::to_integer<unsigned>(data[*bad]), std::dec, " at offset ", *bad),
                *bad);
        }
    }

} // namespace pngchunk
