/**
 * @file chunk_type.hh
 * @brief Four-byte chunk type code with its property bits
 *
 * A chunk type is four bytes, by convention ASCII letters. Bit 5 (0x20)
 * of each byte carries a property: lowercase letters have it set,
 * uppercase letters have it clear.
 *
 * | byte | bit 5 clear        | bit 5 set      |
 * |------|--------------------|----------------|
 * | 0    | critical           | ancillary      |
 * | 1    | public             | private        |
 * | 2    | valid (reserved)   | invalid        |
 * | 3    | unsafe to copy     | safe to copy   |
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <string_view>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    constexpr bool is_ascii_letter(std::byte v) noexcept {
        auto c = std::to_integer<unsigned char>(v);
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    class PNGCHUNK_EXPORT chunk_type {
    public:
        static constexpr std::size_t size = 4;
        static constexpr std::byte property_bit{0x20};

        constexpr chunk_type(std::byte c0, std::byte c1, std::byte c2, std::byte c3) noexcept
            : m_bytes{c0, c1, c2, c3} {}

        // Raw bytes are stored verbatim, no character class check
        static constexpr chunk_type from_bytes(const std::array<std::byte, 4>& bytes) noexcept {
            return {bytes[0], bytes[1], bytes[2], bytes[3]};
        }

        static chunk_type from_bytes(const void* data) noexcept {
            std::array<std::byte, 4> bytes;
            std::memcpy(bytes.data(), data, 4);
            return from_bytes(bytes);
        }

        /**
         * @brief Build a chunk type from its textual form
         * @param text Exactly four ASCII letters
         * @throws invalid_character_error if a character is not A-Z / a-z.
         *         Non-ASCII bytes are reported this way whatever the length.
         * @throws invalid_length_error if @p text is not four characters
         */
        static chunk_type from_text(std::string_view text);

        [[nodiscard]] constexpr std::array<std::byte, 4> bytes() const noexcept { return m_bytes; }

        void to_bytes(void* dest) const noexcept {
            std::memcpy(dest, m_bytes.data(), 4);
        }

        // Bytes read as a big-endian number, the way PNG tables list them
        [[nodiscard]] constexpr std::uint32_t to_uint32() const noexcept {
            return (std::to_integer<std::uint32_t>(m_bytes[0]) << 24) |
                   (std::to_integer<std::uint32_t>(m_bytes[1]) << 16) |
                   (std::to_integer<std::uint32_t>(m_bytes[2]) << 8) |
                   std::to_integer<std::uint32_t>(m_bytes[3]);
        }

        constexpr std::byte operator[](std::size_t i) const { return m_bytes[i]; }

        [[nodiscard]] constexpr auto begin() const noexcept { return m_bytes.begin(); }
        [[nodiscard]] constexpr auto end() const noexcept { return m_bytes.end(); }

        // Property bits
        [[nodiscard]] constexpr bool ancillary_bit() const noexcept { return bit(0); }
        [[nodiscard]] constexpr bool private_bit() const noexcept { return bit(1); }
        [[nodiscard]] constexpr bool reserved_bit() const noexcept { return bit(2); }
        [[nodiscard]] constexpr bool safe_to_copy_bit() const noexcept { return bit(3); }

        [[nodiscard]] constexpr bool is_reserved_bit_valid() const noexcept { return !reserved_bit(); }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return is_reserved_bit_valid(); }
        [[nodiscard]] constexpr bool is_critical() const noexcept { return !ancillary_bit(); }
        [[nodiscard]] constexpr bool is_public() const noexcept { return !private_bit(); }
        // Unlike the other predicates, true when the bit is set
        [[nodiscard]] constexpr bool is_safe_to_copy() const noexcept { return safe_to_copy_bit(); }

        [[nodiscard]] constexpr bool is_alphabetic() const noexcept {
            for (auto v : m_bytes) {
                if (!is_ascii_letter(v)) {
                    return false;
                }
            }
            return true;
        }

        /**
         * @brief Render the type code as text
         * @throws invalid_utf8_error if the bytes are not valid UTF-8
         */
        [[nodiscard]] std::string to_string() const;

        constexpr bool operator==(const chunk_type& o) const noexcept { return m_bytes == o.m_bytes; }
        constexpr bool operator!=(const chunk_type& o) const noexcept { return !(*this == o); }
        constexpr bool operator<(const chunk_type& o) const noexcept { return to_uint32() < o.to_uint32(); }

    private:
        constexpr bool bit(std::size_t i) const noexcept {
            return (m_bytes[i] & property_bit) != std::byte{0};
        }

        std::array<std::byte, 4> m_bytes;
    };

    // Quoted text with non-printable bytes escaped; hex mode prints to_uint32()
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time chunk types: "IHDR"_ctype
    constexpr chunk_type operator""_ctype(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("chunk type literal must be exactly 4 characters");
        }
        chunk_type t{std::byte(str[0]), std::byte(str[1]), std::byte(str[2]), std::byte(str[3])};
        if (!t.is_alphabetic()) {
            throw std::invalid_argument("chunk type literal must contain only A-Z or a-z");
        }
        return t;
    }

} // namespace pngchunk

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
