//
// chunk_type: text construction and rendering
//

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

#include <iomanip>
#include <ostream>

#include "utf8.hh"

namespace pngchunk {

    namespace {
        [[noreturn]] void throw_invalid_character(std::string_view text, std::size_t i) {
            auto c = static_cast<unsigned char>(text[i]);
            throw invalid_character_error(
                build_error_msg("Chunk type \"", text, "\" contains a character outside A-Z/a-z at position ",
                                i, " (0x", std::hex, static_cast<unsigned>(c), std::dec, ")"),
                i, c);
        }
    }

    chunk_type chunk_type::from_text(std::string_view text) {
        // Everything before the first non-ASCII byte is one byte per character,
        // so its byte index is also its character index
        for (std::size_t i = 0; i < text.size(); i++) {
            if (static_cast<unsigned char>(text[i]) >= 0x80) {
                throw_invalid_character(text, i);
            }
        }

        if (text.size() != size) {
            throw invalid_length_error(
                build_error_msg("Chunk type must be exactly 4 characters, got ", text.size(),
                                " in \"", text, "\""),
                text.size());
        }

        std::array<std::byte, 4> bytes;
        for (std::size_t i = 0; i < size; i++) {
            auto v = static_cast<std::byte>(text[i]);
            if (!is_ascii_letter(v)) {
                throw_invalid_character(text, i);
            }
            bytes[i] = v;
        }
        return from_bytes(bytes);
    }

    std::string chunk_type::to_string() const {
        ensure_utf8(m_bytes.data(), m_bytes.size(), "Chunk type");
        return {reinterpret_cast<const char*>(m_bytes.data()), m_bytes.size()};
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        // Check if hex format is set
        if (os.flags() & std::ios::hex) {
            // Save and restore format flags
            auto flags = os.flags();
            auto fill = os.fill();
            os << "0x" << std::hex << std::setfill('0') << std::setw(8) << t.to_uint32();
            os.flags(flags);
            os.fill(fill);
            return os;
        }

        // Default: output as quoted string
        auto flags = os.flags();
        auto fill = os.fill();
        os << '\'';
        for (auto v : t) {
            auto c = std::to_integer<unsigned char>(v);
            if (c >= 32 && c <= 126) {
                os << static_cast<char>(c);
            } else {
                // Escape non-printable characters
                os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                   << static_cast<unsigned>(c) << std::dec;
            }
        }
        os << '\'';
        os.flags(flags);
        os.fill(fill);
        return os;
    }

} // namespace pngchunk
