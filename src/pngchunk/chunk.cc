//
// chunk: construction, parsing and serialization
//

#include <pngchunk/chunk.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/crc.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <iomanip>
#include <limits>
#include <ostream>
#include <utility>

#include "utf8.hh"

namespace pngchunk {

    namespace {
        std::vector<std::byte> text_bytes(std::string_view text) {
            auto first = reinterpret_cast<const std::byte*>(text.data());
            return {first, first + text.size()};
        }

        void warn(const codec_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> payload)
        : m_length(0)
        , m_type(type)
        , m_payload(std::move(payload))
        , m_crc(0) {
        THROW_CHUNK_IF(m_payload.size() > std::numeric_limits<std::uint32_t>::max(),
                       "Payload of ", m_payload.size(), " bytes does not fit a 32-bit chunk length");
        m_length = static_cast<std::uint32_t>(m_payload.size());
        m_crc = chunk_crc(m_type, m_payload.data(), m_payload.size());
    }

    chunk::chunk(chunk_type type, std::string_view text)
        : chunk(type, text_bytes(text)) {
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> payload, std::uint32_t crc)
        : m_length(static_cast<std::uint32_t>(payload.size()))
        , m_type(type)
        , m_payload(std::move(payload))
        , m_crc(crc) {
    }

    chunk chunk::parse(const void* data, std::size_t size, const codec_options& options) {
        if (size == 0) {
            throw empty_input_error("Cannot parse chunk from empty input");
        }
        if (size < overhead) {
            throw truncated_input_error(
                build_error_msg("Chunk too short: need at least ", overhead,
                                " bytes for header and CRC, got ", size),
                overhead, size);
        }

        auto bytes = static_cast<const std::byte*>(data);
        std::uint32_t length = load_u32(bytes, byte_order::big);

        if (length > options.max_chunk_length) {
            if (options.strict) {
                THROW_PARSE("Chunk declares payload length ", length,
                            " bytes, which exceeds maximum allowed length of ",
                            options.max_chunk_length, " bytes");
            }
            warn(options, 0, "size_limit",
                 build_error_msg("Chunk length ", length, " exceeds maximum ", options.max_chunk_length));
        }

        std::uint64_t needed = overhead + static_cast<std::uint64_t>(length);
        if (size < needed) {
            throw truncated_input_error(
                build_error_msg("Chunk truncated: declared payload length ", length, " needs ",
                                needed, " bytes, got ", size),
                needed, size);
        }

        auto type = chunk_type::from_bytes(bytes + length_field_size);

        if (!type.is_alphabetic()) {
            warn(options, length_field_size, "type_charset",
                 build_error_msg("Chunk type ", type, " contains bytes outside A-Z/a-z"));
        }
        if (!type.is_reserved_bit_valid()) {
            if (options.reject_reserved_type) {
                THROW_PARSE("Chunk type ", type, " has the reserved bit set");
            }
            warn(options, length_field_size, "reserved_bit",
                 build_error_msg("Chunk type ", type, " has the reserved bit set"));
        }

        const std::byte* payload_begin = bytes + header_size;
        const std::byte* payload_end = payload_begin + length;
        std::uint32_t stored = load_u32(payload_end, byte_order::big);
        std::uint32_t expected = chunk_crc(type, payload_begin, length);

        if (stored != expected) {
            throw crc_mismatch_error(
                build_error_msg("CRC mismatch in chunk ", type, ": computed 0x", std::hex,
                                std::setfill('0'), std::setw(8), expected, ", stored 0x",
                                std::setw(8), stored),
                expected, stored);
        }

        if (size > needed) {
            warn(options, needed, "trailing_data",
                 build_error_msg(size - needed, " bytes follow chunk ", type));
        }

        return chunk(type, std::vector<std::byte>(payload_begin, payload_end), stored);
    }

    chunk chunk::parse(const std::vector<std::byte>& buffer, const codec_options& options) {
        return parse(buffer.data(), buffer.size(), options);
    }

    std::string chunk::payload_as_string() const {
        ensure_utf8(m_payload.data(), m_payload.size(), "Chunk payload");
        return {reinterpret_cast<const char*>(m_payload.data()), m_payload.size()};
    }

    std::vector<std::byte> chunk::serialize() const {
        std::vector<std::byte> out;
        out.reserve(wire_size());
        serialize_to(out);
        return out;
    }

    void chunk::serialize_to(std::vector<std::byte>& out) const {
        auto start = out.size();
        out.resize(start + wire_size());

        std::byte* dst = out.data() + start;
        store_u32(dst, m_length, byte_order::big);
        m_type.to_bytes(dst + length_field_size);
        std::copy(m_payload.begin(), m_payload.end(), dst + header_size);
        store_u32(dst + header_size + m_payload.size(), m_crc, byte_order::big);
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        auto flags = os.flags();
        auto fill = os.fill();
        os << std::dec << "chunk " << c.type() << " length=" << c.length()
           << " crc=0x" << std::hex << std::setfill('0') << std::setw(8) << c.crc();
        os.flags(flags);
        os.fill(fill);
        return os;
    }

} // namespace pngchunk
