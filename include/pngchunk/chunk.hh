/**
 * @file chunk.hh
 * @brief A single length-prefixed, typed, CRC-checked chunk record
 *
 * Wire layout (all integers big-endian):
 *
 * | offset | size | field                              |
 * |--------|------|------------------------------------|
 * | 0      | 4    | payload length N                   |
 * | 4      | 4    | chunk type                         |
 * | 8      | N    | payload                            |
 * | 8+N    | 4    | CRC-32 over bytes [4, 8+N)         |
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/codec_options.hh>

namespace pngchunk {

    /**
     * @class chunk
     * @brief Immutable chunk record
     *
     * A chunk always carries the CRC of its type and payload: it is either
     * built from parts, in which case the CRC is computed, or parsed, in
     * which case the stored CRC has been verified.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        static constexpr std::size_t length_field_size = 4;
        static constexpr std::size_t header_size = 8;      ///< length + type
        static constexpr std::size_t crc_size = 4;
        static constexpr std::size_t overhead = header_size + crc_size;

        /**
         * @brief Build a chunk from a type and payload
         * @throws chunk_error if the payload does not fit a 32-bit length
         */
        chunk(chunk_type type, std::vector<std::byte> payload);

        /**
         * @brief Build a chunk whose payload is the bytes of @p text
         */
        chunk(chunk_type type, std::string_view text);

        /**
         * @brief Decode one chunk from the start of a buffer
         *
         * Bytes past the end of the record are ignored; wire_size() tells
         * how many were consumed.
         *
         * @param data Input bytes
         * @param size Number of input bytes
         * @param options Validation limits and warning callback
         * @throws empty_input_error if @p size is 0
         * @throws truncated_input_error if the buffer ends before the CRC footer
         * @throws crc_mismatch_error if the stored CRC does not verify
         * @throws parse_error if @p options reject the record
         */
        static chunk parse(const void* data, std::size_t size, const codec_options& options = {});

        static chunk parse(const std::vector<std::byte>& buffer, const codec_options& options = {});

        [[nodiscard]] std::uint32_t length() const noexcept { return m_length; }
        [[nodiscard]] const chunk_type& type() const noexcept { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& payload() const noexcept { return m_payload; }
        [[nodiscard]] std::uint32_t crc() const noexcept { return m_crc; }

        /// Total encoded size: length, type, payload and CRC
        [[nodiscard]] std::size_t wire_size() const noexcept { return overhead + m_payload.size(); }

        /**
         * @brief Payload as text
         * @throws invalid_utf8_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string payload_as_string() const;

        /// Encode to the canonical wire form
        [[nodiscard]] std::vector<std::byte> serialize() const;

        /// Append the wire form to @p out
        void serialize_to(std::vector<std::byte>& out) const;

        bool operator==(const chunk& o) const {
            return m_type == o.m_type && m_crc == o.m_crc && m_payload == o.m_payload;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(chunk_type type, std::vector<std::byte> payload, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_payload;
        std::uint32_t m_crc;
    };

    /// One-line summary: chunk 'RuSt' length=42 crc=0xabd1d84e
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
