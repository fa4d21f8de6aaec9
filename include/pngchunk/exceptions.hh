/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the chunk codec
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library. Every failure of a codec
 * operation is reported by throwing one of these types; no operation
 * terminates the process on malformed input.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>

namespace pngchunk {

    /**
     * @class chunk_error
     * @brief Base exception class for all codec errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch all codec errors with a single catch block.
     */
    class chunk_error : public std::runtime_error {
    public:
        explicit chunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for errors while decoding a chunk from bytes
     *
     * Thrown directly for option violations (size limit, reserved type)
     * and used as the base of the specific decoding failures below.
     */
    class parse_error : public chunk_error {
    public:
        explicit parse_error(const std::string& msg)
            : chunk_error(msg) {}
    };

    /**
     * @class empty_input_error
     * @brief Parse was called on a zero-length buffer
     */
    class empty_input_error : public parse_error {
    public:
        explicit empty_input_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class truncated_input_error
     * @brief Buffer is shorter than the header, payload or CRC footer require
     */
    class truncated_input_error : public parse_error {
    public:
        truncated_input_error(const std::string& msg, std::uint64_t needed, std::uint64_t available)
            : parse_error(msg), m_needed(needed), m_available(available) {}

        /// Number of bytes the record requires
        [[nodiscard]] std::uint64_t needed() const noexcept { return m_needed; }
        /// Number of bytes actually supplied
        [[nodiscard]] std::uint64_t available() const noexcept { return m_available; }

    private:
        std::uint64_t m_needed;
        std::uint64_t m_available;
    };

    /**
     * @class crc_mismatch_error
     * @brief Stored CRC does not match the CRC recomputed over type and payload
     *
     * Signals corrupted or tampered data.
     */
    class crc_mismatch_error : public parse_error {
    public:
        crc_mismatch_error(const std::string& msg, std::uint32_t expected, std::uint32_t found)
            : parse_error(msg), m_expected(expected), m_found(found) {}

        /// CRC computed from the type and payload bytes
        [[nodiscard]] std::uint32_t expected() const noexcept { return m_expected; }
        /// CRC stored in the record footer
        [[nodiscard]] std::uint32_t found() const noexcept { return m_found; }

    private:
        std::uint32_t m_expected;
        std::uint32_t m_found;
    };

    /**
     * @class chunk_type_error
     * @brief Base for errors building a chunk type from text
     */
    class chunk_type_error : public chunk_error {
    public:
        explicit chunk_type_error(const std::string& msg)
            : chunk_error(msg) {}
    };

    /**
     * @class invalid_length_error
     * @brief Chunk type text is not exactly four characters long
     */
    class invalid_length_error : public chunk_type_error {
    public:
        invalid_length_error(const std::string& msg, std::size_t length)
            : chunk_type_error(msg), m_length(length) {}

        [[nodiscard]] std::size_t length() const noexcept { return m_length; }

    private:
        std::size_t m_length;
    };

    /**
     * @class invalid_character_error
     * @brief Chunk type text contains a byte outside A-Z / a-z
     */
    class invalid_character_error : public chunk_type_error {
    public:
        invalid_character_error(const std::string& msg, std::size_t position, unsigned char value)
            : chunk_type_error(msg), m_position(position), m_value(value) {}

        /// Index of the first offending character
        [[nodiscard]] std::size_t position() const noexcept { return m_position; }
        /// The offending byte
        [[nodiscard]] unsigned char value() const noexcept { return m_value; }

    private:
        std::size_t m_position;
        unsigned char m_value;
    };

    /**
     * @class encoding_error
     * @brief Base for errors converting bytes to text
     */
    class encoding_error : public chunk_error {
    public:
        explicit encoding_error(const std::string& msg)
            : chunk_error(msg) {}
    };

    /**
     * @class invalid_utf8_error
     * @brief Bytes requested as text are not valid UTF-8
     */
    class invalid_utf8_error : public encoding_error {
    public:
        invalid_utf8_error(const std::string& msg, std::size_t offset)
            : encoding_error(msg), m_offset(offset) {}

        /// Offset of the first byte that does not start a valid sequence
        [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }

    private:
        std::size_t m_offset;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_CHUNK
     * @brief Throw a chunk_error with formatted message
     */
    #define THROW_CHUNK(...) \
        throw ::pngchunk::chunk_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error with formatted message
     */
    #define THROW_PARSE(...) \
        throw ::pngchunk::parse_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_CHUNK_IF
     * @brief Conditionally throw a chunk_error
     */
    #define THROW_CHUNK_IF(condition, ...) \
        do { if (condition) THROW_CHUNK(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
