/**
 * @file codec_options.hh
 * @brief Parsing options for chunk records
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct codec_options
     * @brief Configuration options for chunk::parse
     *
     * Default-constructed options accept every well-formed record whose
     * CRC verifies. The remaining knobs tighten validation or report
     * non-fatal findings through the warning callback.
     */
    struct codec_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a declared length above max_chunk_length is an error.
         * When false, it is reported as a warning and parsing continues.
         */
        bool strict = true;

        /**
         * @brief Maximum accepted payload length in bytes
         *
         * Default is 4GB, which no 32-bit length field can exceed.
         * PNG itself limits lengths to 2^31 - 1.
         */
        std::uint64_t max_chunk_length = std::uint64_t(1) << 32;  // 4GB

        /**
         * @brief Reject chunk types whose reserved bit is set
         *
         * When false, such types are accepted and a "reserved_bit"
         * warning is emitted.
         */
        bool reject_reserved_type = false;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Byte offset within the input buffer
         * @param category Warning category ("size_limit", "reserved_bit",
         *                 "type_charset", "trailing_data")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
