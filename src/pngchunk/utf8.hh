//
// Strict UTF-8 validation for text views of chunk bytes
//

#pragma once

#include <cstddef>
#include <optional>

namespace pngchunk {

    // Offset of the first byte that does not begin a well-formed UTF-8
    // sequence, or nullopt if the whole range is valid. Overlong forms,
    // surrogates and code points above U+10FFFF are rejected.
    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size) noexcept;

    // Throws invalid_utf8_error naming @p what if the range is not valid UTF-8
    void ensure_utf8(const std::byte* data, std::size_t size, const char* what);

} // namespace pngchunk
