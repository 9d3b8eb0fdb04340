//
// UTF-8 validation used by text rendering of type codes and chunk data.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {
    /**
     * @brief Find the first byte that does not start a well-formed UTF-8 sequence
     * @param data Bytes to check
     * @param size Number of bytes
     * @return Offset of the offending sequence, or nullopt if the input is valid
     *
     * Overlong encodings, surrogates and code points above U+10FFFF are
     * rejected, as are sequences truncated by the end of the input.
     */
    PNGCHUNK_EXPORT std::optional<std::size_t> find_invalid_utf8(const std::uint8_t* data, std::size_t size);

    inline bool is_valid_utf8(const std::uint8_t* data, std::size_t size) {
        return !find_invalid_utf8(data, size).has_value();
    }
}
