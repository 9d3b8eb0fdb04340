//
// Platform endianness and 32-bit byte swapping.
//

#pragma once

#include <cstdint>

#include <pngchunk/pngchunk_config.h>

namespace pngchunk {
    // Platform endianness detection using CMake-generated config
#if LIBPNGCHUNK_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    constexpr std::uint32_t swap32(std::uint32_t x) noexcept {
        return ((x << 24) | ((x << 8) & 0x00FF0000u) |
                ((x >> 8) & 0x0000FF00u) | (x >> 24));
    }

    // Conditional byte swapping based on platform
    constexpr std::uint32_t swap32le(std::uint32_t x) noexcept {
        return is_little_endian ? x : swap32(x);
    }

    constexpr std::uint32_t swap32be(std::uint32_t x) noexcept {
        return is_big_endian ? x : swap32(x);
    }
}
