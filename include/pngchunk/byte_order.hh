/**
 * @file byte_order.hh
 * @brief Byte order utilities for the chunk length and checksum fields
 */

#pragma once

#include <cstdint>
#include <cstring>

#include <pngchunk/endian.hh>

namespace pngchunk {
    /**
     * @enum byte_order
     * @brief Byte order (endianness) for reading/writing multi-byte values
     */
    enum class byte_order {
        little, ///< Little-endian, accepted on parse for compatibility
        big     ///< Big-endian, the canonical wire order
    };

    /**
     * @brief Read an unsigned 32-bit value stored in the given byte order
     * @param src Pointer to at least 4 readable bytes
     * @param bo Byte order of the stored value
     */
    inline std::uint32_t load_u32(const std::uint8_t* src, byte_order bo) {
        std::uint32_t value;
        std::memcpy(&value, src, sizeof(value));
        return bo == byte_order::big ? swap32be(value) : swap32le(value);
    }

    /**
     * @brief Write an unsigned 32-bit value in the given byte order
     * @param value Value to store
     * @param bo Byte order to use
     * @param dst Pointer to at least 4 writable bytes
     */
    inline void store_u32(std::uint32_t value, byte_order bo, std::uint8_t* dst) {
        value = bo == byte_order::big ? swap32be(value) : swap32le(value);
        std::memcpy(dst, &value, sizeof(value));
    }
}
