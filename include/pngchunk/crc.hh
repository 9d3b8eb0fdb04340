/**
 * @file crc.hh
 * @brief CRC-32 used to protect chunk type and data
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/type_code.hh>

namespace pngchunk {

    /**
     * @brief CRC-32/ISO-HDLC (the zlib and PNG polynomial) of a buffer
     * @param data Bytes to checksum, may be null when size is 0
     * @param size Number of bytes
     */
    PNGCHUNK_EXPORT std::uint32_t crc32(const std::uint8_t* data, std::size_t size);

    /**
     * @brief Checksum stored in a chunk trailer
     *
     * Computed over the four type code bytes followed by the chunk data,
     * the same value as crc32() of their concatenation.
     */
    PNGCHUNK_EXPORT std::uint32_t crc32(const type_code& type, const std::uint8_t* data, std::size_t size);

} // namespace pngchunk
