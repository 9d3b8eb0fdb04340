//
// CRC-32 on top of zlib.
//

#include <pngchunk/crc.hh>

#include <algorithm>
#include <limits>
#include <zlib.h>

namespace pngchunk {

    namespace {
        uLong update(uLong crc, const std::uint8_t* data, std::size_t size) {
            // zlib takes uInt lengths, feed larger buffers in blocks
            constexpr std::size_t max_block = std::numeric_limits<uInt>::max();
            while (size > 0) {
                auto block = std::min(size, max_block);
                crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(block));
                data += block;
                size -= block;
            }
            return crc;
        }
    }

    std::uint32_t crc32(const std::uint8_t* data, std::size_t size) {
        uLong crc = ::crc32(0L, Z_NULL, 0);
        return static_cast<std::uint32_t>(update(crc, data, size));
    }

    std::uint32_t crc32(const type_code& type, const std::uint8_t* data, std::size_t size) {
        auto bytes = type.bytes();
        uLong crc = ::crc32(0L, Z_NULL, 0);
        crc = update(crc, bytes.data(), bytes.size());
        return static_cast<std::uint32_t>(update(crc, data, size));
    }

}
