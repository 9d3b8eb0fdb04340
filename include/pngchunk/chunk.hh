/**
 * @file chunk.hh
 * @brief A single PNG-style chunk: type code, data and CRC
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/type_code.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @class chunk
     * @brief Immutable chunk value with wire serialization
     *
     * Wire layout:
     * @code
     * offset  size  field
     * 0       4     data length, big-endian
     * 4       4     type code
     * 8       N     data
     * 8+N     4     CRC-32 of type code and data, big-endian
     * @endcode
     *
     * Length and CRC are not stored; they are derived from the data on
     * every call.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        static constexpr std::size_t length_field_size = 4;
        static constexpr std::size_t type_field_size = 4;
        static constexpr std::size_t crc_field_size = 4;
        /// Smallest possible encoded chunk (empty data)
        static constexpr std::size_t min_size = length_field_size + type_field_size + crc_field_size;

        /**
         * @brief Create a chunk from a type code and data
         *
         * The type code is not checked; validation happens on the parse path.
         */
        chunk(type_code type, std::vector<std::uint8_t> data);

        /**
         * @brief Decode and validate a chunk occupying the whole buffer
         * @param data Encoded chunk
         * @param size Size of the encoded chunk
         * @param options Validation options
         * @throws buffer_too_short if size is below min_size
         * @throws length_mismatch if the length field does not match the data size
         * @throws checksum_mismatch if the CRC field does not match the computed CRC
         * @throws invalid_type_code if options.require_valid_type is set and the type is not valid
         */
        static chunk parse(const std::uint8_t* data, std::size_t size, const parse_options& options);
        static chunk parse(const std::uint8_t* data, std::size_t size);
        static chunk parse(const std::vector<std::uint8_t>& buffer, const parse_options& options);
        static chunk parse(const std::vector<std::uint8_t>& buffer);

        [[nodiscard]] std::uint32_t length() const {
            return static_cast<std::uint32_t>(m_data.size());
        }

        [[nodiscard]] const type_code& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::uint8_t>& data() const { return m_data; }

        /// CRC-32 over type code bytes followed by the data
        [[nodiscard]] std::uint32_t crc() const;

        /**
         * @brief Chunk data as text
         * @throws text_decode_error if the data is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /// Encode as length, type, data and CRC; always 12 + length() bytes
        [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;

        bool operator==(const chunk& o) const { return m_type == o.m_type && m_data == o.m_data; }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        type_code m_type;
        std::vector<std::uint8_t> m_data;
    };

    /// Multi-line human-readable summary, for diagnostics only
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
