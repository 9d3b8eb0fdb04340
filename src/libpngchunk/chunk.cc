//
// Chunk encoding and validating decode.
//

#include <pngchunk/chunk.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/crc.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <ostream>
#include <utility>

#include "utf8.hh"

namespace pngchunk {

    namespace {
        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }

        void check_type(const type_code& type, const parse_options& options) {
            constexpr std::uint64_t offset = chunk::length_field_size;
            auto bytes = type.bytes();
            std::string raw(reinterpret_cast<const char*>(bytes.data()), bytes.size());

            if (!type.is_alphanumeric_code()) {
                auto msg = build_error_msg("type code ", type, " contains a byte that is not an ASCII letter");
                if (options.require_valid_type) {
                    THROW_INVALID_TYPE(raw, msg);
                }
                warn(options, offset, "type_code", msg);
            } else if (!type.is_reserved_bit_valid()) {
                auto msg = build_error_msg("type code ", type, " has the reserved bit set");
                if (options.require_valid_type) {
                    THROW_INVALID_TYPE(raw, msg);
                }
                warn(options, offset, "reserved_bit", msg);
            }
        }
    }

    chunk::chunk(type_code type, std::vector<std::uint8_t> data)
        : m_type(type), m_data(std::move(data)) {}

    chunk chunk::parse(const std::uint8_t* data, std::size_t size, const parse_options& options) {
        // Nothing is sliced before the minimal frame is known to be present
        if (data == nullptr || size < min_size) {
            throw buffer_too_short(min_size, data == nullptr ? 0 : size);
        }

        const std::uint32_t len_be = load_u32(data, byte_order::big);
        const std::uint32_t len_le = load_u32(data, byte_order::little);

        type_code type = type_code::from_bytes(data + length_field_size);

        const std::size_t crc_offset = size - crc_field_size;
        const std::uint8_t* payload = data + length_field_size + type_field_size;
        const std::uint64_t payload_size = crc_offset - length_field_size - type_field_size;

        if (payload_size > options.max_payload_size) {
            throw length_mismatch(len_be, len_le, payload_size,
                                  build_error_msg("payload of ", payload_size,
                                                  " bytes exceeds the limit of ",
                                                  options.max_payload_size, " bytes"));
        }

        const bool length_le_only = payload_size != len_be;
        if (length_le_only && (options.strict_byte_order || payload_size != len_le)) {
            throw length_mismatch(len_be, len_le, payload_size);
        }

        const std::uint32_t crc_be = load_u32(data + crc_offset, byte_order::big);
        const std::uint32_t crc_le = load_u32(data + crc_offset, byte_order::little);
        const std::uint32_t computed = crc32(type, payload, static_cast<std::size_t>(payload_size));

        const bool crc_le_only = computed != crc_be;
        if (crc_le_only && (options.strict_byte_order || computed != crc_le)) {
            throw checksum_mismatch(crc_be, crc_le, computed);
        }

        // Frame is intact; only now look at the type code and report findings
        check_type(type, options);
        if (length_le_only) {
            warn(options, 0, "byte_order",
                 build_error_msg("length field ", len_le, " only matches in little-endian order"));
        }
        if (crc_le_only) {
            warn(options, crc_offset, "byte_order",
                 build_error_msg("checksum field ", crc_le, " only matches in little-endian order"));
        }

        return chunk(type, std::vector<std::uint8_t>(payload, payload + payload_size));
    }

    chunk chunk::parse(const std::uint8_t* data, std::size_t size) {
        return parse(data, size, parse_options{});
    }

    chunk chunk::parse(const std::vector<std::uint8_t>& buffer, const parse_options& options) {
        return parse(buffer.data(), buffer.size(), options);
    }

    chunk chunk::parse(const std::vector<std::uint8_t>& buffer) {
        return parse(buffer.data(), buffer.size(), parse_options{});
    }

    std::uint32_t chunk::crc() const {
        return crc32(m_type, m_data.data(), m_data.size());
    }

    std::string chunk::data_as_string() const {
        if (auto bad = find_invalid_utf8(m_data.data(), m_data.size())) {
            throw text_decode_error(*bad);
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::uint8_t> chunk::to_bytes() const {
        std::vector<std::uint8_t> out(min_size + m_data.size());
        std::uint8_t* p = out.data();

        store_u32(length(), byte_order::big, p);
        p += length_field_size;
        m_type.to_bytes(p);
        p += type_field_size;
        p = std::copy(m_data.begin(), m_data.end(), p);
        store_u32(crc(), byte_order::big, p);

        return out;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        auto bytes = c.type().bytes();
        os << "Chunk {\n";
        os << "    Length: " << c.length() << "\n";
        os << "    Type code: " << c.type() << " (["
           << unsigned(bytes[0]) << ", " << unsigned(bytes[1]) << ", "
           << unsigned(bytes[2]) << ", " << unsigned(bytes[3]) << "])\n";
        os << "    Data: " << c.data().size() << " bytes\n";
        os << "    CRC: " << c.crc() << "\n";
        os << "}\n";
        return os;
    }

}
