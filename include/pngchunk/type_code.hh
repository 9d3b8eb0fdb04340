/**
 * @file type_code.hh
 * @brief Four byte chunk type code with PNG property bits
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>
#include <functional>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class type_code
     * @brief Immutable 4-byte chunk type identifier
     *
     * Bit 5 (value 32, the ASCII case bit) of every byte carries a property:
     * byte 0 the ancillary bit, byte 1 the private bit, byte 2 the reserved
     * bit and byte 3 the safe-to-copy bit.
     *
     * Construction from raw bytes performs no validation. Construction from
     * text requires four ASCII letters but does not check the reserved bit.
     */
    class PNGCHUNK_EXPORT type_code {
    public:
        static constexpr std::size_t size = 4;

        // The case bit of an ASCII letter
        static constexpr std::uint8_t property_bit = 0x20;

        // Constructor from raw bytes (no validation)
        constexpr explicit type_code(const std::array<std::uint8_t, 4>& bytes)
            : m_bytes(bytes) {}

        // Constructor from a raw buffer of at least 4 bytes (no validation)
        static type_code from_bytes(const void* data) {
            std::array<std::uint8_t, 4> bytes{};
            std::memcpy(bytes.data(), data, size);
            return type_code(bytes);
        }

        /**
         * @brief Build a type code from its textual form
         * @param text Exactly four ASCII letters
         * @throws invalid_type_code if text has another length or a non-letter byte
         *
         * The reserved bit is not checked; "Rust" is accepted although
         * is_valid() reports false for it.
         */
        static type_code from_text(std::string_view text);

        [[nodiscard]] constexpr std::array<std::uint8_t, 4> bytes() const { return m_bytes; }

        /// True iff every byte is an ASCII letter (A-Z or a-z)
        [[nodiscard]] bool is_alphanumeric_code() const {
            return std::all_of(m_bytes.begin(), m_bytes.end(), is_valid_byte);
        }

        /// Alphanumeric and reserved bit clear
        [[nodiscard]] bool is_valid() const {
            return is_alphanumeric_code() && is_reserved_bit_valid();
        }

        // Uppercase first letter: unknown chunks of this type must not be skipped
        [[nodiscard]] constexpr bool is_critical() const {
            return (m_bytes[0] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_public() const {
            return (m_bytes[1] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_reserved_bit_valid() const {
            return (m_bytes[2] & property_bit) == 0;
        }

        // Lowercase last letter: editors may copy the chunk without understanding it
        [[nodiscard]] constexpr bool is_safe_to_copy() const {
            return (m_bytes[3] & property_bit) != 0;
        }

        [[nodiscard]] static constexpr bool is_valid_byte(std::uint8_t byte) {
            return (byte >= 65 && byte <= 90) || (byte >= 97 && byte <= 122);
        }

        /**
         * @brief Render the code as text
         * @throws text_render_error if the bytes are not valid UTF-8
         */
        [[nodiscard]] std::string to_string() const;

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, m_bytes.data(), size);
        }

        constexpr std::uint8_t operator[](std::size_t i) const { return m_bytes[i]; }

        // Comparison operators
        bool operator==(const type_code& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const type_code& o) const { return !(*this == o); }
        bool operator<(const type_code& o) const { return m_bytes < o.m_bytes; }

        // Stream output, quoted, with non-printable bytes escaped
        friend std::ostream& operator<<(std::ostream& os, const type_code& t) {
            auto flags = os.flags();
            auto fill = os.fill();
            os << '\'';
            for (std::uint8_t c : t.m_bytes) {
                if (c >= 32 && c <= 126) {
                    os << static_cast<char>(c);
                } else {
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(c);
                }
            }
            os << '\'';
            os.flags(flags);
            os.fill(fill);
            return os;
        }

    private:
        std::array<std::uint8_t, 4> m_bytes;
    };

    // Hash function
    struct type_code_hash {
        std::size_t operator()(const type_code& t) const noexcept {
            std::uint32_t v;
            auto bytes = t.bytes();
            std::memcpy(&v, bytes.data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // Registered PNG chunk types
    namespace chunk_types {
        inline constexpr type_code IHDR({'I', 'H', 'D', 'R'});
        inline constexpr type_code PLTE({'P', 'L', 'T', 'E'});
        inline constexpr type_code IDAT({'I', 'D', 'A', 'T'});
        inline constexpr type_code IEND({'I', 'E', 'N', 'D'});
        inline constexpr type_code tEXt({'t', 'E', 'X', 't'});
    }

} // namespace pngchunk

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::type_code> {
        std::size_t operator()(const pngchunk::type_code& t) const noexcept {
            return pngchunk::type_code_hash{}(t);
        }
    };
}
