/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the chunk library
 *
 * Every failure of the library is reported as an exception derived from
 * chunk_error. Each exception carries an error_kind tag and the structured
 * values that caused it, so callers can branch on the kind and log the
 * expected and actual values without parsing the message.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>
#include <ostream>
#include <utility>

namespace pngchunk {

    /**
     * @enum error_kind
     * @brief Tag identifying the concrete failure behind a chunk_error
     */
    enum class error_kind {
        invalid_type_code, ///< Type code text is not exactly 4 ASCII letters
        buffer_too_short,  ///< Parse input is shorter than the minimal frame
        length_mismatch,   ///< Declared length does not match the payload
        checksum_mismatch, ///< Declared checksum does not match the computed one
        text_decode,       ///< Payload is not valid UTF-8
        text_render        ///< Type code bytes are not valid UTF-8
    };

    inline const char* to_string(error_kind kind) {
        switch (kind) {
            case error_kind::invalid_type_code:
                return "invalid type code";
            case error_kind::buffer_too_short:
                return "buffer too short";
            case error_kind::length_mismatch:
                return "length mismatch";
            case error_kind::checksum_mismatch:
                return "checksum mismatch";
            case error_kind::text_decode:
                return "text decode error";
            case error_kind::text_render:
                return "text render error";
        }
        return "unknown error";
    }

    inline std::ostream& operator<<(std::ostream& os, error_kind kind) {
        return os << to_string(kind);
    }

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @class chunk_error
     * @brief Base exception class for all chunk-related errors
     *
     * Catch this to handle every failure of the library in one place;
     * use kind() to tell them apart.
     */
    class chunk_error : public std::runtime_error {
    public:
        chunk_error(error_kind kind, const std::string& msg)
            : std::runtime_error(build_error_msg(to_string(kind), ": ", msg)),
              m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class invalid_type_code
     * @brief Thrown when a type code is built from text that is not 4 ASCII letters
     *
     * Also raised by the parser when parse_options::require_valid_type is set
     * and the parsed code fails type_code::is_valid().
     */
    class invalid_type_code : public chunk_error {
    public:
        invalid_type_code(std::string input, const std::string& msg)
            : chunk_error(error_kind::invalid_type_code, msg),
              m_input(std::move(input)) {}

        /// Raw bytes of the rejected input
        [[nodiscard]] const std::string& input() const noexcept { return m_input; }

    private:
        std::string m_input;
    };

    /**
     * @class buffer_too_short
     * @brief Thrown when a parse input cannot hold length, type and checksum
     */
    class buffer_too_short : public chunk_error {
    public:
        buffer_too_short(std::size_t required, std::size_t actual)
            : chunk_error(error_kind::buffer_too_short,
                          build_error_msg("need at least ", required, " bytes, got ", actual)),
              m_required(required),
              m_actual(actual) {}

        [[nodiscard]] std::size_t required() const noexcept { return m_required; }
        [[nodiscard]] std::size_t actual() const noexcept { return m_actual; }

    private:
        std::size_t m_required;
        std::size_t m_actual;
    };

    /**
     * @class length_mismatch
     * @brief Thrown when the declared length matches the payload in neither byte order
     *
     * declared_be() and declared_le() are the two readings of the length
     * field; actual() is the number of payload bytes found in the buffer.
     */
    class length_mismatch : public chunk_error {
    public:
        length_mismatch(std::uint32_t declared_be, std::uint32_t declared_le, std::uint64_t actual)
            : chunk_error(error_kind::length_mismatch,
                          build_error_msg("declared ", declared_be, " (big-endian) / ",
                                          declared_le, " (little-endian), payload has ",
                                          actual, " bytes")),
              m_declared_be(declared_be),
              m_declared_le(declared_le),
              m_actual(actual) {}

        length_mismatch(std::uint32_t declared_be, std::uint32_t declared_le, std::uint64_t actual,
                        const std::string& msg)
            : chunk_error(error_kind::length_mismatch, msg),
              m_declared_be(declared_be),
              m_declared_le(declared_le),
              m_actual(actual) {}

        [[nodiscard]] std::uint32_t declared_be() const noexcept { return m_declared_be; }
        [[nodiscard]] std::uint32_t declared_le() const noexcept { return m_declared_le; }
        [[nodiscard]] std::uint64_t actual() const noexcept { return m_actual; }

    private:
        std::uint32_t m_declared_be;
        std::uint32_t m_declared_le;
        std::uint64_t m_actual;
    };

    /**
     * @class checksum_mismatch
     * @brief Thrown when the stored CRC matches the computed one in neither byte order
     */
    class checksum_mismatch : public chunk_error {
    public:
        checksum_mismatch(std::uint32_t declared_be, std::uint32_t declared_le, std::uint32_t computed)
            : chunk_error(error_kind::checksum_mismatch,
                          build_error_msg("declared ", declared_be, " (big-endian) / ",
                                          declared_le, " (little-endian), computed ", computed)),
              m_declared_be(declared_be),
              m_declared_le(declared_le),
              m_computed(computed) {}

        [[nodiscard]] std::uint32_t declared_be() const noexcept { return m_declared_be; }
        [[nodiscard]] std::uint32_t declared_le() const noexcept { return m_declared_le; }
        [[nodiscard]] std::uint32_t computed() const noexcept { return m_computed; }

    private:
        std::uint32_t m_declared_be;
        std::uint32_t m_declared_le;
        std::uint32_t m_computed;
    };

    /**
     * @class text_decode_error
     * @brief Thrown when chunk data requested as text is not valid UTF-8
     */
    class text_decode_error : public chunk_error {
    public:
        explicit text_decode_error(std::size_t offset)
            : chunk_error(error_kind::text_decode,
                          build_error_msg("invalid UTF-8 sequence at offset ", offset)),
              m_offset(offset) {}

        /// Offset of the first byte that does not start a valid sequence
        [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }

    private:
        std::size_t m_offset;
    };

    /**
     * @class text_render_error
     * @brief Thrown when a type code built from raw bytes cannot be rendered as text
     */
    class text_render_error : public chunk_error {
    public:
        explicit text_render_error(const std::array<std::uint8_t, 4>& bytes)
            : chunk_error(error_kind::text_render,
                          build_error_msg("type code bytes [",
                                          unsigned(bytes[0]), ", ", unsigned(bytes[1]), ", ",
                                          unsigned(bytes[2]), ", ", unsigned(bytes[3]),
                                          "] are not valid UTF-8")),
              m_bytes(bytes) {}

        [[nodiscard]] const std::array<std::uint8_t, 4>& bytes() const noexcept { return m_bytes; }

    private:
        std::array<std::uint8_t, 4> m_bytes;
    };

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_INVALID_TYPE
     * @brief Throw an invalid_type_code for the given input with formatted message
     */
    #define THROW_INVALID_TYPE(input, ...) \
        throw ::pngchunk::invalid_type_code((input), ::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_INVALID_TYPE_UNLESS
     * @brief Throw an invalid_type_code unless condition is true
     */
    #define THROW_INVALID_TYPE_UNLESS(condition, input, ...) \
        do { if (!(condition)) THROW_INVALID_TYPE(input, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
