/**
 * @file parse_options.hh
 * @brief Options controlling how chunks are validated when parsed
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>
#include <limits>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for chunk::parse
     */
    struct parse_options {
        /**
         * @brief Accept only big-endian length and checksum fields
         *
         * When false, a length or checksum field also matches if its
         * little-endian reading is correct. Such matches are reported
         * through on_warning with category "byte_order".
         */
        bool strict_byte_order = false;

        /**
         * @brief Reject type codes that fail type_code::is_valid()
         *
         * When false, any four bytes are accepted as a type code and
         * problems are only reported as warnings.
         */
        bool require_valid_type = false;

        /// Largest chunk length allowed by the PNG specification
        static constexpr std::uint64_t png_max_payload_size = (std::uint64_t(1) << 31) - 1;

        /**
         * @brief Maximum accepted payload size in bytes
         *
         * Defaults to the largest value the length field can declare.
         * Set to png_max_payload_size to enforce the PNG limit.
         */
        std::uint64_t max_payload_size = std::numeric_limits<std::uint32_t>::max();

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset within the parsed buffer the warning refers to
         * @param category Warning category ("byte_order", "reserved_bit", "type_code")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
