/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunks
 * @date 03/09/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing chunks and PNG files
     *
     * Controls strictness, size limits, and warning handling.
     * Default-constructed options give the canonical behaviour:
     * every structural and CRC error throws, and a chunk type with
     * the reserved bit set is still accepted.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, parsing fails on any violation.
         * When false, recoverable problems (CRC mismatch, oversized chunk,
         * reserved bit, trailing bytes) are reported through on_warning
         * and parsing continues.
         */
        bool strict = true;

        /**
         * @brief Verify the stored CRC of each chunk
         */
        bool verify_checksum = true;

        /**
         * @brief Reject chunk types whose reserved bit is set
         *
         * Off by default: is_valid() is a query for the caller,
         * not a reason to refuse a chunk.
         */
        bool require_valid_type = false;

        /**
         * @brief Maximum allowed chunk data length in bytes
         *
         * Default accepts any 32-bit length. PNG itself caps chunk
         * lengths at 2^31 - 1 (see png::MAX_CHUNK_LENGTH).
         */
        std::uint32_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset of the chunk the warning is about
         * @param category Warning category ("checksum", "size_limit",
         *        "reserved_bit", "trailing_data")
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
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngme
