/**
 * @file chunk_header.hh
 * @brief Framing information of a chunk inside a buffer
 * @date 04/09/2025
 */

#pragma once

#include <cstdint>
#include <pngme/chunk.hh>
#include <pngme/chunk_type.hh>

namespace pngme {

    /**
     * @struct chunk_header
     * @brief Where a parsed chunk sits in its source buffer
     */
    struct chunk_header {
        chunk_type type;                ///< Chunk type code
        std::uint32_t length = 0;       ///< Data length in bytes
        std::uint32_t crc = 0;          ///< CRC as stored in the buffer
        std::uint64_t file_offset = 0;  ///< Offset of the length field in the buffer

        /**
         * @brief Offset of the first byte after this chunk
         */
        [[nodiscard]] std::uint64_t end_offset() const {
            return file_offset + chunk::OVERHEAD_BYTES + length;
        }
    };

} // namespace pngme
