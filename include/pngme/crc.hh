/**
 * @file crc.hh
 * @brief CRC-32 used by PNG chunks
 * @date 03/09/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @brief Compute the CRC-32 (ISO-HDLC / IEEE 802.3) of a buffer
     * @param data Bytes to checksum
     * @param size Number of bytes
     * @return CRC value, e.g. 0xCBF43926 for "123456789"
     */
    PNGME_EXPORT std::uint32_t crc32(const void* data, std::size_t size);

    /**
     * @class crc32_accumulator
     * @brief Incremental CRC-32 over several discontiguous buffers
     *
     * update(a); update(b) yields the same value as crc32(a ++ b).
     */
    class PNGME_EXPORT crc32_accumulator {
    public:
        crc32_accumulator();

        crc32_accumulator& update(const void* data, std::size_t size);

        [[nodiscard]] std::uint32_t value() const noexcept { return m_crc; }

    private:
        std::uint32_t m_crc;
    };

} // namespace pngme
