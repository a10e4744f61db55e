//
// Created on 03/09/2025.
//

#include <pngme/crc.hh>

#include <algorithm>
#include <limits>

#include <zlib.h>

namespace pngme {

    std::uint32_t crc32(const void* data, std::size_t size) {
        return crc32_accumulator().update(data, size).value();
    }

    crc32_accumulator::crc32_accumulator()
        : m_crc(static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0))) {
    }

    crc32_accumulator& crc32_accumulator::update(const void* data, std::size_t size) {
        auto p = static_cast<const Bytef*>(data);
        // zlib takes uInt lengths, feed large buffers in pieces
        while (size > 0) {
            const auto n = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            m_crc = static_cast<std::uint32_t>(::crc32(m_crc, p, n));
            p += n;
            size -= n;
        }
        return *this;
    }

} // namespace pngme
