//
// Created on 04/09/2025.
//

#include "utf8.hh"

#include <cstdint>
#include <string>

namespace pngme {

    std::size_t find_invalid_utf8(const std::byte* data, std::size_t size) {
        auto at = [data](std::size_t i) {
            return static_cast<std::uint8_t>(data[i]);
        };
        auto is_cont = [](std::uint8_t c) {
            return (c & 0xC0) == 0x80;
        };

        std::size_t i = 0;
        while (i < size) {
            const std::uint8_t c = at(i);
            if (c < 0x80) {
                i++;
                continue;
            }

            std::size_t len;
            // Allowed range for the second byte (Unicode table 3-7)
            std::uint8_t lo = 0x80;
            std::uint8_t hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                len = 2;
            } else if (c >= 0xE0 && c <= 0xEF) {
                len = 3;
                if (c == 0xE0) {
                    lo = 0xA0;
                } else if (c == 0xED) {
                    hi = 0x9F;
                }
            } else if (c >= 0xF0 && c <= 0xF4) {
                len = 4;
                if (c == 0xF0) {
                    lo = 0x90;
                } else if (c == 0xF4) {
                    hi = 0x8F;
                }
            } else {
                return i;
            }

            if (size - i < len) {
                return i;
            }
            const std::uint8_t c1 = at(i + 1);
            if (c1 < lo || c1 > hi) {
                return i;
            }
            for (std::size_t k = 2; k < len; k++) {
                if (!is_cont(at(i + k))) {
                    return i;
                }
            }
            i += len;
        }
        return std::string::npos;
    }
}
