//
// Created on 04/09/2025.
//

#pragma once

#include <cstddef>

namespace pngme {
    // Offset of the first byte that is not part of a well-formed UTF-8
    // sequence (overlongs, surrogates and code points above U+10FFFF are
    // rejected), or npos if the whole buffer is valid.
    std::size_t find_invalid_utf8(const std::byte* data, std::size_t size);
}
