//
// Created on 03/09/2025.
//

#include <istream>
#include <ostream>
#include <iterator>
#include <algorithm>

#include "input.hh"

namespace pngme {

    std::size_t reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst || size == 0, "Null buffer in read");

        size = std::min(size, remaining());
        if (size == 0) {
            return 0;
        }

        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
        return size;
    }

    void reader::skip(std::size_t size) {
        THROW_IO_IF(size > remaining(), "Skip beyond end of buffer: ", size, " > ", remaining());
        m_position += size;
    }

    std::vector<std::byte> read_stream(std::istream& is) {
        THROW_IO_UNLESS(is.good(), "Stream in bad state");

        std::vector<char> raw((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
        THROW_IO_IF(is.bad(), "Stream read failed");

        std::vector<std::byte> result(raw.size());
        if (!raw.empty()) {
            std::memcpy(result.data(), raw.data(), raw.size());
        }
        return result;
    }

    void write_stream(std::ostream& os, const std::vector<std::byte>& data) {
        os.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        THROW_IO_UNLESS(os.good(), "Stream write failed after ", data.size(), " bytes");
    }
}
