//
// Created on 03/09/2025.
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <cstring>

#include <pngme/exceptions.hh>
#include <pngme/byte_order.hh>

namespace pngme {

    // Forward-only cursor over a memory buffer. Reads past the end
    // return short counts; callers decide which error that is.
    class reader {
        public:
            reader(const std::byte* data, std::size_t size)
                : m_data(data), m_size(size), m_position(0) {}

            std::size_t read(void* dst, std::size_t size);
            void skip(std::size_t size);

            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }

            // Pointer to the current position, valid for remaining() bytes
            [[nodiscard]] const std::byte* current() const { return m_data + m_position; }

            template<typename T>
            bool read(T& value, byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                if (read(buff.data(), sizeof(T)) != sizeof(T)) {
                    return false;
                }
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return true;
            }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Read a whole stream into memory
    std::vector<std::byte> read_stream(std::istream& is);

    // Write a buffer to a stream
    void write_stream(std::ostream& os, const std::vector<std::byte>& data);
}
