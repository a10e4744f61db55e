//
// Created on 02/09/2025.
//

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

#include <ostream>
#include <sstream>

namespace pngme {

    static constexpr std::uint8_t PROPERTY_BIT = 1u << 5;

    chunk_type_flags decode_flags(const std::array<std::uint8_t, 4>& bytes) noexcept {
        chunk_type_flags f;
        f.ancillary          = (bytes[0] & PROPERTY_BIT) != 0;
        f.is_public          = (bytes[1] & PROPERTY_BIT) == 0;
        f.reserved_bit_valid = (bytes[2] & PROPERTY_BIT) == 0;
        f.safe_to_copy       = (bytes[3] & PROPERTY_BIT) != 0;
        return f;
    }

    chunk_type::chunk_type(const std::array<std::uint8_t, 4>& bytes)
        : m_bytes(bytes) {
        for (std::size_t i = 0; i < m_bytes.size(); i++) {
            const auto c = m_bytes[i];
            if (!is_chunk_type_byte(c)) {
                throw chunk_type_error(error_code::invalid_byte, c, i,
                    build_error_msg("Byte ", static_cast<unsigned>(c), " at position ", i,
                                    " is not a valid chunk type character "
                                    "(expected A-Z = 65-90 or a-z = 97-122)"));
            }
        }
    }

    chunk_type::chunk_type(std::string_view text)
        : chunk_type([text]() {
            if (text.size() != 4) {
                throw chunk_type_error(error_code::wrong_length, text.size(), 0,
                    build_error_msg("A chunk type must have 4 characters, got ", text.size()));
            }
            std::array<std::uint8_t, 4> bytes{};
            std::memcpy(bytes.data(), text.data(), 4);
            return bytes;
        }()) {
    }

    chunk_type::chunk_type(const char* text)
        : chunk_type([text]() {
            if (!text) {
                throw chunk_type_error(error_code::wrong_length, 0, 0,
                    "A chunk type must have 4 characters, got a null string");
            }
            return std::string_view(text);
        }()) {
    }

    chunk_type chunk_type::from_bytes(const void* data) {
        std::array<std::uint8_t, 4> bytes{};
        std::memcpy(bytes.data(), data, 4);
        return chunk_type(bytes);
    }

    std::string chunk_type::describe() const {
        const auto f = flags();
        std::ostringstream oss;
        oss << to_string() << " ["
            << static_cast<unsigned>(m_bytes[0]) << ", "
            << static_cast<unsigned>(m_bytes[1]) << ", "
            << static_cast<unsigned>(m_bytes[2]) << ", "
            << static_cast<unsigned>(m_bytes[3]) << "] "
            << (f.ancillary ? "Ancillary" : "Critical") << ' '
            << (f.is_public ? "Public" : "Private") << ' '
            << (f.reserved_bit_valid ? "Reserved" : "NotReserved") << ' '
            << (f.safe_to_copy ? "SafeToCopy" : "UnsafeToCopy");
        return oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        return os << '\'' << t.to_string_view() << '\'';
    }

} // namespace pngme
