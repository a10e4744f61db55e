/**
 * @file chunk_type.hh
 * @brief Four byte PNG chunk type code
 * @date 02/09/2025
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iosfwd>
#include <string>
#include <string_view>

#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @struct chunk_type_flags
     * @brief Properties encoded in bit 5 of each chunk type byte
     */
    struct chunk_type_flags {
        bool ancillary = false;          ///< Byte 0: set = ancillary, clear = critical
        bool is_public = false;          ///< Byte 1: clear = public, set = private
        bool reserved_bit_valid = false; ///< Byte 2: must be clear
        bool safe_to_copy = false;       ///< Byte 3: set = safe to copy

        bool operator==(const chunk_type_flags& o) const {
            return ancillary == o.ancillary && is_public == o.is_public &&
                   reserved_bit_valid == o.reserved_bit_valid && safe_to_copy == o.safe_to_copy;
        }
        bool operator!=(const chunk_type_flags& o) const { return !(*this == o); }
    };

    /**
     * @brief Decode the property bits of four chunk type bytes
     * @param bytes Raw chunk type bytes
     * @return Decoded flags
     *
     * Does not validate the bytes; any value is decoded.
     */
    PNGME_EXPORT chunk_type_flags decode_flags(const std::array<std::uint8_t, 4>& bytes) noexcept;

    /**
     * @brief Check if a byte is allowed in a chunk type (A-Z or a-z)
     */
    constexpr bool is_chunk_type_byte(std::uint8_t c) noexcept {
        return (c >= 0x41 && c <= 0x5A) || (c >= 0x61 && c <= 0x7A);
    }

    /**
     * @class chunk_type
     * @brief Validated four letter chunk type code (e.g. "IHDR", "ruSt")
     *
     * Every byte is an ASCII letter; construction throws chunk_type_error
     * otherwise. The case of each letter carries one property bit, see
     * chunk_type_flags.
     */
    class PNGME_EXPORT chunk_type {
    public:
        /**
         * @brief Construct from raw bytes
         * @param bytes Four type bytes as they appear in a chunk
         * @throws chunk_type_error (invalid_byte) on a non-letter byte
         */
        explicit chunk_type(const std::array<std::uint8_t, 4>& bytes);

        /**
         * @brief Construct from text
         * @param text Exactly four ASCII letters
         * @throws chunk_type_error (wrong_length) if text is not 4 bytes long,
         *         (invalid_byte) on a non-letter byte
         */
        explicit chunk_type(std::string_view text);

        // Constructor from C-string, a null pointer is a wrong_length error
        explicit chunk_type(const char* text);

        /**
         * @brief Construct from four bytes in memory
         * @param data Pointer to at least 4 readable bytes
         * @throws chunk_type_error (invalid_byte) on a non-letter byte
         */
        static chunk_type from_bytes(const void* data);

        // Raw bytes
        [[nodiscard]] const std::array<std::uint8_t, 4>& bytes() const noexcept { return m_bytes; }

        // Property bits
        [[nodiscard]] chunk_type_flags flags() const noexcept { return decode_flags(m_bytes); }

        [[nodiscard]] bool is_critical() const noexcept { return !flags().ancillary; }
        [[nodiscard]] bool is_public() const noexcept { return flags().is_public; }
        [[nodiscard]] bool is_reserved_bit_valid() const noexcept { return flags().reserved_bit_valid; }
        [[nodiscard]] bool is_safe_to_copy() const noexcept { return flags().safe_to_copy; }

        /**
         * @brief Check the reserved bit
         * @return True if the reserved bit (byte 2) is clear
         *
         * Letter validity is guaranteed by construction, so this is the
         * only rule left to check.
         */
        [[nodiscard]] bool is_valid() const noexcept { return is_reserved_bit_valid(); }

        // Convert to string
        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), 4};
        }

        // Convert to string_view (valid while this object lives)
        [[nodiscard]] std::string_view to_string_view() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), 4};
        }

        // Numeric value as stored in a file (big-endian)
        [[nodiscard]] std::uint32_t to_uint32() const noexcept {
            return (std::uint32_t(m_bytes[0]) << 24) | (std::uint32_t(m_bytes[1]) << 16) |
                   (std::uint32_t(m_bytes[2]) << 8) | std::uint32_t(m_bytes[3]);
        }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, m_bytes.data(), 4);
        }

        // Access individual bytes
        std::uint8_t operator[](std::size_t i) const { return m_bytes[i]; }

        // Iterators
        [[nodiscard]] auto begin() const { return m_bytes.begin(); }
        [[nodiscard]] auto end() const { return m_bytes.end(); }

        /**
         * @brief Human readable dump of the bytes and property bits
         * @return e.g. "RuSt [82, 117, 83, 116] Critical Private Reserved SafeToCopy"
         */
        [[nodiscard]] std::string describe() const;

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }
        bool operator<=(const chunk_type& o) const { return m_bytes <= o.m_bytes; }
        bool operator>(const chunk_type& o) const { return m_bytes > o.m_bytes; }
        bool operator>=(const chunk_type& o) const { return m_bytes >= o.m_bytes; }

        // Stream output: quoted type code, e.g. 'IHDR'
        friend PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    private:
        std::array<std::uint8_t, 4> m_bytes;
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // Well known chunk types
    namespace chunk_types {
        inline const chunk_type IHDR("IHDR");
        inline const chunk_type PLTE("PLTE");
        inline const chunk_type IDAT("IDAT");
        inline const chunk_type IEND("IEND");
        inline const chunk_type tEXt("tEXt");
    }

} // namespace pngme

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
