/**
 * @file chunk.hh
 * @brief A single PNG chunk: length, type, data and CRC
 * @date 04/09/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class chunk
     * @brief One length-prefixed, type-tagged, CRC-checked record
     *
     * On-wire layout (all integers big-endian):
     * @code
     *   +--------+--------+----------------+--------+
     *   | length |  type  | data (length)  |  crc   |
     *   | 4 B    |  4 B   |                |  4 B   |
     *   +--------+--------+----------------+--------+
     * @endcode
     * The CRC covers type and data. It is always recomputed from the
     * current contents and never stored in the object.
     */
    class PNGME_EXPORT chunk {
    public:
        static constexpr std::size_t LENGTH_BYTES = 4;
        static constexpr std::size_t TYPE_BYTES = 4;
        static constexpr std::size_t CRC_BYTES = 4;

        // Size of a chunk with no data
        static constexpr std::size_t OVERHEAD_BYTES = LENGTH_BYTES + TYPE_BYTES + CRC_BYTES;

        /**
         * @brief Create a chunk from a type and its data
         * @param type Chunk type
         * @param data Chunk data, may be empty
         */
        chunk(const pngme::chunk_type& type, std::vector<std::byte> data);

        /**
         * @brief Create a chunk holding text
         * @param type Chunk type
         * @param text Bytes of the text become the chunk data
         */
        chunk(const pngme::chunk_type& type, std::string_view text);

        /**
         * @brief Parse a chunk from the start of a buffer
         * @param data Buffer holding at least one encoded chunk
         * @param size Buffer size in bytes
         * @return Parsed chunk
         * @throws parse_error too_short, truncated_data, bad_checksum_field
         * @throws bad_type_error if the type field is not four letters
         * @throws checksum_error if the stored CRC does not match
         *
         * Bytes after the CRC field are ignored; they belong to the next chunk.
         */
        static chunk parse(const void* data, std::size_t size);

        /**
         * @brief Parse a chunk with custom options
         * @param data Buffer holding at least one encoded chunk
         * @param size Buffer size in bytes
         * @param options Checks to apply and warning handler
         * @param base_offset Offset of data within its file, used in messages
         *        and warnings
         */
        static chunk parse(const void* data, std::size_t size, const parse_options& options,
                           std::uint64_t base_offset = 0);

        // Parse a chunk from the start of a byte vector
        static chunk parse(const std::vector<std::byte>& bytes) {
            return parse(bytes.data(), bytes.size());
        }

        // Number of data bytes
        [[nodiscard]] std::uint32_t length() const noexcept {
            return static_cast<std::uint32_t>(m_data.size());
        }

        [[nodiscard]] const pngme::chunk_type& chunk_type() const noexcept { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const noexcept { return m_data; }

        /**
         * @brief CRC-32 of type bytes followed by data bytes
         */
        [[nodiscard]] std::uint32_t crc() const;

        // Bytes taken by the encoded chunk (data + 12)
        [[nodiscard]] std::size_t encoded_size() const noexcept {
            return OVERHEAD_BYTES + m_data.size();
        }

        /**
         * @brief Interpret the data as UTF-8 text
         * @return Data as string
         * @throws encoding_error if the data is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Encode the chunk
         * @return length ++ type ++ data ++ crc
         */
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        /**
         * @brief Write the encoded chunk to a stream
         * @throws io_error if the stream fails
         */
        void write_to(std::ostream& os) const;

        bool operator==(const chunk& o) const { return m_type == o.m_type && m_data == o.m_data; }
        bool operator!=(const chunk& o) const { return !(*this == o); }

        // Stream output: type, length, crc and a short data preview
        friend PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

    private:
        pngme::chunk_type m_type;
        std::vector<std::byte> m_data;
    };

} // namespace pngme
