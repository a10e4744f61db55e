/**
 * @file png.hh
 * @brief PNG file as a signature followed by a list of chunks
 * @date 06/09/2025
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string_view>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/chunk_type.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class png
     * @brief Chunk level view of a PNG file
     *
     * Pixel data is never decoded; every chunk is kept as opaque bytes,
     * so writing a parsed file back reproduces it exactly.
     */
    class PNGME_EXPORT png {
    public:
        // 89 50 4E 47 0D 0A 1A 0A
        static const std::array<std::byte, 8> standard_header;

        // Largest chunk length permitted by the PNG format
        static constexpr std::uint32_t MAX_CHUNK_LENGTH = 0x7FFFFFFFu;

        png() = default;

        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Parse a PNG file held in memory
         * @param data File contents
         * @param size File size in bytes
         * @throws parse_error (bad_signature) if the signature is missing
         * @throws parse_error for any malformed chunk
         */
        static png parse(const void* data, std::size_t size);

        /**
         * @brief Parse a PNG file held in memory with custom options
         */
        static png parse(const void* data, std::size_t size, const parse_options& options);

        /**
         * @brief Read and parse a whole PNG stream
         * @param is Binary input stream, read to its end
         * @throws io_error if the stream cannot be read
         */
        static png from_stream(std::istream& is, const parse_options& options = parse_options{});

        /**
         * @brief Add a chunk
         *
         * The chunk goes before a trailing IEND chunk so the file stays
         * well formed; without IEND it is appended at the end.
         */
        void append_chunk(chunk c);

        /**
         * @brief Remove the first chunk of the given type
         * @param type Four letter chunk type
         * @return The removed chunk
         * @throws chunk_type_error if type is not a valid chunk type
         * @throws pngme_error (chunk_not_found) if no chunk has that type
         */
        chunk remove_first_chunk(std::string_view type);

        /**
         * @brief Find the first chunk of the given type
         * @param type Four letter chunk type
         * @return Pointer to the chunk, or nullptr if there is none
         * @throws chunk_type_error if type is not a valid chunk type
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        [[nodiscard]] const std::array<std::byte, 8>& header() const noexcept { return standard_header; }
        [[nodiscard]] const std::vector<chunk>& chunks() const noexcept { return m_chunks; }

        /**
         * @brief Encode the file: signature followed by every chunk
         */
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        /**
         * @brief Write the encoded file to a stream
         * @throws io_error if the stream fails
         */
        void write_to(std::ostream& os) const;

        // Stream output: one line per chunk
        friend PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

    private:
        std::vector<chunk> m_chunks;
    };

} // namespace pngme
