/**
 * @file chunk_iterator.hh
 * @brief Sequential traversal of the chunks in a buffer
 * @date 05/09/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/chunk_header.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class chunk_iterator
     * @brief Walks consecutive chunks of a memory buffer
     *
     * Each step parses the chunk at the current offset and then moves
     * past it (12 + length bytes). Iteration ends exactly at the end of
     * the buffer. The buffer must outlive the iterator.
     */
    class PNGME_EXPORT chunk_iterator {
    public:
        /**
         * @struct chunk_info
         * @brief Information about the current chunk being iterated
         */
        struct chunk_info {
            chunk_header header;     ///< Framing information of the chunk
            pngme::chunk value;      ///< The parsed chunk
            std::size_t index = 0;   ///< Position in the sequence (0 = first)
        };

        /**
         * @brief Start iterating
         * @param data Buffer holding encoded chunks
         * @param size Buffer size in bytes
         * @param start_offset Offset of the first chunk (e.g. 8 to skip a PNG signature)
         * @throws parse_error if the first chunk is malformed (strict mode)
         */
        chunk_iterator(const void* data, std::size_t size, std::size_t start_offset = 0);

        /**
         * @brief Start iterating with custom options
         * @param data Buffer holding encoded chunks
         * @param size Buffer size in bytes
         * @param options Parse options for checks and warnings
         * @param start_offset Offset of the first chunk
         */
        chunk_iterator(const void* data, std::size_t size, const parse_options& options,
                       std::size_t start_offset = 0);

        /**
         * @brief Get current chunk information
         * @return Const reference to current chunk information
         */
        const chunk_info& current() const { return *m_current; }

        /**
         * @brief Advance to the next chunk
         * @throws parse_error if the next chunk is malformed (strict mode)
         */
        void next();

        bool has_next() const { return m_current.has_value(); }
        bool at_end() const { return !m_current.has_value(); }

        // Offset of the next unread byte
        std::size_t offset() const { return m_offset; }

    private:
        void read_next_chunk();

        const std::byte* m_data;
        std::size_t m_size;
        std::size_t m_offset;
        std::size_t m_count;
        parse_options m_options;
        std::optional<chunk_info> m_current;
    };

    /**
     * @brief Parse every chunk of a buffer
     * @param data Buffer holding encoded chunks
     * @param size Buffer size in bytes
     * @param options Parse options
     * @param start_offset Offset of the first chunk
     * @return Chunks in file order
     */
    PNGME_EXPORT std::vector<chunk> parse_chunks(const void* data, std::size_t size,
                                                 const parse_options& options = parse_options{},
                                                 std::size_t start_offset = 0);

    /**
     * @brief Simple functional interface for iterating chunks with custom options
     *
     * Calls the provided function for each chunk in the buffer.
     *
     * @tparam Func Callable type accepting const chunk_iterator::chunk_info&
     * @param data Buffer holding encoded chunks
     * @param size Buffer size in bytes
     * @param func Function to call for each chunk
     * @param options Parse options for controlling parsing behavior
     */
    template<typename Func>
    void for_each_chunk(const void* data, std::size_t size, Func func, const parse_options& options) {
        chunk_iterator it(data, size, options);

        while (it.has_next()) {
            func(it.current());
            it.next();
        }
    }

    /**
     * @brief Simple functional interface for iterating chunks
     *
     * Calls the provided function for each chunk in the buffer.
     * Uses default parse options.
     */
    template<typename Func>
    void for_each_chunk(const void* data, std::size_t size, Func func) {
        for_each_chunk(data, size, func, parse_options{});
    }

} // namespace pngme
