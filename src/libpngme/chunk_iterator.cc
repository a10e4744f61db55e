//
// Created on 05/09/2025.
//

#include <pngme/chunk_iterator.hh>
#include <pngme/exceptions.hh>

#include "input.hh"

namespace pngme {

    chunk_iterator::chunk_iterator(const void* data, std::size_t size, std::size_t start_offset)
        : chunk_iterator(data, size, parse_options{}, start_offset) {
    }

    chunk_iterator::chunk_iterator(const void* data, std::size_t size, const parse_options& options,
                                   std::size_t start_offset)
        : m_data(static_cast<const std::byte*>(data))
        , m_size(size)
        , m_offset(start_offset)
        , m_count(0)
        , m_options(options) {
        THROW_IO_UNLESS(m_data || m_size == 0, "Null buffer in chunk_iterator");
        if (start_offset > size) {
            throw frame_error(error_code::too_short, size, start_offset, size,
                              build_error_msg("Start offset ", start_offset, " is beyond the buffer size ", size));
        }

        read_next_chunk();
    }

    void chunk_iterator::next() {
        if (!m_current) {
            return;
        }
        m_offset = static_cast<std::size_t>(m_current->header.end_offset());
        read_next_chunk();
    }

    void chunk_iterator::read_next_chunk() {
        m_current.reset();

        const std::size_t left = m_size - m_offset;
        if (left == 0) {
            return;
        }

        try {
            auto c = chunk::parse(m_data + m_offset, left, m_options, m_offset);

            reader in(m_data + m_offset + c.encoded_size() - chunk::CRC_BYTES, chunk::CRC_BYTES);
            std::uint32_t stored_crc = 0;
            THROW_IO_UNLESS(in.read(stored_crc, byte_order::big), "Failed to re-read CRC at offset ", m_offset);

            chunk_header header{c.chunk_type(), c.length(), stored_crc, m_offset};
            m_current.emplace(chunk_info{std::move(header), std::move(c), m_count++});
        } catch (const parse_error& e) {
            // A partial chunk at the very end is trailing garbage in lenient mode
            const bool trailing = e.code() == error_code::too_short ||
                                  e.code() == error_code::truncated_data ||
                                  e.code() == error_code::bad_checksum_field;
            if (m_options.strict || !trailing) {
                throw;
            }
            if (m_options.on_warning) {
                m_options.on_warning(m_offset, "trailing_data",
                    build_error_msg("Ignoring ", left, " trailing bytes at offset ", m_offset, ": ", e.what()));
            }
            m_offset = m_size;
        }
    }

    std::vector<chunk> parse_chunks(const void* data, std::size_t size, const parse_options& options,
                                    std::size_t start_offset) {
        std::vector<chunk> result;
        chunk_iterator it(data, size, options, start_offset);
        while (it.has_next()) {
            result.push_back(it.current().value);
            it.next();
        }
        return result;
    }

} // namespace pngme
