//
// Created on 06/09/2025.
//

#include <pngme/png.hh>
#include <pngme/chunk_iterator.hh>
#include <pngme/exceptions.hh>

#include <algorithm>
#include <ostream>

#include "input.hh"

namespace pngme {

    const std::array<std::byte, 8> png::standard_header = {
        std::byte(0x89), std::byte('P'), std::byte('N'), std::byte('G'),
        std::byte('\r'), std::byte('\n'), std::byte(0x1A), std::byte('\n')
    };

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::parse(const void* data, std::size_t size) {
        return parse(data, size, parse_options{});
    }

    png png::parse(const void* data, std::size_t size, const parse_options& options) {
        const auto* bytes = static_cast<const std::byte*>(data);
        THROW_PARSE_IF(size < standard_header.size(), bad_signature,
                       "Not a PNG file: ", size, " bytes is shorter than the ",
                       standard_header.size(), " byte signature");
        THROW_PARSE_UNLESS(std::equal(standard_header.begin(), standard_header.end(), bytes), bad_signature,
                           "Not a PNG file: signature mismatch");

        return png(parse_chunks(bytes, size, options, standard_header.size()));
    }

    png png::from_stream(std::istream& is, const parse_options& options) {
        const auto data = read_stream(is);
        return parse(data.data(), data.size(), options);
    }

    void png::append_chunk(chunk c) {
        if (!m_chunks.empty() && m_chunks.back().chunk_type() == chunk_types::IEND) {
            m_chunks.insert(m_chunks.end() - 1, std::move(c));
        } else {
            m_chunks.push_back(std::move(c));
        }
    }

    chunk png::remove_first_chunk(std::string_view type) {
        const chunk_type wanted(type);
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&wanted](const chunk& c) {
            return c.chunk_type() == wanted;
        });
        if (it == m_chunks.end()) {
            throw pngme_error(error_code::chunk_not_found,
                              build_error_msg("No chunk of type ", wanted, " found"));
        }
        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        const chunk_type wanted(type);
        for (const auto& c : m_chunks) {
            if (c.chunk_type() == wanted) {
                return &c;
            }
        }
        return nullptr;
    }

    std::vector<std::byte> png::as_bytes() const {
        std::size_t total = standard_header.size();
        for (const auto& c : m_chunks) {
            total += c.encoded_size();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        out.insert(out.end(), standard_header.begin(), standard_header.end());
        for (const auto& c : m_chunks) {
            const auto encoded = c.as_bytes();
            out.insert(out.end(), encoded.begin(), encoded.end());
        }
        return out;
    }

    void png::write_to(std::ostream& os) const {
        write_stream(os, as_bytes());
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        os << "PNG with " << p.chunks().size() << " chunk(s)\n";
        for (const auto& c : p.chunks()) {
            os << "  " << c << '\n';
        }
        return os;
    }

} // namespace pngme
