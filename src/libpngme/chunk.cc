//
// Created on 04/09/2025.
//

#include <pngme/chunk.hh>
#include <pngme/crc.hh>
#include <pngme/exceptions.hh>

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <optional>
#include <ostream>

#include "input.hh"
#include "utf8.hh"

namespace pngme {

    namespace {
        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }
    }

    chunk::chunk(const pngme::chunk_type& type, std::vector<std::byte> data)
        : m_type(type)
        , m_data(std::move(data)) {
    }

    chunk::chunk(const pngme::chunk_type& type, std::string_view text)
        : m_type(type)
        , m_data(text.size()) {
        if (!text.empty()) {
            std::memcpy(m_data.data(), text.data(), text.size());
        }
    }

    chunk chunk::parse(const void* data, std::size_t size) {
        return parse(data, size, parse_options{});
    }

    chunk chunk::parse(const void* data, std::size_t size, const parse_options& options,
                       std::uint64_t base_offset) {
        if (size < OVERHEAD_BYTES) {
            throw frame_error(error_code::too_short, size, OVERHEAD_BYTES, size,
                              build_error_msg("Chunk at offset ", base_offset, " is too short: must be at least ",
                                              OVERHEAD_BYTES, " bytes, data was ", size, " bytes"));
        }

        reader in(static_cast<const std::byte*>(data), size);

        // Length and type fit, size was checked above
        std::uint32_t length = 0;
        in.read(length, byte_order::big);

        std::array<std::uint8_t, 4> type_bytes{};
        in.read(type_bytes.data(), type_bytes.size());

        std::optional<pngme::chunk_type> type;
        try {
            type.emplace(type_bytes);
        } catch (const chunk_type_error& e) {
            throw bad_type_error(e);
        }

        if (length > options.max_chunk_size) {
            const auto msg = build_error_msg("Chunk ", *type, " at offset ", base_offset, " has length ",
                                             length, " bytes, which exceeds maximum allowed size of ",
                                             options.max_chunk_size, " bytes");
            THROW_PARSE_IF(options.strict, chunk_too_large, msg);
            warn(options, base_offset, "size_limit", msg);
        }

        if (!type->is_valid()) {
            const auto msg = build_error_msg("Chunk ", *type, " at offset ", base_offset,
                                             " has the reserved bit set");
            if (options.require_valid_type) {
                THROW_PARSE_IF(options.strict, invalid_type, msg);
                warn(options, base_offset, "reserved_bit", msg);
            }
        }

        if (in.remaining() < length) {
            throw frame_error(error_code::truncated_data, size, length, in.remaining(),
                              build_error_msg("Chunk ", *type, " at offset ", base_offset, " declares ", length,
                                              " data bytes but only ", in.remaining(), " are available"));
        }

        std::vector<std::byte> payload(in.current(), in.current() + length);
        in.skip(length);

        const auto crc_available = in.remaining();
        std::uint32_t stored_crc = 0;
        if (!in.read(stored_crc, byte_order::big)) {
            throw frame_error(error_code::bad_checksum_field, size, CRC_BYTES, crc_available,
                              build_error_msg("Could not parse CRC of chunk ", *type, " at offset ", base_offset,
                                              ": ", crc_available, " bytes left, need ", CRC_BYTES));
        }

        chunk result(*type, std::move(payload));

        if (options.verify_checksum) {
            const auto computed = result.crc();
            if (computed != stored_crc) {
                if (options.strict) {
                    throw checksum_error(stored_crc, computed);
                }
                warn(options, base_offset, "checksum",
                     build_error_msg("Chunk ", *type, " at offset ", base_offset, " has CRC ",
                                     stored_crc, ", calculated ", computed));
            }
        }

        return result;
    }

    std::uint32_t chunk::crc() const {
        crc32_accumulator acc;
        acc.update(m_type.bytes().data(), TYPE_BYTES);
        acc.update(m_data.data(), m_data.size());
        return acc.value();
    }

    std::string chunk::data_as_string() const {
        const auto bad = find_invalid_utf8(m_data.data(), m_data.size());
        if (bad != std::string::npos) {
            throw encoding_error(bad, build_error_msg("Chunk ", m_type, " data is not valid UTF-8: invalid byte ",
                                                      static_cast<unsigned>(m_data[bad]), " at offset ", bad));
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::as_bytes() const {
        std::vector<std::byte> out(encoded_size());
        auto* p = out.data();

        store_u32(p, length(), byte_order::big);
        p += LENGTH_BYTES;
        m_type.to_bytes(p);
        p += TYPE_BYTES;
        std::copy(m_data.begin(), m_data.end(), p);
        p += m_data.size();
        store_u32(p, crc(), byte_order::big);

        return out;
    }

    void chunk::write_to(std::ostream& os) const {
        write_stream(os, as_bytes());
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        static constexpr std::size_t PREVIEW_BYTES = 32;

        // Save and restore format flags
        auto flags = os.flags();
        auto fill = os.fill();
        os << "Chunk " << c.chunk_type() << " length: " << c.length()
           << " crc: 0x" << std::hex << std::setw(8) << std::setfill('0') << c.crc();
        os.flags(flags);
        os.fill(fill);

        const auto& data = c.data();
        const auto n = std::min(data.size(), PREVIEW_BYTES);
        const bool printable = std::all_of(data.begin(), data.begin() + n, [](std::byte b) {
            const auto v = static_cast<unsigned char>(b);
            return v >= 32 && v <= 126;
        });

        if (n == 0) {
            return os;
        }
        os << " data: ";
        if (printable) {
            os << '"' << std::string(reinterpret_cast<const char*>(data.data()), n) << '"';
        } else {
            os << std::hex << std::setfill('0');
            for (std::size_t i = 0; i < n; i++) {
                os << std::setw(2) << static_cast<unsigned>(data[i]) << (i + 1 < n ? " " : "");
            }
            os.flags(flags);
            os.fill(fill);
        }
        if (data.size() > n) {
            os << "...";
        }
        return os;
    }

} // namespace pngme
