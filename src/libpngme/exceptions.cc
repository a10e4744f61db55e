//
// Created on 02/09/2025.
//

#include <pngme/exceptions.hh>

namespace pngme {

    const char* to_string(error_code ec) noexcept {
        switch (ec) {
            case error_code::invalid_byte:
                return "invalid_byte";
            case error_code::wrong_length:
                return "wrong_length";
            case error_code::too_short:
                return "too_short";
            case error_code::bad_type:
                return "bad_type";
            case error_code::truncated_data:
                return "truncated_data";
            case error_code::bad_checksum_field:
                return "bad_checksum_field";
            case error_code::checksum_mismatch:
                return "checksum_mismatch";
            case error_code::not_utf8:
                return "not_utf8";
            case error_code::chunk_too_large:
                return "chunk_too_large";
            case error_code::invalid_type:
                return "invalid_type";
            case error_code::bad_signature:
                return "bad_signature";
            case error_code::chunk_not_found:
                return "chunk_not_found";
            case error_code::io:
                return "io";
        }
        // make compiler happy
        return "unknown";
    }

    bad_type_error::bad_type_error(const chunk_type_error& cause)
        : parse_error(error_code::bad_type,
                      build_error_msg("Could not parse chunk type: ", cause.what()))
        , m_cause(cause) {
    }

    checksum_error::checksum_error(std::uint32_t parsed, std::uint32_t computed)
        : parse_error(error_code::checksum_mismatch,
                      build_error_msg("CRC not matching. Parsed CRC is ", parsed,
                                      " and calculated CRC is ", computed))
        , m_parsed(parsed)
        , m_computed(computed) {
    }

} // namespace pngme
