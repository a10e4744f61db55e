/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 * @date 02/09/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library. Every exception carries an
 * error_code so callers can tell failure kinds apart without parsing
 * the message text.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>

#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @enum error_code
     * @brief Kind of failure reported by a pngme_error
     */
    enum class error_code {
        invalid_byte,       ///< Chunk type byte outside A-Z / a-z
        wrong_length,       ///< Chunk type text is not exactly 4 bytes
        too_short,          ///< Buffer smaller than the 12 byte chunk frame
        bad_type,           ///< Chunk type field could not be decoded
        truncated_data,     ///< Declared data length exceeds available bytes
        bad_checksum_field, ///< Fewer than 4 bytes left for the CRC field
        checksum_mismatch,  ///< Stored CRC differs from the computed one
        not_utf8,           ///< Chunk data requested as text is not UTF-8
        chunk_too_large,    ///< Declared length exceeds parse_options::max_chunk_size
        invalid_type,       ///< Reserved bit set while require_valid_type is on
        bad_signature,      ///< PNG signature missing or wrong
        chunk_not_found,    ///< No chunk of the requested type
        io                  ///< Stream read/write failure
    };

    /**
     * @brief Get a short name for an error code
     * @param ec Error code
     * @return Static string such as "checksum_mismatch"
     */
    PNGME_EXPORT const char* to_string(error_code ec) noexcept;

    /**
     * @class pngme_error
     * @brief Base exception class for all library errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch all PNG chunk errors with a single catch block.
     */
    class PNGME_EXPORT pngme_error : public std::runtime_error {
    public:
        pngme_error(error_code code, const std::string& msg)
            : std::runtime_error(msg), m_code(code) {}

        [[nodiscard]] error_code code() const noexcept { return m_code; }

    private:
        error_code m_code;
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when reading or writing a stream fails.
     */
    class PNGME_EXPORT io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(error_code::io, msg) {}
    };

    /**
     * @class chunk_type_error
     * @brief A chunk type could not be built from bytes or text
     *
     * Raised with error_code::invalid_byte or error_code::wrong_length.
     * value() holds the offending byte or the offending text length.
     */
    class PNGME_EXPORT chunk_type_error : public pngme_error {
    public:
        chunk_type_error(error_code code, std::size_t value, std::size_t index, const std::string& msg)
            : pngme_error(code, msg), m_value(value), m_index(index) {}

        [[nodiscard]] std::size_t value() const noexcept { return m_value; }

        // Position of the offending byte (0 for wrong_length)
        [[nodiscard]] std::size_t index() const noexcept { return m_index; }

    private:
        std::size_t m_value;
        std::size_t m_index;
    };

    /**
     * @class parse_error
     * @brief Exception for chunk and file parsing errors
     *
     * Thrown when a byte buffer does not hold a well-formed chunk
     * or PNG file.
     */
    class PNGME_EXPORT parse_error : public pngme_error {
    public:
        parse_error(error_code code, const std::string& msg)
            : pngme_error(code, msg) {}
    };

    /**
     * @class frame_error
     * @brief The buffer is too small for the chunk frame it should hold
     *
     * Raised with error_code::too_short (fewer than 12 bytes),
     * error_code::truncated_data (declared length exceeds the bytes left)
     * or error_code::bad_checksum_field (fewer than 4 bytes left for the CRC).
     */
    class PNGME_EXPORT frame_error : public parse_error {
    public:
        frame_error(error_code code, std::size_t actual_size, std::size_t declared,
                    std::size_t available, const std::string& msg)
            : parse_error(code, msg)
            , m_actual_size(actual_size)
            , m_declared(declared)
            , m_available(available) {}

        // Size of the whole input buffer
        [[nodiscard]] std::size_t actual_size() const noexcept { return m_actual_size; }

        // Bytes the frame needs at the failing field: 12 for too_short,
        // the declared data length for truncated_data, 4 for bad_checksum_field
        [[nodiscard]] std::size_t declared() const noexcept { return m_declared; }

        // Bytes left in the buffer at the failing field
        [[nodiscard]] std::size_t available() const noexcept { return m_available; }

    private:
        std::size_t m_actual_size;
        std::size_t m_declared;
        std::size_t m_available;
    };

    /**
     * @class bad_type_error
     * @brief The type field of a chunk is not a valid chunk type
     *
     * Wraps the chunk_type_error raised while decoding the field.
     */
    class PNGME_EXPORT bad_type_error : public parse_error {
    public:
        explicit bad_type_error(const chunk_type_error& cause);

        [[nodiscard]] const chunk_type_error& cause() const noexcept { return m_cause; }

    private:
        chunk_type_error m_cause;
    };

    /**
     * @class checksum_error
     * @brief The stored CRC of a chunk does not match its contents
     */
    class PNGME_EXPORT checksum_error : public parse_error {
    public:
        checksum_error(std::uint32_t parsed, std::uint32_t computed);

        [[nodiscard]] std::uint32_t parsed() const noexcept { return m_parsed; }
        [[nodiscard]] std::uint32_t computed() const noexcept { return m_computed; }

    private:
        std::uint32_t m_parsed;
        std::uint32_t m_computed;
    };

    /**
     * @class encoding_error
     * @brief Chunk data is not valid UTF-8 text
     */
    class PNGME_EXPORT encoding_error : public pngme_error {
    public:
        encoding_error(std::size_t offset, const std::string& msg)
            : pngme_error(error_code::not_utf8, msg), m_offset(offset) {}

        // Offset of the first byte that breaks the encoding
        [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }

    private:
        std::size_t m_offset;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     *
     * Uses C++17 fold expressions to concatenate all arguments into
     * a single error message string.
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     * @param ... Variable arguments to format into error message
     */
    #define THROW_IO(...) \
        throw ::pngme::io_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error of the given kind with formatted message
     * @param code error_code enumerator name (e.g. too_short)
     * @param ... Variable arguments to format into error message
     */
    #define THROW_PARSE(code, ...) \
        throw ::pngme::parse_error(::pngme::error_code::code, ::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     * @param condition Condition to check
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     * @param condition Condition to check
     * @param code error_code enumerator name
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_PARSE_IF(condition, code, ...) \
        do { if (condition) THROW_PARSE(code, __VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     * @param condition Condition that must be true to avoid throwing
     * @param ... Variable arguments for error message if condition is false
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_UNLESS
     * @brief Throw a parse_error unless condition is true
     * @param condition Condition that must be true to avoid throwing
     * @param code error_code enumerator name
     * @param ... Variable arguments for error message if condition is false
     */
    #define THROW_PARSE_UNLESS(condition, code, ...) \
        do { if (!(condition)) THROW_PARSE(code, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
