/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library. Every failure of the chunk codec
 * is reported as one of a closed set of concrete exception types, grouped
 * under a base class per component that also exposes an error code.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>

#include <pngme/chunk_type.hh>
#include <pngme/utf8.hh>

namespace pngme {

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
     * @class pngme_error
     * @brief Base exception class for all library errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch all PNG-chunk errors with a single catch block.
     */
    class pngme_error : public std::runtime_error {
    public:
        explicit pngme_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when reading from or writing to a stream fails.
     */
    class io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for malformed input
     *
     * Base of every error raised while decoding chunk types, chunks
     * and PNG documents.
     */
    class parse_error : public pngme_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    // ---------------------------------------------------------------
    // chunk type errors
    // ---------------------------------------------------------------

    enum class chunk_type_errc {
        invalid_byte,   ///< A byte outside the ASCII letter range
        invalid_length  ///< Textual code not exactly 4 characters long
    };

    /**
     * @class chunk_type_error
     * @brief Failure to construct a chunk type code
     */
    class chunk_type_error : public parse_error {
    public:
        [[nodiscard]] chunk_type_errc code() const noexcept { return m_code; }

    protected:
        chunk_type_error(chunk_type_errc code, const std::string& msg)
            : parse_error(msg), m_code(code) {}

    private:
        chunk_type_errc m_code;
    };

    class invalid_byte_error : public chunk_type_error {
    public:
        explicit invalid_byte_error(std::uint8_t byte)
            : chunk_type_error(chunk_type_errc::invalid_byte,
                               build_error_msg("Invalid chunk type byte: ", static_cast<unsigned>(byte),
                                               " (not an ASCII letter)")),
              m_byte(byte) {}

        [[nodiscard]] std::uint8_t byte() const noexcept { return m_byte; }

    private:
        std::uint8_t m_byte;
    };

    class invalid_length_error : public chunk_type_error {
    public:
        explicit invalid_length_error(std::size_t length)
            : chunk_type_error(chunk_type_errc::invalid_length,
                               build_error_msg("Invalid chunk type length: ", length, " (expected 4)")),
              m_length(length) {}

        [[nodiscard]] std::size_t length() const noexcept { return m_length; }

    private:
        std::size_t m_length;
    };

    // ---------------------------------------------------------------
    // chunk errors
    // ---------------------------------------------------------------

    enum class chunk_errc {
        length_too_large,   ///< Declared data length is 2^31 or more
        checksum_mismatch,  ///< Stored CRC differs from the computed one
        truncated_buffer    ///< Buffer ends before a field is complete
    };

    /**
     * @class chunk_error
     * @brief Failure to construct or decode a chunk
     */
    class chunk_error : public parse_error {
    public:
        [[nodiscard]] chunk_errc code() const noexcept { return m_code; }

    protected:
        chunk_error(chunk_errc code, const std::string& msg)
            : parse_error(msg), m_code(code) {}

    private:
        chunk_errc m_code;
    };

    class length_too_large_error : public chunk_error {
    public:
        explicit length_too_large_error(std::uint64_t length)
            : chunk_error(chunk_errc::length_too_large,
                          build_error_msg("Chunk length ", length,
                                          " exceeds maximum of 2147483647 bytes")),
              m_length(length) {}

        [[nodiscard]] std::uint64_t length() const noexcept { return m_length; }

    private:
        std::uint64_t m_length;
    };

    class checksum_mismatch_error : public chunk_error {
    public:
        checksum_mismatch_error(std::uint32_t supplied, std::uint32_t expected)
            : chunk_error(chunk_errc::checksum_mismatch,
                          build_error_msg("Chunk CRC mismatch: stored ", supplied,
                                          ", computed ", expected)),
              m_supplied(supplied), m_expected(expected) {}

        [[nodiscard]] std::uint32_t supplied() const noexcept { return m_supplied; }
        [[nodiscard]] std::uint32_t expected() const noexcept { return m_expected; }

    private:
        std::uint32_t m_supplied;
        std::uint32_t m_expected;
    };

    class truncated_buffer_error : public chunk_error {
    public:
        truncated_buffer_error(const char* field, std::size_t needed, std::size_t available)
            : chunk_error(chunk_errc::truncated_buffer,
                          build_error_msg("Truncated chunk: ", field, " field needs ", needed,
                                          " bytes, only ", available, " available")),
              m_field(field), m_needed(needed), m_available(available) {}

        /// Name of the field being read: "length", "type", "data" or "crc"
        [[nodiscard]] const char* field() const noexcept { return m_field; }
        [[nodiscard]] std::size_t needed() const noexcept { return m_needed; }
        [[nodiscard]] std::size_t available() const noexcept { return m_available; }

    private:
        const char* m_field;
        std::size_t m_needed;
        std::size_t m_available;
    };

    // ---------------------------------------------------------------
    // document and text errors
    // ---------------------------------------------------------------

    /**
     * @class signature_error
     * @brief The stream does not start with the 8-byte PNG signature
     */
    class signature_error : public parse_error {
    public:
        explicit signature_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class not_utf8_error
     * @brief Chunk data requested as text is not valid UTF-8
     */
    class not_utf8_error : public pngme_error {
    public:
        explicit not_utf8_error(const utf8_error& detail)
            : pngme_error(build_error_msg("Chunk data is not valid UTF-8: ", detail.reason,
                                          " at offset ", detail.offset)),
              m_detail(detail) {}

        [[nodiscard]] const utf8_error& detail() const noexcept { return m_detail; }

    private:
        utf8_error m_detail;
    };

    /**
     * @class chunk_not_found_error
     * @brief No chunk of the requested type exists in a document
     */
    class chunk_not_found_error : public pngme_error {
    public:
        explicit chunk_not_found_error(const chunk_type& type)
            : pngme_error(build_error_msg("Chunk not found: ", type)),
              m_type(type) {}

        [[nodiscard]] const chunk_type& type() const noexcept { return m_type; }

    private:
        chunk_type m_type;
    };

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
     * @brief Throw a parse_error with formatted message
     * @param ... Variable arguments to format into error message
     */
    #define THROW_PARSE(...) \
        throw ::pngme::parse_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
