/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 * @author Igor
 * @date 02/09/2025
 * 
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library. Each exception carries a
 * pngchunk::errc code so callers can discriminate failures without
 * inspecting message text.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>
#include <system_error>
#include <utility>

#include <pngchunk/errc.hh>

namespace pngchunk {
    
    /**
     * @class pngchunk_error
     * @brief Base exception class for all library errors
     * 
     * All library exceptions derive from this class, making it easy
     * to catch every library-specific error with a single catch block.
     */
    class pngchunk_error : public std::runtime_error {
    public:
        pngchunk_error(errc code, const std::string& msg)
            : std::runtime_error(msg), m_code(make_error_code(code)) {}

        /**
         * @brief Error code identifying the failure kind
         */
        [[nodiscard]] const std::error_code& code() const noexcept { return m_code; }

    private:
        std::error_code m_code;
    };
    
    /**
     * @class io_error
     * @brief Exception for I/O related errors
     * 
     * Thrown when file access, reading or writing fails.
     */
    class io_error : public pngchunk_error {
    public:
        explicit io_error(const std::string& msg) 
            : pngchunk_error(errc::io_failure, msg) {}
    };
    
    /**
     * @class parse_error
     * @brief Exception for parsing errors
     * 
     * Thrown when the data is malformed or corrupted, or violates the
     * PNG chunk layout.
     */
    class parse_error : public pngchunk_error {
    public:
        parse_error(errc code, const std::string& msg) 
            : pngchunk_error(code, msg) {}
    };

    /**
     * @class chunk_type_error
     * @brief A 4-byte type code could not be constructed
     *
     * code() is either errc::non_alphabetic_type or errc::invalid_type_length.
     */
    class chunk_type_error : public parse_error {
    public:
        chunk_type_error(errc code, const std::string& msg)
            : parse_error(code, msg) {}
    };

    /**
     * @class insufficient_bytes_error
     * @brief Buffer is shorter than the structure it should contain
     */
    class insufficient_bytes_error : public parse_error {
    public:
        insufficient_bytes_error(std::size_t needed, std::size_t available, const std::string& msg)
            : parse_error(errc::insufficient_bytes, msg), m_needed(needed), m_available(available) {}

        [[nodiscard]] std::size_t needed() const noexcept { return m_needed; }
        [[nodiscard]] std::size_t available() const noexcept { return m_available; }

    private:
        std::size_t m_needed;
        std::size_t m_available;
    };

    /**
     * @class bad_checksum_error
     * @brief Stored CRC differs from the one computed over type and data
     */
    class bad_checksum_error : public parse_error {
    public:
        bad_checksum_error(std::uint32_t expected, std::uint32_t actual, const std::string& msg)
            : parse_error(errc::bad_checksum, msg), m_expected(expected), m_actual(actual) {}

        /// CRC recomputed from the parsed type and data
        [[nodiscard]] std::uint32_t expected() const noexcept { return m_expected; }
        /// CRC read from the buffer
        [[nodiscard]] std::uint32_t actual() const noexcept { return m_actual; }

    private:
        std::uint32_t m_expected;
        std::uint32_t m_actual;
    };

    /**
     * @class bad_signature_error
     * @brief Buffer does not start with the 8-byte PNG signature
     */
    class bad_signature_error : public parse_error {
    public:
        explicit bad_signature_error(const std::string& msg)
            : parse_error(errc::bad_signature, msg) {}
    };

    /**
     * @class chunk_not_found_error
     * @brief Lookup or removal named a type that is not present
     */
    class chunk_not_found_error : public pngchunk_error {
    public:
        chunk_not_found_error(std::string type, const std::string& msg)
            : pngchunk_error(errc::chunk_type_not_found, msg), m_type(std::move(type)) {}

        [[nodiscard]] const std::string& type() const noexcept { return m_type; }

    private:
        std::string m_type;
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
        throw ::pngchunk::io_error(::pngchunk::build_error_msg(__VA_ARGS__))
    
    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error of the given code with formatted message
     * @param code pngchunk::errc value
     * @param ... Variable arguments to format into error message
     */
    #define THROW_PARSE(code, ...) \
        throw ::pngchunk::parse_error(code, ::pngchunk::build_error_msg(__VA_ARGS__))
    
    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)
    
    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     */
    #define THROW_PARSE_IF(condition, code, ...) \
        do { if (condition) THROW_PARSE(code, __VA_ARGS__); } while(0)
    
    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)
    
    /** @} */ // end of ExceptionMacros group
    
} // namespace pngchunk
