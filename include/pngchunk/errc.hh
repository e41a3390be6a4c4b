/**
 * @file errc.hh
 * @brief Error codes reported by the PNG chunk library
 * @author Igor
 * @date 02/09/2025
 */

#pragma once

#include <string>
#include <system_error>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @enum errc
     * @brief Closed set of failure kinds
     *
     * Every exception thrown by the library carries one of these codes,
     * and the non-throwing overloads report them through std::error_code.
     */
    enum class errc {
        non_alphabetic_type = 1, ///< Chunk type contains a byte outside A-Z / a-z
        invalid_type_length,     ///< Chunk type string is not exactly 4 bytes
        insufficient_bytes,      ///< Buffer too short for the declared structure
        bad_checksum,            ///< Stored CRC does not match the recomputed one
        bad_signature,           ///< Buffer does not start with the PNG signature
        chunk_type_not_found,    ///< No chunk with the requested type
        length_overflow,         ///< Declared chunk length above the allowed maximum
        trailing_bytes,          ///< Bytes left over after a single chunk
        too_many_chunks,         ///< Chunk count limit exceeded
        io_failure               ///< Reading or writing a file failed
    };

    /**
     * @brief Category for pngchunk::errc values
     */
    PNGCHUNK_EXPORT const std::error_category& pngchunk_category() noexcept;

    inline std::error_code make_error_code(errc e) noexcept {
        return {static_cast<int>(e), pngchunk_category()};
    }

} // namespace pngchunk

namespace std {
    template<>
    struct is_error_code_enum<pngchunk::errc> : true_type {};
}
