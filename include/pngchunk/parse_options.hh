/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk streams
 * @author Igor
 * @date 04/09/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstddef>
#include <cstdint>

namespace pngchunk {
    
    /**
     * @struct parse_options
     * @brief Configuration options for parsing PNG buffers
     * 
     * Controls size limits and warning handling. Structural errors
     * (bad CRC, truncation, bad signature) are always fatal; options
     * cannot relax them.
     */
    struct parse_options {
        /**
         * @brief Maximum allowed chunk data length in bytes
         * 
         * Chunks declaring a larger length are rejected with
         * errc::length_overflow before any data is copied.
         * Default is 2^31-1, the largest length PNG permits.
         */
        std::uint32_t max_chunk_size = 0x7FFFFFFFu;
        
        /**
         * @brief Maximum number of chunks in one buffer
         * 
         * Zero means unlimited. Exceeding the limit fails with
         * errc::too_many_chunks.
         */
        std::size_t max_chunks = 0;
        
        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset of the chunk the warning refers to
         * @param category Warning category ("reserved_bit", "after_iend")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;
        
        /**
         * @brief Optional warning handler callback
         * 
         * If set, will be called for non-fatal findings during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };
    
} // namespace pngchunk
