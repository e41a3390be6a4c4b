/**
 * @file chunk.hh
 * @brief Length-prefixed, CRC-protected PNG chunk record
 * @author Igor
 * @date 04/09/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    class byte_reader;

    /**
     * @class chunk
     * @brief One PNG chunk: type code, opaque payload and CRC
     *
     * Wire layout (all integers big-endian):
     * @code
     *   length(4) | type(4) | data(length) | crc(4)
     * @endcode
     * The CRC is CRC-32/ISO-HDLC over type and data. It is always computed
     * from the contents; a parsed CRC is only compared against it.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /// Size of length, type and crc fields together
        static constexpr std::size_t metadata_size = 12;

        /// Largest payload a chunk may carry (2^31 - 1)
        static constexpr std::uint32_t max_length = 0x7FFFFFFFu;

        /**
         * @brief Build a chunk and compute its CRC
         * @throws parse_error errc::length_overflow if data is longer than max_length
         */
        chunk(const chunk_type& type, std::vector<std::byte> data);

        /**
         * @brief Convenience constructor for text payloads
         * @param type Chunk type
         * @param text Payload, stored byte for byte
         */
        chunk(const chunk_type& type, std::string_view text);

        /**
         * @brief Parse a buffer holding exactly one chunk
         * @throws insufficient_bytes_error Buffer shorter than the declared chunk
         * @throws chunk_type_error Type field is not alphabetic
         * @throws bad_checksum_error Stored CRC does not match
         * @throws parse_error errc::trailing_bytes or errc::length_overflow
         */
        static chunk parse(const void* data, std::size_t size, const parse_options& options = {});
        static chunk parse(const std::vector<std::byte>& data, const parse_options& options = {});

        /**
         * @brief Non-throwing parse
         * @return The chunk, or std::nullopt with ec set to a pngchunk::errc value
         */
        static std::optional<chunk> parse(const void* data, std::size_t size, std::error_code& ec);
        static std::optional<chunk> parse(const std::vector<std::byte>& data, std::error_code& ec);

        /**
         * @brief Parse the next chunk from a cursor
         *
         * On success the cursor advances by exactly metadata_size + length().
         * Throws the same errors as parse(), except errc::trailing_bytes.
         */
        static chunk read(byte_reader& in, const parse_options& options = {});

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        // Engaged only if the payload is well-formed UTF-8
        [[nodiscard]] std::optional<std::string> data_as_string() const;

        [[nodiscard]] std::size_t serialized_size() const { return metadata_size + m_data.size(); }
        [[nodiscard]] std::vector<std::byte> serialize() const;

        // Appends the wire form to out
        void serialize_to(std::vector<std::byte>& out) const;

        bool operator==(const chunk& o) const {
            return m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

        friend PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

    private:
        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    /**
     * @brief Narrow a payload size to the 32-bit length field
     * @throws parse_error errc::length_overflow if size exceeds chunk::max_length
     */
    PNGCHUNK_EXPORT std::uint32_t checked_chunk_length(std::size_t size);

    /**
     * @brief CRC-32/ISO-HDLC of type bytes followed by data
     */
    PNGCHUNK_EXPORT std::uint32_t compute_crc(const chunk_type& type, const std::byte* data, std::size_t size);

    /**
     * @brief Check that a byte sequence is well-formed UTF-8
     *
     * Rejects overlong forms, surrogates and code points above U+10FFFF.
     */
    PNGCHUNK_EXPORT bool is_valid_utf8(const std::byte* data, std::size_t size);

} // namespace pngchunk
