/**
 * @file png.hh
 * @brief Ordered chunk sequence behind the PNG signature
 * @author Igor
 * @date 05/09/2025
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @class png
     * @brief In-memory PNG container
     *
     * Holds the chunks of a PNG buffer in parse order. Pixel data is never
     * decoded; every chunk payload is an opaque byte blob. Lookups and
     * removal match the first chunk of the given type in current order.
     */
    class PNGCHUNK_EXPORT png {
    public:
        static constexpr std::array<std::uint8_t, 8> signature{137, 80, 78, 71, 13, 10, 26, 10};

        png() = default;

        static png from_chunks(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete PNG buffer
         *
         * Verifies the signature, then reads chunks until the buffer is
         * exhausted. Any chunk failure aborts the whole parse.
         *
         * @throws bad_signature_error Buffer does not start with the signature
         * @throws parse_error Any chunk error, see chunk::parse()
         */
        static png parse(const void* data, std::size_t size, const parse_options& options = {});
        static png parse(const std::vector<std::byte>& data, const parse_options& options = {});

        /**
         * @brief Non-throwing parse
         * @return The container, or std::nullopt with ec set to a pngchunk::errc value
         */
        static std::optional<png> parse(const void* data, std::size_t size, std::error_code& ec,
                                        const parse_options& options = {});
        static std::optional<png> parse(const std::vector<std::byte>& data, std::error_code& ec,
                                        const parse_options& options = {});

        static constexpr const std::array<std::uint8_t, 8>& header() { return signature; }

        void append_chunk(chunk c);

        /**
         * @brief First chunk with the given type code
         * @return Pointer into the container, nullptr if no chunk matches.
         *         Invalidated by append_chunk() and remove_first().
         * @throws chunk_type_error type is not a valid 4-letter code
         */
        [[nodiscard]] const chunk* find_first(std::string_view type) const;
        [[nodiscard]] const chunk* find_first(const chunk_type& type) const;

        /**
         * @brief Remove and return the first chunk with the given type code
         * @throws chunk_not_found_error No chunk of that type; the sequence is unchanged
         * @throws chunk_type_error type is not a valid 4-letter code
         */
        chunk remove_first(std::string_view type);
        chunk remove_first(const chunk_type& type);

        // Non-throwing removal; ec is errc::chunk_type_not_found or a type error
        std::optional<chunk> remove_first(std::string_view type, std::error_code& ec);

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] std::size_t size() const { return m_chunks.size(); }
        [[nodiscard]] bool empty() const { return m_chunks.empty(); }

        [[nodiscard]] std::size_t serialized_size() const;
        [[nodiscard]] std::vector<std::byte> serialize() const;

        friend PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

    private:
        explicit png(std::vector<chunk> chunks) : m_chunks(std::move(chunks)) {}

        std::vector<chunk>::const_iterator find_iter(const chunk_type& type) const;

        std::vector<chunk> m_chunks;
    };

} // namespace pngchunk
