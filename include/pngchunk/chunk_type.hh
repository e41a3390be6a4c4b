//
// Created by igor on 01/09/2025.
//
#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <iosfwd>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {
    /**
     * @class chunk_type
     * @brief 4-byte PNG chunk type code
     *
     * Every byte is ASCII alphabetic; this is checked on construction, so a
     * chunk_type value is always well-formed. Bit 5 of each byte carries a
     * property flag (critical, public, reserved, safe-to-copy).
     */
    class PNGCHUNK_EXPORT chunk_type {
    public:
        static constexpr std::size_t size = 4;
        using bytes_type = std::array<std::uint8_t, size>;

        // Throws chunk_type_error(non_alphabetic_type)
        static chunk_type from_bytes(const bytes_type& bytes);

        // Reads 4 raw bytes; throws chunk_type_error(non_alphabetic_type)
        static chunk_type from_bytes(const void* data);

        // Throws chunk_type_error(invalid_type_length or non_alphabetic_type)
        static chunk_type from_string(std::string_view s);

        // Non-throwing form; ec is cleared on success
        static std::optional<chunk_type> from_string(std::string_view s, std::error_code& ec);

        static constexpr bool are_valid_bytes(const bytes_type& bytes) {
            for (auto c : bytes) {
                if (!is_alpha(c)) {
                    return false;
                }
            }
            return true;
        }

        [[nodiscard]] constexpr const bytes_type& bytes() const { return m_bytes; }

        [[nodiscard]] constexpr bool is_critical() const { return !bit5(m_bytes[0]); }
        [[nodiscard]] constexpr bool is_public() const { return !bit5(m_bytes[1]); }
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return !bit5(m_bytes[2]); }
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return bit5(m_bytes[3]); }

        // Only the reserved bit gates validity; the other three flags are informational
        [[nodiscard]] constexpr bool is_valid() const {
            return are_valid_bytes(m_bytes) && is_reserved_bit_valid();
        }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), size};
        }

        void to_bytes(void* dest) const;

        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

        friend PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    private:
        explicit constexpr chunk_type(const bytes_type& bytes) : m_bytes(bytes) {}

        static constexpr bool is_alpha(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        static constexpr bool bit5(std::uint8_t c) {
            return (c & 0x20) != 0;
        }

        friend struct chunk_id;

        bytes_type m_bytes;
    };

    // Well-known critical chunk types
    struct chunk_id {
        static constexpr chunk_type IHDR{{'I', 'H', 'D', 'R'}};
        static constexpr chunk_type PLTE{{'P', 'L', 'T', 'E'}};
        static constexpr chunk_type IDAT{{'I', 'D', 'A', 'T'}};
        static constexpr chunk_type IEND{{'I', 'E', 'N', 'D'}};
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            const auto& b = t.bytes();
            std::uint32_t v = (std::uint32_t(b[0]) << 24) | (std::uint32_t(b[1]) << 16) |
                              (std::uint32_t(b[2]) << 8) | std::uint32_t(b[3]);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
