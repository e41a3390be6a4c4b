//
// Created by igor on 04/09/2025.
//

#include <pngchunk/chunk.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>
#include "input.hh"

#include <cstring>
#include <ostream>
#include <zlib.h>

namespace pngchunk {

    std::uint32_t compute_crc(const chunk_type& type, const std::byte* data, std::size_t size) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(type.bytes().data()), chunk_type::size);
        // crc32_z() resets to zero on a null buffer
        if (size > 0) {
            crc = crc32_z(crc, reinterpret_cast<const Bytef*>(data), size);
        }
        return static_cast<std::uint32_t>(crc);
    }

    bool is_valid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            auto c = static_cast<std::uint8_t>(data[i]);
            if (c < 0x80) {
                i++;
                continue;
            }

            std::size_t extra;
            std::uint32_t cp;
            std::uint32_t min_cp;
            if ((c & 0xE0) == 0xC0) {
                extra = 1; cp = c & 0x1F; min_cp = 0x80;
            } else if ((c & 0xF0) == 0xE0) {
                extra = 2; cp = c & 0x0F; min_cp = 0x800;
            } else if ((c & 0xF8) == 0xF0) {
                extra = 3; cp = c & 0x07; min_cp = 0x10000;
            } else {
                return false;
            }

            if (size - i <= extra) {
                return false;
            }
            for (std::size_t k = 1; k <= extra; k++) {
                auto cc = static_cast<std::uint8_t>(data[i + k]);
                if ((cc & 0xC0) != 0x80) {
                    return false;
                }
                cp = (cp << 6) | (cc & 0x3F);
            }

            if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return false;
            }
            i += extra + 1;
        }
        return true;
    }

    std::uint32_t checked_chunk_length(std::size_t size) {
        THROW_PARSE_IF(size > chunk::max_length, errc::length_overflow,
                       "Chunk payload of ", size, " bytes exceeds maximum allowed length of ",
                       chunk::max_length);
        return static_cast<std::uint32_t>(size);
    }

    chunk::chunk(const chunk_type& type, std::vector<std::byte> data)
        : m_length(checked_chunk_length(data.size())),
          m_type(type),
          m_data(std::move(data)),
          m_crc(compute_crc(m_type, m_data.data(), m_data.size())) {
    }

    chunk::chunk(const chunk_type& type, std::string_view text)
        : chunk(type, std::vector<std::byte>(reinterpret_cast<const std::byte*>(text.data()),
                                             reinterpret_cast<const std::byte*>(text.data()) + text.size())) {
    }

    chunk chunk::read(byte_reader& in, const parse_options& options) {
        const std::size_t start = in.tell();

        if (in.remaining() < metadata_size) {
            throw insufficient_bytes_error(metadata_size, in.remaining(),
                build_error_msg("Insufficient bytes for chunk at offset ", start,
                                ": need at least ", metadata_size, ", have ", in.remaining()));
        }

        const std::uint32_t length = in.read_be32();
        const chunk_type type = in.read_chunk_type();

        // Data plus the trailing CRC must fit in what is left
        const std::size_t needed = std::size_t(length) + 4;
        if (in.remaining() < needed) {
            throw insufficient_bytes_error(needed, in.remaining(),
                build_error_msg("Insufficient bytes for chunk '", type, "' at offset ", start,
                                ": declared length ", length, ", only ",
                                in.remaining() < 4 ? 0 : in.remaining() - 4, " data bytes available"));
        }

        THROW_PARSE_IF(length > options.max_chunk_size, errc::length_overflow,
                       "Chunk '", type, "' at offset ", start, " declares length ", length,
                       ", which exceeds maximum allowed length of ", options.max_chunk_size);

        auto data = in.read_exact(length);
        const std::uint32_t stored_crc = in.read_be32();

        chunk result(type, std::move(data));
        if (result.crc() != stored_crc) {
            throw bad_checksum_error(result.crc(), stored_crc,
                build_error_msg("Bad CRC for chunk '", type, "' at offset ", start,
                                ": expected ", result.crc(), ", got ", stored_crc));
        }

        if (!type.is_reserved_bit_valid() && options.on_warning) {
            options.on_warning(start, "reserved_bit",
                build_error_msg("Chunk '", type, "' has the reserved bit set"));
        }

        return result;
    }

    chunk chunk::parse(const void* data, std::size_t size, const parse_options& options) {
        byte_reader in(data, size);
        auto result = read(in, options);
        THROW_PARSE_IF(!in.at_end(), errc::trailing_bytes,
                       in.remaining(), " unexpected bytes after chunk '", result.type(), "'");
        return result;
    }

    chunk chunk::parse(const std::vector<std::byte>& data, const parse_options& options) {
        return parse(data.data(), data.size(), options);
    }

    std::optional<chunk> chunk::parse(const void* data, std::size_t size, std::error_code& ec) {
        try {
            auto result = parse(data, size);
            ec.clear();
            return result;
        } catch (const pngchunk_error& e) {
            ec = e.code();
            return std::nullopt;
        }
    }

    std::optional<chunk> chunk::parse(const std::vector<std::byte>& data, std::error_code& ec) {
        return parse(data.data(), data.size(), ec);
    }

    std::optional<std::string> chunk::data_as_string() const {
        if (!is_valid_utf8(m_data.data(), m_data.size())) {
            return std::nullopt;
        }
        return std::string(reinterpret_cast<const char*>(m_data.data()), m_data.size());
    }

    void chunk::serialize_to(std::vector<std::byte>& out) const {
        const std::size_t offset = out.size();
        out.resize(offset + serialized_size());

        std::byte* p = out.data() + offset;
        store_be32(p, m_length);
        m_type.to_bytes(p + 4);
        if (!m_data.empty()) {
            std::memcpy(p + 8, m_data.data(), m_data.size());
        }
        store_be32(p + 8 + m_data.size(), m_crc);
    }

    std::vector<std::byte> chunk::serialize() const {
        std::vector<std::byte> out;
        out.reserve(serialized_size());
        serialize_to(out);
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        auto text = c.data_as_string();
        os << "Length: " << c.length() << "\n"
           << "Type: " << c.type() << "\n"
           << "Data: " << (text ? *text : std::string("<not representable>")) << "\n"
           << "CRC: " << c.crc();
        return os;
    }

} // namespace pngchunk
