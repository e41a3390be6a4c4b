#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

#include <pngchunk/png.hh>

inline constexpr std::string_view secret_message = "This is where your secret message will be!";
inline constexpr std::uint32_t secret_crc = 2882656334u;

inline void append_be32(std::vector<std::byte>& out, std::uint32_t v) {
    out.push_back(std::byte(v >> 24));
    out.push_back(std::byte(v >> 16));
    out.push_back(std::byte(v >> 8));
    out.push_back(std::byte(v));
}

inline void append_text(std::vector<std::byte>& out, std::string_view s) {
    for (char c : s) {
        out.push_back(std::byte(static_cast<unsigned char>(c)));
    }
}

// Raw chunk bytes with caller-chosen fields, valid or not
inline std::vector<std::byte> raw_chunk(std::uint32_t length, std::string_view type,
                                        std::string_view payload, std::uint32_t crc) {
    std::vector<std::byte> out;
    append_be32(out, length);
    append_text(out, type);
    append_text(out, payload);
    append_be32(out, crc);
    return out;
}

inline std::vector<std::byte> secret_chunk_bytes() {
    return raw_chunk(static_cast<std::uint32_t>(secret_message.size()), "RuSt", secret_message, secret_crc);
}

inline std::vector<std::byte> png_signature_bytes() {
    std::vector<std::byte> out;
    for (auto b : pngchunk::png::signature) {
        out.push_back(std::byte(b));
    }
    return out;
}

// Signature followed by the wire form of every chunk
inline std::vector<std::byte> png_bytes(std::initializer_list<pngchunk::chunk> chunks) {
    auto out = png_signature_bytes();
    for (const auto& c : chunks) {
        auto bytes = c.serialize();
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
    return out;
}

inline pngchunk::chunk text_chunk(std::string_view type, std::string_view text) {
    return pngchunk::chunk(pngchunk::chunk_type::from_string(type), text);
}

// Minimal well-formed image: IHDR, one IDAT, IEND
inline std::vector<pngchunk::chunk> minimal_image_chunks() {
    using pngchunk::chunk;
    using pngchunk::chunk_id;
    std::vector<std::byte> ihdr = {
        std::byte(0), std::byte(0), std::byte(0), std::byte(1),   // width
        std::byte(0), std::byte(0), std::byte(0), std::byte(1),   // height
        std::byte(8), std::byte(0), std::byte(0), std::byte(0), std::byte(0)
    };
    std::vector<std::byte> idat = {
        std::byte(0x78), std::byte(0x9c), std::byte(0x63), std::byte(0x60),
        std::byte(0x00), std::byte(0x00), std::byte(0x00), std::byte(0x02),
        std::byte(0x00), std::byte(0x01)
    };
    return {
        chunk(chunk_id::IHDR, ihdr),
        chunk(chunk_id::IDAT, idat),
        chunk(chunk_id::IEND, std::vector<std::byte>{})
    };
}
