//
// Created by igor on 03/09/2025.
//

#include <algorithm>
#include <cstring>

#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>
#include "input.hh"

namespace pngchunk {

    byte_reader::byte_reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data)), m_size(size), m_position(0) {
        if (!m_data && m_size != 0) {
            THROW_IO("Null buffer of size ", size, " in byte_reader");
        }
    }

    byte_reader::byte_reader(const std::vector<std::byte>& data)
        : byte_reader(data.data(), data.size()) {}

    std::size_t byte_reader::read(void* dst, std::size_t size) {
        size = std::min(size, remaining());
        if (size == 0) {
            return 0;
        }
        THROW_IO_UNLESS(dst, "Null buffer in read");

        std::memcpy(dst, current(), size);
        m_position += size;
        return size;
    }

    void byte_reader::require(std::size_t size) const {
        if (size > remaining()) {
            throw insufficient_bytes_error(size, remaining(),
                build_error_msg("Insufficient bytes at offset ", m_position,
                                ": need ", size, ", have ", remaining()));
        }
    }

    void byte_reader::read_exact(void* dst, std::size_t size) {
        require(size);
        read(dst, size);
    }

    std::vector<std::byte> byte_reader::read_exact(std::size_t size) {
        require(size);
        std::vector<std::byte> buffer(current(), current() + size);
        m_position += size;
        return buffer;
    }

    void byte_reader::skip(std::size_t size) {
        require(size);
        m_position += size;
    }

    std::uint32_t byte_reader::read_be32() {
        require(4);
        auto value = load_be32(current());
        m_position += 4;
        return value;
    }

    chunk_type byte_reader::read_chunk_type() {
        require(chunk_type::size);
        auto type = chunk_type::from_bytes(current());
        m_position += chunk_type::size;
        return type;
    }
}
