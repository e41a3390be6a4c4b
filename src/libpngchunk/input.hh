//
// Created by igor on 03/09/2025.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    // Bounded read cursor over an in-memory buffer.
    // The buffer is not owned and must outlive the reader.
    class byte_reader {
        public:
            byte_reader(const void* data, std::size_t size);
            explicit byte_reader(const std::vector<std::byte>& data);

            // Reads up to size bytes, returns the number actually read
            std::size_t read(void* dst, std::size_t size);

            // Throw insufficient_bytes_error when fewer than size bytes remain
            void read_exact(void* dst, std::size_t size);
            std::vector<std::byte> read_exact(std::size_t size);
            void skip(std::size_t size);

            std::uint32_t read_be32();
            chunk_type read_chunk_type();

            // Throws insufficient_bytes_error unless size bytes remain
            void require(std::size_t size) const;

            [[nodiscard]] const std::byte* current() const { return m_data + m_position; }
            [[nodiscard]] std::size_t tell() const { return m_position; }
            [[nodiscard]] std::size_t size() const { return m_size; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] bool at_end() const { return m_position == m_size; }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };
}
