//
// Created by igor on 01/09/2025.
//

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

#include <cstring>
#include <iomanip>
#include <ostream>

namespace pngchunk {

    chunk_type chunk_type::from_bytes(const bytes_type& bytes) {
        if (!are_valid_bytes(bytes)) {
            std::ostringstream hex;
            hex << std::hex << std::setfill('0');
            for (auto c : bytes) {
                hex << "\\x" << std::setw(2) << static_cast<unsigned>(c);
            }
            throw chunk_type_error(errc::non_alphabetic_type,
                                   build_error_msg("Chunk type '", hex.str(),
                                                   "' contains non-alphabetic bytes"));
        }
        return chunk_type(bytes);
    }

    chunk_type chunk_type::from_bytes(const void* data) {
        bytes_type bytes;
        std::memcpy(bytes.data(), data, size);
        return from_bytes(bytes);
    }

    chunk_type chunk_type::from_string(std::string_view s) {
        if (s.size() != size) {
            throw chunk_type_error(errc::invalid_type_length,
                                   build_error_msg("Chunk type '", s, "' is ", s.size(),
                                                   " bytes long, expected ", size));
        }
        return from_bytes(s.data());
    }

    std::optional<chunk_type> chunk_type::from_string(std::string_view s, std::error_code& ec) {
        try {
            auto result = from_string(s);
            ec.clear();
            return result;
        } catch (const chunk_type_error& e) {
            ec = e.code();
            return std::nullopt;
        }
    }

    void chunk_type::to_bytes(void* dest) const {
        std::memcpy(dest, m_bytes.data(), size);
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        return os << t.to_string();
    }

} // namespace pngchunk
