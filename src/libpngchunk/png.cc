//
// Created by igor on 05/09/2025.
//

#include <pngchunk/png.hh>
#include <pngchunk/exceptions.hh>
#include "input.hh"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <ostream>

namespace pngchunk {

    png png::from_chunks(std::vector<chunk> chunks) {
        return png(std::move(chunks));
    }

    png png::parse(const void* data, std::size_t size, const parse_options& options) {
        byte_reader in(data, size);

        if (in.remaining() < signature.size() ||
            std::memcmp(in.current(), signature.data(), signature.size()) != 0) {
            std::ostringstream got;
            got << std::hex << std::setfill('0');
            for (std::size_t i = 0; i < std::min(in.remaining(), signature.size()); i++) {
                got << (i ? " " : "") << std::setw(2) << static_cast<unsigned>(in.current()[i]);
            }
            throw bad_signature_error(build_error_msg("Invalid PNG signature: got [", got.str(),
                                                      "], expected [89 50 4e 47 0d 0a 1a 0a]"));
        }
        in.skip(signature.size());

        std::vector<chunk> chunks;
        bool seen_iend = false;
        // Each successful read consumes at least chunk::metadata_size bytes
        while (!in.at_end()) {
            if (options.max_chunks != 0 && chunks.size() >= options.max_chunks) {
                THROW_PARSE(errc::too_many_chunks, "Chunk at offset ", in.tell(),
                            " exceeds maximum chunk count of ", options.max_chunks);
            }

            const std::size_t offset = in.tell();
            chunks.push_back(chunk::read(in, options));

            if (seen_iend && options.on_warning) {
                options.on_warning(offset, "after_iend",
                    build_error_msg("Chunk '", chunks.back().type(), "' follows IEND"));
            }
            if (chunks.back().type() == chunk_id::IEND) {
                seen_iend = true;
            }
        }

        return png(std::move(chunks));
    }

    png png::parse(const std::vector<std::byte>& data, const parse_options& options) {
        return parse(data.data(), data.size(), options);
    }

    std::optional<png> png::parse(const void* data, std::size_t size, std::error_code& ec,
                                  const parse_options& options) {
        try {
            auto result = parse(data, size, options);
            ec.clear();
            return result;
        } catch (const pngchunk_error& e) {
            ec = e.code();
            return std::nullopt;
        }
    }

    std::optional<png> png::parse(const std::vector<std::byte>& data, std::error_code& ec,
                                  const parse_options& options) {
        return parse(data.data(), data.size(), ec, options);
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    std::vector<chunk>::const_iterator png::find_iter(const chunk_type& type) const {
        return std::find_if(m_chunks.begin(), m_chunks.end(),
                            [&type](const chunk& c) { return c.type() == type; });
    }

    const chunk* png::find_first(const chunk_type& type) const {
        auto it = find_iter(type);
        return it == m_chunks.end() ? nullptr : &*it;
    }

    const chunk* png::find_first(std::string_view type) const {
        return find_first(chunk_type::from_string(type));
    }

    chunk png::remove_first(const chunk_type& type) {
        auto it = find_iter(type);
        if (it == m_chunks.end()) {
            throw chunk_not_found_error(type.to_string(),
                build_error_msg("Chunk type '", type, "' not found"));
        }
        chunk removed = *it;
        m_chunks.erase(it);
        return removed;
    }

    chunk png::remove_first(std::string_view type) {
        return remove_first(chunk_type::from_string(type));
    }

    std::optional<chunk> png::remove_first(std::string_view type, std::error_code& ec) {
        try {
            auto removed = remove_first(type);
            ec.clear();
            return removed;
        } catch (const pngchunk_error& e) {
            ec = e.code();
            return std::nullopt;
        }
    }

    std::size_t png::serialized_size() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += c.serialized_size();
        }
        return total;
    }

    std::vector<std::byte> png::serialize() const {
        std::vector<std::byte> out;
        out.reserve(serialized_size());
        for (auto b : signature) {
            out.push_back(std::byte(b));
        }
        for (const auto& c : m_chunks) {
            c.serialize_to(out);
        }
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        os << "PNG: " << p.size() << " chunk(s), " << p.serialized_size() << " bytes";
        std::size_t index = 0;
        for (const auto& c : p.chunks()) {
            os << "\n\n[" << index++ << "]\n" << c;
        }
        return os;
    }

} // namespace pngchunk
