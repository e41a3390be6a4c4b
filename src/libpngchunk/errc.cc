//
// Created by igor on 02/09/2025.
//

#include <pngchunk/errc.hh>

namespace pngchunk {

    namespace {
        class category_impl : public std::error_category {
        public:
            [[nodiscard]] const char* name() const noexcept override {
                return "pngchunk";
            }

            [[nodiscard]] std::string message(int ev) const override {
                switch (static_cast<errc>(ev)) {
                    case errc::non_alphabetic_type:
                        return "Chunk types must be ASCII alphabetic bytes";
                    case errc::invalid_type_length:
                        return "Chunk types are four bytes exactly";
                    case errc::insufficient_bytes:
                        return "Insufficient bytes";
                    case errc::bad_checksum:
                        return "Chunk CRC mismatch";
                    case errc::bad_signature:
                        return "Invalid PNG signature";
                    case errc::chunk_type_not_found:
                        return "Chunk type not found";
                    case errc::length_overflow:
                        return "Chunk length exceeds maximum";
                    case errc::trailing_bytes:
                        return "Unexpected bytes after chunk";
                    case errc::too_many_chunks:
                        return "Too many chunks";
                    case errc::io_failure:
                        return "I/O failure";
                }
                return "Unknown error";
            }
        };
    }

    const std::error_category& pngchunk_category() noexcept {
        static const category_impl instance;
        return instance;
    }

} // namespace pngchunk
