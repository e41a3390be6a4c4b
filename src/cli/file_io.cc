//
// Created by igor on 08/09/2025.
//

#include "file_io.hh"

#include <fstream>
#include <pngchunk/exceptions.hh>

namespace pngchunk::cli {

    std::vector<std::byte> read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file, "Cannot open file '", path.string(), "' for reading");

        file.seekg(0, std::ios::end);
        auto size = file.tellg();
        THROW_IO_IF(size == std::streampos(-1), "Failed to get size of '", path.string(), "'");
        file.seekg(0, std::ios::beg);

        std::vector<std::byte> data(static_cast<std::size_t>(size));
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        THROW_IO_IF(static_cast<std::size_t>(file.gcount()) != data.size(),
                    "Unexpected EOF in '", path.string(), "': requested ", data.size(),
                    " got ", file.gcount());
        return data;
    }

    void write_file(const std::filesystem::path& path, const std::vector<std::byte>& data) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_UNLESS(file, "Cannot open file '", path.string(), "' for writing");

        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        THROW_IO_UNLESS(file, "Failed to write ", data.size(), " bytes to '", path.string(), "'");
    }

}
