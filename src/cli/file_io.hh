//
// Created by igor on 08/09/2025.
//

#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

namespace pngchunk::cli {

    // Both throw pngchunk::io_error
    std::vector<std::byte> read_file(const std::filesystem::path& path);
    void write_file(const std::filesystem::path& path, const std::vector<std::byte>& data);

}
