//
// Created by igor on 08/09/2025.
//

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace pngchunk::cli {

    enum class command_kind {
        encode,
        decode,
        remove,
        print
    };

    struct command {
        command_kind kind;
        std::filesystem::path path;
        std::string chunk_type;
        std::string message;
        std::optional<std::filesystem::path> output;
    };

    // Exit codes
    inline constexpr int exit_ok = 0;
    inline constexpr int exit_failure = 1;
    inline constexpr int exit_usage = 2;

    // Returns std::nullopt on a usage error after printing the reason to err
    std::optional<command> parse_command_line(const std::vector<std::string>& args, std::ostream& err);

    void print_usage(const std::string& program, std::ostream& os);

    int run(const command& cmd, std::ostream& out, std::ostream& err);

}
