/**
 * @file main.cc
 * @brief pngchunk - hide, reveal and strip messages in PNG chunks
 */

#include "commands.hh"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto cmd = pngchunk::cli::parse_command_line(args, std::cerr);
    if (!cmd) {
        pngchunk::cli::print_usage(argv[0], std::cerr);
        return pngchunk::cli::exit_usage;
    }

    return pngchunk::cli::run(*cmd, std::cout, std::cerr);
}
