//
// Created by igor on 08/09/2025.
//

#include "commands.hh"
#include "file_io.hh"

#include <ostream>
#include <pngchunk/exceptions.hh>
#include <pngchunk/png.hh>

namespace pngchunk::cli {

    namespace {
        struct command_spec {
            const char* name;
            command_kind kind;
            std::size_t min_args;
            std::size_t max_args;
        };

        constexpr command_spec command_table[] = {
            {"encode", command_kind::encode, 3, 4},
            {"decode", command_kind::decode, 2, 2},
            {"remove", command_kind::remove, 2, 2},
            {"print",  command_kind::print,  1, 1}
        };

        parse_options make_options(std::ostream& err) {
            parse_options options;
            options.on_warning = [&err](std::uint64_t offset, std::string_view category, std::string_view message) {
                err << "warning: [" << category << "] " << message << " (offset " << offset << ")\n";
            };
            return options;
        }

        png load(const std::filesystem::path& path, std::ostream& err) {
            auto data = read_file(path);
            try {
                return png::parse(data, make_options(err));
            } catch (const parse_error&) {
                err << "Error parsing PNG data for file at " << path.string() << "\n";
                throw;
            }
        }

        int run_encode(const command& cmd, std::ostream& err) {
            auto type = chunk_type::from_string(cmd.chunk_type);
            if (!type.is_valid()) {
                err << "warning: chunk type '" << type << "' has the reserved bit set\n";
            }

            auto image = load(cmd.path, err);
            image.append_chunk(chunk(type, cmd.message));
            write_file(cmd.output.value_or(cmd.path), image.serialize());
            return exit_ok;
        }

        int run_decode(const command& cmd, std::ostream& out, std::ostream& err) {
            auto image = load(cmd.path, err);
            const chunk* found = image.find_first(cmd.chunk_type);
            if (!found) {
                err << "Chunk type '" << cmd.chunk_type << "' not found\n";
                return exit_failure;
            }
            out << "Decoded: " << found->data_as_string().value_or("<not representable>") << "\n";
            return exit_ok;
        }

        int run_remove(const command& cmd, std::ostream& err) {
            auto image = load(cmd.path, err);
            try {
                image.remove_first(cmd.chunk_type);
            } catch (const chunk_not_found_error& e) {
                err << "Could not remove chunk type '" << cmd.chunk_type << "': " << e.what() << "\n";
                return exit_failure;
            }
            write_file(cmd.path, image.serialize());
            return exit_ok;
        }

        int run_print(const command& cmd, std::ostream& out, std::ostream& err) {
            auto image = load(cmd.path, err);
            out << cmd.path.filename().string() << "\n" << image << "\n";
            return exit_ok;
        }
    }

    void print_usage(const std::string& program, std::ostream& os) {
        os << "Usage: " << program << " <command> <args>\n"
           << "\n"
           << "Commands:\n"
           << "  encode <file> <chunk-type> <message> [output]  Hide message in a new chunk\n"
           << "  decode <file> <chunk-type>                     Print message of first matching chunk\n"
           << "  remove <file> <chunk-type>                     Remove first matching chunk\n"
           << "  print  <file>                                  List all chunks\n";
    }

    std::optional<command> parse_command_line(const std::vector<std::string>& args, std::ostream& err) {
        if (args.empty()) {
            err << "Missing command\n";
            return std::nullopt;
        }

        const command_spec* spec = nullptr;
        for (const auto& candidate : command_table) {
            if (args[0] == candidate.name) {
                spec = &candidate;
                break;
            }
        }
        if (!spec) {
            err << "Unknown command '" << args[0] << "'\n";
            return std::nullopt;
        }

        const std::size_t count = args.size() - 1;
        if (count < spec->min_args || count > spec->max_args) {
            err << "Wrong number of arguments for '" << spec->name << "'\n";
            return std::nullopt;
        }

        command cmd{.kind = spec->kind, .path = args[1]};
        if (count >= 2) {
            cmd.chunk_type = args[2];
        }
        if (count >= 3) {
            cmd.message = args[3];
        }
        if (count >= 4) {
            cmd.output = args[4];
        }
        return cmd;
    }

    int run(const command& cmd, std::ostream& out, std::ostream& err) {
        try {
            switch (cmd.kind) {
                case command_kind::encode:
                    return run_encode(cmd, err);
                case command_kind::decode:
                    return run_decode(cmd, out, err);
                case command_kind::remove:
                    return run_remove(cmd, err);
                case command_kind::print:
                    return run_print(cmd, out, err);
            }
        } catch (const pngchunk_error& e) {
            err << "Error: " << e.what() << "\n";
            return exit_failure;
        }
        // make compiler happy
        return exit_failure;
    }

}
