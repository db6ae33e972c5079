#include "commands/line.hpp"
#include "commands/parse.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  rts parse <path> [args]\n"
        << "  rts line \"<ingredient text>\" [--strict]\n"
        << "  rts help\n";
    return 1;
}

static int print_parse_help() {
    std::cerr
        << "usage:\n"
        << "  rts parse <path> [options]\n"
        << "\n"
        << "input:\n"
        << "  --from <n>                   first line to read (0-based), default: 0\n"
        << "  --to <n>                     stop before this line, default: end of file\n"
        << "  --per-line                   parse every line on its own instead of one joined stream\n"
        << "  --config <path>              JSON with strict/per_line/from_line/to_line\n"
        << "\n"
        << "output:\n"
        << "  --json <path>                write ingredients + issues as JSON\n"
        << "  --strict                     fail on a line that has no unit slot\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    if (cmd == "parse" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_parse_help();

    if (cmd == "parse") return cmd_parse(argc - 1, argv + 1);
    if (cmd == "line")  return cmd_line(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
