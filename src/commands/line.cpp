#include "commands/line.hpp"

#include "ingredient/IngredientParser.hpp"

#include <iostream>
#include <string>

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

int cmd_line(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage:\n"
                  << "  rts line \"<ingredient text>\" [--strict]\n";
        return 1;
    }

    ingredient::ParserOptions opts;
    opts.strict = has_flag(argc, argv, "--strict");
    ingredient::IngredientParser parser(opts);

    auto stream = parser.parse(argv[1]);
    try {
        while (auto ing = stream.next()) {
            std::cout << *ing << "\n";
        }
    } catch (const ingredient::MalformedIngredientLine& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    for (const auto& is : stream.issues()) {
        std::cerr << "warning: skipped " << is.code << ": " << is.message << "\n";
    }
    return 0;
}
