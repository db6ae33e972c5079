#include "commands/parse.hpp"

#include "ingredient/BatchParse.hpp"
#include "ingredient/IngredientParser.hpp"
#include "ingredient/IngredientReport.hpp"
#include "ingredient/ParseConfig.hpp"
#include "io/JsonIO.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        std::cerr << "warning: ignoring non-integer " << key << " '" << s << "'\n";
        return def;
    }
}

static std::string read_all(const fs::path& p) {
    std::ifstream in(p);
    if (!in) throw std::runtime_error("failed to open: " + p.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static int parse_usage() {
    std::cerr
        << "usage:\n"
        << "  rts parse <path> [--from N] [--to N] [--per-line] [--strict] [--json <out>] [--config <file>]\n";
    return 1;
}

static void print_issue(const ingredient::ParseIssue& is) {
    std::cerr << "warning: skipped " << is.code << ": " << is.message << "\n";
}

int cmd_parse(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]).rfind("--", 0) == 0) {
        std::cerr << "error: missing input path\n";
        return parse_usage();
    }
    const std::string path = argv[1];

    ingredient::ParseConfig cfg;
    const std::string config_path = get_arg(argc, argv, "--config", "");
    if (!config_path.empty()) {
        try {
            cfg = loadParseConfig(config_path);
        } catch (const std::exception& e) {
            std::cerr << "[error] failed to load config: " << e.what() << "\n";
            return 1;
        }
    }

    cfg.from_line = get_arg_int(argc, argv, "--from", cfg.from_line);
    cfg.to_line   = get_arg_int(argc, argv, "--to", cfg.to_line);
    if (has_flag(argc, argv, "--per-line")) cfg.per_line = true;
    if (has_flag(argc, argv, "--strict")) cfg.strict = true;

    if (cfg.from_line < 0) {
        std::cerr << "error: --from must be >= 0\n";
        return parse_usage();
    }

    const std::string json_out = get_arg(argc, argv, "--json", "");

    std::string text;
    try {
        text = read_all(fs::path(path));
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    const auto lines = ingredient::select_lines(text, cfg.from_line, cfg.to_line);

    ingredient::ParserOptions opts;
    opts.strict = cfg.strict;
    ingredient::IngredientParser parser(opts);

    ingredient::BatchResult batch;
    try {
        batch = ingredient::parse_batch(parser, lines, cfg.per_line);
    } catch (const ingredient::MalformedIngredientLine& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    for (const auto& entry : batch.entries) {
        std::cout << entry.line << " => " << entry.ingredient << "\n";
    }
    if (!cfg.per_line && !batch.counts_match()) {
        std::cerr << "warning: " << batch.line_count << " line(s) produced "
                  << batch.ingredients.size() << " ingredient(s); use --per-line to keep lines apart\n";
    }
    for (const auto& is : batch.issues) print_issue(is);

    ingredient::IngredientReport report;
    report.source = path;
    report.ingredients = batch.ingredients;
    report.issues = batch.issues;

    if (!json_out.empty()) {
        try {
            report.write_to(fs::path(json_out));
        } catch (const std::exception& e) {
            std::cerr << "[error] failed to write report: " << e.what() << "\n";
            return 1;
        }
        std::cout << "OUT_INGREDIENTS: " << json_out << "\n";
    }

    return 0;
}
