#include "ingredient/BatchParse.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>

namespace ingredient {

std::vector<SourceLine> select_lines(const std::string& text, int from, int to) {
    auto lines = textutil::split_lines(text);
    const int n = (int)lines.size();
    const int end = (to < 0) ? n : std::min(to, n);

    std::vector<SourceLine> out;
    for (int i = std::max(from, 0); i < end; ++i) {
        std::string t = textutil::trim(lines[i]);
        if (!t.empty()) out.push_back({i + 1, std::move(t)});
    }
    return out;
}

static std::string line_prefix(const SourceLine& line) {
    return "line " + std::to_string(line.number) + ": ";
}

static void parse_each_line(IngredientParser& parser, const std::vector<SourceLine>& lines, BatchResult& out) {
    for (const auto& line : lines) {
        auto stream = parser.parse(line.text);
        try {
            while (auto ing = stream.next()) {
                out.entries.push_back({line.text, *ing});
                out.ingredients.push_back(std::move(*ing));
            }
        } catch (const MalformedIngredientLine& e) {
            ParseIssue issue = e.issue();
            issue.message = line_prefix(line) + issue.message;
            throw MalformedIngredientLine(std::move(issue));
        }

        for (auto issue : stream.issues()) {
            issue.message = line_prefix(line) + issue.message;
            out.issues.push_back(std::move(issue));
        }
    }
}

static void parse_joined(IngredientParser& parser, const std::vector<SourceLine>& lines, BatchResult& out) {
    std::vector<std::string> texts;
    texts.reserve(lines.size());
    for (const auto& line : lines) texts.push_back(line.text);

    auto stream = parser.parse_lines(texts);
    out.ingredients = stream.collect();
    out.issues = stream.issues();

    const size_t n = std::min(texts.size(), out.ingredients.size());
    for (size_t i = 0; i < n; ++i) {
        out.entries.push_back({texts[i], out.ingredients[i]});
    }
}

BatchResult parse_batch(IngredientParser& parser, const std::vector<SourceLine>& lines, bool per_line) {
    BatchResult out;
    out.line_count = lines.size();

    if (per_line) parse_each_line(parser, lines, out);
    else parse_joined(parser, lines, out);

    return out;
}

}
