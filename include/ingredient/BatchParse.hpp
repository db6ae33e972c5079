#pragma once
#include "ingredient/IngredientParser.hpp"

#include <string>
#include <vector>

namespace ingredient {

struct SourceLine {
    int number = 0;    // 1-based line number in the input file
    std::string text;  // trimmed, never empty
};

// lines [from, to) of text (0-based, to = -1 for end of input), trimmed,
// blank lines dropped; each keeps its position in the file
std::vector<SourceLine> select_lines(const std::string& text, int from, int to);

struct BatchEntry {
    std::string line;  // source line the ingredient is listed against
    Ingredient ingredient;
};

struct BatchResult {
    std::vector<BatchEntry> entries;
    std::vector<Ingredient> ingredients;
    std::vector<ParseIssue> issues;
    size_t line_count = 0;

    // joined mode can yield more or fewer ingredients than lines
    bool counts_match() const { return ingredients.size() == line_count; }
};

// Joined mode parses all lines as one token stream and pairs lines with
// ingredients in order. Per-line mode parses every line on its own and
// prefixes issue messages with "line N: ". In strict mode the
// MalformedIngredientLine from the parser propagates, carrying the line
// number in per-line mode.
BatchResult parse_batch(IngredientParser& parser, const std::vector<SourceLine>& lines, bool per_line);

}
