#pragma once
#include "ingredient/Ingredient.hpp"
#include "quantity/QuantityClassifier.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ingredient {

struct ParserOptions {
    // throw MalformedIngredientLine instead of skipping groups with < 2 tokens
    bool strict = false;
};

// Single-use sequence of ingredients. Token merging and grouping have already
// happened; each Ingredient is assembled when next() reaches its group.
class IngredientStream {
public:
    IngredientStream(std::vector<std::vector<std::string>> groups, bool strict);

    std::optional<Ingredient> next();
    std::vector<Ingredient> collect();

    bool done() const { return m_pos >= m_groups.size(); }
    size_t group_count() const { return m_groups.size(); }
    const std::vector<ParseIssue>& issues() const { return m_issues; }

private:
    std::vector<std::vector<std::string>> m_groups;
    size_t m_pos = 0;
    bool m_strict = false;
    std::vector<ParseIssue> m_issues;
};

class IngredientParser {
public:
    IngredientParser() = default;
    explicit IngredientParser(ParserOptions opts);

    IngredientStream parse(const std::string& raw_text);

    // lines are joined with '\n' and parsed as one token stream
    IngredientStream parse_lines(const std::vector<std::string>& lines);

    // merged tokens split at quantity boundaries
    std::vector<std::vector<std::string>> segment(const std::string& raw_text);

    quantity::QuantityClassifier& classifier() { return m_classifier; }

private:
    ParserOptions m_opts;
    quantity::QuantityClassifier m_classifier;
};

}
