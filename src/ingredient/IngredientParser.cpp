#include "ingredient/IngredientParser.hpp"
#include "ingredient/TokenMerger.hpp"
#include "text/TextUtil.hpp"

#include <sstream>

namespace ingredient {

IngredientStream::IngredientStream(std::vector<std::vector<std::string>> groups, bool strict)
    : m_groups(std::move(groups)), m_strict(strict) {}

std::optional<Ingredient> IngredientStream::next() {
    while (m_pos < m_groups.size()) {
        const size_t index = m_pos++;
        const auto& group = m_groups[index];

        if (group.size() < 2) {
            ParseIssue issue;
            issue.code = "malformed_group";
            issue.group_index = index;
            issue.tokens = group;

            std::ostringstream oss;
            oss << "group " << index << " has " << group.size()
                << " token(s), need at least quantity and unit: '"
                << textutil::join(group, " ") << "'";
            issue.message = oss.str();

            m_issues.push_back(issue);
            if (m_strict) throw MalformedIngredientLine(std::move(issue));
            continue;
        }

        Ingredient ing;
        ing.quantity = group[0];
        ing.unit = group[1];
        ing.name = textutil::join(std::vector<std::string>(group.begin() + 2, group.end()), " ");
        return ing;
    }
    return std::nullopt;
}

std::vector<Ingredient> IngredientStream::collect() {
    std::vector<Ingredient> out;
    while (auto ing = next()) out.push_back(std::move(*ing));
    return out;
}

IngredientParser::IngredientParser(ParserOptions opts) : m_opts(opts) {}

std::vector<std::vector<std::string>> IngredientParser::segment(const std::string& raw_text) {
    const auto merged = merge_tokens(textutil::split_ws(raw_text), m_classifier);

    std::vector<std::vector<std::string>> groups;
    std::vector<std::string> current;

    for (const auto& token : merged) {
        if (!current.empty() && !token.aside && m_classifier.is_quantity(token.text)) {
            groups.push_back(std::move(current));
            current.clear();
        }
        current.push_back(token.text);
    }
    if (!current.empty()) groups.push_back(std::move(current));

    return groups;
}

IngredientStream IngredientParser::parse(const std::string& raw_text) {
    return IngredientStream(segment(raw_text), m_opts.strict);
}

IngredientStream IngredientParser::parse_lines(const std::vector<std::string>& lines) {
    return parse(textutil::join(lines, "\n"));
}

}
