#pragma once
#include "quantity/QuantityClassifier.hpp"

#include <string>
#include <vector>

namespace ingredient {

struct MergedToken {
    std::string text;
    bool aside = false;  // a parenthesized span from pass A, never a quantity
};

// true for a token pass A left as a whole span: "(8)", "(14.5 oz)"
bool is_paren_span(const std::string& token);

// Pass A: ["1", "(16", "oz)", "box"] -> ["1", "(16 oz)", "box"].
// A token starting with '(' opens a span, the first later token ending with
// ')' closes it. Spans do not nest; an unclosed span is left unfolded.
std::vector<std::string> fold_parentheses(const std::vector<std::string>& tokens);

// Pass B: ["1", "1/2", "cup"] -> ["(1, 1/2)", "cup"].
// Two adjacent quantity tokens become one "(A, B)" token; the merged token is
// not merged again. Spans folded by pass A are never merged. Expects the
// output of pass A.
std::vector<MergedToken> coalesce_marked(const std::vector<std::string>& folded,
                                         quantity::QuantityClassifier& classifier);

// coalesce_marked without the aside flags
std::vector<std::string> coalesce_quantities(const std::vector<std::string>& folded,
                                             quantity::QuantityClassifier& classifier);

// pass A then pass B
std::vector<MergedToken> merge_tokens(const std::vector<std::string>& tokens,
                                      quantity::QuantityClassifier& classifier);

}
