#include "ingredient/TokenMerger.hpp"
#include "text/TextUtil.hpp"

namespace ingredient {

namespace {

struct ParenSpan {
    size_t start = 0;
    size_t end = 0;  // inclusive
};

std::vector<ParenSpan> find_paren_spans(const std::vector<std::string>& tokens) {
    std::vector<ParenSpan> spans;
    bool open = false;
    size_t start = 0;

    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& t = tokens[i];

        if (!open) {
            if (!textutil::starts_with(t, '(')) continue;
            start = i;
            open = true;
            // "(8)" opens and closes on the same token
            if (t.size() > 1 && textutil::ends_with(t, ')')) {
                spans.push_back({start, i});
                open = false;
            }
            continue;
        }

        if (textutil::ends_with(t, ')')) {
            spans.push_back({start, i});
            open = false;
        }
    }

    return spans;
}

}

std::vector<std::string> fold_parentheses(const std::vector<std::string>& tokens) {
    const auto spans = find_paren_spans(tokens);

    std::vector<std::string> out;
    out.reserve(tokens.size());

    size_t i = 0;
    for (const auto& span : spans) {
        while (i < span.start) out.push_back(tokens[i++]);

        std::vector<std::string> parts(tokens.begin() + span.start, tokens.begin() + span.end + 1);
        out.push_back(textutil::join(parts, " "));
        i = span.end + 1;
    }
    while (i < tokens.size()) out.push_back(tokens[i++]);

    return out;
}

bool is_paren_span(const std::string& token) {
    return textutil::starts_with(token, '(') && textutil::ends_with(token, ')');
}

std::vector<MergedToken> coalesce_marked(const std::vector<std::string>& folded,
                                         quantity::QuantityClassifier& classifier) {
    std::vector<MergedToken> out;
    out.reserve(folded.size());

    auto mergeable = [&](const std::string& t) {
        return !is_paren_span(t) && classifier.is_quantity(t);
    };

    for (size_t i = 0; i < folded.size(); ++i) {
        if (i + 1 < folded.size() && mergeable(folded[i]) && mergeable(folded[i + 1])) {
            out.push_back({"(" + folded[i] + ", " + folded[i + 1] + ")", false});
            ++i;
            continue;
        }
        out.push_back({folded[i], is_paren_span(folded[i])});
    }

    return out;
}

std::vector<std::string> coalesce_quantities(const std::vector<std::string>& folded,
                                             quantity::QuantityClassifier& classifier) {
    std::vector<std::string> out;
    for (auto& t : coalesce_marked(folded, classifier)) out.push_back(std::move(t.text));
    return out;
}

std::vector<MergedToken> merge_tokens(const std::vector<std::string>& tokens,
                                      quantity::QuantityClassifier& classifier) {
    return coalesce_marked(fold_parentheses(tokens), classifier);
}

}
