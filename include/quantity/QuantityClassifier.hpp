#pragma once
#include "quantity/QuantityValue.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace quantity {

// strategy: "1", "1.5", ".5"
std::optional<QuantityValue> parse_literal_number(const std::string& token);

// strategy: "½", "⅓", "³"
std::optional<QuantityValue> parse_unicode_numeral(const std::string& token);

// strategy: "1/3", "10-20", "(1, 1/2)"
std::optional<QuantityValue> parse_constant_expression(const std::string& token);

// Decides whether a token is a quantity. Strategies are tried in order and
// the first non-empty result wins; results (including "not a quantity") are
// memoized per token text for the lifetime of the classifier.
class QuantityClassifier {
public:
    std::optional<QuantityValue> classify(const std::string& token);
    bool is_quantity(const std::string& token) { return classify(token).has_value(); }

    size_t cache_size() const { return m_cache.size(); }
    bool is_cached(const std::string& token) const { return m_cache.find(token) != m_cache.end(); }

private:
    static std::optional<QuantityValue> compute(const std::string& token);

    // key present => computed; mapped nullopt => not a quantity
    std::unordered_map<std::string, std::optional<QuantityValue>> m_cache;
};

}
