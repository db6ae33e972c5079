#include "quantity/QuantityClassifier.hpp"
#include "quantity/ConstantExpression.hpp"
#include "quantity/UnicodeNumeral.hpp"

#include <cstdlib>

namespace quantity {

std::optional<QuantityValue> parse_literal_number(const std::string& token) {
    size_t i = 0;
    size_t digits = 0;

    while (i < token.size() && token[i] >= '0' && token[i] <= '9') { ++i; ++digits; }
    if (i < token.size() && token[i] == '.') {
        ++i;
        while (i < token.size() && token[i] >= '0' && token[i] <= '9') { ++i; ++digits; }
    }
    if (digits == 0 || i != token.size()) return std::nullopt;

    return QuantityValue{std::strtod(token.c_str(), nullptr)};
}

std::optional<QuantityValue> parse_unicode_numeral(const std::string& token) {
    auto v = decode_numeral_token(token);
    if (!v) return std::nullopt;
    return QuantityValue{*v};
}

std::optional<QuantityValue> parse_constant_expression(const std::string& token) {
    return ConstantExpression::evaluate(token);
}

std::optional<QuantityValue> QuantityClassifier::compute(const std::string& token) {
    using Strategy = std::optional<QuantityValue> (*)(const std::string&);
    static const Strategy strategies[] = {
        parse_literal_number,
        parse_unicode_numeral,
        parse_constant_expression,
    };

    for (Strategy s : strategies) {
        if (auto q = s(token)) return q;
    }
    return std::nullopt;
}

std::optional<QuantityValue> QuantityClassifier::classify(const std::string& token) {
    auto it = m_cache.find(token);
    if (it != m_cache.end()) return it->second;

    auto q = compute(token);
    m_cache.emplace(token, q);
    return q;
}

}
