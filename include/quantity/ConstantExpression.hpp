#pragma once
#include "quantity/QuantityValue.hpp"

#include <optional>
#include <string>
#include <vector>

namespace quantity {

// Restricted arithmetic grammar used for written quantities:
//
//   expr     := operand [ ('/' | '-' | '+') operand ]
//   operand  := NUMBER | '(' element (',' element)* [','] ')'
//   element  := NUMBER [ ('/' | '-') NUMBER ]
//   NUMBER   := digits [ '.' digits* ] | '.' digits | numeral glyph ("½")
//
// "a/b" evaluates to the quotient, "a-b" renders as the range string "a-b",
// "(a, b)" renders as a tuple string keeping each element's source text, and
// a single parenthesized element without a comma is that element's value.
// "a+b" parses but has no rendering and is rejected like any other
// malformed input.
class ConstantExpression {
public:
    static std::optional<QuantityValue> evaluate(const std::string& source);

private:
    enum class Kind { Number, Slash, Minus, Plus, LParen, RParen, Comma, End };

    struct Lexeme {
        Kind kind = Kind::End;
        std::string text;
        double value = 0.0;  // Number only
    };

    // NUMBER, NUMBER/NUMBER or NUMBER-NUMBER inside parentheses
    struct Element {
        std::string source;
        Kind op = Kind::End;  // End for a lone NUMBER
        double lhs = 0.0;
        double rhs = 0.0;
    };

    // a number, or rendered text (range or tuple) that takes no operator
    struct Operand {
        bool is_text = false;
        double value = 0.0;
        std::string text;
    };

    explicit ConstantExpression(std::vector<Lexeme> lexemes);

    static std::optional<std::vector<Lexeme>> lex(const std::string& source);

    std::optional<QuantityValue> parse_expr();
    std::optional<Operand> parse_operand();
    std::optional<Element> parse_element();

    const Lexeme& peek() const { return m_lexemes[m_pos]; }
    bool accept(Kind k);

    std::vector<Lexeme> m_lexemes;
    size_t m_pos = 0;
};

}
