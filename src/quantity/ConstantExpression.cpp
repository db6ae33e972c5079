#include "quantity/ConstantExpression.hpp"
#include "quantity/UnicodeNumeral.hpp"

#include <cctype>
#include <cstdlib>

namespace quantity {

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// byte length of the UTF-8 sequence starting with lead, 0 if not a lead byte
static size_t utf8_length(unsigned char lead) {
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

ConstantExpression::ConstantExpression(std::vector<Lexeme> lexemes)
    : m_lexemes(std::move(lexemes)) {}

std::optional<std::vector<ConstantExpression::Lexeme>> ConstantExpression::lex(const std::string& source) {
    std::vector<Lexeme> out;
    size_t i = 0;

    while (i < source.size()) {
        const char c = source[i];

        if (std::isspace((unsigned char)c)) {
            ++i;
            continue;
        }

        if (is_digit(c) || c == '.') {
            size_t j = i;
            size_t digits = 0;
            while (j < source.size() && is_digit(source[j])) { ++j; ++digits; }
            if (j < source.size() && source[j] == '.') {
                ++j;
                while (j < source.size() && is_digit(source[j])) { ++j; ++digits; }
            }
            if (digits == 0) return std::nullopt; // a lone "."
            const std::string text = source.substr(i, j - i);
            out.push_back({Kind::Number, text, std::strtod(text.c_str(), nullptr)});
            i = j;
            continue;
        }

        if ((unsigned char)c >= 0x80) {
            const size_t len = utf8_length((unsigned char)c);
            if (len == 0 || i + len > source.size()) return std::nullopt;
            const std::string glyph = source.substr(i, len);
            auto v = decode_numeral_token(glyph);
            if (!v) return std::nullopt;
            out.push_back({Kind::Number, glyph, *v});
            i += len;
            continue;
        }

        Kind k;
        switch (c) {
            case '/': k = Kind::Slash; break;
            case '-': k = Kind::Minus; break;
            case '+': k = Kind::Plus; break;
            case '(': k = Kind::LParen; break;
            case ')': k = Kind::RParen; break;
            case ',': k = Kind::Comma; break;
            default: return std::nullopt;
        }
        out.push_back({k, std::string(1, c), 0.0});
        ++i;
    }

    out.push_back({Kind::End, "", 0.0});
    return out;
}

bool ConstantExpression::accept(Kind k) {
    if (peek().kind != k) return false;
    ++m_pos;
    return true;
}

std::optional<ConstantExpression::Element> ConstantExpression::parse_element() {
    if (peek().kind != Kind::Number) return std::nullopt;

    Element el;
    el.source = peek().text;
    el.lhs = peek().value;
    ++m_pos;

    const Kind op = peek().kind;
    if (op != Kind::Slash && op != Kind::Minus) return el;
    ++m_pos;

    if (peek().kind != Kind::Number) return std::nullopt;
    el.op = op;
    el.source += (op == Kind::Slash ? "/" : "-") + peek().text;
    el.rhs = peek().value;
    ++m_pos;

    if (op == Kind::Slash && el.rhs == 0.0) return std::nullopt;
    return el;
}

std::optional<ConstantExpression::Operand> ConstantExpression::parse_operand() {
    if (peek().kind == Kind::Number) {
        Operand op;
        op.value = peek().value;
        op.text = format_number(op.value);
        ++m_pos;
        return op;
    }

    if (!accept(Kind::LParen)) return std::nullopt;

    std::vector<Element> elements;
    bool trailing_comma = false;

    while (true) {
        auto el = parse_element();
        if (!el) return std::nullopt;
        elements.push_back(*el);
        trailing_comma = false;

        if (accept(Kind::RParen)) break;
        if (!accept(Kind::Comma)) return std::nullopt;
        trailing_comma = true;
        if (accept(Kind::RParen)) break;
    }

    Operand op;

    // "(2)", "(1/2)", "(10-20)" are just parenthesized values
    if (elements.size() == 1 && !trailing_comma) {
        const Element& el = elements[0];
        switch (el.op) {
            case Kind::Slash:
                op.value = el.lhs / el.rhs;
                op.text = format_number(op.value);
                break;
            case Kind::Minus:
                op.is_text = true;
                op.text = format_number(el.lhs) + "-" + format_number(el.rhs);
                break;
            default:
                op.value = el.lhs;
                op.text = format_number(op.value);
                break;
        }
        return op;
    }

    op.is_text = true;
    op.text = "(";
    for (size_t i = 0; i < elements.size(); ++i) {
        if (i) op.text += ", ";
        op.text += elements[i].source;
    }
    if (elements.size() == 1) op.text += ",";
    op.text += ")";
    return op;
}

std::optional<QuantityValue> ConstantExpression::parse_expr() {
    auto left = parse_operand();
    if (!left) return std::nullopt;

    if (accept(Kind::End)) {
        if (left->is_text) return QuantityValue{left->text};
        return QuantityValue{left->value};
    }

    const Kind op = peek().kind;
    if (op != Kind::Slash && op != Kind::Minus && op != Kind::Plus) return std::nullopt;
    ++m_pos;

    auto right = parse_operand();
    if (!right) return std::nullopt;
    if (!accept(Kind::End)) return std::nullopt;
    if (left->is_text || right->is_text) return std::nullopt;

    switch (op) {
        case Kind::Slash:
            if (right->value == 0.0) return std::nullopt;
            return QuantityValue{left->value / right->value};
        case Kind::Minus:
            // a range, kept as text rather than evaluated
            return QuantityValue{left->text + "-" + right->text};
        default:
            // no rendering for '+'
            return std::nullopt;
    }
}

std::optional<QuantityValue> ConstantExpression::evaluate(const std::string& source) {
    auto lexemes = lex(source);
    if (!lexemes) return std::nullopt;

    ConstantExpression parser(std::move(*lexemes));
    return parser.parse_expr();
}

}
