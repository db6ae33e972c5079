#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace quantity {

// numeric value of a single codepoint (vulgar fractions, super/subscript
// digits, circled numbers, roman numerals, non-ASCII decimal digits)
std::optional<double> numeral_value(uint32_t cp);

// succeeds only when token is exactly one UTF-8 codepoint with a numeric value
std::optional<double> decode_numeral_token(const std::string& token);

}
