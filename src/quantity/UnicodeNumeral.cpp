#include "quantity/UnicodeNumeral.hpp"
#include "text/TextUtil.hpp"

#include <unordered_map>

namespace quantity {

static std::optional<double> digit_block(uint32_t cp, uint32_t zero) {
    if (cp >= zero && cp <= zero + 9) return (double)(cp - zero);
    return std::nullopt;
}

std::optional<double> numeral_value(uint32_t cp) {
    static const std::unordered_map<uint32_t, double> table = {
        // Latin-1 fractions and superscripts
        {0x00BC, 1.0 / 4}, {0x00BD, 1.0 / 2}, {0x00BE, 3.0 / 4},
        {0x00B9, 1}, {0x00B2, 2}, {0x00B3, 3},

        // Number Forms block
        {0x2150, 1.0 / 7}, {0x2151, 1.0 / 9}, {0x2152, 1.0 / 10},
        {0x2153, 1.0 / 3}, {0x2154, 2.0 / 3},
        {0x2155, 1.0 / 5}, {0x2156, 2.0 / 5}, {0x2157, 3.0 / 5}, {0x2158, 4.0 / 5},
        {0x2159, 1.0 / 6}, {0x215A, 5.0 / 6},
        {0x215B, 1.0 / 8}, {0x215C, 3.0 / 8}, {0x215D, 5.0 / 8}, {0x215E, 7.0 / 8},
        {0x215F, 1},       // FRACTION NUMERATOR ONE
        {0x2189, 0},       // VULGAR FRACTION ZERO THIRDS

        // archaic roman numerals; U+2183/2184 carry no value
        {0x2180, 1000}, {0x2181, 5000}, {0x2182, 10000},
        {0x2185, 6}, {0x2186, 50}, {0x2187, 50000}, {0x2188, 100000},

        // circled and negative circled zero
        {0x24EA, 0}, {0x24FF, 0},

        // superscript zero, four..nine
        {0x2070, 0}, {0x2074, 4}, {0x2075, 5}, {0x2076, 6},
        {0x2077, 7}, {0x2078, 8}, {0x2079, 9},
    };

    auto it = table.find(cp);
    if (it != table.end()) return it->second;

    // subscript digits
    if (auto d = digit_block(cp, 0x2080)) return d;

    // roman numerals, upper and lower case share the same values
    if ((cp >= 0x2160 && cp <= 0x216F) || (cp >= 0x2170 && cp <= 0x217F)) {
        static const double roman[] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 50, 100, 500, 1000};
        return roman[(cp - 0x2160) % 16];
    }

    // circled, parenthesized and full-stop numbers one..twenty
    if (cp >= 0x2460 && cp <= 0x2473) return (double)(cp - 0x2460 + 1);
    if (cp >= 0x2474 && cp <= 0x2487) return (double)(cp - 0x2474 + 1);
    if (cp >= 0x2488 && cp <= 0x249B) return (double)(cp - 0x2488 + 1);

    // negative circled eleven..twenty, double circled one..ten
    if (cp >= 0x24EB && cp <= 0x24F4) return (double)(cp - 0x24EB + 11);
    if (cp >= 0x24F5 && cp <= 0x24FE) return (double)(cp - 0x24F5 + 1);

    // dingbat circled digits one..ten, three styles
    if (cp >= 0x2776 && cp <= 0x2793) return (double)((cp - 0x2776) % 10 + 1);

    // decimal digits outside ASCII
    if (auto d = digit_block(cp, 0x0660)) return d;  // arabic-indic
    if (auto d = digit_block(cp, 0x06F0)) return d;  // extended arabic-indic
    if (auto d = digit_block(cp, 0x0966)) return d;  // devanagari
    if (auto d = digit_block(cp, 0xFF10)) return d;  // fullwidth

    // a lone ASCII digit; the literal-number strategy normally gets there first
    if (auto d = digit_block(cp, 0x0030)) return d;

    return std::nullopt;
}

std::optional<double> decode_numeral_token(const std::string& token) {
    auto cp = textutil::single_codepoint(token);
    if (!cp) return std::nullopt;
    return numeral_value(*cp);
}

}
