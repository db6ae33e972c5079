#include "text/TextUtil.hpp"

namespace textutil {

static bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> tokens;
    std::string cur;

    for (char c : s) {
        if (is_ws(c)) {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && is_ws(s[i])) ++i;
    while (j > i && is_ws(s[j - 1])) --j;
    return s.substr(i, j - i);
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    std::string cur;
    cur.reserve(128);

    for (char ch : s) {
        if (ch == '\r') continue;
        if (ch == '\n') {
            lines.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    lines.push_back(cur);
    return lines;
}

bool starts_with(const std::string& s, char c) {
    return !s.empty() && s.front() == c;
}

bool ends_with(const std::string& s, char c) {
    return !s.empty() && s.back() == c;
}

std::optional<uint32_t> single_codepoint(const std::string& s) {
    if (s.empty()) return std::nullopt;

    const unsigned char lead = (unsigned char)s[0];
    size_t len = 0;
    uint32_t cp = 0;

    if (lead < 0x80) {
        len = 1;
        cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp = lead & 0x07;
    } else {
        return std::nullopt; // stray continuation byte or invalid lead
    }

    if (s.size() != len) return std::nullopt;

    for (size_t i = 1; i < len; ++i) {
        const unsigned char cont = (unsigned char)s[i];
        if ((cont & 0xC0) != 0x80) return std::nullopt;
        cp = (cp << 6) | (cont & 0x3F);
    }

    // reject overlong encodings and surrogates
    static const uint32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < min_for_len[len]) return std::nullopt;
    if (cp >= 0xD800 && cp <= 0xDFFF) return std::nullopt;
    if (cp > 0x10FFFF) return std::nullopt;

    return cp;
}

}
