#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace textutil {

// split on any ASCII whitespace, dropping empty runs
std::vector<std::string> split_ws(const std::string& s);

// join with a single separator between items
std::string join(const std::vector<std::string>& items, const std::string& sep);

std::string trim(const std::string& s);

// split on '\n', dropping '\r'; always returns at least one (possibly empty) line
std::vector<std::string> split_lines(const std::string& s);

bool starts_with(const std::string& s, char c);
bool ends_with(const std::string& s, char c);

// decodes s as UTF-8 and returns the codepoint only when s is exactly one codepoint
std::optional<uint32_t> single_codepoint(const std::string& s);

}
