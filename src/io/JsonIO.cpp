#include "io/JsonIO.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static bool optional_bool(const json& j, const char* key, const std::string& where, bool def) {
    if (!j.contains(key)) return def;
    if (!j.at(key).is_boolean()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a boolean");
    }
    return j.at(key).get<bool>();
}

static int optional_int(const json& j, const char* key, const std::string& where, int def) {
    if (!j.contains(key)) return def;
    const json& v = j.at(key);
    if (!v.is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }

    const bool in_range = v.is_number_unsigned()
        ? v.get<std::uint64_t>() <= (std::uint64_t)std::numeric_limits<int>::max()
        : v.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
          v.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw std::runtime_error(where + "." + std::string(key) + " is out of range");
    }
    return (int)v.get<std::int64_t>();
}

ingredient::ParseConfig loadParseConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open config file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    require_object(j, "root");

    ingredient::ParseConfig cfg;
    cfg.strict    = optional_bool(j, "strict", "root", cfg.strict);
    cfg.per_line  = optional_bool(j, "per_line", "root", cfg.per_line);
    cfg.from_line = optional_int(j, "from_line", "root", cfg.from_line);
    cfg.to_line   = optional_int(j, "to_line", "root", cfg.to_line);

    if (cfg.from_line < 0) throw std::runtime_error("root.from_line must be >= 0");
    if (cfg.to_line < -1) throw std::runtime_error("root.to_line must be >= -1");

    return cfg;
}

json ingredientToJson(const ingredient::Ingredient& ing) {
    return {
        {"quantity", ing.quantity},
        {"unit", ing.unit},
        {"name", ing.name},
    };
}

json issueToJson(const ingredient::ParseIssue& issue) {
    json j;
    j["code"] = issue.code;
    j["message"] = issue.message;
    j["group_index"] = issue.group_index;
    j["tokens"] = issue.tokens;
    return j;
}
