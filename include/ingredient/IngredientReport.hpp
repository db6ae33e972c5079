// include/ingredient/IngredientReport.hpp
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "ingredient/Ingredient.hpp"

namespace ingredient {

struct IngredientReport {
    std::string source;

    std::vector<Ingredient> ingredients;
    std::vector<ParseIssue> issues;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace ingredient
