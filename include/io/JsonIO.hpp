#pragma once
#include "ingredient/Ingredient.hpp"
#include "ingredient/ParseConfig.hpp"

#include <string>

#include "nlohmann/json.hpp"

// throws std::runtime_error naming the file or field on failure
ingredient::ParseConfig loadParseConfig(const std::string& path);

nlohmann::json ingredientToJson(const ingredient::Ingredient& ing);
nlohmann::json issueToJson(const ingredient::ParseIssue& issue);
