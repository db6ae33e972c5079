#include "ingredient/IngredientReport.hpp"
#include "io/JsonIO.hpp"

#include <fstream>
#include <stdexcept>

namespace ingredient {

nlohmann::json IngredientReport::to_json() const {
    nlohmann::json j;
    j["source"] = source;
    j["num_ingredients"] = ingredients.size();

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& ing : ingredients) {
        arr.push_back(ingredientToJson(ing));
    }
    j["ingredients"] = arr;

    nlohmann::json iss = nlohmann::json::array();
    for (const auto& is : issues) {
        iss.push_back(issueToJson(is));
    }
    j["issues"] = iss;

    return j;
}

void IngredientReport::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace ingredient
