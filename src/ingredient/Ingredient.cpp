#include "ingredient/Ingredient.hpp"

#include <utility>

namespace ingredient {

std::ostream& operator<<(std::ostream& os, const Ingredient& ing) {
    os << "Ingredient(quantity='" << ing.quantity
       << "', unit='" << ing.unit
       << "', name='" << ing.name << "')";
    return os;
}

MalformedIngredientLine::MalformedIngredientLine(ParseIssue issue)
    : std::runtime_error("malformed ingredient line: " + issue.message),
      m_issue(std::move(issue)) {}

}
