#pragma once
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace ingredient {

struct Ingredient {
    std::string quantity;  // "1", "1/3", "10-20", "(1, 1/2)"
    std::string unit;      // "cup", or a whole aside like "(14.5 oz)"
    std::string name;      // remaining words, single-spaced

    bool operator==(const Ingredient& o) const {
        return quantity == o.quantity && unit == o.unit && name == o.name;
    }
    bool operator!=(const Ingredient& o) const { return !(*this == o); }
};

std::ostream& operator<<(std::ostream& os, const Ingredient& ing);

// a token group that could not be assembled into an Ingredient
struct ParseIssue {
    std::string code;     // "malformed_group"
    std::string message;
    size_t group_index = 0;
    std::vector<std::string> tokens;
};

class MalformedIngredientLine : public std::runtime_error {
public:
    explicit MalformedIngredientLine(ParseIssue issue);
    const ParseIssue& issue() const { return m_issue; }

private:
    ParseIssue m_issue;
};

}
