#pragma once
#include <string>
#include <variant>

namespace quantity {

// A classified quantity: either a number (1, 1.5, 1/3 -> 0.333...) or a
// rendered string (ranges "10-20", tuples "(1, 1/2)").
using QuantityValue = std::variant<double, std::string>;

// shortest readable form: integral values print without a fraction part
std::string format_number(double v);

std::string to_display(const QuantityValue& q);

}
