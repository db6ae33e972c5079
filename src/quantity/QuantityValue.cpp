#include "quantity/QuantityValue.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace quantity {

std::string format_number(double v) {
    if (std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 1e15) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(0) << v;
        return oss.str();
    }
    std::ostringstream oss;
    oss << std::setprecision(15) << v;
    return oss.str();
}

std::string to_display(const QuantityValue& q) {
    if (const double* d = std::get_if<double>(&q)) return format_number(*d);
    return std::get<std::string>(q);
}

}
