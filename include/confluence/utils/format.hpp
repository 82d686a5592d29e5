#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Number Formatting
// ============================================================================

#include <iomanip>
#include <sstream>
#include <string>

namespace confluence::utils {

/// Fixed-point rendering with a given number of decimals
[[nodiscard]] inline std::string fixed(double value, int precision = 2) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

}  // namespace confluence::utils
