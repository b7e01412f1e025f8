#include "display_format.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace {

// Fixed notation with at most `digits` decimals, trailing zeros dropped
std::string trimmedFixed(double value, int digits) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(digits) << value;
    std::string s = out.str();
    if (s.find('.') != std::string::npos) {
        while (!s.empty() && s.back() == '0') {
            s.pop_back();
        }
        if (!s.empty() && s.back() == '.') {
            s.pop_back();
        }
    }
    if (s == "-0") {
        s = "0";
    }
    return s;
}

std::string groupThousands(std::string digits) {
    std::string result;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            result.insert(result.begin(), ',');
        }
        result.insert(result.begin(), *it);
        ++count;
    }
    return result;
}

} // namespace

std::string formatPrice(std::optional<double> value) {
    if (!value || !std::isfinite(*value)) {
        return "-";
    }
    double v = *value;
    if (v >= 1000.0) {
        return groupThousands(trimmedFixed(std::round(v), 0));
    }
    if (v >= 1.0) {
        return trimmedFixed(v, 2);
    }
    return trimmedFixed(v, 6);
}

std::string formatPercent(std::optional<double> value) {
    if (!value || !std::isfinite(*value)) {
        return "-";
    }
    std::ostringstream out;
    out << (*value >= 0.0 ? "+" : "") << std::fixed << std::setprecision(2) << *value << "%";
    return out.str();
}
