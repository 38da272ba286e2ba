#pragma once

#include <cmath>

namespace agentcost {

// Rounding contract for values handed to callers: money to cents, percentages
// to one decimal. Applied once when a result is assembled.

inline double round_to(double value, int decimals) {
    double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

inline double round_money(double value) {
    return round_to(value, 2);
}

inline double round_percent(double value) {
    return round_to(value, 1);
}

} // namespace agentcost
