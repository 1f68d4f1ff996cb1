#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include "common/Errors.h"

namespace cyclebt {

// Capital is booked in integer units of 1e-8 so that pool arithmetic is exact.
using MoneyUnits = std::int64_t;

constexpr double kMoneyScale = 1e8;

// int64 holds about 9.22e10 at this scale.
constexpr double kMaxMoneyAmount = 9.0e10;

// Starting capital leaves room for the pool to grow several times over.
constexpr double kMaxInitialCapital = 1.0e10;

inline MoneyUnits toMoneyUnits(double amount) {
    if (!std::isfinite(amount) || std::abs(amount) > kMaxMoneyAmount) {
        throw InvariantViolation("money amount out of range: " + std::to_string(amount));
    }
    return static_cast<MoneyUnits>(std::llround(amount * kMoneyScale));
}

inline double fromMoneyUnits(MoneyUnits units) {
    return static_cast<double>(units) / kMoneyScale;
}

} // namespace cyclebt
