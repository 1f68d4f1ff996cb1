#include "execution/LimitPriceCalculator.h"
#include <algorithm>
#include <cctype>

namespace cyclebt {
namespace execution {

namespace {
std::string normalizeName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return name;
}
} // namespace

const char* sellRepricePolicyToString(SellRepricePolicy policy) {
    switch (policy) {
        case SellRepricePolicy::RECOMPUTE: return "recompute";
        case SellRepricePolicy::NEVER_LOWER: return "never_lower";
        case SellRepricePolicy::NEVER_RAISE: return "never_raise";
    }
    return "recompute";
}

std::optional<SellRepricePolicy> parseSellRepricePolicy(const std::string& name) {
    const std::string n = normalizeName(name);
    if (n == "recompute") return SellRepricePolicy::RECOMPUTE;
    if (n == "never_lower") return SellRepricePolicy::NEVER_LOWER;
    if (n == "never_raise") return SellRepricePolicy::NEVER_RAISE;
    return std::nullopt;
}

Price LimitPriceCalculator::entryBasePrice(Price p5, Price close, Price inertia_mid) {
    const Price mid_p5 = (p5 + inertia_mid) / 2.0;
    return std::min({p5, close, mid_p5});
}

Price LimitPriceCalculator::entryOrderPrice(Price base_price, double discount) {
    return base_price * (1.0 - discount);
}

SellTarget LimitPriceCalculator::cycleSellTarget(analytics::Phase phase, Price ema, Price p95) {
    if (analytics::isBearPhase(phase)) {
        return {ema, "ema_reversion"};
    }
    if (phase == analytics::Phase::CONSOLIDATION) {
        return {(p95 + ema) / 2.0, "consolidation_mid"};
    }
    return {p95, "p95_target"};
}

SellTarget LimitPriceCalculator::applyTakeProfitCap(const SellTarget& target, Price entry_price,
                                                    double take_profit_pct) {
    if (take_profit_pct <= 0.0) {
        return target;
    }
    const Price cap = entry_price * (1.0 + take_profit_pct);
    if (cap < target.price) {
        return {cap, "take_profit"};
    }
    return target;
}

std::optional<Price> LimitPriceCalculator::stopLossPrice(Price entry_price, double stop_loss_pct) {
    if (stop_loss_pct <= 0.0) {
        return std::nullopt;
    }
    return entry_price * (1.0 - stop_loss_pct);
}

Price LimitPriceCalculator::reprice(std::optional<Price> previous, Price recomputed,
                                    SellRepricePolicy policy) {
    if (!previous) {
        return recomputed;
    }
    switch (policy) {
        case SellRepricePolicy::RECOMPUTE: return recomputed;
        case SellRepricePolicy::NEVER_LOWER: return std::max(*previous, recomputed);
        case SellRepricePolicy::NEVER_RAISE: return std::min(*previous, recomputed);
    }
    return recomputed;
}

} // namespace execution
} // namespace cyclebt
