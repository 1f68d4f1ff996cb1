#pragma once

#include <optional>
#include <string>
#include "common/Types.h"
#include "analytics/CycleClassifier.h"

namespace cyclebt {
namespace execution {

// How a resting sell target moves when it is recomputed on a new bar.
enum class SellRepricePolicy {
    RECOMPUTE,      // new target replaces the previous one
    NEVER_LOWER,    // max(previous, recomputed)
    NEVER_RAISE     // min(previous, recomputed)
};

const char* sellRepricePolicyToString(SellRepricePolicy policy);
std::optional<SellRepricePolicy> parseSellRepricePolicy(const std::string& name);

struct SellTarget {
    Price price = 0.0;
    std::string reason;
};

class LimitPriceCalculator {
public:
    // min(p5, close, (p5 + inertia_mid) / 2)
    static Price entryBasePrice(Price p5, Price close, Price inertia_mid);

    static Price entryOrderPrice(Price base_price, double discount);

    // Bear phases -> ema, consolidation -> (p95 + ema) / 2, bull phases -> p95.
    static SellTarget cycleSellTarget(analytics::Phase phase, Price ema, Price p95);

    // Caps the target at entry * (1 + take_profit_pct); pct <= 0 leaves it alone.
    static SellTarget applyTakeProfitCap(const SellTarget& target, Price entry_price,
                                         double take_profit_pct);

    // pct <= 0 means no stop.
    static std::optional<Price> stopLossPrice(Price entry_price, double stop_loss_pct);

    static Price reprice(std::optional<Price> previous, Price recomputed, SellRepricePolicy policy);
};

} // namespace execution
} // namespace cyclebt
