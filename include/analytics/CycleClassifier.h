#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"
#include "analytics/IndicatorPipeline.h"

namespace cyclebt {
namespace analytics {

enum class Phase {
    CONSOLIDATION,
    BULL_WARNING,
    BULL_STRONG,
    BEAR_WARNING,
    BEAR_STRONG
};

inline const char* phaseToString(Phase phase) {
    switch (phase) {
        case Phase::CONSOLIDATION: return "consolidation";
        case Phase::BULL_WARNING: return "bull_warning";
        case Phase::BULL_STRONG: return "bull_strong";
        case Phase::BEAR_WARNING: return "bear_warning";
        case Phase::BEAR_STRONG: return "bear_strong";
    }
    return "consolidation";
}

inline bool isBullPhase(Phase phase) {
    return phase == Phase::BULL_WARNING || phase == Phase::BULL_STRONG;
}

inline bool isBearPhase(Phase phase) {
    return phase == Phase::BEAR_WARNING || phase == Phase::BEAR_STRONG;
}

// Thresholds in trend_value units. Bear side defaults to the negated bull side.
struct CycleThresholds {
    double bull_warning = 600.0;
    double bull_strong = 1000.0;
    double bull_exit = 0.0;
    double bear_warning = -600.0;
    double bear_strong = -1000.0;
    double bear_exit = 0.0;
};

struct PhaseStreak {
    Phase phase = Phase::CONSOLIDATION;
    std::size_t start_bar_index = 0;
    TimestampMs start_timestamp = 0;
    Price start_price = 0.0;
    double extremum_value = 0.0;    // max trend_value for bull, min for bear
    std::size_t length = 0;         // bars spent in the phase so far
};

struct CycleState {
    Phase phase = Phase::CONSOLIDATION;
    bool is_confirmed = false;
    bool valid = false;             // false while the signal is insufficient
    PhaseStreak streak;
};

// Per-instrument hysteresis state machine over trend_value.
// A bar's phase depends only on its own trend value, the previous valid trend
// value and the previous phase; nothing is ever revised.
class CycleClassifier {
public:
    explicit CycleClassifier(const CycleThresholds& thresholds = CycleThresholds());

    // Insufficient snapshots yield CONSOLIDATION / unconfirmed and leave the
    // machine untouched.
    CycleState update(const SignalSnapshot& snapshot, std::size_t bar_index, const Candle& candle);

    CycleState update(std::optional<double> trend_value, std::size_t bar_index,
                      TimestampMs timestamp = 0, Price price = 0.0);

    const CycleState& current() const { return state_; }
    Phase previousPhase() const { return previous_phase_; }
    void reset();

    static std::vector<Phase> classifySeries(const std::vector<std::optional<double>>& trend_values,
                                             const CycleThresholds& thresholds = CycleThresholds());

private:
    CycleState advance(double trend_value, std::optional<double> prior_value,
                       std::size_t bar_index, TimestampMs timestamp, Price price);
    Phase nextPhase(Phase phase, double trend_value, bool increased, bool decreased) const;
    static CycleState unknownState();

    CycleThresholds thresholds_;
    CycleState state_;
    Phase previous_phase_ = Phase::CONSOLIDATION;
    std::optional<double> last_valid_value_;
    bool started_ = false;
};

} // namespace analytics
} // namespace cyclebt
