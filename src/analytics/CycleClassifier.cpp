#include "analytics/CycleClassifier.h"
#include <algorithm>

namespace cyclebt {
namespace analytics {

CycleClassifier::CycleClassifier(const CycleThresholds& thresholds)
    : thresholds_(thresholds) {
}

void CycleClassifier::reset() {
    state_ = CycleState();
    previous_phase_ = Phase::CONSOLIDATION;
    last_valid_value_.reset();
    started_ = false;
}

CycleState CycleClassifier::unknownState() {
    CycleState s;
    s.phase = Phase::CONSOLIDATION;
    s.is_confirmed = false;
    s.valid = false;
    return s;
}

CycleState CycleClassifier::update(const SignalSnapshot& snapshot, std::size_t bar_index,
                                   const Candle& candle) {
    if (!snapshot.ready) {
        return unknownState();
    }

    // The pipeline already knows the previous bar's trend value, including the
    // warm-up bars the classifier never saw.
    std::optional<double> prior = last_valid_value_;
    if (!prior && snapshot.has_prior_trend) {
        prior = snapshot.trend_value - snapshot.trend_delta;
    }
    return advance(snapshot.trend_value, prior, bar_index, candle.timestamp, candle.close);
}

CycleState CycleClassifier::update(std::optional<double> trend_value, std::size_t bar_index,
                                   TimestampMs timestamp, Price price) {
    if (!trend_value) {
        return unknownState();
    }
    return advance(*trend_value, last_valid_value_, bar_index, timestamp, price);
}

CycleState CycleClassifier::advance(double trend_value, std::optional<double> prior_value,
                                    std::size_t bar_index, TimestampMs timestamp, Price price) {
    if (!started_) {
        state_.phase = Phase::CONSOLIDATION;
        state_.streak = PhaseStreak{Phase::CONSOLIDATION, bar_index, timestamp, price, trend_value, 0};
        started_ = true;
    }

    // Without a prior value only the threshold decides the warning transition.
    const bool increased = !prior_value || trend_value > *prior_value;
    const bool decreased = !prior_value || trend_value < *prior_value;

    previous_phase_ = state_.phase;
    const Phase next = nextPhase(state_.phase, trend_value, increased, decreased);

    if (next != state_.phase) {
        state_.phase = next;
        state_.streak = PhaseStreak{next, bar_index, timestamp, price, trend_value, 1};
    } else {
        auto& streak = state_.streak;
        ++streak.length;
        if (isBullPhase(next)) {
            streak.extremum_value = std::max(streak.extremum_value, trend_value);
        } else if (isBearPhase(next)) {
            streak.extremum_value = std::min(streak.extremum_value, trend_value);
        }
    }

    state_.is_confirmed = (state_.phase == Phase::BULL_STRONG || state_.phase == Phase::BEAR_STRONG);
    state_.valid = true;
    last_valid_value_ = trend_value;
    return state_;
}

Phase CycleClassifier::nextPhase(Phase phase, double tv, bool increased, bool decreased) const {
    const auto& t = thresholds_;
    switch (phase) {
        case Phase::CONSOLIDATION:
            if (tv > t.bull_warning && increased) {
                return Phase::BULL_WARNING;
            }
            if (tv < t.bear_warning && decreased) {
                return Phase::BEAR_WARNING;
            }
            return Phase::CONSOLIDATION;

        case Phase::BULL_WARNING:
            if (tv > t.bull_strong) {
                return Phase::BULL_STRONG;
            }
            if (tv <= t.bull_exit) {
                return Phase::CONSOLIDATION;
            }
            return Phase::BULL_WARNING;

        case Phase::BULL_STRONG:
            return (tv <= t.bull_exit) ? Phase::CONSOLIDATION : Phase::BULL_STRONG;

        case Phase::BEAR_WARNING:
            if (tv < t.bear_strong) {
                return Phase::BEAR_STRONG;
            }
            if (tv >= t.bear_exit) {
                return Phase::CONSOLIDATION;
            }
            return Phase::BEAR_WARNING;

        case Phase::BEAR_STRONG:
            return (tv >= t.bear_exit) ? Phase::CONSOLIDATION : Phase::BEAR_STRONG;
    }
    return Phase::CONSOLIDATION;
}

std::vector<Phase> CycleClassifier::classifySeries(const std::vector<std::optional<double>>& trend_values,
                                                   const CycleThresholds& thresholds) {
    CycleClassifier classifier(thresholds);
    std::vector<Phase> phases;
    phases.reserve(trend_values.size());
    for (std::size_t i = 0; i < trend_values.size(); ++i) {
        phases.push_back(classifier.update(trend_values[i], i).phase);
    }
    return phases;
}

} // namespace analytics
} // namespace cyclebt
