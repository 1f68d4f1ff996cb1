#include "analytics/CycleClassifier.h"

#include <cassert>
#include <iostream>
#include <optional>
#include <vector>

using cyclebt::Candle;
using cyclebt::analytics::CycleClassifier;
using cyclebt::analytics::CycleState;
using cyclebt::analytics::Phase;
using cyclebt::analytics::SignalSnapshot;

namespace {
std::vector<Phase> classify(const std::vector<double>& values) {
    std::vector<std::optional<double>> in(values.begin(), values.end());
    return CycleClassifier::classifySeries(in);
}
}

int main() {
    // Full bull cycle.
    {
        const auto phases = classify({500, 650, 750, 1050, 900, -50});
        const std::vector<Phase> expected = {
            Phase::CONSOLIDATION, Phase::BULL_WARNING, Phase::BULL_WARNING,
            Phase::BULL_STRONG, Phase::BULL_STRONG, Phase::CONSOLIDATION
        };
        assert(phases == expected);
    }

    // Warning that never confirms.
    {
        const auto phases = classify({650, 700, -10});
        const std::vector<Phase> expected = {
            Phase::BULL_WARNING, Phase::BULL_WARNING, Phase::CONSOLIDATION
        };
        assert(phases == expected);
    }

    // Bear side mirrors the bull side.
    {
        const auto phases = classify({-500, -650, -750, -1050, -900, 50});
        const std::vector<Phase> expected = {
            Phase::CONSOLIDATION, Phase::BEAR_WARNING, Phase::BEAR_WARNING,
            Phase::BEAR_STRONG, Phase::BEAR_STRONG, Phase::CONSOLIDATION
        };
        assert(phases == expected);
    }

    // Entering a warning needs the trend value to move in its direction.
    {
        const auto phases = classify({-700, 900, 800, 850});
        const std::vector<Phase> expected = {
            Phase::BEAR_WARNING, Phase::CONSOLIDATION, Phase::CONSOLIDATION, Phase::BULL_WARNING
        };
        assert(phases == expected);
    }

    // Appending values never changes earlier phases.
    {
        const std::vector<double> values = {500, 650, 750, 1050, 900, -50, -700, -1200, 10};
        const auto full = classify(values);
        for (std::size_t n = 1; n <= values.size(); ++n) {
            const auto prefix = classify(std::vector<double>(values.begin(), values.begin() + n));
            for (std::size_t i = 0; i < n; ++i) {
                assert(prefix[i] == full[i]);
            }
        }
    }

    // Streak bookkeeping and confirmation.
    {
        CycleClassifier c;
        c.update(500.0, 0, 1000, 10.0);
        CycleState s = c.update(650.0, 1, 2000, 11.0);
        assert(s.phase == Phase::BULL_WARNING);
        assert(!s.is_confirmed);
        assert(s.streak.start_bar_index == 1);
        assert(s.streak.start_timestamp == 2000);
        assert(s.streak.length == 1);

        s = c.update(1050.0, 2, 3000, 12.0);
        assert(s.phase == Phase::BULL_STRONG);
        assert(s.is_confirmed);
        assert(c.previousPhase() == Phase::BULL_WARNING);
        assert(s.streak.start_bar_index == 2);
        assert(s.streak.start_price == 12.0);

        s = c.update(1200.0, 3, 4000, 13.0);
        s = c.update(900.0, 4, 5000, 12.5);
        assert(s.phase == Phase::BULL_STRONG);
        assert(s.streak.length == 3);
        assert(s.streak.extremum_value == 1200.0);

        s = c.update(-5.0, 5, 6000, 11.0);
        assert(s.phase == Phase::CONSOLIDATION);
        assert(!s.is_confirmed);
        assert(s.streak.start_bar_index == 5);
        assert(s.streak.length == 1);
    }

    // Missing values report consolidation and leave the machine alone.
    {
        CycleClassifier c;
        c.update(650.0, 0);
        const CycleState unknown = c.update(std::nullopt, 1);
        assert(!unknown.valid);
        assert(!unknown.is_confirmed);
        assert(unknown.phase == Phase::CONSOLIDATION);
        assert(c.current().phase == Phase::BULL_WARNING);
        assert(c.current().valid);

        const CycleState next = c.update(1100.0, 2);
        assert(next.phase == Phase::BULL_STRONG);
    }

    // Snapshot updates use the pipeline's prior trend for the first classified bar.
    {
        Candle bar(10.0, 11.0, 9.0, 10.5, 1.0, 1000);
        SignalSnapshot snap;
        snap.ready = true;
        snap.trend_value = 650.0;
        snap.has_prior_trend = true;

        snap.trend_delta = -100.0;      // prior 750: falling
        CycleClassifier falling;
        assert(falling.update(snap, 30, bar).phase == Phase::CONSOLIDATION);

        snap.trend_delta = 100.0;       // prior 550: rising
        CycleClassifier rising;
        assert(rising.update(snap, 30, bar).phase == Phase::BULL_WARNING);

        SignalSnapshot not_ready;
        CycleClassifier idle;
        const auto s = idle.update(not_ready, 0, bar);
        assert(!s.valid && s.phase == Phase::CONSOLIDATION);
    }

    std::cout << "[TEST] CycleClassifier PASSED\n";
    return 0;
}
