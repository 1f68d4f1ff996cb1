#include "risk/PositionCoordinator.h"
#include "risk/CapitalPool.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>

using cyclebt::InvariantViolation;
using cyclebt::toMoneyUnits;
using cyclebt::analytics::Phase;
using cyclebt::risk::CapitalPool;
using cyclebt::risk::PositionCoordinator;

int main() {
    // Default gate blocks new entries only in bear_warning.
    {
        PositionCoordinator coordinator(3);
        assert(coordinator.entryAllowed(Phase::CONSOLIDATION));
        assert(coordinator.entryAllowed(Phase::BULL_WARNING));
        assert(coordinator.entryAllowed(Phase::BULL_STRONG));
        assert(coordinator.entryAllowed(Phase::BEAR_STRONG));
        assert(!coordinator.entryAllowed(Phase::BEAR_WARNING));
    }

    {
        PositionCoordinator coordinator(3, [](Phase phase) { return phase == Phase::CONSOLIDATION; });
        assert(coordinator.entryAllowed(Phase::CONSOLIDATION));
        assert(!coordinator.entryAllowed(Phase::BULL_STRONG));
    }

    // Two instruments contending for capital with two slots.
    {
        CapitalPool pool(10000.0);
        PositionCoordinator coordinator(2);

        const double size_a = coordinator.dynamicOrderSize(pool.available());
        assert(size_a == 5000.0);
        assert(pool.freeze(toMoneyUnits(size_a), "A", 1, 100));
        coordinator.onBuyPlaced("A");

        const double size_b = coordinator.dynamicOrderSize(pool.available());
        assert(size_b == 5000.0);
        assert(pool.freeze(toMoneyUnits(size_b), "B", 2, 100));
        coordinator.onBuyPlaced("B");
        assert(!coordinator.canOpenPosition());
        assert(coordinator.dynamicOrderSize(pool.available()) == 0.0);

        // A fills; B's resting buy goes stale and is cancelled before re-entry.
        pool.settle(toMoneyUnits(size_a), "A", 1, 200);
        coordinator.onBuyFilled("A");
        pool.unfreeze(toMoneyUnits(size_b), "B", 2, 200);
        coordinator.onBuyCancelled("B");

        assert(coordinator.openCount() == 1);
        assert(coordinator.openCount("A") == 1);
        assert(coordinator.pendingCount() == 0);
        assert(coordinator.freeSlots() == 1);
        const double size_b2 = coordinator.dynamicOrderSize(pool.available());
        assert(std::abs(size_b2 - pool.available() / 1.0) < 1e-9);
        assert(size_b2 == 5000.0);
    }

    // Resting buys take slots, so the cap cannot be exceeded.
    {
        PositionCoordinator coordinator(1);
        coordinator.onBuyPlaced("A");
        assert(!coordinator.canOpenPosition());

        bool threw = false;
        try {
            coordinator.onBuyPlaced("B");
        } catch (const InvariantViolation&) {
            threw = true;
        }
        assert(threw);
        assert(coordinator.pendingCount() == 1);

        coordinator.onBuyFilled("A");
        assert(!coordinator.canOpenPosition());
        coordinator.onPositionClosed("A");
        assert(coordinator.canOpenPosition());
        assert(coordinator.openCount() == 0);
        coordinator.checkInvariant();
    }

    // Releasing a slot that was never taken.
    {
        PositionCoordinator coordinator(2);
        bool threw = false;
        try {
            coordinator.onPositionClosed("A");
        } catch (const InvariantViolation&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            coordinator.onBuyFilled("A");
        } catch (const InvariantViolation&) {
            threw = true;
        }
        assert(threw);
    }

    {
        bool threw = false;
        try {
            PositionCoordinator coordinator(0);
        } catch (const InvariantViolation&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] PositionCoordinator PASSED\n";
    return 0;
}
