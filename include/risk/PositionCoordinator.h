#pragma once

#include <functional>
#include <map>
#include <string>
#include "analytics/CycleClassifier.h"

namespace cyclebt {
namespace risk {

// Phase gate for new entries. Returns true when a buy may be placed.
using EntryGate = std::function<bool(analytics::Phase)>;

// Default gate: everything except BEAR_WARNING.
EntryGate defaultEntryGate();

// Global position-slot accounting across instruments.
// A slot is taken by an open position or by a resting buy that may still
// become one, so open positions can never exceed max_positions.
class PositionCoordinator {
public:
    explicit PositionCoordinator(int max_positions, EntryGate gate = defaultEntryGate());

    bool canOpenPosition() const;
    bool entryAllowed(analytics::Phase phase) const;

    // available / free slots; 0 when no slot remains or available <= 0.
    double dynamicOrderSize(double available) const;

    void onBuyPlaced(const std::string& instrument);
    void onBuyCancelled(const std::string& instrument);
    void onBuyFilled(const std::string& instrument);
    void onPositionClosed(const std::string& instrument);

    int maxPositions() const { return max_positions_; }
    int openCount() const { return open_total_; }
    int pendingCount() const { return pending_total_; }
    int openCount(const std::string& instrument) const;
    int freeSlots() const { return max_positions_ - open_total_ - pending_total_; }

    // Throws InvariantViolation when per-instrument counts disagree with the
    // totals or the cap is exceeded.
    void checkInvariant() const;

private:
    int max_positions_;
    EntryGate gate_;
    int open_total_ = 0;
    int pending_total_ = 0;
    std::map<std::string, int> open_by_instrument_;
    std::map<std::string, int> pending_by_instrument_;
};

} // namespace risk
} // namespace cyclebt
