#include "risk/PositionCoordinator.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <utility>

namespace cyclebt {
namespace risk {

namespace {
void decrementOrThrow(std::map<std::string, int>& counts, int& total,
                      const std::string& instrument, const char* what) {
    auto it = counts.find(instrument);
    if (it == counts.end() || it->second <= 0 || total <= 0) {
        throw InvariantViolation(std::string("PositionCoordinator: ") + what +
                                 " without a matching slot for " + instrument);
    }
    --it->second;
    --total;
}
}

EntryGate defaultEntryGate() {
    return [](analytics::Phase phase) {
        return phase != analytics::Phase::BEAR_WARNING;
    };
}

PositionCoordinator::PositionCoordinator(int max_positions, EntryGate gate)
    : max_positions_(max_positions)
    , gate_(gate ? std::move(gate) : defaultEntryGate()) {
    if (max_positions_ < 1) {
        throw InvariantViolation("PositionCoordinator: max_positions must be >= 1");
    }
}

bool PositionCoordinator::canOpenPosition() const {
    return open_total_ + pending_total_ < max_positions_;
}

bool PositionCoordinator::entryAllowed(analytics::Phase phase) const {
    return gate_(phase);
}

double PositionCoordinator::dynamicOrderSize(double available) const {
    const int free_slots = freeSlots();
    if (free_slots <= 0 || available <= 0.0) {
        return 0.0;
    }
    return available / free_slots;
}

void PositionCoordinator::onBuyPlaced(const std::string& instrument) {
    if (!canOpenPosition()) {
        throw InvariantViolation("PositionCoordinator: buy placed with no free slot for " + instrument);
    }
    ++pending_by_instrument_[instrument];
    ++pending_total_;
    checkInvariant();
}

void PositionCoordinator::onBuyCancelled(const std::string& instrument) {
    decrementOrThrow(pending_by_instrument_, pending_total_, instrument, "buy cancelled");
    checkInvariant();
}

void PositionCoordinator::onBuyFilled(const std::string& instrument) {
    decrementOrThrow(pending_by_instrument_, pending_total_, instrument, "buy filled");
    ++open_by_instrument_[instrument];
    ++open_total_;
    checkInvariant();
}

void PositionCoordinator::onPositionClosed(const std::string& instrument) {
    decrementOrThrow(open_by_instrument_, open_total_, instrument, "position closed");
    checkInvariant();
}

int PositionCoordinator::openCount(const std::string& instrument) const {
    auto it = open_by_instrument_.find(instrument);
    return (it == open_by_instrument_.end()) ? 0 : it->second;
}

void PositionCoordinator::checkInvariant() const {
    int open_sum = 0;
    for (const auto& [instrument, count] : open_by_instrument_) {
        open_sum += count;
    }
    int pending_sum = 0;
    for (const auto& [instrument, count] : pending_by_instrument_) {
        pending_sum += count;
    }
    if (open_sum != open_total_ || pending_sum != pending_total_ ||
        open_total_ + pending_total_ > max_positions_) {
        LOG_ERROR("Position invariant broken: open={} pending={} max={}",
                  open_total_, pending_total_, max_positions_);
        throw InvariantViolation("PositionCoordinator: position cap exceeded");
    }
}

} // namespace risk
} // namespace cyclebt
