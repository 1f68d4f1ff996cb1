#include "risk/CapitalPool.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <string>

namespace cyclebt {
namespace risk {

CapitalPool::CapitalPool(double initial_capital)
    : initial_(toMoneyUnits(initial_capital))
    , total_(initial_)
    , available_(initial_) {
    if (initial_ < 0) {
        throw InvariantViolation("CapitalPool: negative initial capital");
    }
}

bool CapitalPool::freeze(MoneyUnits amount, const std::string& instrument,
                         long long order_id, TimestampMs ts) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount <= 0 || amount > available_) {
        return false;
    }
    available_ -= amount;
    frozen_ += amount;
    record(CapitalTxType::FREEZE, amount, instrument, order_id, ts);
    checkInvariantLocked();
    return true;
}

void CapitalPool::unfreeze(MoneyUnits amount, const std::string& instrument,
                           long long order_id, TimestampMs ts) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount < 0 || amount > frozen_) {
        throw InvariantViolation("CapitalPool: unfreeze of " + std::to_string(amount) +
                                 " exceeds frozen " + std::to_string(frozen_));
    }
    frozen_ -= amount;
    available_ += amount;
    record(CapitalTxType::UNFREEZE, amount, instrument, order_id, ts);
    checkInvariantLocked();
}

void CapitalPool::settle(MoneyUnits amount, const std::string& instrument,
                         long long order_id, TimestampMs ts) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount < 0 || amount > frozen_) {
        throw InvariantViolation("CapitalPool: settle of " + std::to_string(amount) +
                                 " exceeds frozen " + std::to_string(frozen_));
    }
    frozen_ -= amount;
    total_ -= amount;
    record(CapitalTxType::SETTLE, amount, instrument, order_id, ts);
    checkInvariantLocked();
}

void CapitalPool::credit(MoneyUnits amount, const std::string& instrument,
                         long long order_id, TimestampMs ts) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount < 0) {
        throw InvariantViolation("CapitalPool: negative credit");
    }
    available_ += amount;
    total_ += amount;
    record(CapitalTxType::CREDIT, amount, instrument, order_id, ts);
    checkInvariantLocked();
}

double CapitalPool::total() const { return fromMoneyUnits(totalUnits()); }
double CapitalPool::available() const { return fromMoneyUnits(availableUnits()); }
double CapitalPool::frozen() const { return fromMoneyUnits(frozenUnits()); }

MoneyUnits CapitalPool::totalUnits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

MoneyUnits CapitalPool::availableUnits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

MoneyUnits CapitalPool::frozenUnits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frozen_;
}

std::vector<CapitalTransaction> CapitalPool::ledger() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_;
}

void CapitalPool::checkInvariant() const {
    std::lock_guard<std::mutex> lock(mutex_);
    checkInvariantLocked();
}

void CapitalPool::record(CapitalTxType type, MoneyUnits amount, const std::string& instrument,
                         long long order_id, TimestampMs ts) {
    CapitalTransaction tx;
    tx.timestamp = ts;
    tx.type = type;
    tx.amount = amount;
    tx.instrument = instrument;
    tx.order_id = order_id;
    tx.available_after = available_;
    tx.frozen_after = frozen_;
    ledger_.push_back(tx);
}

void CapitalPool::checkInvariantLocked() const {
    if (available_ + frozen_ != total_ || available_ < 0 || frozen_ < 0) {
        LOG_ERROR("CapitalPool invariant broken: available={} frozen={} total={}",
                  available_, frozen_, total_);
        throw InvariantViolation("CapitalPool: available + frozen != total");
    }
}

} // namespace risk
} // namespace cyclebt
