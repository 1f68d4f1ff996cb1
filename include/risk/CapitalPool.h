#pragma once

#include <mutex>
#include <string>
#include <vector>
#include "common/Money.h"
#include "common/Types.h"

namespace cyclebt {
namespace risk {

enum class CapitalTxType {
    FREEZE,     // available -> frozen (buy order placed)
    UNFREEZE,   // frozen -> available (buy order cancelled)
    SETTLE,     // frozen -> position (buy order filled)
    CREDIT      // position -> available (sell proceeds)
};

inline const char* capitalTxTypeToString(CapitalTxType type) {
    switch (type) {
        case CapitalTxType::FREEZE: return "freeze";
        case CapitalTxType::UNFREEZE: return "unfreeze";
        case CapitalTxType::SETTLE: return "settle";
        case CapitalTxType::CREDIT: return "credit";
    }
    return "unknown";
}

struct CapitalTransaction {
    TimestampMs timestamp = 0;
    CapitalTxType type = CapitalTxType::FREEZE;
    MoneyUnits amount = 0;
    std::string instrument;
    long long order_id = 0;
    MoneyUnits available_after = 0;
    MoneyUnits frozen_after = 0;
};

// Single shared cash resource for every instrument of a run.
// total is the cash the pool owns: available + frozen == total after every
// mutation. Capital settled into positions leaves the pool and returns through
// credit().
class CapitalPool {
public:
    explicit CapitalPool(double initial_capital);

    // Reserve capital for a pending buy. Returns false (no side effect) when the
    // amount is not positive or exceeds available.
    bool freeze(MoneyUnits amount, const std::string& instrument, long long order_id, TimestampMs ts);

    void unfreeze(MoneyUnits amount, const std::string& instrument, long long order_id, TimestampMs ts);
    void settle(MoneyUnits amount, const std::string& instrument, long long order_id, TimestampMs ts);
    void credit(MoneyUnits amount, const std::string& instrument, long long order_id, TimestampMs ts);

    double total() const;
    double available() const;
    double frozen() const;
    double initialCapital() const { return fromMoneyUnits(initial_); }

    MoneyUnits totalUnits() const;
    MoneyUnits availableUnits() const;
    MoneyUnits frozenUnits() const;

    std::vector<CapitalTransaction> ledger() const;

    // Throws InvariantViolation when available + frozen != total or any side is negative.
    void checkInvariant() const;

private:
    void record(CapitalTxType type, MoneyUnits amount, const std::string& instrument,
                long long order_id, TimestampMs ts);
    void checkInvariantLocked() const;

    mutable std::mutex mutex_;
    MoneyUnits initial_;
    MoneyUnits total_;
    MoneyUnits available_;
    MoneyUnits frozen_ = 0;
    std::vector<CapitalTransaction> ledger_;
};

} // namespace risk
} // namespace cyclebt
