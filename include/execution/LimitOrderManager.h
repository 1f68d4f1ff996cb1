#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/Money.h"
#include "common/Types.h"
#include "execution/LimitPriceCalculator.h"
#include "risk/CapitalPool.h"

namespace cyclebt {
namespace execution {

struct PendingOrder {
    long long id = 0;
    std::string instrument_id;
    OrderSide side = OrderSide::BUY;
    Price price = 0.0;
    Volume quantity = 0.0;
    MoneyUnits frozen_amount = 0;       // sells reserve nothing
    std::size_t created_bar_index = 0;
    TimestampMs created_at = 0;
    std::optional<long long> parent_position_id;
    OrderStatus status = OrderStatus::PENDING;
    std::string reason;

    double frozenAmount() const { return fromMoneyUnits(frozen_amount); }
    bool isPending() const { return status == OrderStatus::PENDING; }
};

struct Position {
    long long id = 0;                   // id of the buy order that opened it
    std::string instrument_id;
    Price entry_price = 0.0;
    std::size_t entry_bar_index = 0;
    TimestampMs entry_time = 0;
    Volume quantity = 0.0;              // net of the entry fee
    double cost_basis = 0.0;            // cash that left the pool
    double entry_fee = 0.0;
    std::optional<Price> stop_price;
    std::optional<std::string> exit_at_open;   // sell at the next bar's open with this reason
};

struct TradeRecord {
    std::string instrument_id;
    long long position_id = 0;
    Price entry_price = 0.0;
    Price exit_price = 0.0;
    TimestampMs entry_time = 0;
    TimestampMs exit_time = 0;
    Volume quantity = 0.0;
    double pnl = 0.0;
    double pnl_pct = 0.0;               // percent of cost basis
    double fees = 0.0;
    std::string exit_reason;
};

enum class OrderPlacementStatus {
    PLACED,
    INSUFFICIENT_CAPITAL,
    INVALID_REQUEST
};

inline const char* orderPlacementStatusToString(OrderPlacementStatus status) {
    switch (status) {
        case OrderPlacementStatus::PLACED: return "placed";
        case OrderPlacementStatus::INSUFFICIENT_CAPITAL: return "insufficient_capital";
        case OrderPlacementStatus::INVALID_REQUEST: return "invalid_request";
    }
    return "unknown";
}

struct BuyOrderResult {
    OrderPlacementStatus status = OrderPlacementStatus::INVALID_REQUEST;
    std::optional<PendingOrder> order;

    bool ok() const { return status == OrderPlacementStatus::PLACED; }
};

// Monotonic order ids shared by every instrument of a run.
class OrderIdSequence {
public:
    long long next() { return ++last_; }

private:
    long long last_ = 0;
};

// Resting limit orders, open positions and closed trades of one instrument.
// Capital moves only through the shared CapitalPool.
class LimitOrderManager {
public:
    LimitOrderManager(std::string instrument_id, risk::CapitalPool& pool,
                      double fee_rate = 0.0, OrderIdSequence* ids = nullptr);

    LimitOrderManager(const LimitOrderManager&) = delete;
    LimitOrderManager& operator=(const LimitOrderManager&) = delete;

    BuyOrderResult createBuyOrder(Price price, double amount, std::size_t bar_index,
                                  TimestampMs ts, const std::string& reason = "");

    // Releases every still-pending buy; a second call releases 0.
    double cancelAllPendingBuys(TimestampMs ts);

    // Inclusive range containment: bar.low <= price <= bar.high.
    static bool checkFill(const PendingOrder& order, const Candle& candle);

    // Settles the frozen capital of a pending buy into a new Position.
    const Position& fillBuy(long long order_id, std::size_t bar_index, TimestampMs ts);

    // One resting sell per position. An existing sell is cancelled and replaced,
    // its price moved according to the policy.
    const PendingOrder& placeSellOrder(long long position_id, Price target_price,
                                       SellRepricePolicy policy, std::size_t bar_index,
                                       TimestampMs ts, const std::string& reason);

    // Closes the position at fill_price, credits the proceeds to the pool and
    // appends a TradeRecord.
    TradeRecord fillSell(long long position_id, Price fill_price, TimestampMs ts,
                         const std::string& reason);

    std::vector<TradeRecord> liquidateAll(Price price, TimestampMs ts, const std::string& reason);

    void setStopPrice(long long position_id, std::optional<Price> stop_price);

    // Marks the position for a market exit at the next bar's open. The first
    // reason given sticks.
    void scheduleExitAtOpen(long long position_id, const std::string& reason);

    const std::string& instrumentId() const { return instrument_id_; }
    double feeRate() const { return fee_rate_; }

    std::vector<PendingOrder> pendingBuys() const;
    std::size_t pendingBuyCount() const;
    const PendingOrder* sellOrderFor(long long position_id) const;
    const std::map<long long, Position>& positions() const { return positions_; }
    std::size_t openPositionCount() const { return positions_.size(); }
    const std::vector<TradeRecord>& trades() const { return trades_; }
    double marketValue(Price price) const;

private:
    PendingOrder& findPendingBuy(long long order_id);

    std::string instrument_id_;
    risk::CapitalPool& pool_;
    double fee_rate_;
    OrderIdSequence own_ids_;
    OrderIdSequence* ids_;

    std::vector<PendingOrder> buy_orders_;
    std::map<long long, PendingOrder> sell_orders_;     // key: position id
    std::map<long long, Position> positions_;           // key: position id
    std::vector<TradeRecord> trades_;
};

} // namespace execution
} // namespace cyclebt
