#include "execution/LimitOrderManager.h"
#include "execution/OrderLifecycleStateMachine.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <utility>

namespace cyclebt {
namespace execution {

namespace {
void applyEvent(PendingOrder& order, OrderEvent event) {
    const auto result = OrderLifecycleStateMachine::transition(order.status, event);
    if (!result.accepted) {
        throw InvariantViolation(std::string("order ") + std::to_string(order.id) + " already " +
                                 orderStatusToString(order.status) + ", cannot " +
                                 orderEventToString(event));
    }
    order.status = result.status;
}
} // namespace

LimitOrderManager::LimitOrderManager(std::string instrument_id, risk::CapitalPool& pool,
                                     double fee_rate, OrderIdSequence* ids)
    : instrument_id_(std::move(instrument_id))
    , pool_(pool)
    , fee_rate_(fee_rate)
    , ids_(ids ? ids : &own_ids_) {
}

BuyOrderResult LimitOrderManager::createBuyOrder(Price price, double amount, std::size_t bar_index,
                                                 TimestampMs ts, const std::string& reason) {
    BuyOrderResult result;
    if (!std::isfinite(price) || !std::isfinite(amount) || price <= 0.0 || amount <= 0.0) {
        result.status = OrderPlacementStatus::INVALID_REQUEST;
        return result;
    }

    const MoneyUnits units = toMoneyUnits(amount);
    if (units <= 0) {
        result.status = OrderPlacementStatus::INVALID_REQUEST;
        return result;
    }

    PendingOrder order;
    order.id = ids_->next();
    order.instrument_id = instrument_id_;
    order.side = OrderSide::BUY;
    order.price = price;
    order.quantity = fromMoneyUnits(units) / price;
    order.frozen_amount = units;
    order.created_bar_index = bar_index;
    order.created_at = ts;
    order.reason = reason;

    if (!pool_.freeze(units, instrument_id_, order.id, ts)) {
        LOG_DEBUG("[{}] buy {} skipped: need {:.2f}, available {:.2f}",
                  instrument_id_, order.id, fromMoneyUnits(units), pool_.available());
        result.status = OrderPlacementStatus::INSUFFICIENT_CAPITAL;
        return result;
    }

    buy_orders_.push_back(order);
    result.status = OrderPlacementStatus::PLACED;
    result.order = order;
    LOG_DEBUG("[{}] buy order {} placed: price={:.8f} amount={:.2f}",
              instrument_id_, order.id, price, fromMoneyUnits(units));
    return result;
}

double LimitOrderManager::cancelAllPendingBuys(TimestampMs ts) {
    MoneyUnits released = 0;
    for (auto& order : buy_orders_) {
        if (!order.isPending()) {
            continue;
        }
        applyEvent(order, OrderEvent::CANCEL);
        pool_.unfreeze(order.frozen_amount, instrument_id_, order.id, ts);
        released += order.frozen_amount;
    }
    buy_orders_.erase(std::remove_if(buy_orders_.begin(), buy_orders_.end(),
                                     [](const PendingOrder& o) { return !o.isPending(); }),
                      buy_orders_.end());
    return fromMoneyUnits(released);
}

bool LimitOrderManager::checkFill(const PendingOrder& order, const Candle& candle) {
    return candle.low <= order.price && order.price <= candle.high;
}

PendingOrder& LimitOrderManager::findPendingBuy(long long order_id) {
    auto it = std::find_if(buy_orders_.begin(), buy_orders_.end(),
                           [order_id](const PendingOrder& o) { return o.id == order_id; });
    if (it == buy_orders_.end()) {
        throw InvariantViolation("unknown buy order " + std::to_string(order_id) +
                                 " for " + instrument_id_);
    }
    return *it;
}

const Position& LimitOrderManager::fillBuy(long long order_id, std::size_t bar_index, TimestampMs ts) {
    PendingOrder& order = findPendingBuy(order_id);
    applyEvent(order, OrderEvent::FILL);
    pool_.settle(order.frozen_amount, instrument_id_, order.id, ts);

    const double amount = fromMoneyUnits(order.frozen_amount);
    const double entry_fee = amount * fee_rate_;

    Position pos;
    pos.id = order.id;
    pos.instrument_id = instrument_id_;
    pos.entry_price = order.price;
    pos.entry_bar_index = bar_index;
    pos.entry_time = ts;
    pos.quantity = (amount - entry_fee) / order.price;
    pos.cost_basis = amount;
    pos.entry_fee = entry_fee;

    buy_orders_.erase(std::remove_if(buy_orders_.begin(), buy_orders_.end(),
                                     [order_id](const PendingOrder& o) { return o.id == order_id; }),
                      buy_orders_.end());

    LOG_INFO("[{}] buy filled: id={} price={:.8f} qty={:.8f}",
             instrument_id_, pos.id, pos.entry_price, pos.quantity);

    auto inserted = positions_.emplace(pos.id, pos);
    return inserted.first->second;
}

const PendingOrder& LimitOrderManager::placeSellOrder(long long position_id, Price target_price,
                                                      SellRepricePolicy policy, std::size_t bar_index,
                                                      TimestampMs ts, const std::string& reason) {
    auto pos_it = positions_.find(position_id);
    if (pos_it == positions_.end()) {
        throw InvariantViolation("sell order for unknown position " + std::to_string(position_id));
    }

    std::optional<Price> previous;
    auto sell_it = sell_orders_.find(position_id);
    if (sell_it != sell_orders_.end() && sell_it->second.isPending()) {
        previous = sell_it->second.price;
        applyEvent(sell_it->second, OrderEvent::CANCEL);
    }

    PendingOrder order;
    order.id = ids_->next();
    order.instrument_id = instrument_id_;
    order.side = OrderSide::SELL;
    order.price = LimitPriceCalculator::reprice(previous, target_price, policy);
    order.quantity = pos_it->second.quantity;
    order.created_bar_index = bar_index;
    order.created_at = ts;
    order.parent_position_id = position_id;
    order.reason = reason;

    sell_orders_[position_id] = order;
    return sell_orders_[position_id];
}

TradeRecord LimitOrderManager::fillSell(long long position_id, Price fill_price, TimestampMs ts,
                                        const std::string& reason) {
    auto pos_it = positions_.find(position_id);
    if (pos_it == positions_.end()) {
        throw InvariantViolation("fill for unknown position " + std::to_string(position_id));
    }
    const Position pos = pos_it->second;

    const double gross = pos.quantity * fill_price;
    const double exit_fee = gross * fee_rate_;
    const MoneyUnits proceeds = toMoneyUnits(gross - exit_fee);
    pool_.credit(proceeds, instrument_id_, position_id, ts);

    TradeRecord trade;
    trade.instrument_id = instrument_id_;
    trade.position_id = position_id;
    trade.entry_price = pos.entry_price;
    trade.exit_price = fill_price;
    trade.entry_time = pos.entry_time;
    trade.exit_time = ts;
    trade.quantity = pos.quantity;
    trade.pnl = fromMoneyUnits(proceeds) - pos.cost_basis;
    trade.pnl_pct = (pos.cost_basis > 0.0) ? trade.pnl / pos.cost_basis * 100.0 : 0.0;
    trade.fees = pos.entry_fee + exit_fee;
    trade.exit_reason = reason;

    // reason may refer to the resting sell erased below.
    auto sell_it = sell_orders_.find(position_id);
    if (sell_it != sell_orders_.end()) {
        if (sell_it->second.isPending()) {
            applyEvent(sell_it->second, OrderEvent::FILL);
        }
        sell_orders_.erase(sell_it);
    }
    positions_.erase(pos_it);
    trades_.push_back(trade);

    LOG_INFO("[{}] sell filled: position={} exit={:.8f} pnl={:.2f} ({:.2f}%) reason={}",
             instrument_id_, position_id, fill_price, trade.pnl, trade.pnl_pct, trade.exit_reason);
    Logger::getInstance().logTrade(instrument_id_, trade.entry_price, trade.exit_price,
                                   trade.quantity, trade.pnl, trade.exit_reason);
    return trade;
}

std::vector<TradeRecord> LimitOrderManager::liquidateAll(Price price, TimestampMs ts,
                                                         const std::string& reason) {
    std::vector<long long> ids;
    for (const auto& [id, pos] : positions_) {
        ids.push_back(id);
    }
    std::vector<TradeRecord> closed;
    for (long long id : ids) {
        closed.push_back(fillSell(id, price, ts, reason));
    }
    return closed;
}

void LimitOrderManager::setStopPrice(long long position_id, std::optional<Price> stop_price) {
    auto it = positions_.find(position_id);
    if (it == positions_.end()) {
        throw InvariantViolation("stop for unknown position " + std::to_string(position_id));
    }
    it->second.stop_price = stop_price;
}

void LimitOrderManager::scheduleExitAtOpen(long long position_id, const std::string& reason) {
    auto it = positions_.find(position_id);
    if (it == positions_.end()) {
        throw InvariantViolation("exit for unknown position " + std::to_string(position_id));
    }
    if (!it->second.exit_at_open) {
        it->second.exit_at_open = reason;
        LOG_DEBUG("[{}] position {} exits at next open: {}", instrument_id_, position_id, reason);
    }
}

std::vector<PendingOrder> LimitOrderManager::pendingBuys() const {
    std::vector<PendingOrder> out;
    for (const auto& order : buy_orders_) {
        if (order.isPending()) {
            out.push_back(order);
        }
    }
    return out;
}

std::size_t LimitOrderManager::pendingBuyCount() const {
    return static_cast<std::size_t>(std::count_if(buy_orders_.begin(), buy_orders_.end(),
                                                  [](const PendingOrder& o) { return o.isPending(); }));
}

const PendingOrder* LimitOrderManager::sellOrderFor(long long position_id) const {
    auto it = sell_orders_.find(position_id);
    return (it == sell_orders_.end()) ? nullptr : &it->second;
}

double LimitOrderManager::marketValue(Price price) const {
    double value = 0.0;
    for (const auto& [id, pos] : positions_) {
        value += pos.quantity * price;
    }
    return value;
}

} // namespace execution
} // namespace cyclebt
