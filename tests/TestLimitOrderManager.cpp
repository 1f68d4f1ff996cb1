#include "execution/LimitOrderManager.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>

using cyclebt::Candle;
using cyclebt::InvariantViolation;
using cyclebt::OrderStatus;
using cyclebt::execution::LimitOrderManager;
using cyclebt::execution::OrderIdSequence;
using cyclebt::execution::OrderPlacementStatus;
using cyclebt::execution::SellRepricePolicy;
using cyclebt::risk::CapitalPool;

namespace {
bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) <= eps;
}
}

int main() {
    // Fill check is inclusive at both ends of the bar range.
    {
        CapitalPool pool(10000.0);
        LimitOrderManager orders("A", pool);
        auto at_high = orders.createBuyOrder(105.0, 1000.0, 0, 1000);
        auto at_low = orders.createBuyOrder(95.0, 1000.0, 0, 1000);
        auto outside = orders.createBuyOrder(94.99, 1000.0, 0, 1000);
        assert(at_high.ok() && at_low.ok() && outside.ok());

        const Candle bar(100.0, 105.0, 95.0, 101.0, 1.0, 2000);
        assert(LimitOrderManager::checkFill(*at_high.order, bar));
        assert(LimitOrderManager::checkFill(*at_low.order, bar));
        assert(!LimitOrderManager::checkFill(*outside.order, bar));
    }

    // Placement outcomes are reported, not thrown.
    {
        CapitalPool pool(1000.0);
        LimitOrderManager orders("A", pool);
        assert(orders.createBuyOrder(100.0, 2000.0, 0, 1000).status == OrderPlacementStatus::INSUFFICIENT_CAPITAL);
        assert(orders.createBuyOrder(0.0, 100.0, 0, 1000).status == OrderPlacementStatus::INVALID_REQUEST);
        assert(orders.createBuyOrder(100.0, -1.0, 0, 1000).status == OrderPlacementStatus::INVALID_REQUEST);
        assert(orders.createBuyOrder(NAN, 100.0, 0, 1000).status == OrderPlacementStatus::INVALID_REQUEST);
        assert(orders.pendingBuyCount() == 0);
        assert(pool.available() == 1000.0);

        auto placed = orders.createBuyOrder(100.0, 400.0, 3, 1000, "limit_entry");
        assert(placed.ok());
        assert(placed.order->status == OrderStatus::PENDING);
        assert(placed.order->frozenAmount() == 400.0);
        assert(near(placed.order->quantity, 4.0));
        assert(placed.order->reason == "limit_entry");
        assert(pool.frozen() == 400.0);
    }

    // Cancelling twice releases capital once.
    {
        CapitalPool pool(10000.0);
        LimitOrderManager orders("A", pool);
        assert(orders.createBuyOrder(100.0, 3000.0, 0, 1000).ok());
        assert(orders.createBuyOrder(99.0, 2000.0, 0, 1000).ok());
        assert(pool.available() == 5000.0);

        assert(orders.cancelAllPendingBuys(2000) == 5000.0);
        assert(orders.cancelAllPendingBuys(2000) == 0.0);
        assert(pool.available() == 10000.0);
        assert(pool.frozen() == 0.0);
        assert(orders.pendingBuyCount() == 0);
        assert(pool.ledger().size() == 4);
    }

    // Buy then sell at the same price loses exactly the fees.
    {
        CapitalPool pool(10000.0);
        LimitOrderManager orders("A", pool, 0.001);
        auto placed = orders.createBuyOrder(100.0, 1000.0, 0, 1000);
        assert(placed.ok());

        const auto& pos = orders.fillBuy(placed.order->id, 1, 2000);
        assert(near(pos.entry_fee, 1.0));
        assert(near(pos.quantity, 9.99));
        assert(near(pos.cost_basis, 1000.0));
        assert(pool.total() == 9000.0);
        const long long position_id = pos.id;

        const auto trade = orders.fillSell(position_id, 100.0, 3000, "test_exit");
        assert(near(trade.pnl, -trade.fees));
        assert(near(trade.fees, 1.0 + 0.999));
        assert(trade.exit_reason == "test_exit");
        assert(trade.entry_time == 2000 && trade.exit_time == 3000);
        assert(orders.openPositionCount() == 0);
        assert(orders.trades().size() == 1);
        assert(near(pool.total(), 10000.0 + trade.pnl));
    }

    // Resting sells follow the reprice policy.
    {
        CapitalPool pool(10000.0);
        LimitOrderManager orders("A", pool);
        auto placed = orders.createBuyOrder(100.0, 1000.0, 0, 1000);
        const long long id = orders.fillBuy(placed.order->id, 0, 1000).id;

        assert(orders.placeSellOrder(id, 110.0, SellRepricePolicy::NEVER_LOWER, 1, 2000, "p95_target").price == 110.0);
        assert(orders.placeSellOrder(id, 105.0, SellRepricePolicy::NEVER_LOWER, 2, 3000, "consolidation_mid").price == 110.0);
        assert(orders.placeSellOrder(id, 120.0, SellRepricePolicy::NEVER_RAISE, 3, 4000, "p95_target").price == 110.0);
        assert(orders.placeSellOrder(id, 104.0, SellRepricePolicy::RECOMPUTE, 4, 5000, "ema_reversion").price == 104.0);

        const auto* sell = orders.sellOrderFor(id);
        assert(sell != nullptr);
        assert(sell->isPending());
        assert(sell->parent_position_id && *sell->parent_position_id == id);
        assert(sell->reason == "ema_reversion");
        assert(sell->frozen_amount == 0);

        const auto trade = orders.fillSell(id, sell->price, 6000, sell->reason);
        assert(trade.exit_reason == "ema_reversion");
        assert(near(trade.pnl, 40.0));
        assert(near(trade.pnl_pct, 4.0));
        assert(orders.sellOrderFor(id) == nullptr);
    }

    // Liquidation closes everything at one price.
    {
        CapitalPool pool(10000.0);
        OrderIdSequence ids;
        LimitOrderManager orders("A", pool, 0.0, &ids);
        auto a = orders.createBuyOrder(100.0, 1000.0, 0, 1000);
        auto b = orders.createBuyOrder(50.0, 500.0, 0, 1000);
        orders.fillBuy(a.order->id, 0, 1000);
        orders.fillBuy(b.order->id, 0, 1000);
        assert(orders.openPositionCount() == 2);
        assert(near(orders.marketValue(80.0), 10.0 * 80.0 + 10.0 * 80.0));

        const auto closed = orders.liquidateAll(80.0, 2000, "instrument_aborted");
        assert(closed.size() == 2);
        for (const auto& t : closed) {
            assert(t.exit_reason == "instrument_aborted");
            assert(t.exit_price == 80.0);
        }
        assert(orders.openPositionCount() == 0);
        assert(near(pool.total(), 10000.0 - 200.0 + 300.0));
        assert(ids.next() == 3);
    }

    // Unknown ids are bookkeeping errors.
    {
        CapitalPool pool(10000.0);
        LimitOrderManager orders("A", pool);
        bool threw = false;
        try {
            orders.fillBuy(42, 0, 1000);
        } catch (const InvariantViolation&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            orders.fillSell(42, 100.0, 1000, "x");
        } catch (const InvariantViolation&) {
            threw = true;
        }
        assert(threw);

        auto placed = orders.createBuyOrder(100.0, 1000.0, 0, 1000);
        orders.cancelAllPendingBuys(1500);
        threw = false;
        try {
            orders.fillBuy(placed.order->id, 1, 2000);
        } catch (const InvariantViolation&) {
            threw = true;
        }
        assert(threw);
        assert(pool.available() == 10000.0);
    }

    // Proceeds beyond the fixed-point range stop the sale instead of wrapping.
    {
        CapitalPool pool(1e10);
        LimitOrderManager orders("A", pool);
        auto buy = orders.createBuyOrder(1.0, 1e10, 0, 1000);
        assert(buy.ok());
        orders.fillBuy(buy.order->id, 1, 2000);

        bool threw = false;
        try {
            orders.fillSell(buy.order->id, 100.0, 3000, "p95_target");
        } catch (const InvariantViolation&) {
            threw = true;
        }
        assert(threw);
        assert(orders.openPositionCount() == 1);
        assert(pool.total() == 0.0);
    }

    // A scheduled open exit keeps its first reason; unknown positions are bugs.
    {
        CapitalPool pool(10000.0);
        LimitOrderManager orders("A", pool);
        auto buy = orders.createBuyOrder(100.0, 1000.0, 0, 1000);
        assert(buy.ok());
        orders.fillBuy(buy.order->id, 1, 2000);
        assert(!orders.positions().at(buy.order->id).exit_at_open);

        orders.scheduleExitAtOpen(buy.order->id, "cycle_exit");
        orders.scheduleExitAtOpen(buy.order->id, "other");
        assert(*orders.positions().at(buy.order->id).exit_at_open == "cycle_exit");

        bool threw = false;
        try {
            orders.scheduleExitAtOpen(buy.order->id + 100, "cycle_exit");
        } catch (const InvariantViolation&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] LimitOrderManager PASSED\n";
    return 0;
}
