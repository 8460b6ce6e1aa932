// =============================================================================
// order_factory_test.cpp
// =============================================================================
// Unit tests for simex::makeMarketOrder(), simex::ordersForTarget() and the
// OrderIdGenerator they draw ids from, plus a target rebalance driven through
// PaperBroker and Portfolio.
// =============================================================================

#include "simex/execution/order_factory.hpp"
#include "simex/execution/paper_broker.hpp"
#include "simex/portfolio/portfolio.hpp"
#include "simex/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <set>
#include <thread>
#include <vector>

using simex::domain::OrderType;
using simex::domain::Side;

TEST(OrderFactoryTest, MarketOrderFromSignal) {
  simex::OrderIdGenerator ids;
  simex::domain::Signal signal;
  signal.side = Side::Sell;
  signal.size = 12.5;

  auto order = simex::makeMarketOrder(ids, "AAA", signal, 101.0,
                                      simex::ms_to_timestamp(42));

  EXPECT_EQ(order.id, 1u);
  EXPECT_EQ(order.symbol, "AAA");
  EXPECT_EQ(order.side, Side::Sell);
  EXPECT_DOUBLE_EQ(order.quantity, 12.5);
  EXPECT_EQ(order.type, OrderType::Market);
  ASSERT_TRUE(order.price.has_value());
  EXPECT_DOUBLE_EQ(*order.price, 101.0);
  EXPECT_EQ(simex::timestamp_to_ms(order.timestamp), 42);
}

TEST(OrderFactoryTest, IdsIncreasePerOrder) {
  simex::OrderIdGenerator ids;
  simex::domain::Signal signal;
  signal.size = 1.0;

  auto a = simex::makeMarketOrder(ids, "AAA", signal, 1.0, {});
  auto b = simex::makeMarketOrder(ids, "AAA", signal, 1.0, {});
  EXPECT_LT(a.id, b.id);
  EXPECT_EQ(ids.peek(), b.id + 1);
}

TEST(OrderFactoryTest, TargetEqualToCurrentYieldsNoOrder) {
  simex::OrderIdGenerator ids;
  EXPECT_TRUE(simex::ordersForTarget(ids, 10.0, 10.0, "AAA", 100.0, {}).empty());
  EXPECT_EQ(ids.peek(), 1u);
}

TEST(OrderFactoryTest, TargetAboveCurrentBuysDelta) {
  simex::OrderIdGenerator ids;
  auto orders = simex::ordersForTarget(ids, 10.0, 25.0, "AAA", 100.0, {});
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].side, Side::Buy);
  EXPECT_DOUBLE_EQ(orders[0].quantity, 15.0);
  EXPECT_EQ(orders[0].type, OrderType::Market);
}

TEST(OrderFactoryTest, TargetBelowCurrentSellsDelta) {
  simex::OrderIdGenerator ids;
  auto orders = simex::ordersForTarget(ids, 25.0, 5.0, "AAA", 100.0, {});
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].side, Side::Sell);
  EXPECT_DOUBLE_EQ(orders[0].quantity, 20.0);
  EXPECT_GT(orders[0].quantity, 0.0);
}

// -----------------------------------------------------------------------------
// A caller outside the bar pipeline rebalances to a series of targets.
// -----------------------------------------------------------------------------
TEST(OrderFactoryTest, RebalanceToTargetsThroughBroker) {
  simex::SimulationTimeProvider clock(1000);
  simex::PaperBroker broker(clock, 0.0);
  simex::Portfolio portfolio(10000.0);
  simex::OrderIdGenerator ids;

  auto held = [&] {
    const auto* pos = portfolio.view().position("AAA");
    return pos ? pos->quantity : 0.0;
  };

  for (double target : {30.0, 12.0, 12.0, 0.0}) {
    for (const auto& order :
         simex::ordersForTarget(ids, held(), target, "AAA", 100.0, {})) {
      auto result = broker.execute(order, 100.0);
      ASSERT_TRUE(result.trade.has_value());
      portfolio.applyTrade(*result.trade);
    }
    EXPECT_DOUBLE_EQ(held(), target);
  }

  // 30 bought, 18 sold, nothing for the repeated 12, 12 sold.
  ASSERT_EQ(broker.trades().size(), 3u);
  EXPECT_EQ(broker.trades()[0].side, Side::Buy);
  EXPECT_EQ(broker.trades()[1].side, Side::Sell);
  EXPECT_DOUBLE_EQ(broker.trades()[1].quantity, 18.0);
  EXPECT_DOUBLE_EQ(portfolio.view().cash, 10000.0);
}

// -----------------------------------------------------------------------------
// Ids handed out concurrently are unique.
// -----------------------------------------------------------------------------
TEST(OrderIdGeneratorTest, UniqueAcrossThreads) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 1000;
  simex::OrderIdGenerator ids;
  std::vector<std::vector<simex::domain::OrderId>> taken(kThreads);

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&ids, &taken, t] {
      for (int i = 0; i < kPerThread; ++i) {
        taken[t].push_back(ids.next_id());
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  std::set<simex::domain::OrderId> unique;
  for (const auto& v : taken) {
    unique.insert(v.begin(), v.end());
  }
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kPerThread));
}
