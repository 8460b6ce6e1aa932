// =============================================================================
// paper_broker_test.cpp
// =============================================================================
// Unit tests for simex::PaperBroker.
// =============================================================================

#include "simex/execution/paper_broker.hpp"
#include "simex/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

namespace {

simex::domain::Order marketOrder(simex::domain::OrderId id,
                                 simex::domain::Side side, double qty) {
  simex::domain::Order order;
  order.id = id;
  order.symbol = "AAA";
  order.side = side;
  order.quantity = qty;
  order.type = simex::domain::OrderType::Market;
  order.price = 99.0;  // advisory only
  return order;
}

}  // namespace

class PaperBrokerTest : public ::testing::Test {
 protected:
  simex::SimulationTimeProvider clock{5000};
  simex::PaperBroker broker{clock, 0.001};
};

// -----------------------------------------------------------------------------
// The fill is at the mark passed to execute(), not the order's advisory
// price, and fee = |qty| * mark * fee_rate.
// -----------------------------------------------------------------------------
TEST_F(PaperBrokerTest, FillsAtMarkAndChargesFee) {
  auto result = broker.execute(marketOrder(7, simex::domain::Side::Buy, 10.0),
                               100.0);

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.message, "filled");
  ASSERT_TRUE(result.trade.has_value());
  EXPECT_EQ(result.trade->order_id, 7u);
  EXPECT_EQ(result.trade->symbol, "AAA");
  EXPECT_EQ(result.trade->side, simex::domain::Side::Buy);
  EXPECT_DOUBLE_EQ(result.trade->quantity, 10.0);
  EXPECT_DOUBLE_EQ(result.trade->price, 100.0);
  EXPECT_DOUBLE_EQ(result.trade->fee, 1.0);
}

TEST_F(PaperBrokerTest, TimestampComesFromClock) {
  clock.advance_time(123456);
  auto result = broker.execute(marketOrder(1, simex::domain::Side::Sell, 1.0),
                               10.0);
  ASSERT_TRUE(result.trade.has_value());
  EXPECT_EQ(simex::timestamp_to_ms(result.trade->timestamp), 123456);
}

TEST_F(PaperBrokerTest, LedgerKeepsEveryFillInOrder) {
  broker.execute(marketOrder(1, simex::domain::Side::Buy, 1.0), 10.0);
  broker.execute(marketOrder(2, simex::domain::Side::Sell, 2.0), 11.0);
  broker.execute(marketOrder(3, simex::domain::Side::Buy, 3.0), 12.0);

  const auto& trades = broker.trades();
  ASSERT_EQ(trades.size(), 3u);
  EXPECT_EQ(trades[0].order_id, 1u);
  EXPECT_EQ(trades[1].order_id, 2u);
  EXPECT_EQ(trades[2].order_id, 3u);
  EXPECT_DOUBLE_EQ(trades[1].price, 11.0);
}

TEST(PaperBrokerZeroFeeTest, ZeroFeeRateChargesNothing) {
  simex::SimulationTimeProvider clock;
  simex::PaperBroker broker(clock, 0.0);
  auto result = broker.execute(marketOrder(1, simex::domain::Side::Buy, 50.0),
                               100.0);
  ASSERT_TRUE(result.trade.has_value());
  EXPECT_DOUBLE_EQ(result.trade->fee, 0.0);
  EXPECT_DOUBLE_EQ(broker.feeRate(), 0.0);
}
