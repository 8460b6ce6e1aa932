// =============================================================================
// risk_rules_test.cpp
// =============================================================================
// Unit tests for simex::MaxDailyLossRule and simex::MaxPositionRule.
// =============================================================================

#include "simex/risk/risk_rules.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

namespace {

simex::domain::PortfolioState withStartEquity(double start, double cash) {
  simex::domain::PortfolioState state;
  state.cash = cash;
  state.equity_curve.push_back({simex::ms_to_timestamp(1000), start});
  return state;
}

simex::domain::Signal signalOfSize(double size) {
  simex::domain::Signal signal;
  signal.side = simex::domain::Side::Buy;
  signal.size = size;
  return signal;
}

}  // namespace

// =============================================================================
// MaxDailyLossRule
// =============================================================================

TEST(MaxDailyLossRuleTest, PassesWithoutEquityHistory) {
  simex::MaxDailyLossRule rule(0.2);
  simex::domain::PortfolioState state;
  EXPECT_TRUE(rule.validate(state, 1.0));
  EXPECT_DOUBLE_EQ(rule.drawdown(state, 1.0), 0.0);
}

TEST(MaxDailyLossRuleTest, ThirtyPercentDrawdownBreachesTwentyPercentLimit) {
  simex::MaxDailyLossRule rule(0.2);
  auto state = withStartEquity(10000.0, 7000.0);
  EXPECT_FALSE(rule.validate(state, 7000.0));
  EXPECT_DOUBLE_EQ(rule.drawdown(state, 7000.0), 0.3);
}

TEST(MaxDailyLossRuleTest, SmallerDrawdownPasses) {
  simex::MaxDailyLossRule rule(0.2);
  auto state = withStartEquity(10000.0, 8500.0);
  EXPECT_TRUE(rule.validate(state, 8500.0));
  EXPECT_TRUE(rule.validate(state, 12000.0));
}

// -----------------------------------------------------------------------------
// The comparison is >=: a loss of exactly the limit breaches.
// -----------------------------------------------------------------------------
TEST(MaxDailyLossRuleTest, ExactLimitBreaches) {
  simex::MaxDailyLossRule rule(0.25);
  auto state = withStartEquity(10000.0, 7500.0);
  EXPECT_FALSE(rule.validate(state, 7500.0));
}

TEST(MaxDailyLossRuleTest, NonPositiveStartEquityBreaches) {
  simex::MaxDailyLossRule rule(0.2);
  auto state = withStartEquity(0.0, 0.0);
  EXPECT_FALSE(rule.validate(state, 100.0));
}

TEST(MaxDailyLossRuleTest, NonFiniteEquityIsNotABreach) {
  simex::MaxDailyLossRule rule(0.2);
  auto state = withStartEquity(10000.0, 5000.0);
  EXPECT_TRUE(rule.validate(state, std::numeric_limits<double>::quiet_NaN()));
  EXPECT_TRUE(rule.validate(state, -std::numeric_limits<double>::infinity()));

  auto nan_start =
      withStartEquity(std::numeric_limits<double>::quiet_NaN(), 5000.0);
  EXPECT_TRUE(rule.validate(nan_start, 5000.0));
}

// =============================================================================
// MaxPositionRule
// =============================================================================

TEST(MaxPositionRuleTest, WithinCapPassesUnchanged) {
  simex::MaxPositionRule rule(0.5);
  simex::domain::PortfolioState state;
  state.cash = 10000.0;

  auto result = rule.adjust(state, "AAA", signalOfSize(10.0), 100.0);
  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->size, 10.0);
}

TEST(MaxPositionRuleTest, OversizedIsCapped) {
  simex::MaxPositionRule rule(0.5);
  simex::domain::PortfolioState state;
  state.cash = 10000.0;

  auto result = rule.adjust(state, "AAA", signalOfSize(100.0), 100.0);
  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->size, 50.0);
  EXPECT_EQ(result->side, simex::domain::Side::Buy);
}

// -----------------------------------------------------------------------------
// Equity is marked at the given price for the symbol.
// -----------------------------------------------------------------------------
TEST(MaxPositionRuleTest, CapUsesMarkToMarketEquity) {
  simex::MaxPositionRule rule(0.5);
  simex::domain::PortfolioState state;
  state.cash = 5000.0;
  state.positions["AAA"] = simex::domain::Position{"AAA", 50.0, 100.0};

  // Equity at 200 = 5000 + 50*200 = 15000, cap = 0.5*15000/200 = 37.5.
  auto result = rule.adjust(state, "AAA", signalOfSize(1000.0), 200.0);
  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->size, 37.5);
}

TEST(MaxPositionRuleTest, NonPositivePriceBlocks) {
  simex::MaxPositionRule rule(0.5);
  simex::domain::PortfolioState state;
  state.cash = 10000.0;
  EXPECT_FALSE(rule.adjust(state, "AAA", signalOfSize(1.0), 0.0).has_value());
  EXPECT_FALSE(rule.adjust(state, "AAA", signalOfSize(1.0), -1.0).has_value());
}

TEST(MaxPositionRuleTest, NonPositiveEquityBlocks) {
  simex::MaxPositionRule rule(0.5);
  simex::domain::PortfolioState state;
  state.cash = -1.0;
  EXPECT_FALSE(rule.adjust(state, "AAA", signalOfSize(1.0), 100.0).has_value());
}

TEST(MaxPositionRuleTest, NonFiniteSizeBlocks) {
  simex::MaxPositionRule rule(0.5);
  simex::domain::PortfolioState state;
  state.cash = 10000.0;
  EXPECT_FALSE(rule.adjust(state, "AAA",
                           signalOfSize(std::numeric_limits<double>::quiet_NaN()),
                           100.0)
                   .has_value());
  EXPECT_FALSE(rule.adjust(state, "AAA",
                           signalOfSize(std::numeric_limits<double>::infinity()),
                           100.0)
                   .has_value());
}

TEST(MaxPositionRuleTest, ZeroCapBlocksNonZeroSize) {
  simex::MaxPositionRule rule(0.0);
  simex::domain::PortfolioState state;
  state.cash = 10000.0;
  EXPECT_FALSE(rule.adjust(state, "AAA", signalOfSize(1.0), 100.0).has_value());
}

TEST(MaxPositionRuleTest, ZeroSizePassesUnchanged) {
  simex::MaxPositionRule rule(0.5);
  simex::domain::PortfolioState state;
  state.cash = 10000.0;
  auto result = rule.adjust(state, "AAA", signalOfSize(0.0), 100.0);
  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->size, 0.0);
}

// -----------------------------------------------------------------------------
// For fixed price and equity, no returned size ever exceeds the cap.
// -----------------------------------------------------------------------------
TEST(MaxPositionRuleTest, CapIsMonotoneBound) {
  simex::MaxPositionRule rule(0.5);
  simex::domain::PortfolioState state;
  state.cash = 10000.0;
  const double price = 37.0;
  const double cap = rule.maxQuantity(10000.0, price);

  for (double size = 0.0; size <= 1000.0; size += 7.5) {
    auto result = rule.adjust(state, "AAA", signalOfSize(size), price);
    ASSERT_TRUE(result.has_value()) << "size " << size;
    EXPECT_LE(std::abs(result->size), cap) << "size " << size;
  }
}
