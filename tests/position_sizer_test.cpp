// =============================================================================
// position_sizer_test.cpp
// =============================================================================
// Unit tests for simex::fixedFractional() and simex::sizingEquity().
// =============================================================================

#include "simex/risk/position_sizer.hpp"

#include <gtest/gtest.h>

#include <cmath>

namespace {

// 9000 cash + 10 units bought at 100 → cost-basis equity 10000.
simex::domain::PortfolioState holdingTenAt100() {
  simex::domain::PortfolioState state;
  state.cash = 9000.0;
  state.positions["AAA"] = simex::domain::Position{"AAA", 10.0, 100.0};
  return state;
}

}  // namespace

TEST(PositionSizerTest, CostBasisIgnoresMarks) {
  auto state = holdingTenAt100();
  simex::domain::Signal signal;

  double size = simex::fixedFractional(signal, state, 0.1, 50.0,
                                       simex::EquityBasis::CostBasis,
                                       {{"AAA", 200.0}});
  EXPECT_DOUBLE_EQ(size, 10000.0 * 0.1 / 50.0);
}

TEST(PositionSizerTest, MarkToMarketUsesMarks) {
  auto state = holdingTenAt100();
  simex::domain::Signal signal;

  double size = simex::fixedFractional(signal, state, 0.1, 50.0,
                                       simex::EquityBasis::MarkToMarket,
                                       {{"AAA", 200.0}});
  EXPECT_DOUBLE_EQ(size, (9000.0 + 2000.0) * 0.1 / 50.0);
}

TEST(PositionSizerTest, SignalSizeIsReplaced) {
  simex::domain::PortfolioState state;
  state.cash = 10000.0;
  simex::domain::Signal signal;
  signal.size = 12345.0;

  EXPECT_DOUBLE_EQ(simex::fixedFractional(signal, state, 0.01, 100.0), 1.0);
}

// -----------------------------------------------------------------------------
// price <= 0 is not an error at this layer: the result is NaN and the caller
// must check it.
// -----------------------------------------------------------------------------
TEST(PositionSizerTest, NonPositivePriceIsNotFinite) {
  simex::domain::PortfolioState state;
  state.cash = 10000.0;
  simex::domain::Signal signal;

  EXPECT_FALSE(std::isfinite(simex::fixedFractional(signal, state, 0.1, 0.0)));
  EXPECT_FALSE(std::isfinite(simex::fixedFractional(signal, state, 0.1, -5.0)));
}

TEST(PositionSizerTest, SizingEquityPerBasis) {
  auto state = holdingTenAt100();
  EXPECT_DOUBLE_EQ(
      simex::sizingEquity(state, simex::EquityBasis::CostBasis, {{"AAA", 1.0}}),
      10000.0);
  EXPECT_DOUBLE_EQ(simex::sizingEquity(state, simex::EquityBasis::MarkToMarket,
                                       {{"AAA", 1.0}}),
                   9010.0);
}
