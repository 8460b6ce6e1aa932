// =============================================================================
// performance_report_test.cpp
// =============================================================================
// Tests for the performance summary (simex/report/performance_report.hpp).
//
// Validates:
//   - Total return, max drawdown and hit rate on a known curve
//   - Sharpe is zero when returns have no spread
//   - Fees are summed from the trade list
//   - Empty curves produce an all-zero summary
//   - Deflated Sharpe on a known return series, and its penalty for trials
// =============================================================================

#include "simex/report/performance_report.hpp"
#include "simex/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

namespace {

simex::domain::EquityCurve curveOf(const std::vector<double>& equity) {
  simex::domain::EquityCurve curve;
  for (std::size_t i = 0; i < equity.size(); ++i) {
    curve.push_back({simex::ms_to_timestamp(
                         static_cast<std::int64_t>(i + 1) * 1000),
                     equity[i]});
  }
  return curve;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. 100 → 110 → 99 → 121
// -----------------------------------------------------------------------------
TEST(PerformanceReportTest, KnownCurve) {
  auto curve = curveOf({100, 110, 99, 121});

  auto s = simex::summarize(curve, {});

  EXPECT_EQ(s.bars, 4u);
  EXPECT_DOUBLE_EQ(s.initial_equity, 100.0);
  EXPECT_DOUBLE_EQ(s.final_equity, 121.0);
  EXPECT_NEAR(s.total_return, 0.21, 1e-12);
  EXPECT_NEAR(s.max_drawdown, 0.1, 1e-12);
  EXPECT_NEAR(s.hit_rate, 2.0 / 3.0, 1e-12);
  EXPECT_GT(s.sharpe, 0.0);

  auto returns = simex::periodReturns(curve);
  ASSERT_EQ(returns.size(), 3u);
  EXPECT_NEAR(returns[0], 0.1, 1e-12);
  EXPECT_NEAR(returns[1], -0.1, 1e-12);
}

TEST(PerformanceReportTest, FlatCurveHasNoSharpeOrHitRate) {
  auto s = simex::summarize(curveOf({100, 100, 100}), {});
  EXPECT_DOUBLE_EQ(s.sharpe, 0.0);
  EXPECT_DOUBLE_EQ(s.hit_rate, 0.0);
  EXPECT_DOUBLE_EQ(s.max_drawdown, 0.0);
  EXPECT_DOUBLE_EQ(s.total_return, 0.0);
}

TEST(PerformanceReportTest, EmptyCurve) {
  auto s = simex::summarize({}, {});
  EXPECT_EQ(s.bars, 0u);
  EXPECT_DOUBLE_EQ(s.final_equity, 0.0);
  EXPECT_DOUBLE_EQ(simex::maxDrawdown({}), 0.0);
  EXPECT_TRUE(simex::periodReturns({}).empty());
}

// -----------------------------------------------------------------------------
// 2. Deflated Sharpe.
// -----------------------------------------------------------------------------
TEST(PerformanceReportTest, NormalQuantileInvertsCdf) {
  EXPECT_NEAR(simex::normalQuantile(0.975), 1.959963985, 1e-6);
  EXPECT_NEAR(simex::normalQuantile(0.5), 0.0, 1e-9);
  EXPECT_NEAR(simex::normalQuantile(0.01), -2.326347874, 1e-6);
  EXPECT_NEAR(simex::normalCdf(simex::normalQuantile(0.999)), 0.999, 1e-9);
  EXPECT_TRUE(std::isinf(simex::normalQuantile(0.0)));
  EXPECT_TRUE(std::isinf(simex::normalQuantile(1.0)));
}

// --- Alternating 1% / 3%: SR = sqrt(3), skew 0, kurtosis 1, so the
//     statistic is (SR - 0) / sqrt(1/3) = 3 and DSR = Phi(3).
TEST(PerformanceReportTest, DeflatedSharpeKnownSeries) {
  std::vector<double> returns{0.01, 0.03, 0.01, 0.03};
  EXPECT_NEAR(simex::deflatedSharpe(returns, 1), 0.998650102, 1e-6);
  EXPECT_NEAR(simex::deflatedSharpe(returns, 0), 0.998650102, 1e-6);

  double one = simex::deflatedSharpe(returns, 1);
  double ten = simex::deflatedSharpe(returns, 10);
  double hundred = simex::deflatedSharpe(returns, 100);
  EXPECT_LT(ten, one);
  EXPECT_LT(hundred, ten);
  EXPECT_GT(hundred, 0.0);

  auto s = simex::summarize(curveOf({100, 101, 104.03, 105.0703, 108.222409}),
                            {}, 1);
  EXPECT_NEAR(s.deflated_sharpe, 0.998650102, 1e-6);
  EXPECT_NEAR(s.sharpe, std::sqrt(3.0) * std::sqrt(252.0), 1e-6);
}

TEST(PerformanceReportTest, DeflatedSharpeNeedsSpread) {
  EXPECT_DOUBLE_EQ(simex::deflatedSharpe({}), 0.0);
  EXPECT_DOUBLE_EQ(simex::deflatedSharpe({0.01}), 0.0);
  EXPECT_DOUBLE_EQ(simex::deflatedSharpe({0.5, 0.5, 0.5}), 0.0);
  EXPECT_DOUBLE_EQ(simex::summarize(curveOf({100, 100, 100}), {}, 5)
                       .deflated_sharpe,
                   0.0);
}

// -----------------------------------------------------------------------------
// 3. Fees and JSON.
// -----------------------------------------------------------------------------
TEST(PerformanceReportTest, FeesAndJson) {
  simex::domain::Trade a;
  a.fee = 1.5;
  simex::domain::Trade b;
  b.fee = 0.25;

  auto s = simex::summarize(curveOf({100, 90}), {a, b});
  EXPECT_EQ(s.trades, 2u);
  EXPECT_DOUBLE_EQ(s.total_fees, 1.75);
  EXPECT_NEAR(s.max_drawdown, 0.1, 1e-12);

  auto j = simex::toJson(s);
  for (const char* key : {"bars", "trades", "initial_equity", "final_equity",
                          "total_return", "sharpe", "deflated_sharpe",
                          "hit_rate", "max_drawdown", "total_fees"}) {
    EXPECT_TRUE(j.contains(key)) << key;
  }
  EXPECT_DOUBLE_EQ(j["total_fees"].get<double>(), 1.75);
}
