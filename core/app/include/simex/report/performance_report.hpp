#pragma once

#include "simex/domain/portfolio_state.hpp"
#include "simex/domain/trade.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <vector>

namespace simex {

// -----------------------------------------------------------------------------
// PerformanceSummary — statistics over one run's equity curve and ledger
// -----------------------------------------------------------------------------
//
// @details
// Returns are simple per-bar returns of the equity curve:
//   r_i = equity_i / equity_{i-1} - 1
//
//   sharpe        mean(r) / stddev(r) * sqrt(252), sample stddev; 0 when
//                 fewer than two returns or zero variance.
//   hit_rate      fraction of non-zero returns that are positive; 0 when
//                 there are none.
//   max_drawdown  largest peak-to-trough fall as a fraction of the peak.
//   total_return  final / initial - 1 using the first and last curve points.
//   deflated_sharpe
//                 probability that the true per-bar Sharpe exceeds the best
//                 one expected from `n_trials` unskilled strategies, after
//                 correcting for sample length, skew and kurtosis (Bailey and
//                 Lopez de Prado). In [0, 1]; 0 under the same conditions as
//                 sharpe.
// -----------------------------------------------------------------------------
struct PerformanceSummary {
  std::size_t bars{0};
  std::size_t trades{0};
  double initial_equity{0.0};
  double final_equity{0.0};
  double total_return{0.0};
  double sharpe{0.0};
  double deflated_sharpe{0.0};
  double hit_rate{0.0};
  double max_drawdown{0.0};
  double total_fees{0.0};
};

// Annualisation factor for daily bars.
inline constexpr double kTradingDaysPerYear = 252.0;

std::vector<double> periodReturns(const domain::EquityCurve& curve);

double maxDrawdown(const domain::EquityCurve& curve);

// Standard normal CDF and its inverse. normalQuantile(p) is -inf for p <= 0
// and +inf for p >= 1.
double normalCdf(double x);
double normalQuantile(double p);

// Deflated Sharpe ratio of per-bar `returns` selected as the best of
// `n_trials` tried configurations (values below 1 count as 1). Returns 0 for
// fewer than two returns or zero variance.
double deflatedSharpe(const std::vector<double>& returns, int n_trials = 1);

PerformanceSummary summarize(const domain::EquityCurve& curve,
                             const std::vector<domain::Trade>& trades,
                             int n_trials = 1);

nlohmann::json toJson(const PerformanceSummary& summary);

}  // namespace simex
