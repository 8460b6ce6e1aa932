#pragma once

#include "simex/domain/portfolio_state.hpp"
#include "simex/domain/signal.hpp"

#include <optional>
#include <string>

namespace simex {

// -----------------------------------------------------------------------------
// MaxDailyLossRule
// -----------------------------------------------------------------------------
//
// @brief  Drawdown gate measured from the first equity-curve point.
//
// @details
// validate() fails when
//   (start_equity - current_equity) / start_equity >= max_loss_pct
// where start_equity is portfolio.equity_curve.front(). With no equity
// history it always passes. A non-positive start equity cannot express a
// drawdown and is treated as a breach. A non-finite equity on either side
// is not evaluated and passes.
//
// Stateless; the halting is RiskManager's job.
// -----------------------------------------------------------------------------
class MaxDailyLossRule {
 public:
  explicit MaxDailyLossRule(double max_loss_pct) : max_loss_pct_(max_loss_pct) {}

  bool validate(const domain::PortfolioState& portfolio,
                double current_equity) const;

  // Fractional drawdown from the first equity point, or 0 with no history.
  double drawdown(const domain::PortfolioState& portfolio,
                  double current_equity) const;

  double maxLossPct() const { return max_loss_pct_; }

 private:
  double max_loss_pct_;
};

// -----------------------------------------------------------------------------
// MaxPositionRule
// -----------------------------------------------------------------------------
//
// @brief  Caps the size of a single signal to a fraction of equity.
//
// @details
// adjust() computes
//   equity  = portfolio.totalValue({symbol: price})
//   max_qty = (max_pct * equity) / price
// and returns
//   - std::nullopt     if size is NaN or infinite,
//   - std::nullopt     if price <= 0 or equity <= 0 (blocked),
//   - the signal as-is if |size| == 0 or |size| <= max_qty,
//   - std::nullopt     if max_qty <= 0,
//   - a copy with size = max_qty otherwise.
// The returned size never exceeds max_qty in absolute value.
// -----------------------------------------------------------------------------
class MaxPositionRule {
 public:
  explicit MaxPositionRule(double max_pct) : max_pct_(max_pct) {}

  std::optional<domain::Signal> adjust(const domain::PortfolioState& portfolio,
                                       const std::string& symbol,
                                       const domain::Signal& signal,
                                       double price) const;

  // (max_pct * equity) / price, or 0 when price <= 0.
  double maxQuantity(double equity, double price) const;

  double maxPct() const { return max_pct_; }

 private:
  double max_pct_;
};

}  // namespace simex
