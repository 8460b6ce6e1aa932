#include "simex/risk/risk_rules.hpp"

#include <cmath>

namespace simex {

// -----------------------------------------------------------------------------
// MaxDailyLossRule
// -----------------------------------------------------------------------------
double MaxDailyLossRule::drawdown(const domain::PortfolioState& portfolio,
                                  double current_equity) const {
  if (portfolio.equity_curve.empty()) {
    return 0.0;
  }
  double start_equity = portfolio.equity_curve.front().equity;
  return (start_equity - current_equity) / start_equity;
}

bool MaxDailyLossRule::validate(const domain::PortfolioState& portfolio,
                                double current_equity) const {
  if (portfolio.equity_curve.empty()) {
    return true;
  }
  double start_equity = portfolio.equity_curve.front().equity;
  // A NaN or infinite equity cannot be measured against the limit.
  if (!std::isfinite(start_equity) || !std::isfinite(current_equity)) {
    return true;
  }
  if (start_equity <= 0.0) {
    return false;
  }
  return drawdown(portfolio, current_equity) < max_loss_pct_;
}

// -----------------------------------------------------------------------------
// MaxPositionRule
// -----------------------------------------------------------------------------
double MaxPositionRule::maxQuantity(double equity, double price) const {
  if (price <= 0.0) {
    return 0.0;
  }
  return (max_pct_ * equity) / price;
}

std::optional<domain::Signal> MaxPositionRule::adjust(
    const domain::PortfolioState& portfolio, const std::string& symbol,
    const domain::Signal& signal, double price) const {
  if (!std::isfinite(signal.size)) {
    return std::nullopt;
  }
  double equity = portfolio.totalValue({{symbol, price}});
  if (price <= 0.0 || equity <= 0.0) {
    return std::nullopt;
  }

  double max_qty = maxQuantity(equity, price);
  double proposed = std::abs(signal.size);

  if (proposed == 0.0 || proposed <= max_qty) {
    return signal;
  }
  if (max_qty <= 0.0) {
    return std::nullopt;
  }

  domain::Signal capped = signal;
  capped.size = max_qty;
  return capped;
}

}  // namespace simex
