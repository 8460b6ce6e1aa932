#include "simex/risk/position_sizer.hpp"

#include <limits>

namespace simex {

double sizingEquity(const domain::PortfolioState& portfolio, EquityBasis basis,
                    const domain::MarkPrices& marks) {
  if (basis == EquityBasis::MarkToMarket) {
    return portfolio.totalValue(marks);
  }

  double equity = portfolio.cash;
  for (const auto& [symbol, pos] : portfolio.positions) {
    equity += pos.average_price * pos.quantity;
  }
  return equity;
}

double fixedFractional(const domain::Signal& /*signal*/,
                       const domain::PortfolioState& portfolio, double fraction,
                       double price, EquityBasis basis,
                       const domain::MarkPrices& marks) {
  if (price <= 0.0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return (sizingEquity(portfolio, basis, marks) * fraction) / price;
}

}  // namespace simex
