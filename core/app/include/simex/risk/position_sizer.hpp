#pragma once

#include "simex/domain/portfolio_state.hpp"
#include "simex/domain/signal.hpp"

namespace simex {

// -----------------------------------------------------------------------------
// EquityBasis — which equity the sizer scales from
// -----------------------------------------------------------------------------
//   CostBasis    cash + Σ average_price * quantity. Ignores unrealised PnL,
//                so it lags true equity when prices move. Default.
//   MarkToMarket cash + Σ mark * quantity using the supplied marks
//                (average_price for symbols without a mark).
// -----------------------------------------------------------------------------
enum class EquityBasis {
  CostBasis,
  MarkToMarket,
};

// Equity the sizer would use for `portfolio` under `basis`.
double sizingEquity(const domain::PortfolioState& portfolio, EquityBasis basis,
                    const domain::MarkPrices& marks = {});

// -----------------------------------------------------------------------------
// fixedFractional(signal, portfolio, fraction, price, basis, marks)
// -----------------------------------------------------------------------------
//
// @brief  Units to trade so that the position is worth `fraction` of equity.
//
// @return (equity * fraction) / price. Returns NaN when price <= 0; callers
//         must check std::isfinite() before using the result.
//
// @details
// Pure function. The signal's own size is ignored: the result replaces it.
// -----------------------------------------------------------------------------
double fixedFractional(const domain::Signal& signal,
                       const domain::PortfolioState& portfolio, double fraction,
                       double price, EquityBasis basis = EquityBasis::CostBasis,
                       const domain::MarkPrices& marks = {});

}  // namespace simex
