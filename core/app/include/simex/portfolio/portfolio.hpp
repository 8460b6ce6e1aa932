#pragma once

#include "simex/domain/portfolio_state.hpp"
#include "simex/domain/position.hpp"
#include "simex/domain/side.hpp"
#include "simex/domain/trade.hpp"
#include "simex/time/time_utils.hpp"

#include <map>
#include <string>

namespace simex {

// -----------------------------------------------------------------------------
// Portfolio — the driver-owned, mutable account
// -----------------------------------------------------------------------------
//
// @brief  Cash, per-symbol positions and the equity curve of one run or
//         session, and the single mutation path both drivers use.
//
// @details
// BacktestEngine and LivePaperRunner both apply fills with applyTrade(); there
// is no second route that adjusts cash directly. Everybody else (strategy,
// sizer, risk rules) gets a `const domain::PortfolioState&` from view(),
// which they can read but not change; snapshot() makes a copy for results
// and for other threads.
//
// Accounting:
//   BUY  qty @ price : quantity += qty, avg recomputed (cost-weighted),
//                      cash -= qty * price
//   SELL qty @ price : quantity -= qty floored at 0, avg unchanged,
//                      cash += qty * price   (full qty, even if oversold)
//   applyTrade additionally subtracts trade.fee from cash.
//
// Nothing at this layer fails. Oversell rejection and size validation happen
// upstream in the bar pipeline.
//
// Thread model:
//   Not synchronized. Owned by one driver and touched only on that driver's
//   thread (the replay loop, or the live session's BarWorker).
// -----------------------------------------------------------------------------
class Portfolio {
 public:
  explicit Portfolio(double initial_cash);

  // -------------------------------------------------------------------------
  // updatePosition(symbol, side, qty, price)
  // -------------------------------------------------------------------------
  // @brief  Applies one fill of `qty` units at `price` (no fee).
  //
  // @details
  // Creates the position lazily on the first update for `symbol`. A SELL of
  // more than is held credits the full qty * price and leaves quantity 0;
  // the excess is not tracked as a short.
  // -------------------------------------------------------------------------
  void updatePosition(const std::string& symbol, domain::Side side, double qty,
                      double price);

  // updatePosition() for the trade, then charges trade.fee against cash.
  void applyTrade(const domain::Trade& trade);

  // True if a SELL of `qty` would take the holding below zero.
  bool wouldOversell(const std::string& symbol, domain::Side side,
                     double qty) const;

  // cash + Σ quantity * mark, defaulting the mark to average_price.
  double markToMarket(const domain::MarkPrices& marks) const;

  // -------------------------------------------------------------------------
  // recordEquity(timestamp, equity)
  // -------------------------------------------------------------------------
  // @brief  Appends one equity-curve point.
  // @return false (and records nothing) if timestamp is not strictly after
  //         the last recorded point.
  // -------------------------------------------------------------------------
  bool recordEquity(Timestamp timestamp, double equity);

  // True if `timestamp` would be accepted by recordEquity().
  bool acceptsTimestamp(Timestamp timestamp) const;

  // Read-only view of the live state, valid until the next mutation.
  const domain::PortfolioState& view() const { return state_; }

  // Deep copy, safe to keep or hand to another thread.
  domain::PortfolioState snapshot() const { return state_; }

  double cash() const { return state_.cash; }
  const domain::Position* position(const std::string& symbol) const {
    return state_.position(symbol);
  }
  const std::map<std::string, domain::Position>& positions() const {
    return state_.positions;
  }
  const domain::EquityCurve& equityCurve() const {
    return state_.equity_curve;
  }

 private:
  domain::PortfolioState state_;
};

}  // namespace simex
