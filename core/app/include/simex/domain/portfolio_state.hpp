#pragma once

#include "simex/domain/position.hpp"
#include "simex/time/time_utils.hpp"

#include <map>
#include <string>
#include <vector>

namespace simex {
namespace domain {

// -----------------------------------------------------------------------------
// EquityPoint — one entry of the equity curve
// -----------------------------------------------------------------------------
struct EquityPoint {
  Timestamp timestamp{};
  double equity{0.0};
};

using EquityCurve = std::vector<EquityPoint>;

// Mark prices keyed by symbol. Symbols without a mark are valued at their
// average price.
using MarkPrices = std::map<std::string, double>;

// -----------------------------------------------------------------------------
// PortfolioState — read-only snapshot of cash, positions and equity history
// -----------------------------------------------------------------------------
//
// @brief  The value handed to strategies, the sizer and the risk rules, and
//         returned by the drivers as their final result.
//
// @details
// Snapshots are copies. A strategy or rule that modifies its copy cannot
// affect the Portfolio the driver owns; the only way state changes is via
// Portfolio::applyTrade() on the driver's thread.
//
// equity_curve is strictly time-ascending with one entry per processed bar.
// -----------------------------------------------------------------------------
struct PortfolioState {
  double cash{0.0};
  std::map<std::string, Position> positions;
  EquityCurve equity_curve;

  // cash + Σ quantity * mark(symbol), mark defaulting to average_price.
  double totalValue(const MarkPrices& marks) const {
    double value = cash;
    for (const auto& [symbol, pos] : positions) {
      auto it = marks.find(symbol);
      double mark = (it != marks.end()) ? it->second : pos.average_price;
      value += pos.marketValue(mark);
    }
    return value;
  }

  const Position* position(const std::string& symbol) const {
    auto it = positions.find(symbol);
    return (it != positions.end()) ? &it->second : nullptr;
  }
};

}  // namespace domain
}  // namespace simex
