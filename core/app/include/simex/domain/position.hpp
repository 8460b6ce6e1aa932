#pragma once

#include <string>

namespace simex {
namespace domain {

// -----------------------------------------------------------------------------
// Position — long-only holding for one symbol
// -----------------------------------------------------------------------------
//
// @brief  Quantity held and its cost-weighted average entry price.
//
// @details
// quantity is never negative. A sell larger than the holding floors the
// quantity at zero; the excess is not recorded as a short (see
// Portfolio::updatePosition for how cash is treated).
//
// average_price is recomputed only when a buy increases the holding:
//   avg = (avg * qty_old + qty * price) / (qty_old + qty)
// Sells leave it unchanged. A position that has been sold down to zero stays
// in the map as a record.
//
// Ownership:
//   Portfolio owns the live copies. PortfolioState snapshots carry copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  double quantity{0.0};
  double average_price{0.0};

  double marketValue(double mark_price) const { return quantity * mark_price; }
};

}  // namespace domain
}  // namespace simex
