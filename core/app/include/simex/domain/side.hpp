#pragma once

namespace simex {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Direction of a signal, order or trade. Quantities and sizes elsewhere are
// magnitudes; the side alone carries the direction.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

inline const char* sideToString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace simex
