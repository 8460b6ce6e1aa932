#pragma once

#include "simex/domain/side.hpp"

namespace simex {

// -----------------------------------------------------------------------------
// SlippageModel
// -----------------------------------------------------------------------------
// Adverse price adjustment applied to the mark before a fill:
//   BUY  : mark * (1 + pct) + abs
//   SELL : mark * (1 - pct) - abs
// Both default to zero, i.e. fill at the mark.
// -----------------------------------------------------------------------------
struct SlippageModel {
  double pct{0.0};
  double abs{0.0};

  double fillPrice(domain::Side side, double mark) const {
    if (side == domain::Side::Buy) {
      return mark * (1.0 + pct) + abs;
    }
    return mark * (1.0 - pct) - abs;
  }
};

}  // namespace simex
