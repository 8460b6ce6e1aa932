#pragma once

#include "simex/domain/order.hpp"
#include "simex/domain/trade.hpp"

#include <vector>

namespace simex {

// -----------------------------------------------------------------------------
// IBroker — execution venue seen by the bar pipeline
// -----------------------------------------------------------------------------
//
// @brief  Turns an Order into an ExecutionResult at a given mark price.
//
// @details
// The pipeline only knows this interface, so the paper broker can be swapped
// for another venue without touching either driver. Implementations keep the
// ledger of every trade they produced, in execution order.
//
// Ownership:
//   The driver owns the broker (unique_ptr<IBroker>) for one run/session.
// -----------------------------------------------------------------------------
class IBroker {
 public:
  virtual ~IBroker() = default;

  virtual domain::ExecutionResult execute(const domain::Order& order,
                                          double mark_price) = 0;

  virtual const std::vector<domain::Trade>& trades() const = 0;
};

}  // namespace simex
