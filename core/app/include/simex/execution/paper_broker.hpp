#pragma once

#include "simex/execution/i_broker.hpp"
#include "simex/time/i_time_provider.hpp"

#include <vector>

namespace simex {

// -----------------------------------------------------------------------------
// PaperBroker — always-filled simulated venue
// -----------------------------------------------------------------------------
//
// @brief  Fills every order in full at the mark price it is given and charges
//         a proportional fee.
//
// @details
// For each execute():
//   fee   = |quantity| * mark_price * fee_rate
//   trade = {order.id, order.symbol, order.side, order.quantity, mark_price,
//            fee, clock.now_ms()}
// The trade is appended to the ledger and returned with success = true.
// There is no rejection, latency or partial-fill modelling.
//
// Trades are stamped from the injected clock: SimulationTimeProvider in a
// backtest (bar time), LiveTimeProvider in a live session.
//
// Thread model:
//   Not synchronized. Called only from the driver's thread.
// -----------------------------------------------------------------------------
class PaperBroker final : public IBroker {
 public:
  PaperBroker(const ITimeProvider& clock, double fee_rate);

  domain::ExecutionResult execute(const domain::Order& order,
                                  double mark_price) override;

  const std::vector<domain::Trade>& trades() const override { return trades_; }

  double feeRate() const { return fee_rate_; }

 private:
  const ITimeProvider& clock_;
  double fee_rate_;
  std::vector<domain::Trade> trades_;
};

}  // namespace simex
