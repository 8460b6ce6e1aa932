#include "simex/execution/paper_broker.hpp"
#include "simex/time/time_utils.hpp"

#include <cmath>
#include <iostream>

namespace simex {

PaperBroker::PaperBroker(const ITimeProvider& clock, double fee_rate)
    : clock_(clock), fee_rate_(fee_rate) {}

// -----------------------------------------------------------------------------
// execute: full fill at the mark, fee charged on notional
// -----------------------------------------------------------------------------
domain::ExecutionResult PaperBroker::execute(const domain::Order& order,
                                             double mark_price) {
  domain::Trade trade;
  trade.order_id = order.id;
  trade.symbol = order.symbol;
  trade.side = order.side;
  trade.quantity = order.quantity;
  trade.price = mark_price;
  trade.fee = std::abs(order.quantity) * mark_price * fee_rate_;
  trade.timestamp = ms_to_timestamp(clock_.now_ms());

  trades_.push_back(trade);

  std::cout << "[PaperBroker] fill order_id=" << order.id << " "
            << domain::sideToString(order.side) << " " << order.quantity << " "
            << order.symbol << " @ " << mark_price << " fee=" << trade.fee
            << "\n";

  domain::ExecutionResult result;
  result.success = true;
  result.trade = trade;
  result.message = "filled";
  return result;
}

}  // namespace simex
