#pragma once

#include "simex/domain/order.hpp"
#include "simex/domain/side.hpp"
#include "simex/time/time_utils.hpp"

#include <optional>
#include <string>

namespace simex {
namespace domain {

// -----------------------------------------------------------------------------
// Trade — an executed fill
// -----------------------------------------------------------------------------
//
// @details
// Created by the broker for every executed order and appended to the ledger.
// Never mutated afterwards. For paper fills
//   fee = |quantity| * price * fee_rate
// and fee >= 0.
// -----------------------------------------------------------------------------
struct Trade {
  OrderId order_id{};
  std::string symbol;
  Side side{Side::Buy};
  double quantity{0.0};
  double price{0.0};
  double fee{0.0};
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// ExecutionResult — outcome of one IBroker::execute() call
// -----------------------------------------------------------------------------
// The paper broker always reports success and always carries a trade.
// -----------------------------------------------------------------------------
struct ExecutionResult {
  bool success{false};
  std::optional<Trade> trade;
  std::string message;
};

}  // namespace domain
}  // namespace simex
