#pragma once

#include "simex/domain/side.hpp"
#include "simex/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace simex {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Unique within a run/session. Issued by OrderIdGenerator, starting at 1.
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;

enum class OrderType {
  Market,
  Limit,
};

inline const char* orderTypeToString(OrderType type) {
  switch (type) {
    case OrderType::Market: return "MARKET";
    case OrderType::Limit:  return "LIMIT";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  An instruction handed to the broker, built immediately before
//         execution.
//
// @details
// quantity is always > 0; the pipeline never builds an order for a zero or
// non-finite size. For Market orders `price` is advisory only: the paper
// broker fills at the mark it is given, not at this price.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};
  std::string symbol;
  Side side{Side::Buy};
  double quantity{0.0};
  OrderType type{OrderType::Market};
  std::optional<double> price;
  Timestamp timestamp{};
};

}  // namespace domain
}  // namespace simex
