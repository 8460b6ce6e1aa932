#pragma once

#include "simex/domain/order.hpp"

#include <atomic>

namespace simex {

// -----------------------------------------------------------------------------
// OrderIdGenerator — per-session source of unique order ids
// -----------------------------------------------------------------------------
//
// @details
// Owned by the driver (BacktestEngine::run() or LivePaperRunner) as a value
// member and lent to the bar pipeline by reference, so each run numbers its
// orders from 1 independently of any other run in the same process.
//
// The counter is atomic so the session control thread can read the next id
// while the worker issues ids; ids never repeat within one generator.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;
  explicit OrderIdGenerator(domain::OrderId first) : next_id_(first) {}

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;

  domain::OrderId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  domain::OrderId peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::OrderId> next_id_{1};
};

}  // namespace simex
