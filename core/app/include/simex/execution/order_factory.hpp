#pragma once

#include "simex/concurrent/order_id_generator.hpp"
#include "simex/domain/order.hpp"
#include "simex/domain/signal.hpp"
#include "simex/time/time_utils.hpp"

#include <string>
#include <vector>

namespace simex {

// -----------------------------------------------------------------------------
// makeMarketOrder(ids, symbol, signal, advisory_price, timestamp)
// -----------------------------------------------------------------------------
// Market order for |signal.size| units in signal.side with a fresh id. The
// caller guarantees the size is finite and non-zero.
// -----------------------------------------------------------------------------
domain::Order makeMarketOrder(OrderIdGenerator& ids, const std::string& symbol,
                              const domain::Signal& signal,
                              double advisory_price, Timestamp timestamp);

// -----------------------------------------------------------------------------
// ordersForTarget(ids, current_qty, target_qty, symbol, price, timestamp)
// -----------------------------------------------------------------------------
//
// @brief  Orders that move a holding from current_qty to target_qty.
//
// @details
// Library entry point for callers that think in target positions (a
// rebalancer, an external allocator) rather than in buy/sell signals. The
// bar pipeline trades signals through makeMarketOrder() and does not call
// this.
//
// @return Empty if the two are equal, otherwise exactly one Market order for
//         |target - current| units: BUY when the delta is positive, SELL
//         when negative. `price` is carried as the advisory price.
// -----------------------------------------------------------------------------
std::vector<domain::Order> ordersForTarget(OrderIdGenerator& ids,
                                           double current_qty,
                                           double target_qty,
                                           const std::string& symbol,
                                           double price, Timestamp timestamp);

}  // namespace simex
