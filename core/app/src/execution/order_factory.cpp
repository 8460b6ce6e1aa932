#include "simex/execution/order_factory.hpp"

#include <cmath>

namespace simex {

domain::Order makeMarketOrder(OrderIdGenerator& ids, const std::string& symbol,
                              const domain::Signal& signal,
                              double advisory_price, Timestamp timestamp) {
  domain::Order order;
  order.id = ids.next_id();
  order.symbol = symbol;
  order.side = signal.side;
  order.quantity = std::abs(signal.size);
  order.type = domain::OrderType::Market;
  order.price = advisory_price;
  order.timestamp = timestamp;
  return order;
}

std::vector<domain::Order> ordersForTarget(OrderIdGenerator& ids,
                                           double current_qty,
                                           double target_qty,
                                           const std::string& symbol,
                                           double price, Timestamp timestamp) {
  double delta = target_qty - current_qty;
  if (delta == 0.0) {
    return {};
  }

  domain::Order order;
  order.id = ids.next_id();
  order.symbol = symbol;
  order.side = (delta > 0.0) ? domain::Side::Buy : domain::Side::Sell;
  order.quantity = std::abs(delta);
  order.type = domain::OrderType::Market;
  order.price = price;
  order.timestamp = timestamp;
  return {order};
}

}  // namespace simex
