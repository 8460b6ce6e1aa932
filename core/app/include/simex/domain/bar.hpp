#pragma once

#include "simex/time/time_utils.hpp"

namespace simex {
namespace domain {

// -----------------------------------------------------------------------------
// Bar — one OHLCV observation for a fixed interval
// -----------------------------------------------------------------------------
//
// @details
// Produced by the historical replay (CSV) or a live MarketDataStream and
// consumed by the strategy and the drivers. The drivers mark and fill at
// `close`. Plain value type; safe to copy across the stream → worker queue.
// -----------------------------------------------------------------------------
struct Bar {
  Timestamp timestamp{};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
};

}  // namespace domain
}  // namespace simex
