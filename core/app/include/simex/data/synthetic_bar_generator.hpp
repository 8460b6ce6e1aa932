#pragma once

#include "simex/domain/bar.hpp"

#include <cstdint>
#include <random>

namespace simex {

// -----------------------------------------------------------------------------
// SyntheticBarGenerator — seeded random-walk bar source
// -----------------------------------------------------------------------------
//
// @brief  Produces OHLCV bars whose close follows a geometric random walk
//         starting at `start_price` (100 by default).
//
// @details
// next(now_ms) stamps the bar with max(now_ms, previous + 1) so the sequence
// is strictly ascending even when the clock stalls or steps backwards.
// Deterministic for a given seed and sequence of now_ms values.
// -----------------------------------------------------------------------------
class SyntheticBarGenerator {
 public:
  explicit SyntheticBarGenerator(std::uint32_t seed = 42,
                                 double start_price = 100.0,
                                 double volatility = 0.002);

  domain::Bar next(std::int64_t now_ms);

  // Continues the walk from an observed bar: the next bar opens at `close`
  // and is stamped after `ts_ms`. A close that is not a positive finite
  // price is ignored and only the timestamp floor moves.
  void resume(double close, std::int64_t ts_ms);

  double lastClose() const { return last_close_; }

 private:
  std::mt19937 rng_;
  std::normal_distribution<double> step_;
  std::uniform_real_distribution<double> volume_;
  double last_close_;
  std::int64_t last_ts_ms_{0};
};

}  // namespace simex
