#include "simex/data/synthetic_bar_generator.hpp"
#include "simex/time/time_utils.hpp"

#include <algorithm>
#include <cmath>

namespace simex {

SyntheticBarGenerator::SyntheticBarGenerator(std::uint32_t seed,
                                             double start_price,
                                             double volatility)
    : rng_(seed),
      step_(0.0, volatility),
      volume_(10.0, 1000.0),
      last_close_(start_price) {}

domain::Bar SyntheticBarGenerator::next(std::int64_t now_ms) {
  std::int64_t ts = std::max(now_ms, last_ts_ms_ + 1);
  last_ts_ms_ = ts;

  double open = last_close_;
  double close = open * std::exp(step_(rng_));
  double wiggle = std::abs(step_(rng_)) * open;

  domain::Bar bar;
  bar.timestamp = ms_to_timestamp(ts);
  bar.open = open;
  bar.close = close;
  bar.high = std::max(open, close) + wiggle;
  bar.low = std::max(0.0, std::min(open, close) - wiggle);
  bar.volume = volume_(rng_);

  last_close_ = close;
  return bar;
}

void SyntheticBarGenerator::resume(double close, std::int64_t ts_ms) {
  if (std::isfinite(close) && close > 0.0) {
    last_close_ = close;
  }
  last_ts_ms_ = std::max(last_ts_ms_, ts_ms);
}

}  // namespace simex
