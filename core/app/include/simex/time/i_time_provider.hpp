#pragma once

#include <cstdint>

namespace simex {

// -----------------------------------------------------------------------------
// ITimeProvider — source of "now" for orders and trades
// -----------------------------------------------------------------------------
//
// @brief  Abstracts the current time away from std::chrono::system_clock.
//
// @details
// The backtest must stamp orders and fills with the time of the bar being
// replayed, not the wall clock, or two runs over the same data would produce
// different ledgers. The live runner wants the wall clock. Components take a
// `const ITimeProvider&` and never ask which one they got:
//   - LiveTimeProvider       → system_clock.
//   - SimulationTimeProvider → whatever the replay loop last advanced it to.
//
// Thread-safety contract:
//   now_ms() may be called concurrently from any thread.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Epoch milliseconds. May be 0 for a simulation clock that has not been
  // advanced yet.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace simex
