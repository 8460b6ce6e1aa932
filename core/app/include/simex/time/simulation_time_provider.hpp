#pragma once

#include "simex/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace simex {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — replay-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose time is set by the backtest loop.
//
// @details
// BacktestEngine calls advance_time(bar timestamp) before running the
// pipeline for a bar, so every order and trade created while handling that
// bar carries the bar's time. Identical bar files therefore produce identical
// ledgers.
//
// Monotonicity is the caller's job; BacktestEngine validates ordering of the
// whole sequence up front.
//
// Thread model:
//   Single writer (the replay loop), any number of readers. The value is an
//   atomic so readers never see a torn write.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace simex
