#pragma once

#include "simex/data/i_market_data_stream.hpp"
#include "simex/data/synthetic_bar_generator.hpp"
#include "simex/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace simex {

// -----------------------------------------------------------------------------
// SyntheticBarStream — emits one random-walk bar per poll interval
// -----------------------------------------------------------------------------
//
// @details
// Used on its own for offline paper sessions and by ZmqBarStream as its
// degraded mode. The wait between bars is a condition-variable wait, so
// stop() returns without waiting out the interval.
// -----------------------------------------------------------------------------
class SyntheticBarStream final : public IMarketDataStream {
 public:
  SyntheticBarStream(const ITimeProvider& clock,
                     std::chrono::milliseconds interval,
                     std::uint32_t seed = 42);

  ~SyntheticBarStream() override;

  SyntheticBarStream(const SyntheticBarStream&) = delete;
  SyntheticBarStream& operator=(const SyntheticBarStream&) = delete;

  void start(BarSink sink) override;
  void stop() override;

  std::string name() const override { return "SyntheticBarStream"; }

  std::uint64_t emittedCount() const { return emitted_.load(); }

 private:
  void run();

  const ITimeProvider& clock_;
  std::chrono::milliseconds interval_;
  SyntheticBarGenerator generator_;
  BarSink sink_;

  std::thread thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  std::atomic<std::uint64_t> emitted_{0};
};

}  // namespace simex
