#pragma once

#include "simex/domain/bar.hpp"

#include <functional>
#include <string>

namespace simex {

// -----------------------------------------------------------------------------
// IMarketDataStream — cancellable push source of live bars
// -----------------------------------------------------------------------------
//
// @brief  Delivers bars to a sink callback from the stream's own thread.
//
// @details
// start() returns immediately; bars arrive on a thread owned by the stream.
// The sink must not block for long. The live runner binds it to
// BarWorker::submit(), which only enqueues.
//
// stop() stops delivery, releases any socket and joins the stream thread.
// After stop() returns the sink is never called again. Both calls are
// idempotent and made from the owning thread.
// -----------------------------------------------------------------------------
class IMarketDataStream {
 public:
  using BarSink = std::function<void(domain::Bar)>;

  virtual ~IMarketDataStream() = default;

  virtual void start(BarSink sink) = 0;
  virtual void stop() = 0;

  virtual std::string name() const = 0;
};

}  // namespace simex
