#pragma once

#include "simex/concurrent/bounded_queue.hpp"
#include "simex/domain/bar.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <thread>

namespace simex {

// -----------------------------------------------------------------------------
// BarWorker — single-consumer ordered executor for one live session
// -----------------------------------------------------------------------------
//
// @brief  Owns one worker thread that pops bars from a BoundedQueue and runs
//         the session's handler on each, one at a time, in arrival order.
//
// @details
// The portfolio, the ledger and the risk manager's halt state belong to the
// session and have no locking of their own. Funnelling every bar through one
// thread is what makes that safe: handling of bar N+1 cannot start until the
// handler for bar N has returned.
//
// The stream thread only ever calls submit(), which blocks when the queue is
// full (backpressure) but never waits for a handler to finish.
//
// Cancellation (stop()):
//   1. The queue is closed, so submit() fails fast from then on.
//   2. A bar whose handler is running completes normally.
//   3. Bars still queued are discarded without being handled, so no bar is
//      ever partially applied.
//   4. The thread is joined.
//
// An exception escaping the handler is caught, logged and counted; the
// worker moves on to the next bar.
//
// Thread model:
//   start()/stop() from the owning thread; submit() from any thread.
// -----------------------------------------------------------------------------
class BarWorker {
 public:
  using Handler = std::function<void(const domain::Bar&)>;

  BarWorker(std::size_t capacity, Handler handler);

  // Calls stop().
  ~BarWorker();

  BarWorker(const BarWorker&) = delete;
  BarWorker& operator=(const BarWorker&) = delete;
  BarWorker(BarWorker&&) = delete;
  BarWorker& operator=(BarWorker&&) = delete;

  // Spawns the worker thread. No-op if already running.
  void start();

  // See "Cancellation" above. Idempotent. A stopped worker cannot be
  // restarted because its queue stays closed.
  void stop();

  // Enqueues bar, blocking while the queue is full. Returns false once the
  // worker has been stopped.
  bool submit(domain::Bar bar);

  std::uint64_t handledCount() const { return handled_.load(); }
  std::uint64_t failedCount() const { return failed_.load(); }
  std::uint64_t discardedCount() const { return discarded_.load(); }
  std::size_t pending() const { return queue_.size(); }

 private:
  void run();

  BoundedQueue<domain::Bar> queue_;
  Handler handler_;
  std::thread thread_;
  std::atomic<bool> cancelled_{false};
  std::atomic<std::uint64_t> handled_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> discarded_{0};
};

}  // namespace simex
