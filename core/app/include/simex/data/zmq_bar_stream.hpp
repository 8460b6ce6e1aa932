#pragma once

#include "simex/data/i_market_data_stream.hpp"
#include "simex/data/synthetic_bar_generator.hpp"
#include "simex/time/i_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace simex {

// -----------------------------------------------------------------------------
// decodeBar — JSON wire format of a live bar
// -----------------------------------------------------------------------------
//
// @brief  Parses one published bar:
//
//   {
//     "timestamp_ms": 1700000000000,   // int64 epoch milliseconds
//     "open": 100.0, "high": 101.5, "low": 99.5, "close": 101.0,
//     "volume": 1200.0
//   }
//
// @return std::nullopt (after logging) on malformed JSON or a missing or
//         mistyped field. Never throws.
// -----------------------------------------------------------------------------
std::optional<domain::Bar> decodeBar(const std::string& payload);

struct ZmqStreamOptions {
  std::string endpoint{"tcp://127.0.0.1:5555"};

  // No data for this long counts as a dead connection.
  std::chrono::milliseconds stale_timeout{5000};
  std::chrono::milliseconds reconnect_delay{1000};

  // Consecutive reconnects without receiving a bar before the stream gives
  // up on the socket and switches permanently to synthetic bars.
  int max_reconnect_attempts{5};

  // Bar interval once degraded to synthetic data.
  std::chrono::milliseconds poll_interval{1000};

  // How often recv() returns to check for cancellation.
  std::chrono::milliseconds recv_timeout{100};
};

// -----------------------------------------------------------------------------
// ZmqBarStream — ZeroMQ SUB feed of JSON bars with reconnect and fallback
// -----------------------------------------------------------------------------
//
// @brief  Receives bars from a publisher on a dedicated thread and pushes
//         each decoded bar into the sink.
//
// @details
// Connection lifecycle (all on the stream thread):
//   1. Open a SUB socket (subscribe-all, ZMQ_RCVTIMEO = recv_timeout,
//      ZMQ_LINGER = 0) and connect to the endpoint.
//   2. recv() loop. A decoded bar resets the staleness timer and the
//      reconnect counter. Undecodable payloads are logged and skipped.
//   3. After stale_timeout without a bar, or on a zmq::error_t other than
//      EINTR, close the socket, wait reconnect_delay and go to 1.
//   4. Once max_reconnect_attempts consecutive reconnects have not produced a
//      single bar, switch to degraded mode: the socket stays closed and a
//      SyntheticBarGenerator feeds the sink every poll_interval until stop().
//      The walk resumes from the close and timestamp of the last real bar,
//      so prices stay continuous and timestamps keep ascending.
//
// Cancellation:
//   stop() sets the stop flag and wakes any delay wait. The stream thread
//   notices within recv_timeout, closes its socket and exits; stop() joins
//   it. The sink is never called after stop() returns.
//
// Ownership:
//   Owns the zmq::context_t. The socket is owned and used exclusively by the
//   stream thread.
// -----------------------------------------------------------------------------
class ZmqBarStream final : public IMarketDataStream {
 public:
  ZmqBarStream(const ITimeProvider& clock, ZmqStreamOptions options);

  // Calls stop().
  ~ZmqBarStream() override;

  ZmqBarStream(const ZmqBarStream&) = delete;
  ZmqBarStream& operator=(const ZmqBarStream&) = delete;
  ZmqBarStream(ZmqBarStream&&) = delete;
  ZmqBarStream& operator=(ZmqBarStream&&) = delete;

  void start(BarSink sink) override;
  void stop() override;

  std::string name() const override { return "ZmqBarStream"; }

  bool degraded() const { return degraded_.load(); }
  int reconnectAttempts() const { return reconnect_attempts_.load(); }
  std::uint64_t receivedCount() const { return received_.load(); }
  std::uint64_t syntheticCount() const { return synthetic_.load(); }

 private:
  void run();
  void openSocket();
  void closeSocket();
  bool stopRequested();

  // Sleeps for `delay` unless stop() is called first. Returns false if
  // stopped.
  bool waitFor(std::chrono::milliseconds delay);

  void runDegraded();

  const ITimeProvider& clock_;
  ZmqStreamOptions options_;
  BarSink sink_;

  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> socket_;

  SyntheticBarGenerator fallback_;
  std::optional<domain::Bar> last_bar_;  // stream thread only

  std::thread thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_{false};

  std::atomic<bool> degraded_{false};
  std::atomic<int> reconnect_attempts_{0};
  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> synthetic_{0};
};

}  // namespace simex
