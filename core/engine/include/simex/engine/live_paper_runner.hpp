#pragma once

#include "simex/concurrent/bar_worker.hpp"
#include "simex/concurrent/order_id_generator.hpp"
#include "simex/config/engine_config.hpp"
#include "simex/data/i_market_data_stream.hpp"
#include "simex/engine/bar_pipeline.hpp"
#include "simex/engine/live_session_state.hpp"
#include "simex/execution/paper_broker.hpp"
#include "simex/network/session_server.hpp"
#include "simex/portfolio/portfolio.hpp"
#include "simex/risk/risk_manager.hpp"
#include "simex/strategy/i_strategy.hpp"
#include "simex/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace simex {

// -----------------------------------------------------------------------------
// LivePaperRunner — asynchronous driver over a live bar stream
// -----------------------------------------------------------------------------
//
// @brief  Feeds bars from an IMarketDataStream through the same BarPipeline
//         the backtest uses, fills with the PaperBroker, and keeps a live
//         session until stop().
//
// @details
// Threads (between start() and stop()):
//
//   stream thread    IMarketDataStream → worker_.submit(bar)   (enqueue only)
//   bar worker       handleBar(): pipeline + equity point, one bar at a time
//   session server   optional; PING / STATUS / HALT and telemetry
//   caller           start(), stop(), status(), executeCommand()
//
// The Portfolio, the broker's ledger, the strategy and the pipeline are
// touched only by the bar worker. Other threads read the LiveStatus copy
// published after each bar (under status_mutex_) and the RiskManager's
// atomic halt state.
//
// handleBar():
//   1. Bars not strictly after the last equity point are dropped (logged).
//   2. pipeline.process(bar); a fill is published as telemetry.
//   3. Equity point (bar.timestamp, markToMarket({symbol: close})). This is
//      what arms the daily-loss rule in a live session.
//   4. First observation of Halted publishes a HaltNotice.
//   5. LiveStatus refreshed.
//
// stop() order: stream (no more bars), worker (in-flight bar completes,
// queued bars discarded), server. It then returns the final session state.
//
// Ownership:
//   Owns the stream, the portfolio, risk manager, broker, id generator,
//   pipeline, worker and server. Borrows the strategy and the clock, which
//   must outlive the runner.
// -----------------------------------------------------------------------------
class LivePaperRunner {
 public:
  // Throws ConfigError if the config does not validate.
  LivePaperRunner(EngineConfig config, IStrategy& strategy,
                  std::unique_ptr<IMarketDataStream> stream,
                  const ITimeProvider& clock);

  // Calls stop() if still running.
  ~LivePaperRunner();

  LivePaperRunner(const LivePaperRunner&) = delete;
  LivePaperRunner& operator=(const LivePaperRunner&) = delete;
  LivePaperRunner(LivePaperRunner&&) = delete;
  LivePaperRunner& operator=(LivePaperRunner&&) = delete;

  // Starts server, worker and stream, in that order. A runner can be
  // started once.
  void start();

  // Cancels the session and returns its final state. Later calls return the
  // same state again.
  LiveSessionState stop();

  LiveStatus status() const;

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  Control surface used by the SessionServer (and tests).
  //
  //   PING    {"ok":true,"reply":"PONG"}
  //   STATUS  {"ok":true,"running":..,"halted":..,"cash":..,"equity":..,
  //            "positions":{sym:{"quantity":..,"average_price":..}},
  //            "trades":..,"bars_processed":..,"bars_dropped":..}
  //   HALT    manual halt; {"ok":true,"halted":true,"transitioned":bool}
  //
  // Anything else gets {"ok":false,"error":"unknown command: ..."}.
  // Surrounding whitespace is ignored; the match is case-sensitive.
  // Thread-safety: callable from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Irreversible. Returns true if this call performed the transition.
  bool halt(const std::string& reason);

  bool isHalted() const { return risk_.isHalted(); }

  // Blocks until at least `count` bars have been handled (processed or
  // dropped) or the timeout expires. Returns whether the count was reached.
  bool waitForBars(std::uint64_t count, std::chrono::milliseconds timeout);

 private:
  void handleBar(const domain::Bar& bar);
  void publishHaltOnce();
  void refreshStatus(double equity);
  nlohmann::json statusJson() const;

  const EngineConfig config_;
  IStrategy& strategy_;
  std::unique_ptr<IMarketDataStream> stream_;
  const ITimeProvider& clock_;

  Portfolio portfolio_;
  RiskManager risk_;
  PaperBroker broker_;
  OrderIdGenerator ids_;
  BarPipeline pipeline_;

  std::unique_ptr<SessionServer> server_;
  std::unique_ptr<BarWorker> worker_;

  Timestamp start_time_{};
  std::uint64_t processed_{0};  // bar worker only
  std::uint64_t dropped_{0};    // bar worker only
  std::atomic<bool> started_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<bool> halt_published_{false};
  LiveSessionState final_state_;

  mutable std::mutex status_mutex_;
  std::condition_variable status_cv_;
  LiveStatus status_;
};

}  // namespace simex
