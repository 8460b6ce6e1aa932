#include "simex/engine/live_paper_runner.hpp"
#include "simex/engine/backtest_engine.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace simex {

namespace {

EngineConfig validated(EngineConfig config) {
  validate(config);
  return config;
}

std::string trimmed(const std::string& s) {
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto begin = std::find_if(s.begin(), s.end(), not_space);
  auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
  return (begin < end) ? std::string(begin, end) : std::string();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build the session's components; nothing runs yet
// -----------------------------------------------------------------------------
LivePaperRunner::LivePaperRunner(EngineConfig config, IStrategy& strategy,
                                 std::unique_ptr<IMarketDataStream> stream,
                                 const ITimeProvider& clock)
    : config_(validated(std::move(config))),
      strategy_(strategy),
      stream_(std::move(stream)),
      clock_(clock),
      portfolio_(config_.initial_cash),
      risk_(config_.risk),
      broker_(clock_, config_.execution.fee_rate),
      pipeline_(pipelineSettings(config_), strategy_, risk_, broker_,
                portfolio_, ids_, clock_) {
  if (!stream_) {
    throw std::invalid_argument("LivePaperRunner: stream must not be null");
  }

  worker_ = std::make_unique<BarWorker>(
      config_.live.queue_capacity,
      [this](const domain::Bar& bar) { handleBar(bar); });

  if (!config_.live.status_cmd_endpoint.empty() ||
      !config_.live.status_pub_endpoint.empty()) {
    server_ = std::make_unique<SessionServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.live.status_cmd_endpoint, config_.live.status_pub_endpoint);
  }

  status_.cash = config_.initial_cash;
  status_.equity = config_.initial_cash;
}

LivePaperRunner::~LivePaperRunner() {
  if (started_.load()) {
    stop();
  }
}

// -----------------------------------------------------------------------------
// start(): server, worker, then the stream last so every consumer is live
// before the first bar arrives
// -----------------------------------------------------------------------------
void LivePaperRunner::start() {
  if (started_.exchange(true)) {
    return;
  }

  start_time_ = ms_to_timestamp(clock_.now_ms());
  {
    std::lock_guard lock(status_mutex_);
    status_.running = true;
  }

  if (server_) {
    server_->start();
  }
  worker_->start();
  stream_->start([this](domain::Bar bar) {
    if (!worker_->submit(std::move(bar))) {
      std::cerr << "[LivePaperRunner] bar refused, session is stopping.\n";
    }
  });

  std::cout << "[LivePaperRunner] session started. symbol=" << config_.symbol
            << " cash=" << config_.initial_cash
            << " stream=" << stream_->name()
            << " strategy=" << strategy_.name() << "\n";
}

// -----------------------------------------------------------------------------
// stop(): cancel and collect the final state
// -----------------------------------------------------------------------------
LiveSessionState LivePaperRunner::stop() {
  if (stopped_.exchange(true)) {
    return final_state_;
  }

  stream_->stop();
  worker_->stop();
  if (server_) {
    server_->stop();
  }

  // All threads that touch the session are joined; plain reads are safe.
  final_state_.start_time = start_time_;
  final_state_.portfolio = portfolio_.snapshot();
  final_state_.trades = broker_.trades();
  final_state_.bars_processed = processed_;
  final_state_.bars_dropped = dropped_;
  final_state_.bars_discarded = worker_->discardedCount();
  final_state_.halted = risk_.isHalted();
  final_state_.halt_reason = risk_.haltReason();

  {
    std::lock_guard lock(status_mutex_);
    status_.running = false;
  }

  std::cout << "[LivePaperRunner] session stopped. bars=" << processed_
            << " dropped=" << dropped_
            << " discarded=" << final_state_.bars_discarded
            << " trades=" << final_state_.trades.size()
            << " cash=" << final_state_.portfolio.cash
            << (final_state_.halted ? " (HALTED)" : "") << "\n";
  return final_state_;
}

// -----------------------------------------------------------------------------
// handleBar(): runs on the bar worker, one bar at a time
// -----------------------------------------------------------------------------
void LivePaperRunner::handleBar(const domain::Bar& bar) {
  if (!portfolio_.acceptsTimestamp(bar.timestamp)) {
    ++dropped_;
    std::cerr << "[LivePaperRunner] dropping stale bar at "
              << timestamp_to_ms(bar.timestamp) << " ms.\n";
    std::lock_guard lock(status_mutex_);
    status_.bars_dropped = dropped_;
    status_cv_.notify_all();
    return;
  }

  BarOutcome outcome = pipeline_.process(bar);
  if (outcome == BarOutcome::Filled && server_ && pipeline_.lastTrade()) {
    server_->publish(*pipeline_.lastTrade());
  }

  double equity = portfolio_.markToMarket({{config_.symbol, bar.close}});
  if (!portfolio_.recordEquity(bar.timestamp, equity)) {
    std::cerr << "[LivePaperRunner] equity point at "
              << timestamp_to_ms(bar.timestamp) << " ms refused.\n";
  }
  ++processed_;

  if (risk_.isHalted()) {
    publishHaltOnce();
  }
  refreshStatus(equity);
}

void LivePaperRunner::refreshStatus(double equity) {
  std::lock_guard lock(status_mutex_);
  status_.halted = risk_.isHalted();
  status_.cash = portfolio_.cash();
  status_.equity = equity;
  status_.positions = portfolio_.positions();
  status_.trades = broker_.trades().size();
  status_.bars_processed = processed_;
  status_.bars_dropped = dropped_;
  status_cv_.notify_all();
}

void LivePaperRunner::publishHaltOnce() {
  if (halt_published_.exchange(true)) {
    return;
  }
  std::string reason = risk_.haltReason();
  std::cerr << "[LivePaperRunner] session HALTED: " << reason
            << ". No further trades this session.\n";
  if (server_) {
    server_->publish(HaltNotice{reason, ms_to_timestamp(clock_.now_ms())});
  }
}

LiveStatus LivePaperRunner::status() const {
  std::lock_guard lock(status_mutex_);
  LiveStatus copy = status_;
  copy.halted = risk_.isHalted();
  return copy;
}

bool LivePaperRunner::waitForBars(std::uint64_t count,
                                  std::chrono::milliseconds timeout) {
  std::unique_lock lock(status_mutex_);
  return status_cv_.wait_for(lock, timeout, [this, count] {
    return status_.bars_processed + status_.bars_dropped >= count;
  });
}

bool LivePaperRunner::halt(const std::string& reason) {
  bool transitioned = risk_.haltTrading(reason);
  if (risk_.isHalted()) {
    publishHaltOnce();
  }
  return transitioned;
}

// -----------------------------------------------------------------------------
// executeCommand(): PING / STATUS / HALT
// -----------------------------------------------------------------------------
std::string LivePaperRunner::executeCommand(const std::string& cmd) {
  std::string command = trimmed(cmd);

  if (command == "PING") {
    return nlohmann::json{{"ok", true}, {"reply", "PONG"}}.dump();
  }
  if (command == "STATUS") {
    return statusJson().dump();
  }
  if (command == "HALT") {
    bool transitioned = halt("manual halt via control command");
    std::cout << "[LivePaperRunner] HALT command received"
              << (transitioned ? "." : " (already halted).") << "\n";
    return nlohmann::json{
        {"ok", true}, {"halted", true}, {"transitioned", transitioned}}
        .dump();
  }

  std::cerr << "[LivePaperRunner] unknown command: " << command << "\n";
  return nlohmann::json{{"ok", false}, {"error", "unknown command: " + command}}
      .dump();
}

nlohmann::json LivePaperRunner::statusJson() const {
  LiveStatus s = status();

  nlohmann::json positions = nlohmann::json::object();
  for (const auto& [symbol, pos] : s.positions) {
    positions[symbol] = {{"quantity", pos.quantity},
                         {"average_price", pos.average_price}};
  }

  nlohmann::json j;
  j["ok"] = true;
  j["running"] = s.running;
  j["halted"] = s.halted;
  j["halt_reason"] = risk_.haltReason();
  j["cash"] = s.cash;
  j["equity"] = s.equity;
  j["positions"] = positions;
  j["trades"] = s.trades;
  j["bars_processed"] = s.bars_processed;
  j["bars_dropped"] = s.bars_dropped;
  return j;
}

}  // namespace simex
