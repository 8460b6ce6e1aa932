// -----------------------------------------------------------------------------
// simex — single executable entry point.
//
//   simex backtest <config.json> <bars.csv>
//       Replays the CSV through BacktestEngine with the configured
//       SmaCrossStrategy and prints the performance summary as JSON.
//
//   simex live <config.json>
//       Runs a LivePaperRunner on the configured stream (ZeroMQ bars with
//       synthetic fallback, or synthetic only) until Ctrl-C, then prints the
//       final session summary as JSON.
//
// Thread layout (live):
//   main thread        → start(), wait for SIGINT, stop()
//   stream thread      → ZmqBarStream / SyntheticBarStream
//   bar worker         → BarPipeline, one bar at a time
//   session server     → optional PING / STATUS / HALT and telemetry
// -----------------------------------------------------------------------------

#include "simex/config/engine_config.hpp"
#include "simex/data/historical_replay.hpp"
#include "simex/data/synthetic_bar_stream.hpp"
#include "simex/data/zmq_bar_stream.hpp"
#include "simex/engine/backtest_engine.hpp"
#include "simex/engine/live_paper_runner.hpp"
#include "simex/report/performance_report.hpp"
#include "simex/strategy/sma_cross_strategy.hpp"
#include "simex/time/live_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// Set by the SIGINT handler, polled by the live mode's wait loop. The only
// global in the program; a sig_atomic_t store is async-signal-safe.
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_stop_requested = 0;

static void sigint_handler(int /*signum*/) { g_stop_requested = 1; }

namespace {

void printUsage() {
  std::cerr << "usage:\n"
            << "  simex backtest <config.json> <bars.csv>\n"
            << "  simex live <config.json>\n";
}

int runBacktest(const std::string& config_path, const std::string& csv_path) {
  simex::EngineConfig config = simex::loadEngineConfig(config_path);
  std::vector<simex::domain::Bar> bars = simex::loadBarsCsv(csv_path);
  std::cout << "[main] loaded " << bars.size() << " bar(s) from " << csv_path
            << "\n";

  simex::SmaCrossStrategy strategy(config.symbol, config.strategy.short_window,
                                   config.strategy.long_window);
  simex::BacktestEngine engine(config);
  simex::BacktestResult result = engine.run(bars, strategy);

  nlohmann::json summary = simex::toJson(
      simex::summarize(result.final_state.equity_curve, result.trades,
                       config.report.n_trials));
  summary["halted"] = result.halted;
  if (result.halted) {
    summary["halt_reason"] = result.halt_reason;
  }
  std::cout << summary.dump(2) << "\n";
  return 0;
}

int runLive(const std::string& config_path) {
  simex::EngineConfig config = simex::loadEngineConfig(config_path);
  simex::LiveTimeProvider clock;

  std::unique_ptr<simex::IMarketDataStream> stream;
  if (config.live.source == simex::LiveSource::Synthetic) {
    stream = std::make_unique<simex::SyntheticBarStream>(
        clock, std::chrono::milliseconds(config.live.poll_interval_ms));
  } else {
    simex::ZmqStreamOptions options;
    options.endpoint = config.live.endpoint;
    options.stale_timeout =
        std::chrono::milliseconds(config.live.stale_timeout_ms);
    options.reconnect_delay =
        std::chrono::milliseconds(config.live.reconnect_delay_ms);
    options.max_reconnect_attempts = config.live.max_reconnect_attempts;
    options.poll_interval =
        std::chrono::milliseconds(config.live.poll_interval_ms);
    stream = std::make_unique<simex::ZmqBarStream>(clock, options);
  }

  simex::SmaCrossStrategy strategy(config.symbol, config.strategy.short_window,
                                   config.strategy.long_window);
  simex::LivePaperRunner runner(config, strategy, std::move(stream), clock);

  std::signal(SIGINT, sigint_handler);
  runner.start();
  std::cout << "[main] live paper session running. Press Ctrl-C to stop.\n";

  while (g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  simex::LiveSessionState state = runner.stop();

  nlohmann::json summary =
      simex::toJson(simex::summarize(state.portfolio.equity_curve, state.trades,
                                     config.report.n_trials));
  summary["bars_processed"] = state.bars_processed;
  summary["bars_dropped"] = state.bars_dropped;
  summary["bars_discarded"] = state.bars_discarded;
  summary["cash"] = state.portfolio.cash;
  summary["halted"] = state.halted;
  if (state.halted) {
    summary["halt_reason"] = state.halt_reason;
  }
  std::cout << summary.dump(2) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    printUsage();
    return 2;
  }

  std::string mode = argv[1];
  try {
    if (mode == "backtest" && argc == 4) {
      return runBacktest(argv[2], argv[3]);
    }
    if (mode == "live" && argc == 3) {
      return runLive(argv[2]);
    }
  } catch (const simex::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }

  printUsage();
  return 2;
}
