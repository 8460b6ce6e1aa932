#pragma once

#include "simex/config/engine_config.hpp"
#include "simex/domain/bar.hpp"
#include "simex/domain/portfolio_state.hpp"
#include "simex/domain/trade.hpp"
#include "simex/engine/bar_pipeline.hpp"
#include "simex/strategy/i_strategy.hpp"

#include <string>
#include <vector>

namespace simex {

// -----------------------------------------------------------------------------
// BacktestResult — output of one replay
// -----------------------------------------------------------------------------
//
// @details
// final_state.equity_curve has exactly one point per input bar, at the bar's
// timestamp. outcomes[i] is what the pipeline did with bars[i].
// -----------------------------------------------------------------------------
struct BacktestResult {
  domain::PortfolioState final_state;
  std::vector<domain::Trade> trades;
  std::vector<BarOutcome> outcomes;
  bool halted{false};
  std::string halt_reason;
};

// -----------------------------------------------------------------------------
// BacktestEngine — synchronous driver over an ordered bar sequence
// -----------------------------------------------------------------------------
//
// @brief  Replays bars through BarPipeline and marks the portfolio to the
//         close after every bar.
//
// @details
// Each run() builds its own Portfolio, RiskManager, PaperBroker, order id
// generator and SimulationTimeProvider, so runs never share state. The
// clock is advanced to every bar's timestamp before the bar is processed;
// orders and trades therefore carry replay time and the result is fully
// deterministic for a deterministic strategy.
//
// Per bar:
//   1. clock.advance_time(bar)
//   2. pipeline.process(bar)
//   3. equity point (bar.timestamp, markToMarket({symbol: close})), always
//
// run() throws std::invalid_argument, before processing anything, if the
// bar timestamps are not strictly ascending. Per-bar problems never throw.
//
// Thread model:
//   Single-threaded. run() does not return until the sequence is exhausted.
// -----------------------------------------------------------------------------
class BacktestEngine {
 public:
  // Throws ConfigError if the config does not validate.
  explicit BacktestEngine(EngineConfig config);

  BacktestResult run(const std::vector<domain::Bar>& bars,
                     IStrategy& strategy) const;

  const EngineConfig& config() const { return config_; }

 private:
  EngineConfig config_;
};

// Throws std::invalid_argument naming the first out-of-order index.
void requireAscending(const std::vector<domain::Bar>& bars);

PipelineSettings pipelineSettings(const EngineConfig& config);

}  // namespace simex
