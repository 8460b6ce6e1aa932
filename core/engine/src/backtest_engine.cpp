#include "simex/engine/backtest_engine.hpp"
#include "simex/concurrent/order_id_generator.hpp"
#include "simex/execution/paper_broker.hpp"
#include "simex/portfolio/portfolio.hpp"
#include "simex/risk/risk_manager.hpp"
#include "simex/time/simulation_time_provider.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace simex {

void requireAscending(const std::vector<domain::Bar>& bars) {
  for (std::size_t i = 1; i < bars.size(); ++i) {
    if (!(bars[i - 1].timestamp < bars[i].timestamp)) {
      throw std::invalid_argument(
          "BacktestEngine: bar timestamps must be strictly ascending (bar " +
          std::to_string(i) + " at " +
          std::to_string(timestamp_to_ms(bars[i].timestamp)) +
          " ms is not after bar " + std::to_string(i - 1) + ")");
    }
  }
}

PipelineSettings pipelineSettings(const EngineConfig& config) {
  PipelineSettings settings;
  settings.symbol = config.symbol;
  settings.sizing_fraction = config.sizing.fraction;
  settings.equity_basis = config.sizing.equity_basis;
  settings.slippage = config.execution.slippage;
  return settings;
}

BacktestEngine::BacktestEngine(EngineConfig config)
    : config_(std::move(config)) {
  validate(config_);
}

// -----------------------------------------------------------------------------
// run(): replay every bar, one equity point per bar
// -----------------------------------------------------------------------------
BacktestResult BacktestEngine::run(const std::vector<domain::Bar>& bars,
                                   IStrategy& strategy) const {
  requireAscending(bars);

  std::int64_t start_ms =
      bars.empty() ? 0 : timestamp_to_ms(bars.front().timestamp);
  SimulationTimeProvider clock(start_ms);
  Portfolio portfolio(config_.initial_cash);
  RiskManager risk(config_.risk);
  PaperBroker broker(clock, config_.execution.fee_rate);
  OrderIdGenerator ids;

  BarPipeline pipeline(pipelineSettings(config_), strategy, risk, broker,
                       portfolio, ids, clock);

  std::cout << "[BacktestEngine] replaying " << bars.size() << " bar(s) of "
            << config_.symbol << " with strategy " << strategy.name() << "\n";

  BacktestResult result;
  result.outcomes.reserve(bars.size());

  for (const auto& bar : bars) {
    clock.advance_time(timestamp_to_ms(bar.timestamp));

    result.outcomes.push_back(pipeline.process(bar));

    double equity = portfolio.markToMarket({{config_.symbol, bar.close}});
    portfolio.recordEquity(bar.timestamp, equity);
  }

  result.final_state = portfolio.snapshot();
  result.trades = broker.trades();
  result.halted = risk.isHalted();
  result.halt_reason = risk.haltReason();

  double final_equity = result.final_state.equity_curve.empty()
                            ? config_.initial_cash
                            : result.final_state.equity_curve.back().equity;
  std::cout << "[BacktestEngine] done. bars=" << bars.size()
            << " trades=" << result.trades.size()
            << " cash=" << result.final_state.cash
            << " final_equity=" << final_equity
            << (result.halted ? " (HALTED)" : "") << "\n";
  return result;
}

}  // namespace simex
