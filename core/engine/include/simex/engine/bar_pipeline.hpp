#pragma once

#include "simex/concurrent/order_id_generator.hpp"
#include "simex/domain/bar.hpp"
#include "simex/domain/trade.hpp"
#include "simex/execution/i_broker.hpp"
#include "simex/execution/slippage.hpp"
#include "simex/portfolio/portfolio.hpp"
#include "simex/risk/position_sizer.hpp"
#include "simex/risk/risk_manager.hpp"
#include "simex/strategy/i_strategy.hpp"
#include "simex/time/i_time_provider.hpp"

#include <optional>
#include <string>

namespace simex {

// -----------------------------------------------------------------------------
// BarOutcome — what happened to one bar inside the pipeline
// -----------------------------------------------------------------------------
//   NoSignal            strategy returned nothing
//   Filled              a trade was executed and applied
//   RejectedPreSizing   first risk gate returned null (not halted)
//   RejectedPostSizing  second risk gate returned null (not halted)
//   InvalidSize         sizer produced a non-finite or non-positive size
//   OversellRejected    SELL larger than the holding under OversellPolicy::Reject
//   ExecutionFailed     broker reported failure
//   Halted              the risk manager is (or has just become) halted
// -----------------------------------------------------------------------------
enum class BarOutcome {
  NoSignal,
  Filled,
  RejectedPreSizing,
  RejectedPostSizing,
  InvalidSize,
  OversellRejected,
  ExecutionFailed,
  Halted,
};

const char* barOutcomeToString(BarOutcome outcome);

struct PipelineSettings {
  std::string symbol{"asset"};
  double sizing_fraction{0.01};
  EquityBasis equity_basis{EquityBasis::CostBasis};
  SlippageModel slippage;
};

// -----------------------------------------------------------------------------
// BarPipeline — signal → risk → size → risk → fill → portfolio, for one bar
// -----------------------------------------------------------------------------
//
// @brief  The per-bar trading logic shared by BacktestEngine and
//         LivePaperRunner, so both drivers behave identically.
//
// @details
// process(bar) steps:
//   1. strategy.generateSignal(bar, portfolio.view())
//   2. risk.approve(..., PreSizing) on the raw signal
//   3. fixedFractional() at the bar close; the result replaces the size
//   4. risk.approve(..., PostSizing) on the sized signal
//   5. oversell check (only under OversellPolicy::Reject)
//   6. fill price = slippage.fillPrice(side, close); Market order with a
//      fresh id, stamped from the clock
//   7. broker.execute(); portfolio.applyTrade(); strategy.onFill()
//
// Every early exit is reported through the returned BarOutcome and logged.
// Nothing is mutated before step 7, so a rejected bar leaves the portfolio
// untouched. The equity-curve entry is the driver's job.
//
// Thread model:
//   Not thread-safe. Runs on the driver's single bar-handling thread.
//
// Ownership:
//   Holds references only; every collaborator must outlive the pipeline.
// -----------------------------------------------------------------------------
class BarPipeline {
 public:
  BarPipeline(PipelineSettings settings, IStrategy& strategy,
              RiskManager& risk, IBroker& broker, Portfolio& portfolio,
              OrderIdGenerator& ids, const ITimeProvider& clock);

  BarPipeline(const BarPipeline&) = delete;
  BarPipeline& operator=(const BarPipeline&) = delete;

  BarOutcome process(const domain::Bar& bar);

  // Trade produced by the most recent Filled outcome.
  const std::optional<domain::Trade>& lastTrade() const { return last_trade_; }

  const PipelineSettings& settings() const { return settings_; }

 private:
  BarOutcome rejected(ApprovalPhase phase) const;

  const PipelineSettings settings_;
  IStrategy& strategy_;
  RiskManager& risk_;
  IBroker& broker_;
  Portfolio& portfolio_;
  OrderIdGenerator& ids_;
  const ITimeProvider& clock_;

  std::optional<domain::Trade> last_trade_;
};

}  // namespace simex
