#include "simex/engine/bar_pipeline.hpp"
#include "simex/execution/order_factory.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace simex {

const char* barOutcomeToString(BarOutcome outcome) {
  switch (outcome) {
    case BarOutcome::NoSignal:           return "NoSignal";
    case BarOutcome::Filled:             return "Filled";
    case BarOutcome::RejectedPreSizing:  return "RejectedPreSizing";
    case BarOutcome::RejectedPostSizing: return "RejectedPostSizing";
    case BarOutcome::InvalidSize:        return "InvalidSize";
    case BarOutcome::OversellRejected:   return "OversellRejected";
    case BarOutcome::ExecutionFailed:    return "ExecutionFailed";
    case BarOutcome::Halted:             return "Halted";
  }
  return "Unknown";
}

BarPipeline::BarPipeline(PipelineSettings settings, IStrategy& strategy,
                         RiskManager& risk, IBroker& broker,
                         Portfolio& portfolio, OrderIdGenerator& ids,
                         const ITimeProvider& clock)
    : settings_(std::move(settings)),
      strategy_(strategy),
      risk_(risk),
      broker_(broker),
      portfolio_(portfolio),
      ids_(ids),
      clock_(clock) {}

BarOutcome BarPipeline::rejected(ApprovalPhase phase) const {
  if (risk_.isHalted()) {
    return BarOutcome::Halted;
  }
  return phase == ApprovalPhase::PreSizing ? BarOutcome::RejectedPreSizing
                                           : BarOutcome::RejectedPostSizing;
}

// -----------------------------------------------------------------------------
// process(): one bar through the full pipeline
// -----------------------------------------------------------------------------
BarOutcome BarPipeline::process(const domain::Bar& bar) {
  const domain::PortfolioState& state = portfolio_.view();
  const std::string& symbol = settings_.symbol;
  const double price = bar.close;

  std::optional<domain::Signal> signal = strategy_.generateSignal(bar, state);
  if (!signal) {
    return BarOutcome::NoSignal;
  }
  if (!std::isfinite(signal->size)) {
    std::cerr << "[BarPipeline] " << strategy_.name()
              << " requested non-finite size " << signal->size
              << ". Signal dropped.\n";
    return BarOutcome::InvalidSize;
  }

  // --- First gate: raw signal --------------------------------------------
  auto approved =
      risk_.approve(*signal, state, price, symbol, ApprovalPhase::PreSizing);
  if (!approved) {
    return rejected(ApprovalPhase::PreSizing);
  }

  // --- Sizing --------------------------------------------------------------
  domain::MarkPrices marks{{symbol, price}};
  double size = fixedFractional(*approved, state, settings_.sizing_fraction,
                                price, settings_.equity_basis, marks);
  if (!std::isfinite(size) || size <= 0.0) {
    std::cerr << "[BarPipeline] sizer returned invalid size " << size
              << " at price " << price << ". Signal dropped.\n";
    return BarOutcome::InvalidSize;
  }
  domain::Signal sized = *approved;
  sized.size = size;

  // --- Second gate: sized signal -------------------------------------------
  auto final_signal =
      risk_.approve(sized, state, price, symbol, ApprovalPhase::PostSizing);
  if (!final_signal) {
    return rejected(ApprovalPhase::PostSizing);
  }
  if (!std::isfinite(final_signal->size) || final_signal->size <= 0.0) {
    return BarOutcome::InvalidSize;
  }

  if (risk_.limits().oversell == domain::OversellPolicy::Reject &&
      portfolio_.wouldOversell(symbol, final_signal->side,
                               final_signal->size)) {
    std::cerr << "[BarPipeline] SELL " << final_signal->size << " " << symbol
              << " exceeds holding. Rejected (oversell policy).\n";
    return BarOutcome::OversellRejected;
  }

  // --- Fill ----------------------------------------------------------------
  double fill_price = settings_.slippage.fillPrice(final_signal->side, price);
  domain::Order order = makeMarketOrder(ids_, symbol, *final_signal, price,
                                        ms_to_timestamp(clock_.now_ms()));

  domain::ExecutionResult result = broker_.execute(order, fill_price);
  if (!result.success || !result.trade) {
    std::cerr << "[BarPipeline] order " << order.id
              << " not executed: " << result.message << "\n";
    return BarOutcome::ExecutionFailed;
  }

  portfolio_.applyTrade(*result.trade);
  strategy_.onFill(*final_signal);
  last_trade_ = std::move(result.trade);
  return BarOutcome::Filled;
}

}  // namespace simex
