#pragma once

#include "simex/domain/bar.hpp"
#include "simex/domain/portfolio_state.hpp"
#include "simex/domain/signal.hpp"

#include <optional>
#include <string>
#include <vector>

namespace simex {

// -----------------------------------------------------------------------------
// IStrategy — signal-generating capability consumed by both drivers
// -----------------------------------------------------------------------------
//
// @brief  One call per bar, at most one Signal out.
//
// @details
// generateSignal() receives the bar and a read-only view of the portfolio as
// it stood before the bar. Returning std::nullopt means "no trade this bar";
// the bar is still recorded on the equity curve.
//
// onFill() is invoked with the final (sized, risk-approved) signal after it
// has been executed and applied to the portfolio.
//
// fit() trains or warms up the strategy from history before a run. Model
// training proper lives outside the engine; implementations may treat this
// as a warm-up.
//
// Thread model:
//   A strategy instance is driven by exactly one driver thread at a time and
//   needs no internal locking.
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  virtual void fit(const std::vector<domain::Bar>& history) = 0;

  virtual std::optional<domain::Signal> generateSignal(
      const domain::Bar& bar, const domain::PortfolioState& portfolio) = 0;

  virtual void onFill(const domain::Signal& signal) = 0;

  virtual std::string name() const = 0;
};

}  // namespace simex
