#pragma once

#include "simex/strategy/i_strategy.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace simex {

// -----------------------------------------------------------------------------
// SmaCrossStrategy — long-only moving-average crossover
// -----------------------------------------------------------------------------
//
// @brief  BUY when the short SMA of the close is above the long SMA and the
//         book is flat; SELL when it is below and a position is held.
//
// @details
// Keeps the last `long_window` closes. No signal is produced until that many
// closes have been seen (fit() can pre-load them). Signals carry size 0: the
// pipeline's sizer decides the quantity. Confidence is the relative gap
// between the two averages, clipped to [0, 1].
//
// Windows must satisfy 0 < short_window < long_window; the constructor throws
// std::invalid_argument otherwise.
// -----------------------------------------------------------------------------
class SmaCrossStrategy final : public IStrategy {
 public:
  SmaCrossStrategy(std::string symbol, std::size_t short_window = 12,
                   std::size_t long_window = 48);

  void fit(const std::vector<domain::Bar>& history) override;

  std::optional<domain::Signal> generateSignal(
      const domain::Bar& bar, const domain::PortfolioState& portfolio) override;

  void onFill(const domain::Signal& signal) override;

  std::string name() const override { return "SmaCrossStrategy"; }

  std::uint64_t fillCount() const { return fills_; }

 private:
  void addClose(double close);
  double average(std::size_t window) const;

  std::string symbol_;
  std::size_t short_window_;
  std::size_t long_window_;
  std::deque<double> closes_;
  std::uint64_t fills_{0};
};

}  // namespace simex
