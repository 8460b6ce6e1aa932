#include "simex/strategy/sma_cross_strategy.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace simex {

SmaCrossStrategy::SmaCrossStrategy(std::string symbol, std::size_t short_window,
                                   std::size_t long_window)
    : symbol_(std::move(symbol)),
      short_window_(short_window),
      long_window_(long_window) {
  if (short_window_ == 0 || short_window_ >= long_window_) {
    throw std::invalid_argument(
        "SmaCrossStrategy: require 0 < short_window < long_window");
  }
}

void SmaCrossStrategy::fit(const std::vector<domain::Bar>& history) {
  closes_.clear();
  for (const auto& bar : history) {
    addClose(bar.close);
  }
  std::cout << "[SmaCrossStrategy] warmed up with " << closes_.size()
            << " close(s).\n";
}

std::optional<domain::Signal> SmaCrossStrategy::generateSignal(
    const domain::Bar& bar, const domain::PortfolioState& portfolio) {
  addClose(bar.close);
  if (closes_.size() < long_window_) {
    return std::nullopt;
  }

  double fast = average(short_window_);
  double slow = average(long_window_);
  const domain::Position* pos = portfolio.position(symbol_);
  bool holding = pos != nullptr && pos->quantity > 0.0;

  domain::Signal signal;
  signal.timestamp = bar.timestamp;
  signal.confidence =
      (slow > 0.0) ? std::min(1.0, std::abs(fast - slow) / slow) : 0.0;

  if (fast > slow && !holding) {
    signal.side = domain::Side::Buy;
    return signal;
  }
  if (fast < slow && holding) {
    signal.side = domain::Side::Sell;
    return signal;
  }
  return std::nullopt;
}

void SmaCrossStrategy::onFill(const domain::Signal& signal) {
  ++fills_;
  std::cout << "[SmaCrossStrategy] filled " << domain::sideToString(signal.side)
            << " size=" << signal.size << "\n";
}

void SmaCrossStrategy::addClose(double close) {
  closes_.push_back(close);
  while (closes_.size() > long_window_) {
    closes_.pop_front();
  }
}

// Mean of the most recent `window` closes. Caller ensures enough history.
double SmaCrossStrategy::average(std::size_t window) const {
  auto begin = closes_.end() - static_cast<std::ptrdiff_t>(window);
  return std::accumulate(begin, closes_.end(), 0.0) /
         static_cast<double>(window);
}

}  // namespace simex
