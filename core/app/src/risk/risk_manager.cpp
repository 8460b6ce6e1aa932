#include "simex/risk/risk_manager.hpp"

#include <iostream>
#include <sstream>

namespace simex {

const char* approvalPhaseToString(ApprovalPhase phase) {
  switch (phase) {
    case ApprovalPhase::PreSizing:  return "pre-sizing";
    case ApprovalPhase::PostSizing: return "post-sizing";
  }
  return "unknown";
}

RiskManager::RiskManager(const domain::RiskLimits& limits)
    : limits_(limits),
      daily_loss_rule_(limits.max_daily_loss),
      position_rule_(limits.max_position_pct) {}

// -----------------------------------------------------------------------------
// approve: drawdown gate → halt gate → position cap
// -----------------------------------------------------------------------------
std::optional<domain::Signal> RiskManager::approve(
    const domain::Signal& signal, const domain::PortfolioState& portfolio,
    double price, const std::string& symbol, ApprovalPhase phase) {
  // --- 1. Daily loss: a breach halts the session ----------------------------
  double current_equity = portfolio.totalValue({{symbol, price}});
  if (!daily_loss_rule_.validate(portfolio, current_equity)) {
    std::ostringstream reason;
    reason << "Max daily loss breached (drawdown="
           << daily_loss_rule_.drawdown(portfolio, current_equity)
           << ", limit=" << limits_.max_daily_loss << ")";
    haltTrading(reason.str());
    return std::nullopt;
  }

  // --- 2. Halted earlier: reject everything for the rest of the session -----
  if (isHalted()) {
    std::cerr << "[RiskManager] HALTED - dropping " << approvalPhaseToString(phase)
              << " signal for " << symbol << "\n";
    return std::nullopt;
  }

  // --- 3. Position cap ------------------------------------------------------
  std::optional<domain::Signal> adjusted =
      position_rule_.adjust(portfolio, symbol, signal, price);
  if (!adjusted) {
    std::cerr << "[RiskManager] " << approvalPhaseToString(phase)
              << " signal for " << symbol
              << " blocked by position rule (price=" << price
              << ", equity=" << current_equity << ")\n";
    return std::nullopt;
  }

  if (adjusted->size != signal.size) {
    std::cout << "[RiskManager] " << approvalPhaseToString(phase)
              << " size capped for " << symbol << ": " << signal.size
              << " -> " << adjusted->size << "\n";
  }
  return adjusted;
}

// -----------------------------------------------------------------------------
// haltTrading: one-way transition into Halted
// -----------------------------------------------------------------------------
bool RiskManager::haltTrading(const std::string& reason) {
  RiskState expected = RiskState::Normal;
  if (!state_.compare_exchange_strong(expected, RiskState::Halted)) {
    return false;
  }

  {
    std::lock_guard lock(reason_mutex_);
    halt_reason_ = reason;
  }
  std::cerr << "[RiskManager] CRITICAL: " << reason
            << ". ALL TRADING HALTED.\n";
  return true;
}

std::string RiskManager::haltReason() const {
  std::lock_guard lock(reason_mutex_);
  return halt_reason_;
}

}  // namespace simex
