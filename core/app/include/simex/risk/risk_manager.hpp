#pragma once

#include "simex/domain/portfolio_state.hpp"
#include "simex/domain/risk_limits.hpp"
#include "simex/domain/signal.hpp"
#include "simex/risk/risk_rules.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace simex {

// -----------------------------------------------------------------------------
// RiskState — the session's halt state machine
// -----------------------------------------------------------------------------
//
//   Normal ──(daily-loss breach | haltTrading())──> Halted
//
// Halted is terminal for the lifetime of the RiskManager; there is no reset.
// -----------------------------------------------------------------------------
enum class RiskState {
  Normal,
  Halted,
};

// -----------------------------------------------------------------------------
// ApprovalPhase — which of the two per-bar approval calls this is
// -----------------------------------------------------------------------------
//   PreSizing   The strategy's raw signal. Runs the drawdown gate early and
//               catches an explicit request that is already oversized.
//   PostSizing  The sizer's output. The sizer ignores any earlier cap, so
//               its size has to be checked again.
// -----------------------------------------------------------------------------
enum class ApprovalPhase {
  PreSizing,
  PostSizing,
};

const char* approvalPhaseToString(ApprovalPhase phase);

// -----------------------------------------------------------------------------
// RiskManager
// -----------------------------------------------------------------------------
//
// @brief  Runs the daily-loss and max-position rules for every signal and
//         owns the irreversible halt.
//
// @details
// approve() is called twice for every bar that produces a signal: once with
// ApprovalPhase::PreSizing and once with ApprovalPhase::PostSizing. Both
// calls must go to the same instance so they see the same halt state.
//
// approve() steps:
//   1. MaxDailyLossRule on portfolio.totalValue({symbol: price}). On breach:
//      transition to Halted (logged once) and reject.
//   2. Already Halted: reject, even if equity has since recovered.
//   3. MaxPositionRule::adjust. Null → reject (no state change). Otherwise
//      return the (possibly capped) signal; a cap is logged with the old and
//      new size.
//
// Rejection is expressed as std::nullopt; nothing here throws.
//
// Thread model:
//   approve() runs on the driver's thread only. haltTrading(), isHalted(),
//   state() and haltReason() may be called from any thread (the live
//   session's control server uses them), so the state is atomic and the
//   reason is behind a mutex.
//
// Ownership:
//   One instance per run/session, owned by the driver and lent to the bar
//   pipeline by reference.
// -----------------------------------------------------------------------------
class RiskManager {
 public:
  explicit RiskManager(const domain::RiskLimits& limits);

  RiskManager(const RiskManager&) = delete;
  RiskManager& operator=(const RiskManager&) = delete;

  std::optional<domain::Signal> approve(const domain::Signal& signal,
                                        const domain::PortfolioState& portfolio,
                                        double price, const std::string& symbol,
                                        ApprovalPhase phase);

  // -------------------------------------------------------------------------
  // haltTrading(reason)
  // -------------------------------------------------------------------------
  // @brief  Normal → Halted. No-op if already halted (first reason wins).
  // @return true if this call performed the transition.
  // -------------------------------------------------------------------------
  bool haltTrading(const std::string& reason);

  bool isHalted() const { return state_.load() == RiskState::Halted; }
  RiskState state() const { return state_.load(); }
  std::string haltReason() const;

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  const domain::RiskLimits limits_;
  const MaxDailyLossRule daily_loss_rule_;
  const MaxPositionRule position_rule_;

  std::atomic<RiskState> state_{RiskState::Normal};
  mutable std::mutex reason_mutex_;
  std::string halt_reason_;
};

}  // namespace simex
