#pragma once

namespace simex {
namespace domain {

// -----------------------------------------------------------------------------
// OversellPolicy
// -----------------------------------------------------------------------------
// What happens to a SELL larger than the current holding:
//   Clamp  — quantity floors at zero, the full sale is credited to cash.
//            Short information is lost; this is the documented default.
//   Reject — the signal is dropped for that bar, nothing is executed.
// -----------------------------------------------------------------------------
enum class OversellPolicy {
  Clamp,
  Reject,
};

// -----------------------------------------------------------------------------
// RiskLimits — per-session risk thresholds
// -----------------------------------------------------------------------------
//
// @details
// Copied into RiskManager at construction and constant for the session.
// Both percentages are fractions (0.2 == 20%).
//
//   max_daily_loss    Drawdown from the first equity-curve value at which
//                     the session halts: (start - current) / start >= this.
//   max_position_pct  Largest order, as a fraction of mark-to-market equity,
//                     that MaxPositionRule lets through; larger sizes are
//                     capped to (max_position_pct * equity) / price.
// -----------------------------------------------------------------------------
struct RiskLimits {
  double max_daily_loss{0.2};
  double max_position_pct{0.5};
  OversellPolicy oversell{OversellPolicy::Clamp};
};

}  // namespace domain
}  // namespace simex
