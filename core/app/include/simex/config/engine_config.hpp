#pragma once

#include "simex/domain/risk_limits.hpp"
#include "simex/execution/slippage.hpp"
#include "simex/risk/position_sizer.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace simex {

// Missing, unreadable or out-of-range configuration.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct SizingConfig {
  double fraction{0.01};
  EquityBasis equity_basis{EquityBasis::CostBasis};
};

struct ExecutionConfig {
  double fee_rate{0.0005};
  SlippageModel slippage;
};

struct StrategyConfig {
  std::size_t short_window{12};
  std::size_t long_window{48};
};

struct ReportConfig {
  // Strategy configurations tried before this one; deflates the Sharpe.
  int n_trials{1};
};

enum class LiveSource {
  Zmq,
  Synthetic,
};

struct LiveConfig {
  LiveSource source{LiveSource::Zmq};
  std::string endpoint{"tcp://127.0.0.1:5555"};
  int reconnect_delay_ms{1000};
  int max_reconnect_attempts{5};
  int stale_timeout_ms{5000};
  int poll_interval_ms{1000};
  std::size_t queue_capacity{1024};

  // Empty disables the corresponding socket.
  std::string status_cmd_endpoint;
  std::string status_pub_endpoint;
};

// -----------------------------------------------------------------------------
// EngineConfig — everything a backtest or live session is parameterised by
// -----------------------------------------------------------------------------
//
// @details
// Default-constructed values are the documented defaults, so a config file
// only needs the keys it changes. Layout of the JSON document:
//
//   {
//     "initial_cash": 10000,
//     "symbol": "asset",
//     "sizing":    { "fraction": 0.01, "equity_basis": "cost" | "mark" },
//     "execution": { "fee_rate": 0.0005, "slippage_pct": 0, "slippage_abs": 0 },
//     "risk":      { "max_daily_loss": 0.2, "max_position_pct": 0.5,
//                    "oversell": "clamp" | "reject" },
//     "strategy":  { "short_window": 12, "long_window": 48 },
//     "report":    { "n_trials": 1 },
//     "live":      { "source": "zmq" | "synthetic",
//                    "endpoint": "tcp://127.0.0.1:5555",
//                    "reconnect_delay_ms": 1000, "max_reconnect_attempts": 5,
//                    "stale_timeout_ms": 5000, "poll_interval_ms": 1000,
//                    "queue_capacity": 1024,
//                    "status_cmd_endpoint": "", "status_pub_endpoint": "" }
//   }
//
// Unknown keys are ignored.
// -----------------------------------------------------------------------------
struct EngineConfig {
  double initial_cash{10000.0};
  std::string symbol{"asset"};
  SizingConfig sizing;
  ExecutionConfig execution;
  domain::RiskLimits risk;
  StrategyConfig strategy;
  ReportConfig report;
  LiveConfig live;
};

// Throws ConfigError for wrong types or values out of range.
EngineConfig engineConfigFromJson(const nlohmann::json& json);

// Throws ConfigError if the file cannot be read or parsed, or on any error
// engineConfigFromJson() reports.
EngineConfig loadEngineConfig(const std::string& path);

// Throws ConfigError naming the first offending field.
void validate(const EngineConfig& config);

}  // namespace simex
