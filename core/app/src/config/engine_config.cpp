#include "simex/config/engine_config.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>

namespace simex {

namespace {

using nlohmann::json;

// Copies obj[key] into out if present. Type mismatches become ConfigError
// with the dotted key path in the message.
template <typename T>
void read(const json& obj, const char* key, T& out, const std::string& path) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return;
  }
  try {
    out = it->template get<T>();
  } catch (const json::exception& e) {
    throw ConfigError("config: '" + path + key + "' has the wrong type (" +
                      e.what() + ")");
  }
}

// read() for counts. A negative JSON integer would wrap when converted to
// std::size_t, so it is read signed and rejected.
void readCount(const json& obj, const char* key, std::size_t& out,
               const std::string& path) {
  std::int64_t value = static_cast<std::int64_t>(out);
  read(obj, key, value, path);
  if (value < 0) {
    throw ConfigError("config: '" + path + key + "' must not be negative");
  }
  out = static_cast<std::size_t>(value);
}

const json& section(const json& root, const char* key) {
  static const json kEmpty = json::object();
  auto it = root.find(key);
  if (it == root.end() || it->is_null()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("config: '") + key + "' must be an object");
  }
  return *it;
}

EquityBasis parseEquityBasis(const std::string& text) {
  if (text == "cost") return EquityBasis::CostBasis;
  if (text == "mark") return EquityBasis::MarkToMarket;
  throw ConfigError("config: sizing.equity_basis must be \"cost\" or \"mark\", got \"" +
                    text + "\"");
}

domain::OversellPolicy parseOversell(const std::string& text) {
  if (text == "clamp") return domain::OversellPolicy::Clamp;
  if (text == "reject") return domain::OversellPolicy::Reject;
  throw ConfigError("config: risk.oversell must be \"clamp\" or \"reject\", got \"" +
                    text + "\"");
}

LiveSource parseLiveSource(const std::string& text) {
  if (text == "zmq") return LiveSource::Zmq;
  if (text == "synthetic") return LiveSource::Synthetic;
  throw ConfigError("config: live.source must be \"zmq\" or \"synthetic\", got \"" +
                    text + "\"");
}

void require(bool ok, const std::string& message) {
  if (!ok) {
    throw ConfigError("config: " + message);
  }
}

}  // namespace

EngineConfig engineConfigFromJson(const json& root) {
  if (!root.is_object()) {
    throw ConfigError("config: top level must be a JSON object");
  }

  EngineConfig cfg;
  read(root, "initial_cash", cfg.initial_cash, "");
  read(root, "symbol", cfg.symbol, "");

  const json& sizing = section(root, "sizing");
  read(sizing, "fraction", cfg.sizing.fraction, "sizing.");
  std::string basis;
  read(sizing, "equity_basis", basis, "sizing.");
  if (!basis.empty()) {
    cfg.sizing.equity_basis = parseEquityBasis(basis);
  }

  const json& exec = section(root, "execution");
  read(exec, "fee_rate", cfg.execution.fee_rate, "execution.");
  read(exec, "slippage_pct", cfg.execution.slippage.pct, "execution.");
  read(exec, "slippage_abs", cfg.execution.slippage.abs, "execution.");

  const json& risk = section(root, "risk");
  read(risk, "max_daily_loss", cfg.risk.max_daily_loss, "risk.");
  read(risk, "max_position_pct", cfg.risk.max_position_pct, "risk.");
  std::string oversell;
  read(risk, "oversell", oversell, "risk.");
  if (!oversell.empty()) {
    cfg.risk.oversell = parseOversell(oversell);
  }

  const json& strategy = section(root, "strategy");
  readCount(strategy, "short_window", cfg.strategy.short_window, "strategy.");
  readCount(strategy, "long_window", cfg.strategy.long_window, "strategy.");

  const json& report = section(root, "report");
  read(report, "n_trials", cfg.report.n_trials, "report.");

  const json& live = section(root, "live");
  std::string source;
  read(live, "source", source, "live.");
  if (!source.empty()) {
    cfg.live.source = parseLiveSource(source);
  }
  read(live, "endpoint", cfg.live.endpoint, "live.");
  read(live, "reconnect_delay_ms", cfg.live.reconnect_delay_ms, "live.");
  read(live, "max_reconnect_attempts", cfg.live.max_reconnect_attempts, "live.");
  read(live, "stale_timeout_ms", cfg.live.stale_timeout_ms, "live.");
  read(live, "poll_interval_ms", cfg.live.poll_interval_ms, "live.");
  readCount(live, "queue_capacity", cfg.live.queue_capacity, "live.");
  read(live, "status_cmd_endpoint", cfg.live.status_cmd_endpoint, "live.");
  read(live, "status_pub_endpoint", cfg.live.status_pub_endpoint, "live.");

  validate(cfg);
  return cfg;
}

void validate(const EngineConfig& cfg) {
  require(cfg.initial_cash > 0.0, "initial_cash must be > 0");
  require(!cfg.symbol.empty(), "symbol must not be empty");
  require(cfg.sizing.fraction > 0.0 && cfg.sizing.fraction <= 1.0,
          "sizing.fraction must be in (0, 1]");
  require(cfg.execution.fee_rate >= 0.0, "execution.fee_rate must be >= 0");
  require(cfg.execution.slippage.pct >= 0.0 && cfg.execution.slippage.pct < 1.0,
          "execution.slippage_pct must be in [0, 1)");
  require(cfg.execution.slippage.abs >= 0.0,
          "execution.slippage_abs must be >= 0");
  require(cfg.risk.max_daily_loss > 0.0 && cfg.risk.max_daily_loss <= 1.0,
          "risk.max_daily_loss must be in (0, 1]");
  require(cfg.risk.max_position_pct >= 0.0,
          "risk.max_position_pct must be >= 0");
  require(cfg.strategy.short_window > 0 &&
              cfg.strategy.short_window < cfg.strategy.long_window,
          "strategy windows must satisfy 0 < short_window < long_window");
  require(cfg.report.n_trials >= 1, "report.n_trials must be >= 1");
  require(cfg.live.reconnect_delay_ms >= 0,
          "live.reconnect_delay_ms must be >= 0");
  require(cfg.live.max_reconnect_attempts >= 0,
          "live.max_reconnect_attempts must be >= 0");
  require(cfg.live.stale_timeout_ms > 0, "live.stale_timeout_ms must be > 0");
  require(cfg.live.poll_interval_ms > 0, "live.poll_interval_ms must be > 0");
  require(cfg.live.queue_capacity > 0, "live.queue_capacity must be > 0");
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("config: cannot open " + path);
  }

  json root;
  try {
    root = json::parse(in);
  } catch (const json::parse_error& e) {
    throw ConfigError("config: " + path + " is not valid JSON (" + e.what() +
                      ")");
  }

  EngineConfig cfg = engineConfigFromJson(root);
  std::cout << "[EngineConfig] loaded " << path << " (symbol=" << cfg.symbol
            << ", initial_cash=" << cfg.initial_cash << ")\n";
  return cfg;
}

}  // namespace simex
