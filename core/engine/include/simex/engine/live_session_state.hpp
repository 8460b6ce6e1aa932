#pragma once

#include "simex/domain/portfolio_state.hpp"
#include "simex/domain/trade.hpp"
#include "simex/time/time_utils.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace simex {

// -----------------------------------------------------------------------------
// LiveSessionState — what a live paper session leaves behind
// -----------------------------------------------------------------------------
//
// @details
// Returned by LivePaperRunner::stop(). bars_processed counts bars that went
// through the pipeline and got an equity point; bars_dropped counts bars
// that arrived out of order or stale and were skipped before the pipeline;
// bars_discarded counts bars still queued when the session was cancelled.
// -----------------------------------------------------------------------------
struct LiveSessionState {
  Timestamp start_time{};
  domain::PortfolioState portfolio;
  std::vector<domain::Trade> trades;
  std::uint64_t bars_processed{0};
  std::uint64_t bars_dropped{0};
  std::uint64_t bars_discarded{0};
  bool halted{false};
  std::string halt_reason;
};

// Small status view refreshed after every bar; cheap to copy.
struct LiveStatus {
  bool running{false};
  bool halted{false};
  double cash{0.0};
  double equity{0.0};
  std::map<std::string, domain::Position> positions;
  std::uint64_t trades{0};
  std::uint64_t bars_processed{0};
  std::uint64_t bars_dropped{0};
};

}  // namespace simex
