#pragma once

#include <chrono>
#include <cstdint>

namespace simex {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time point carried by bars, signals, orders and trades. Clocks
// (ITimeProvider) speak int64 epoch milliseconds; the helpers below convert.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -------------------------------------------------------------------------
// ms_to_timestamp
// -------------------------------------------------------------------------
// @brief  Converts epoch milliseconds to a Timestamp.
// -------------------------------------------------------------------------
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

// -------------------------------------------------------------------------
// timestamp_to_ms
// -------------------------------------------------------------------------
// @brief  Converts a Timestamp to epoch milliseconds (truncating).
// -------------------------------------------------------------------------
inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace simex
