#pragma once

#include "simex/domain/bar.hpp"

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace simex {

// -----------------------------------------------------------------------------
// Historical replay — CSV bar loader for the backtest driver
// -----------------------------------------------------------------------------
//
// @brief  Reads `timestamp,open,high,low,close,volume` rows and returns the
//         bars sorted strictly ascending by timestamp.
//
// @details
// The timestamp column is either epoch milliseconds (all digits) or a UTC
// date `YYYY-MM-DD`, optionally followed by ` HH:MM:SS` (a `T` separator is
// accepted too). A first row whose timestamp column is not a timestamp is
// treated as a header and skipped. Blank lines are ignored; volume may be
// omitted.
//
// Throws std::runtime_error naming the source and line for an unreadable
// file, a malformed row (including a NaN or infinite price or volume), or
// two rows with the same timestamp.
// -----------------------------------------------------------------------------
std::vector<domain::Bar> loadBarsCsv(const std::string& path);

std::vector<domain::Bar> parseBarsCsv(std::istream& in,
                                      const std::string& source = "<stream>");

// Parses one timestamp cell. Returns false if it is not a recognised format.
bool parseTimestampMs(const std::string& text, std::int64_t& out_ms);

}  // namespace simex
