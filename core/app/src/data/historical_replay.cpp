#include "simex/data/historical_replay.hpp"
#include "simex/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace simex {

namespace {

std::string trim(const std::string& s) {
  auto begin = std::find_if_not(s.begin(), s.end(),
                                [](unsigned char c) { return std::isspace(c); });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
               return std::isspace(c);
             }).base();
  return (begin < end) ? std::string(begin, end) : std::string();
}

std::vector<std::string> splitCsv(const std::string& line) {
  std::vector<std::string> cells;
  std::stringstream ss(line);
  std::string cell;
  while (std::getline(ss, cell, ',')) {
    cells.push_back(trim(cell));
  }
  return cells;
}

bool parseDouble(const std::string& text, double& out) {
  if (text.empty()) {
    return false;
  }
  try {
    std::size_t used = 0;
    out = std::stod(text, &used);
    return used == text.size() && std::isfinite(out);
  } catch (const std::logic_error&) {
    return false;
  }
}

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

[[noreturn]] void fail(const std::string& source, std::size_t line_no,
                       const std::string& what) {
  throw std::runtime_error("[HistoricalReplay] " + source + ":" +
                           std::to_string(line_no) + ": " + what);
}

}  // namespace

bool parseTimestampMs(const std::string& text, std::int64_t& out_ms) {
  if (text.empty()) {
    return false;
  }

  if (std::all_of(text.begin(), text.end(),
                  [](unsigned char c) { return std::isdigit(c); })) {
    try {
      out_ms = std::stoll(text);
      return true;
    } catch (const std::out_of_range&) {
      return false;
    }
  }

  int y = 0;
  unsigned mo = 0, d = 0, h = 0, mi = 0, s = 0;
  char sep = 0;
  int consumed = 0;
  int fields = std::sscanf(text.c_str(), "%4d-%2u-%2u%n%c%2u:%2u:%2u", &y, &mo,
                           &d, &consumed, &sep, &h, &mi, &s);
  if (fields < 3) {
    return false;
  }
  if (fields == 3) {
    // Date only: nothing may follow it.
    if (static_cast<std::size_t>(consumed) != text.size()) {
      return false;
    }
  } else if (fields != 7 || (sep != ' ' && sep != 'T')) {
    return false;
  }
  if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || s > 60) {
    return false;
  }

  std::int64_t days = daysFromCivil(y, mo, d);
  out_ms = ((days * 24 + h) * 60 + mi) * 60 * 1000 +
           static_cast<std::int64_t>(s) * 1000;
  return true;
}

std::vector<domain::Bar> parseBarsCsv(std::istream& in,
                                      const std::string& source) {
  std::vector<domain::Bar> bars;
  std::string line;
  std::size_t line_no = 0;
  bool first_row = true;

  while (std::getline(in, line)) {
    ++line_no;
    std::string trimmed = trim(line);
    if (trimmed.empty()) {
      continue;
    }

    auto cells = splitCsv(trimmed);
    std::int64_t ts_ms = 0;
    bool has_ts = !cells.empty() && parseTimestampMs(cells[0], ts_ms);

    if (first_row) {
      first_row = false;
      if (!has_ts) {
        continue;  // header
      }
    }

    if (!has_ts) {
      fail(source, line_no, "bad timestamp '" + (cells.empty() ? "" : cells[0]) + "'");
    }
    if (cells.size() < 5) {
      fail(source, line_no, "expected at least 5 columns, got " +
                                std::to_string(cells.size()));
    }

    domain::Bar bar;
    bar.timestamp = ms_to_timestamp(ts_ms);
    if (!parseDouble(cells[1], bar.open) || !parseDouble(cells[2], bar.high) ||
        !parseDouble(cells[3], bar.low) || !parseDouble(cells[4], bar.close)) {
      fail(source, line_no, "price column is not a finite number");
    }
    if (cells.size() > 5 && !cells[5].empty() &&
        !parseDouble(cells[5], bar.volume)) {
      fail(source, line_no, "volume column is not a finite number");
    }
    bars.push_back(bar);
  }

  std::stable_sort(bars.begin(), bars.end(),
                   [](const domain::Bar& a, const domain::Bar& b) {
                     return a.timestamp < b.timestamp;
                   });

  auto dup = std::adjacent_find(bars.begin(), bars.end(),
                                [](const domain::Bar& a, const domain::Bar& b) {
                                  return a.timestamp == b.timestamp;
                                });
  if (dup != bars.end()) {
    throw std::runtime_error("[HistoricalReplay] " + source +
                             ": duplicate timestamp " +
                             std::to_string(timestamp_to_ms(dup->timestamp)));
  }

  return bars;
}

std::vector<domain::Bar> loadBarsCsv(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("[HistoricalReplay] cannot open " + path);
  }
  return parseBarsCsv(in, path);
}

}  // namespace simex
