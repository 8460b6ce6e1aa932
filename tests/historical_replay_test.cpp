// =============================================================================
// historical_replay_test.cpp
// =============================================================================
// Tests for the CSV bar loader (simex/data/historical_replay.hpp).
//
// Validates:
//   - Header row detection and blank-line skipping
//   - Epoch-millisecond and calendar-date timestamps (UTC)
//   - Output sorted by timestamp; duplicates rejected
//   - Malformed rows name the source and line
// =============================================================================

#include "simex/data/historical_replay.hpp"
#include "simex/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

using simex::parseBarsCsv;
using simex::parseTimestampMs;
using simex::timestamp_to_ms;

// -----------------------------------------------------------------------------
// 1. Timestamp formats.
// -----------------------------------------------------------------------------
TEST(HistoricalReplayTest, ParsesTimestampFormats) {
  std::int64_t ms = 0;

  ASSERT_TRUE(parseTimestampMs("1700000000000", ms));
  EXPECT_EQ(ms, 1700000000000);

  ASSERT_TRUE(parseTimestampMs("1970-01-02", ms));
  EXPECT_EQ(ms, 86400000);

  ASSERT_TRUE(parseTimestampMs("2024-01-01 00:00:01", ms));
  EXPECT_EQ(ms, 1704067201000);

  ASSERT_TRUE(parseTimestampMs("2024-01-01T00:00:01", ms));
  EXPECT_EQ(ms, 1704067201000);

  EXPECT_FALSE(parseTimestampMs("", ms));
  EXPECT_FALSE(parseTimestampMs("timestamp", ms));
  EXPECT_FALSE(parseTimestampMs("2024-13-01", ms));
  EXPECT_FALSE(parseTimestampMs("2024-01-01x", ms));
}

// -----------------------------------------------------------------------------
// 2. Header, blank lines, optional volume.
// -----------------------------------------------------------------------------
TEST(HistoricalReplayTest, ParsesCsvWithHeader) {
  std::istringstream in(
      "timestamp,open,high,low,close,volume\n"
      "1000,100,101,99,100.5,12\n"
      "\n"
      "2000, 100.5, 102, 100, 101.5\n");

  auto bars = parseBarsCsv(in);

  ASSERT_EQ(bars.size(), 2u);
  EXPECT_EQ(timestamp_to_ms(bars[0].timestamp), 1000);
  EXPECT_DOUBLE_EQ(bars[0].open, 100.0);
  EXPECT_DOUBLE_EQ(bars[0].high, 101.0);
  EXPECT_DOUBLE_EQ(bars[0].low, 99.0);
  EXPECT_DOUBLE_EQ(bars[0].close, 100.5);
  EXPECT_DOUBLE_EQ(bars[0].volume, 12.0);
  EXPECT_DOUBLE_EQ(bars[1].close, 101.5);
}

TEST(HistoricalReplayTest, HeaderIsOptional) {
  std::istringstream in("1000,1,1,1,1,1\n2000,2,2,2,2,2\n");
  EXPECT_EQ(parseBarsCsv(in).size(), 2u);
}

// -----------------------------------------------------------------------------
// 3. Ordering.
// -----------------------------------------------------------------------------
TEST(HistoricalReplayTest, SortsByTimestamp) {
  std::istringstream in(
      "date,open,high,low,close\n"
      "1970-01-03,3,3,3,3\n"
      "1970-01-01,1,1,1,1\n"
      "1970-01-02,2,2,2,2\n");

  auto bars = parseBarsCsv(in);

  ASSERT_EQ(bars.size(), 3u);
  EXPECT_DOUBLE_EQ(bars[0].close, 1.0);
  EXPECT_DOUBLE_EQ(bars[1].close, 2.0);
  EXPECT_DOUBLE_EQ(bars[2].close, 3.0);
  EXPECT_EQ(timestamp_to_ms(bars[0].timestamp), 0);
}

TEST(HistoricalReplayTest, DuplicateTimestampThrows) {
  std::istringstream in("1000,1,1,1,1\n2000,2,2,2,2\n1000,3,3,3,3\n");
  EXPECT_THROW(parseBarsCsv(in), std::runtime_error);
}

// -----------------------------------------------------------------------------
// 4. Errors.
// -----------------------------------------------------------------------------
TEST(HistoricalReplayTest, BadRowNamesSourceAndLine) {
  std::istringstream in(
      "timestamp,open,high,low,close\n"
      "1000,1,1,1,1\n"
      "2000,1,abc,1,1\n");

  try {
    parseBarsCsv(in, "bars.csv");
    FAIL() << "expected runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("bars.csv:3"), std::string::npos)
        << e.what();
  }
}

// --- NaN and infinite cells parse with stod but are rejected with the line.
TEST(HistoricalReplayTest, NonFiniteValuesNameSourceAndLine) {
  std::istringstream nan_row(
      "1000,1,1,1,1,1\n"
      "2000,nan,nan,nan,nan,1\n");
  try {
    parseBarsCsv(nan_row, "bars.csv");
    FAIL() << "expected runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("bars.csv:2"), std::string::npos)
        << e.what();
  }

  std::istringstream inf_close("1000,1,1,1,inf\n");
  EXPECT_THROW(parseBarsCsv(inf_close), std::runtime_error);

  std::istringstream inf_volume("1000,1,1,1,1,1\n2000,1,1,1,1,-inf\n");
  EXPECT_THROW(parseBarsCsv(inf_volume), std::runtime_error);
}

TEST(HistoricalReplayTest, ShortRowAndBadTimestampThrow) {
  std::istringstream short_row("1000,1,1,1,1\n2000,1,1\n");
  EXPECT_THROW(parseBarsCsv(short_row), std::runtime_error);

  std::istringstream bad_ts("1000,1,1,1,1\nyesterday,1,1,1,1\n");
  EXPECT_THROW(parseBarsCsv(bad_ts), std::runtime_error);
}

TEST(HistoricalReplayTest, MissingFileThrows) {
  EXPECT_THROW(simex::loadBarsCsv("/nonexistent/simex/bars.csv"),
               std::runtime_error);
}
