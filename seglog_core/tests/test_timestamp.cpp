#include <gtest/gtest.h>

#include <cstring>
#include <regex>

#include "seglog/timestamp.hpp"

using namespace seglog;

TEST(Timestamp, MonotonicIsIncreasing)
{
  uint64_t t1 = monotonic_now_ns();
  uint64_t t2 = monotonic_now_ns();
  EXPECT_GE(t2, t1);
}

TEST(Timestamp, WallClockReasonableRange)
{
  uint64_t now = wall_clock_now_ns();
  uint64_t year_2020_ns = 1577836800ULL * 1'000'000'000ULL;
  uint64_t year_2100_ns = 4102444800ULL * 1'000'000'000ULL;
  EXPECT_GT(now, year_2020_ns);
  EXPECT_LT(now, year_2100_ns);
}

TEST(Timestamp, FormatTimestampMatchesPattern)
{
  char buf[64]{};
  size_t len = format_timestamp(wall_clock_now_ns(), buf, sizeof(buf));
  EXPECT_GT(len, 0u);

  std::regex pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{6})");
  EXPECT_TRUE(std::regex_match(buf, pattern)) << "Actual: " << buf;
}

TEST(Timestamp, FormatTimestampZeroBuffer)
{
  EXPECT_EQ(format_timestamp(wall_clock_now_ns(), nullptr, 0), 0u);
}

TEST(Timestamp, FormatRfc3339KnownValue)
{
  // 2015-06-30T14:03:07Z
  int64_t ns = 1435672987LL * kNanosPerSecond;
  EXPECT_EQ(format_rfc3339(ns), "2015-06-30T14:03:07Z");
  EXPECT_EQ(format_rfc3339(ns + 999'999'999), "2015-06-30T14:03:07Z");
  EXPECT_EQ(format_rfc3339(0), "1970-01-01T00:00:00Z");
}

TEST(Timestamp, FormatRfc3339TruncatesNegativeTowardPast)
{
  EXPECT_EQ(format_rfc3339(-1), "1969-12-31T23:59:59Z");
}

TEST(Timestamp, TruncateToSecondRoundsTowardPast)
{
  EXPECT_EQ(truncate_to_second(5 * kNanosPerSecond + 999'999'999), 5 * kNanosPerSecond);
  EXPECT_EQ(truncate_to_second(5 * kNanosPerSecond), 5 * kNanosPerSecond);
  EXPECT_EQ(truncate_to_second(-1), -kNanosPerSecond);
}

TEST(Timestamp, ParseRfc3339Utc)
{
  int64_t ns = 0;
  ASSERT_TRUE(parse_rfc3339("2015-06-30T14:03:07Z", &ns));
  EXPECT_EQ(ns, 1435672987LL * kNanosPerSecond);
}

TEST(Timestamp, ParseRfc3339Offset)
{
  int64_t utc = 0;
  int64_t shifted = 0;
  ASSERT_TRUE(parse_rfc3339("2015-06-30T14:03:07Z", &utc));
  ASSERT_TRUE(parse_rfc3339("2015-06-30T16:03:07+02:00", &shifted));
  EXPECT_EQ(utc, shifted);
  ASSERT_TRUE(parse_rfc3339("2015-06-30T09:33:07-04:30", &shifted));
  EXPECT_EQ(utc, shifted);
}

TEST(Timestamp, ParseRfc3339Fraction)
{
  int64_t ns = 0;
  ASSERT_TRUE(parse_rfc3339("1970-01-01T00:00:01.5Z", &ns));
  EXPECT_EQ(ns, 1'500'000'000LL);
  ASSERT_TRUE(parse_rfc3339("1970-01-01T00:00:00.0000000019Z", &ns));
  EXPECT_EQ(ns, 1LL);
}

TEST(Timestamp, ParseRfc3339LeapDay)
{
  int64_t ns = 0;
  EXPECT_TRUE(parse_rfc3339("2024-02-29T00:00:00Z", &ns));
  EXPECT_FALSE(parse_rfc3339("2023-02-29T00:00:00Z", &ns));
}

TEST(Timestamp, ParseRfc3339RejectsMalformed)
{
  int64_t ns = 77;
  EXPECT_FALSE(parse_rfc3339("", &ns));
  EXPECT_FALSE(parse_rfc3339("2015-06-30", &ns));
  EXPECT_FALSE(parse_rfc3339("2015-06-30T14:03:07", &ns));
  EXPECT_FALSE(parse_rfc3339("2015-06-30 14:03:07Z", &ns));
  EXPECT_FALSE(parse_rfc3339("2015-13-30T14:03:07Z", &ns));
  EXPECT_FALSE(parse_rfc3339("2015-06-30T24:03:07Z", &ns));
  EXPECT_FALSE(parse_rfc3339("2015-06-30T14_03_07Z", &ns));
  EXPECT_FALSE(parse_rfc3339("2015-06-30T14:03:07Zjunk", &ns));
  EXPECT_FALSE(parse_rfc3339("2015-06-30T14:03:07.Z", &ns));
  EXPECT_FALSE(parse_rfc3339("2015-06-30T14:03:07+0200", &ns));
  EXPECT_EQ(ns, 77);
}

TEST(Timestamp, FormatThenParseIsIdentityOnWholeSeconds)
{
  int64_t original = 1708099200LL * kNanosPerSecond;
  int64_t parsed = 0;
  ASSERT_TRUE(parse_rfc3339(format_rfc3339(original), &parsed));
  EXPECT_EQ(parsed, original);
}
