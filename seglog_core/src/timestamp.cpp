#include "seglog/timestamp.hpp"

#include <time.h>

#include <cstdio>
#include <ctime>

#include "seglog/platform.hpp"

namespace seglog
{

#if defined(SEGLOG_PLATFORM_LINUX)

uint64_t monotonic_now_ns()
{
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC_RAW, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<uint64_t>(ts.tv_nsec);
}

#elif defined(SEGLOG_PLATFORM_MACOS)

uint64_t monotonic_now_ns() { return clock_gettime_nsec_np(CLOCK_UPTIME_RAW); }

#endif

uint64_t wall_clock_now_ns()
{
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<uint64_t>(ts.tv_nsec);
}

namespace
{

void decompose_wall_ns(uint64_t wall_ns, struct tm& tm_out, uint32_t& us_out)
{
  time_t sec = static_cast<time_t>(wall_ns / 1'000'000'000ULL);
  us_out = static_cast<uint32_t>((wall_ns % 1'000'000'000ULL) / 1'000ULL);
  localtime_r(&sec, &tm_out);
}

size_t clamp_written(int n, size_t buf_size)
{
  return (n > 0 && static_cast<size_t>(n) < buf_size) ? static_cast<size_t>(n)
                                                      : (buf_size - 1);
}

bool parse_digits(std::string_view s, size_t pos, size_t count, int* out)
{
  if (pos + count > s.size())
  {
    return false;
  }
  int value = 0;
  for (size_t i = 0; i < count; ++i)
  {
    char c = s[pos + i];
    if (c < '0' || c > '9')
    {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  *out = value;
  return true;
}

bool is_leap_year(int year)
{
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month)
{
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year))
  {
    return 29;
  }
  return kDays[month - 1];
}

// Days since 1970-01-01 of a proleptic Gregorian date.
int64_t days_from_civil(int64_t y, int m, int d)
{
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

}  // namespace

size_t format_timestamp(uint64_t wall_ns, char* buf, size_t buf_size)
{
  if (buf_size == 0) return 0;
  struct tm tm_val{};
  uint32_t us;
  decompose_wall_ns(wall_ns, tm_val, us);
  int n = snprintf(buf, buf_size, "%04d-%02d-%02d %02d:%02d:%02d.%06u",
                   tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                   tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec, us);
  return clamp_written(n, buf_size);
}

size_t format_date(uint64_t wall_ns, char* buf, size_t buf_size)
{
  if (buf_size == 0) return 0;
  struct tm tm_val{};
  uint32_t us;
  decompose_wall_ns(wall_ns, tm_val, us);
  int n = snprintf(buf, buf_size, "%04d-%02d-%02d", tm_val.tm_year + 1900,
                   tm_val.tm_mon + 1, tm_val.tm_mday);
  return clamp_written(n, buf_size);
}

size_t format_time(uint64_t wall_ns, char* buf, size_t buf_size)
{
  if (buf_size == 0) return 0;
  struct tm tm_val{};
  uint32_t us;
  decompose_wall_ns(wall_ns, tm_val, us);
  int n = snprintf(buf, buf_size, "%02d:%02d:%02d", tm_val.tm_hour, tm_val.tm_min,
                   tm_val.tm_sec);
  return clamp_written(n, buf_size);
}

int64_t truncate_to_second(int64_t unix_ns)
{
  int64_t secs = unix_ns / kNanosPerSecond;
  if (unix_ns % kNanosPerSecond < 0)
  {
    --secs;
  }
  return secs * kNanosPerSecond;
}

std::string format_rfc3339(int64_t unix_ns)
{
  time_t t = static_cast<time_t>(truncate_to_second(unix_ns) / kNanosPerSecond);
  struct tm tm_val{};
  gmtime_r(&t, &tm_val);

  char buf[64];
  int n = snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                   tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                   tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec);
  return std::string(buf, clamp_written(n, sizeof(buf)));
}

bool parse_rfc3339(std::string_view text, int64_t* unix_ns)
{
  int year, month, day, hour, minute, second;
  if (!parse_digits(text, 0, 4, &year) || text.size() < 20 || text[4] != '-' ||
      !parse_digits(text, 5, 2, &month) || text[7] != '-' ||
      !parse_digits(text, 8, 2, &day) || (text[10] != 'T' && text[10] != 't') ||
      !parse_digits(text, 11, 2, &hour) || text[13] != ':' ||
      !parse_digits(text, 14, 2, &minute) || text[16] != ':' ||
      !parse_digits(text, 17, 2, &second))
  {
    return false;
  }
  if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
      hour > 23 || minute > 59 || second > 59)
  {
    return false;
  }

  size_t pos = 19;
  int64_t frac_ns = 0;
  if (text[pos] == '.')
  {
    ++pos;
    size_t digits = 0;
    int64_t scale = 100'000'000;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
    {
      // 超过纳秒精度的位直接丢弃
      if (digits < 9)
      {
        frac_ns += (text[pos] - '0') * scale;
        scale /= 10;
      }
      ++digits;
      ++pos;
    }
    if (digits == 0)
    {
      return false;
    }
  }

  if (pos >= text.size())
  {
    return false;
  }

  int64_t offset_secs = 0;
  if (text[pos] == 'Z' || text[pos] == 'z')
  {
    ++pos;
  }
  else if (text[pos] == '+' || text[pos] == '-')
  {
    int off_hour, off_minute;
    if (!parse_digits(text, pos + 1, 2, &off_hour) || pos + 3 >= text.size() ||
        text[pos + 3] != ':' || !parse_digits(text, pos + 4, 2, &off_minute) ||
        off_hour > 23 || off_minute > 59)
    {
      return false;
    }
    offset_secs = off_hour * 3600 + off_minute * 60;
    if (text[pos] == '-')
    {
      offset_secs = -offset_secs;
    }
    pos += 6;
  }
  else
  {
    return false;
  }

  if (pos != text.size())
  {
    return false;
  }

  int64_t secs = days_from_civil(year, month, day) * 86400 + hour * 3600 +
                 minute * 60 + second - offset_secs;
  *unix_ns = secs * kNanosPerSecond + frac_ns;
  return true;
}

}  // namespace seglog
