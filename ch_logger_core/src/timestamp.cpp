#include "ch_logger/timestamp.hpp"

#include <time.h>

#include <cstdio>
#include <ctime>

#include "ch_logger/platform.hpp"

namespace ch_logger
{

#if defined(CH_LOG_PLATFORM_MACOS)

uint64_t monotonic_now_ns() { return clock_gettime_nsec_np(CLOCK_UPTIME_RAW); }

#else

uint64_t monotonic_now_ns()
{
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<uint64_t>(ts.tv_nsec);
}

#endif

uint64_t wall_clock_now_ns()
{
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<uint64_t>(ts.tv_nsec);
}

size_t format_timestamp(uint64_t wall_ns, char* buf, size_t buf_size)
{
  if (buf_size == 0) return 0;
  time_t sec = static_cast<time_t>(wall_ns / 1'000'000'000ULL);
  uint32_t ms = static_cast<uint32_t>((wall_ns % 1'000'000'000ULL) / 1'000'000ULL);
  struct tm tm_val{};
  localtime_r(&sec, &tm_val);
  int n = std::snprintf(buf, buf_size, "%04d-%02d-%02d %02d:%02d:%02d.%03u",
                        tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                        tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec, ms);
  return (n > 0 && static_cast<size_t>(n) < buf_size) ? static_cast<size_t>(n)
                                                      : (buf_size - 1);
}

namespace
{

bool read_digits(std::string_view text, size_t pos, size_t count, int& out)
{
  int value = 0;
  for (size_t i = pos; i < pos + count; ++i)
  {
    char c = text[i];
    if (c < '0' || c > '9') return false;
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

}  // namespace

std::optional<uint64_t> parse_timestamp(std::string_view text)
{
  if (text.size() != kTimestampLength) return std::nullopt;
  if (text[4] != '-' || text[7] != '-' || text[10] != ' ' || text[13] != ':' ||
      text[16] != ':' || text[19] != '.')
  {
    return std::nullopt;
  }

  int year, month, day, hour, minute, second, ms;
  if (!read_digits(text, 0, 4, year) || !read_digits(text, 5, 2, month) ||
      !read_digits(text, 8, 2, day) || !read_digits(text, 11, 2, hour) ||
      !read_digits(text, 14, 2, minute) || !read_digits(text, 17, 2, second) ||
      !read_digits(text, 20, 3, ms))
  {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
      second > 59)
  {
    return std::nullopt;
  }

  struct tm tm_val{};
  tm_val.tm_year = year - 1900;
  tm_val.tm_mon = month - 1;
  tm_val.tm_mday = day;
  tm_val.tm_hour = hour;
  tm_val.tm_min = minute;
  tm_val.tm_sec = second;
  tm_val.tm_isdst = -1;
  time_t sec = std::mktime(&tm_val);
  // mktime normalizes 2025-02-30 into March; such dates are rejected
  if (sec == static_cast<time_t>(-1) || tm_val.tm_mday != day || tm_val.tm_mon != month - 1)
  {
    return std::nullopt;
  }
  if (sec < 0) return std::nullopt;

  return static_cast<uint64_t>(sec) * 1'000'000'000ULL +
         static_cast<uint64_t>(ms) * 1'000'000ULL;
}

}  // namespace ch_logger
