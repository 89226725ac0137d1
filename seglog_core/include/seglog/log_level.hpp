#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace seglog
{

enum class LogLevel : uint8_t
{
  Trace = 0,
  Debug = 1,
  Info = 2,
  Warn = 3,
  Error = 4,
  Fatal = 5,
  Off = 6
};

// Number of levels that own a segment stream (everything but Off).
constexpr size_t kFileLevelCount = 6;

// The names double as the severity token of segment filenames.
constexpr std::string_view to_string(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Trace:
      return "TRACE";
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Fatal:
      return "FATAL";
    case LogLevel::Off:
      return "OFF";
  }
  return "UNKNOWN";
}

constexpr char to_short_char(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Trace:
      return 'T';
    case LogLevel::Debug:
      return 'D';
    case LogLevel::Info:
      return 'I';
    case LogLevel::Warn:
      return 'W';
    case LogLevel::Error:
      return 'E';
    case LogLevel::Fatal:
      return 'F';
    case LogLevel::Off:
      return 'O';
  }
  return '?';
}

constexpr bool is_file_level(LogLevel level) { return level < LogLevel::Off; }

// Exact, case-sensitive inverse of to_string() restricted to file levels.
constexpr std::optional<LogLevel> level_from_string(std::string_view name)
{
  for (uint8_t i = 0; i < kFileLevelCount; ++i)
  {
    auto level = static_cast<LogLevel>(i);
    if (to_string(level) == name)
    {
      return level;
    }
  }
  return std::nullopt;
}

// 编译期最低活跃级别（通过 CMake -DSEGLOG_ACTIVE_LEVEL=2 注入）
#ifndef SEGLOG_ACTIVE_LEVEL
#ifdef NDEBUG
#define SEGLOG_ACTIVE_LEVEL 2  // Info
#else
#define SEGLOG_ACTIVE_LEVEL 0  // Trace
#endif
#endif

}  // namespace seglog
