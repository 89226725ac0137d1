#pragma once
#include <atomic>
#include <cstdio>  // snprintf fallback
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "log_context.hpp"
#include "log_entry.hpp"
#include "log_level.hpp"
#include "sinks/sink_interface.hpp"
#include "source_location.hpp"
#include "timestamp.hpp"

#ifdef SEGLOG_USE_FMTLIB
#include <fmt/format.h>
#endif

namespace seglog
{

// Front end. Entries are dispatched to the sinks synchronously on the
// calling thread; one mutex serializes the sinks.
class Logger
{
 public:
  static Logger& Instance();

  void AddSink(std::unique_ptr<ILogSink> sink);
  void ClearSinks();

  void SetLevel(LogLevel level);
  LogLevel Level() const;
  bool ShouldLog(LogLevel level) const { return level >= Level(); }

  void Flush();

  template <typename... Args>
  void LogImpl(LogLevel level, const SourceLocation& loc, const char* fmt, Args&&... args);

 private:
  Logger() = default;
  ~Logger();

  void Dispatch(const LogEntry& entry);

  std::mutex mutex_;
  std::vector<std::unique_ptr<ILogSink>> sinks_;
  std::atomic<LogLevel> level_{LogLevel::Info};
  std::atomic<uint64_t> sequence_{0};
};

// ===== LogImpl template implementation =====

template <typename... Args>
void Logger::LogImpl(LogLevel level, const SourceLocation& loc, const char* fmt,
                     Args&&... args)
{
  LogEntry entry{};

  entry.timestamp_ns = monotonic_now_ns();
  entry.wall_clock_ns = wall_clock_now_ns();
  entry.level = level;

  entry.file_name = loc.file_name;
  entry.function_name = loc.function_name;
  entry.line = loc.line;

  entry.sequence_id = sequence_.fetch_add(1, std::memory_order_relaxed);
  LogContext::FillThreadInfo(entry);

#ifdef SEGLOG_USE_FMTLIB
  auto result = fmt::format_to_n(entry.msg, SEGLOG_MAX_MSG_LEN - 1, fmt::runtime(fmt),
                                 std::forward<Args>(args)...);
  entry.msg_len = static_cast<uint16_t>(
      result.size < SEGLOG_MAX_MSG_LEN - 1 ? result.size : SEGLOG_MAX_MSG_LEN - 1);
  entry.msg[entry.msg_len] = '\0';
#else
  int written = std::snprintf(entry.msg, SEGLOG_MAX_MSG_LEN, fmt, args...);
  if (written < 0)
  {
    written = 0;
  }
  else if (written >= SEGLOG_MAX_MSG_LEN)
  {
    written = SEGLOG_MAX_MSG_LEN - 1;
  }
  entry.msg_len = static_cast<uint16_t>(written);
#endif

  Dispatch(entry);
}

}  // namespace seglog

// ===== Logging macros =====

#define SEGLOG_CALL(lvl, fmt_str, ...)                                                  \
  do                                                                                    \
  {                                                                                     \
    constexpr auto _seglog_lvl = ::seglog::LogLevel::lvl;                               \
    if (static_cast<int>(_seglog_lvl) >= SEGLOG_ACTIVE_LEVEL)                           \
    {                                                                                   \
      auto& _seglog_logger = ::seglog::Logger::Instance();                              \
      if (_seglog_logger.ShouldLog(_seglog_lvl))                                         \
      {                                                                                 \
        _seglog_logger.LogImpl(_seglog_lvl, SEGLOG_CURRENT_LOCATION(), fmt_str,         \
                               ##__VA_ARGS__);                                          \
      }                                                                                 \
    }                                                                                   \
  } while (0)

#define LOG_TRACE(fmt, ...) SEGLOG_CALL(Trace, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) SEGLOG_CALL(Debug, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) SEGLOG_CALL(Info, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) SEGLOG_CALL(Warn, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) SEGLOG_CALL(Error, fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) SEGLOG_CALL(Fatal, fmt, ##__VA_ARGS__)

#define LOG_INFO_IF(cond, fmt, ...) \
  do                                \
  {                                 \
    if (cond) LOG_INFO(fmt, ##__VA_ARGS__); \
  } while (0)
#define LOG_WARN_IF(cond, fmt, ...) \
  do                                \
  {                                 \
    if (cond) LOG_WARN(fmt, ##__VA_ARGS__); \
  } while (0)
#define LOG_ERROR_IF(cond, fmt, ...) \
  do                                 \
  {                                  \
    if (cond) LOG_ERROR(fmt, ##__VA_ARGS__); \
  } while (0)

#define LOG_EVERY_N(lvl, n, fmt, ...)                                        \
  do                                                                         \
  {                                                                          \
    static std::atomic<uint64_t> _seglog_count{0};                           \
    if (_seglog_count.fetch_add(1, std::memory_order_relaxed) % (n) == 0)    \
    {                                                                        \
      SEGLOG_CALL(lvl, fmt, ##__VA_ARGS__);                                  \
    }                                                                        \
  } while (0)

#define LOG_ONCE(lvl, fmt, ...)                                              \
  do                                                                         \
  {                                                                          \
    static std::atomic<bool> _seglog_logged{false};                          \
    if (!_seglog_logged.exchange(true, std::memory_order_relaxed))           \
    {                                                                        \
      SEGLOG_CALL(lvl, fmt, ##__VA_ARGS__);                                  \
    }                                                                        \
  } while (0)
