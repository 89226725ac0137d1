#pragma once
#include <cstdint>
#include <type_traits>

#include "log_level.hpp"
#include "platform.hpp"

namespace seglog
{

// Producer-side record, filled by the logger front end and handed to sinks.
struct LogEntry
{
  uint64_t timestamp_ns;
  uint64_t wall_clock_ns;

  LogLevel level;

  const char* file_name;
  const char* function_name;
  uint32_t line;

  uint32_t thread_id;
  uint32_t process_id;
  char thread_name[SEGLOG_MAX_THREAD_NAME_LEN];

  uint64_t sequence_id;

  uint16_t msg_len;
  char msg[SEGLOG_MAX_MSG_LEN];
};

static_assert(std::is_trivially_copyable_v<LogEntry>,
              "LogEntry is copied by value into sinks");

}  // namespace seglog
