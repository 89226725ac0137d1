#pragma once
#include <cstdint>

#include "log_entry.hpp"

namespace seglog
{

// Per-thread identity stamped on every entry. The thread name is empty until
// SetThreadName() is called on that thread; longer names are cut to
// SEGLOG_MAX_THREAD_NAME_LEN - 1 bytes.
class LogContext
{
 public:
  static void SetThreadName(const char* name);
  static const char* GetThreadName();
  // Kernel thread id, looked up once per thread.
  static uint32_t GetThreadId();
  static uint32_t GetProcessId();

  static void FillThreadInfo(LogEntry& entry);
};

}  // namespace seglog
