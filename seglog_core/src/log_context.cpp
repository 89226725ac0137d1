#include "seglog/log_context.hpp"

#include <unistd.h>

#include <cstring>

#include "seglog/platform.hpp"

#if defined(SEGLOG_PLATFORM_LINUX)
#include <sys/syscall.h>
#elif defined(SEGLOG_PLATFORM_MACOS)
#include <pthread.h>
#endif

namespace seglog
{

namespace
{

struct ThreadState
{
  char name[SEGLOG_MAX_THREAD_NAME_LEN] = {};
  uint32_t tid = 0;  // 0 = 尚未查询
};

thread_local ThreadState tls_state;

uint32_t query_thread_id()
{
#if defined(SEGLOG_PLATFORM_LINUX)
  return static_cast<uint32_t>(::syscall(SYS_gettid));
#elif defined(SEGLOG_PLATFORM_MACOS)
  uint64_t tid = 0;
  pthread_threadid_np(nullptr, &tid);
  return static_cast<uint32_t>(tid);
#endif
}

}  // namespace

void LogContext::SetThreadName(const char* name)
{
  if (!name) return;
  size_t len = strnlen(name, sizeof(tls_state.name) - 1);
  std::memcpy(tls_state.name, name, len);
  tls_state.name[len] = '\0';
}

const char* LogContext::GetThreadName() { return tls_state.name; }

uint32_t LogContext::GetThreadId()
{
  if (tls_state.tid == 0)
  {
    tls_state.tid = query_thread_id();
  }
  return tls_state.tid;
}

uint32_t LogContext::GetProcessId()
{
  return static_cast<uint32_t>(::getpid());
}

void LogContext::FillThreadInfo(LogEntry& entry)
{
  entry.process_id = GetProcessId();
  entry.thread_id = GetThreadId();
  std::memcpy(entry.thread_name, tls_state.name, sizeof(entry.thread_name));
}

}  // namespace seglog
