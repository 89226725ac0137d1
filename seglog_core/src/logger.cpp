#include "seglog/logger.hpp"

namespace seglog
{

Logger& Logger::Instance()
{
  static Logger inst;
  return inst;
}

Logger::~Logger() { Flush(); }

void Logger::AddSink(std::unique_ptr<ILogSink> sink)
{
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_.push_back(std::move(sink));
}

void Logger::ClearSinks()
{
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& sink : sinks_)
  {
    sink->Flush();
  }
  sinks_.clear();
}

void Logger::SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }

LogLevel Logger::Level() const { return level_.load(std::memory_order_relaxed); }

void Logger::Flush()
{
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& sink : sinks_)
  {
    sink->Flush();
  }
}

void Logger::Dispatch(const LogEntry& entry)
{
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& sink : sinks_)
  {
    sink->Write(entry);
  }
  // Fatal 之后进程可能马上退出，先落盘
  if (entry.level == LogLevel::Fatal)
  {
    for (auto& sink : sinks_)
    {
      sink->Flush();
    }
  }
}

}  // namespace seglog
