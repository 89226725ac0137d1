#pragma once
#include <memory>
#include <string_view>

#include "../formatters/formatter_interface.hpp"
#include "../log_entry.hpp"
#include "../log_level.hpp"
#include "../platform.hpp"

namespace seglog
{

// Text rendering of one entry never exceeds this, including the message.
constexpr size_t kSinkLineCapacity = SEGLOG_MAX_MSG_LEN + 1024;

// A destination for entries. Logger calls Write/Flush with its mutex held,
// so implementations need no locking of their own.
class ILogSink
{
 public:
  virtual ~ILogSink() = default;

  virtual void Write(const LogEntry& entry) = 0;
  virtual void Flush() = 0;

  // 只影响文本类 Sink；SegmentFileSink 写二进制记录，不用格式化器
  void SetFormatter(std::unique_ptr<IFormatter> formatter) { formatter_ = std::move(formatter); }
  bool HasFormatter() const { return formatter_ != nullptr; }

  void SetLevel(LogLevel level) { min_level_ = level; }
  LogLevel Level() const { return min_level_; }

  bool ShouldLog(LogLevel entry_level) const
  {
    return entry_level != LogLevel::Off && entry_level >= min_level_;
  }

 protected:
  std::unique_ptr<IFormatter> formatter_;
  LogLevel min_level_ = LogLevel::Trace;

  // Renders entry into the sink's line buffer. The view stays valid until
  // the next call; it is empty when no formatter is installed.
  std::string_view RenderLine(const LogEntry& entry)
  {
    if (!formatter_)
    {
      return {};
    }
    size_t len = formatter_->Format(entry, line_, sizeof(line_));
    return std::string_view(line_, len);
  }

 private:
  char line_[kSinkLineCapacity];
};

}  // namespace seglog
