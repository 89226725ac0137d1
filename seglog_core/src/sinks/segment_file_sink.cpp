#include "seglog/sinks/segment_file_sink.hpp"

#include <cstdio>
#include <utility>

#include "seglog/entry_codec.hpp"
#include "seglog/timestamp.hpp"

namespace seglog
{

SegmentFileSink::SegmentFileSink(LogFileConfig config) : config_(std::move(config))
{
  min_level_ = LogLevel::Info;
}

SegmentFileSink::~SegmentFileSink()
{
  for (auto& segment : segments_)
  {
    segment.Close();
  }
}

bool SegmentFileSink::PrepareSegment(LogLevel level, uint64_t wall_ns, size_t len)
{
  SegmentFile& segment = segments_[static_cast<size_t>(level)];
  int64_t entry_second = truncate_to_second(static_cast<int64_t>(wall_ns));
  if (segment.IsOpen())
  {
    // 段名的时间必须不晚于段内任何一条日志，否则按时间窗口取日志时会漏掉它
    bool older_than_segment = entry_second < segment.CreatedNs();
    bool fits = segment.Size() == 0 || segment.Size() + len <= config_.max_file_size;
    // 同一秒内无法换名，只能继续写当前段
    bool same_name = entry_second == segment.CreatedNs();
    if (!older_than_segment && (fits || same_name))
    {
      return true;
    }
  }

  // 轮转：关闭旧段，按本条日志的时间创建新段
  segment.Close();
  SegmentFile next;
  Status status = create_segment(config_, level, static_cast<int64_t>(wall_ns), &next);
  if (!status.IsOk())
  {
    std::fprintf(stderr, "SegmentFileSink: %s\n", status.ToString().c_str());
    return false;
  }
  segment = std::move(next);
  return true;
}

void SegmentFileSink::Write(const LogEntry& entry)
{
  if (!ShouldLog(entry.level) || !is_file_level(entry.level))
  {
    return;
  }

  record_buf_.clear();
  encode_entry(entry, &record_buf_);

  for (auto level = static_cast<int>(entry.level); level >= static_cast<int>(min_level_);
       --level)
  {
    auto file_level = static_cast<LogLevel>(level);
    if (!PrepareSegment(file_level, entry.wall_clock_ns, record_buf_.size()))
    {
      continue;
    }
    SegmentFile& segment = segments_[static_cast<size_t>(level)];
    if (!segment.Append(record_buf_.data(), record_buf_.size()))
    {
      std::fprintf(stderr, "SegmentFileSink: write to '%s' failed\n", segment.Path().c_str());
    }
  }
}

void SegmentFileSink::Flush()
{
  for (auto& segment : segments_)
  {
    segment.Sync();
  }
}

std::string SegmentFileSink::CurrentPath(LogLevel level) const
{
  if (!is_file_level(level))
  {
    return {};
  }
  const SegmentFile& segment = segments_[static_cast<size_t>(level)];
  return segment.IsOpen() ? segment.Path() : std::string();
}

}  // namespace seglog
