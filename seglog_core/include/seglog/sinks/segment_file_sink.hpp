#pragma once
#include <array>
#include <string>

#include "../log_file_config.hpp"
#include "../segment_file.hpp"
#include "sink_interface.hpp"

namespace seglog
{

// Writes entries as records into per-severity segments.
//
// An entry of level L lands in the segment of L and in the segment of every
// lower level down to the sink's own level, so each stream holds its level
// "or worse". Segments are created on first use with the entry's wall time
// and rolled over once the next record would exceed config.max_file_size.
//
// A segment never receives an entry older than the second in its name: such
// an entry opens a segment named after its own time. Within the segment's own
// second there is no new name to roll over to, so a full segment keeps
// growing until the clock moves on.
class SegmentFileSink : public ILogSink
{
 public:
  explicit SegmentFileSink(LogFileConfig config);
  ~SegmentFileSink() override;

  void Write(const LogEntry& entry) override;
  void Flush() override;

  // Full path of the open segment of level, empty when there is none.
  std::string CurrentPath(LogLevel level) const;

  const LogFileConfig& Config() const { return config_; }

 private:
  LogFileConfig config_;
  std::array<SegmentFile, kFileLevelCount> segments_;
  std::string record_buf_;

  // Makes sure segments_[level] is open with room for len more bytes.
  bool PrepareSegment(LogLevel level, uint64_t wall_ns, size_t len);
};

}  // namespace seglog
