#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "log_file_config.hpp"
#include "log_level.hpp"
#include "status.hpp"

namespace seglog
{

// Append-only handle on a freshly created segment.
class SegmentFile
{
 public:
  SegmentFile() = default;
  ~SegmentFile();

  SegmentFile(SegmentFile&& other) noexcept;
  SegmentFile& operator=(SegmentFile&& other) noexcept;
  SegmentFile(const SegmentFile&) = delete;
  SegmentFile& operator=(const SegmentFile&) = delete;

  bool IsOpen() const { return fd_ >= 0; }
  const std::string& Path() const { return path_; }
  // Size of the file when it was opened plus everything appended since.
  uint64_t Size() const { return size_; }
  // Creation time encoded in the file name, whole seconds.
  int64_t CreatedNs() const { return created_ns_; }

  // Outcome of updating the "latest" symlink. Informational only.
  const Status& LinkStatus() const { return link_status_; }

  // Writes all of data or fails.
  bool Append(const void* data, size_t len);
  void Sync();
  void Close();

 private:
  friend Status create_segment(const LogFileConfig& config, LogLevel level, int64_t time_ns,
                               SegmentFile* out);

  int fd_ = -1;
  std::string path_;
  uint64_t size_ = 0;
  int64_t created_ns_ = 0;
  Status link_status_;
};

// Creates (or reopens for append) the segment for level/time_ns in the first
// candidate directory that accepts it, then points <program>.<SEVERITY> at
// it. A symlink failure is reported on stderr and recorded in LinkStatus();
// it never fails the call.
Status create_segment(const LogFileConfig& config, LogLevel level, int64_t time_ns,
                      SegmentFile* out);

}  // namespace seglog
