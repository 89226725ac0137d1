#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "entry_codec.hpp"
#include "log_file_config.hpp"
#include "log_files.hpp"
#include "log_level.hpp"
#include "status.hpp"

namespace seglog
{

// Segments a fetch has to read, newest first.
struct FetchPlan
{
  std::vector<FileInfo> segments;
  // One past the boundary group: the newest segment created at or before the
  // window start together with any segment sharing its creation time. Older
  // segments cannot hold entries of the window. segments.size() when no
  // segment was created at or before the start.
  size_t scan_end = 0;
};

struct FetchStats
{
  std::vector<std::string> scanned_files;  // in scan order
  size_t entries_read = 0;
  size_t entries_kept = 0;
};

// Keeps the segments of exactly `level` created no later than end_ns and
// orders them newest first.
FetchPlan plan_fetch(std::vector<FileInfo> files, LogLevel level, int64_t start_ns,
                     int64_t end_ns);

// Entries of the `level` segment stream with start_ns <= time <= end_ns, in
// non-decreasing time order, at most config.entries_cutoff of the most
// recent ones. Any listing, open or decode error fails the whole call and
// leaves *out empty.
Status fetch_entries_from_files(const LogFileConfig& config, LogLevel level, int64_t start_ns,
                                int64_t end_ns, std::vector<StoredEntry>* out,
                                FetchStats* stats = nullptr);

}  // namespace seglog
