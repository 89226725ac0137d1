#include "seglog/entry_fetcher.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace seglog
{

namespace
{

// Appends the in-window entries of one segment in file order.
Status read_entries_from_file(const FileInfo& file, int64_t start_ns, int64_t end_ns,
                              std::vector<StoredEntry>* entries, FetchStats* stats)
{
  LogFileReader reader;
  Status status = open_log_reader({file.dir}, file.name, false, &reader);
  if (!status.IsOk())
  {
    return status;
  }

  EntryDecoder decoder(reader);
  StoredEntry entry;
  while (true)
  {
    DecodeStatus result = decoder.Decode(&entry);
    if (result == DecodeStatus::EndOfStream)
    {
      break;
    }
    if (result == DecodeStatus::Corrupt)
    {
      return Status(ErrorCode::Corrupt, decoder.ErrorMessage());
    }
    if (result == DecodeStatus::IoError)
    {
      return Status(ErrorCode::IoError, decoder.ErrorMessage());
    }

    if (stats) ++stats->entries_read;
    if (entry.wall_clock_ns >= start_ns && entry.wall_clock_ns <= end_ns)
    {
      entries->push_back(std::move(entry));
    }
  }
  return Status();
}

}  // namespace

FetchPlan plan_fetch(std::vector<FileInfo> files, LogLevel level, int64_t start_ns,
                     int64_t end_ns)
{
  FetchPlan plan;
  for (auto& file : files)
  {
    // 创建时间是段内条目时间的下界
    if (file.details.level == level && file.details.time_ns <= end_ns)
    {
      plan.segments.push_back(std::move(file));
    }
  }

  std::sort(plan.segments.begin(), plan.segments.end(),
            [](const FileInfo& a, const FileInfo& b)
            {
              if (a.details.time_ns != b.details.time_ns)
              {
                return a.details.time_ns > b.details.time_ns;
              }
              if (a.name != b.name)
              {
                return a.name < b.name;
              }
              return a.dir < b.dir;
            });

  plan.scan_end = plan.segments.size();
  for (size_t i = 0; i < plan.segments.size(); ++i)
  {
    int64_t boundary_ns = plan.segments[i].details.time_ns;
    if (boundary_ns <= start_ns)
    {
      size_t j = i;
      while (j < plan.segments.size() && plan.segments[j].details.time_ns == boundary_ns)
      {
        ++j;
      }
      plan.scan_end = j;
      break;
    }
  }
  return plan;
}

Status fetch_entries_from_files(const LogFileConfig& config, LogLevel level, int64_t start_ns,
                                int64_t end_ns, std::vector<StoredEntry>* out,
                                FetchStats* stats)
{
  out->clear();
  if (stats)
  {
    *stats = FetchStats{};
  }
  if (start_ns > end_ns)
  {
    return Status();
  }

  std::vector<FileInfo> files;
  Status status = list_log_files(config.log_dirs, &files);
  if (!status.IsOk())
  {
    return status;
  }

  FetchPlan plan = plan_fetch(std::move(files), level, start_ns, end_ns);
  const size_t cutoff = config.entries_cutoff;

  std::vector<StoredEntry> entries;
  for (size_t i = 0; i < plan.scan_end; ++i)
  {
    const FileInfo& file = plan.segments[i];
    if (stats) stats->scanned_files.push_back(file.name);

    status = read_entries_from_file(file, start_ns, end_ns, &entries, stats);
    if (!status.IsOk())
    {
      return status;
    }
    if (cutoff > 0 && entries.size() >= cutoff)
    {
      break;
    }
  }

  std::stable_sort(entries.begin(), entries.end(),
                   [](const StoredEntry& a, const StoredEntry& b)
                   { return a.wall_clock_ns < b.wall_clock_ns; });
  if (cutoff > 0 && entries.size() > cutoff)
  {
    entries.erase(entries.begin(),
                  entries.begin() + static_cast<std::ptrdiff_t>(entries.size() - cutoff));
  }

  if (stats) stats->entries_kept = entries.size();
  *out = std::move(entries);
  return Status();
}

}  // namespace seglog
