// log_viewer: inspect the segments of the configured log directories.
//
//   log_viewer ls
//   log_viewer cat <file>...
//   log_viewer fetch <LEVEL> [START] [END]
//
// Directories come from SEGLOG_LOG_DIR (colon separated), else TMPDIR, else
// /tmp. START and END are RFC 3339 timestamps.
#include <seglog/entry_codec.hpp>
#include <seglog/entry_fetcher.hpp>
#include <seglog/formatters/pattern_formatter.hpp>
#include <seglog/log_file_config.hpp>
#include <seglog/log_files.hpp>
#include <seglog/timestamp.hpp>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace
{

constexpr const char* kEntryPattern = "%Z %L [%k:%t] %f:%# %m";

int usage()
{
  std::fprintf(stderr,
               "usage: log_viewer ls\n"
               "       log_viewer cat <file>...\n"
               "       log_viewer fetch <LEVEL> [START] [END]\n");
  return 2;
}

void print_entry(seglog::PatternFormatter& formatter, const seglog::StoredEntry& stored)
{
  char buf[2048];
  seglog::LogEntry entry = seglog::to_log_entry(stored);
  size_t len = formatter.Format(entry, buf, sizeof(buf));
  std::fwrite(buf, 1, len, stdout);
  std::fputc('\n', stdout);
}

int cmd_ls(const seglog::LogFileConfig& config)
{
  std::vector<seglog::FileInfo> files;
  seglog::Status status = seglog::list_log_files(config.log_dirs, &files);
  if (!status.IsOk())
  {
    std::fprintf(stderr, "log_viewer: %s\n", status.ToString().c_str());
    return 1;
  }

  std::sort(files.begin(), files.end(),
            [](const seglog::FileInfo& a, const seglog::FileInfo& b)
            {
              if (a.details.time_ns != b.details.time_ns)
              {
                return a.details.time_ns < b.details.time_ns;
              }
              return a.name < b.name;
            });
  for (const auto& f : files)
  {
    std::printf("%-7s %s %10lld %s/%s\n",
                std::string(seglog::to_string(f.details.level)).c_str(),
                seglog::format_rfc3339(f.details.time_ns).c_str(),
                static_cast<long long>(f.size_bytes), f.dir.c_str(), f.name.c_str());
  }
  return 0;
}

int cmd_cat(const seglog::LogFileConfig& config, int argc, char** argv)
{
  seglog::PatternFormatter formatter(kEntryPattern, false);
  int rc = 0;
  for (int i = 0; i < argc; ++i)
  {
    seglog::LogFileReader reader;
    // local tool: absolute paths are allowed
    seglog::Status status = seglog::open_log_reader(config.log_dirs, argv[i], true, &reader);
    if (!status.IsOk())
    {
      std::fprintf(stderr, "log_viewer: %s\n", status.ToString().c_str());
      rc = 1;
      continue;
    }

    seglog::EntryDecoder decoder(reader);
    seglog::StoredEntry entry;
    seglog::DecodeStatus result;
    while ((result = decoder.Decode(&entry)) == seglog::DecodeStatus::Ok)
    {
      print_entry(formatter, entry);
    }
    if (result != seglog::DecodeStatus::EndOfStream)
    {
      std::fprintf(stderr, "log_viewer: %s\n", decoder.ErrorMessage().c_str());
      rc = 1;
    }
  }
  return rc;
}

int cmd_fetch(const seglog::LogFileConfig& config, int argc, char** argv)
{
  if (argc < 1 || argc > 3)
  {
    return usage();
  }

  auto level = seglog::level_from_string(argv[0]);
  if (!level)
  {
    std::fprintf(stderr, "log_viewer: unknown level '%s'\n", argv[0]);
    return 2;
  }

  int64_t start_ns = 0;
  int64_t end_ns = static_cast<int64_t>(seglog::wall_clock_now_ns());
  if (argc >= 2 && !seglog::parse_rfc3339(argv[1], &start_ns))
  {
    std::fprintf(stderr, "log_viewer: bad start time '%s'\n", argv[1]);
    return 2;
  }
  if (argc >= 3 && !seglog::parse_rfc3339(argv[2], &end_ns))
  {
    std::fprintf(stderr, "log_viewer: bad end time '%s'\n", argv[2]);
    return 2;
  }

  std::vector<seglog::StoredEntry> entries;
  seglog::FetchStats stats;
  seglog::Status status =
      seglog::fetch_entries_from_files(config, *level, start_ns, end_ns, &entries, &stats);
  if (!status.IsOk())
  {
    std::fprintf(stderr, "log_viewer: %s\n", status.ToString().c_str());
    return 1;
  }

  seglog::PatternFormatter formatter(kEntryPattern, false);
  for (const auto& entry : entries)
  {
    print_entry(formatter, entry);
  }
  std::fprintf(stderr, "%zu of %zu entries from %zu files\n", stats.entries_kept,
               stats.entries_read, stats.scanned_files.size());
  return 0;
}

}  // namespace

int main(int argc, char** argv)
{
  if (argc < 2)
  {
    return usage();
  }

  seglog::LogFileConfig config = seglog::LogFileConfig::FromEnvironment();
  const char* cmd = argv[1];
  if (std::strcmp(cmd, "ls") == 0 && argc == 2)
  {
    return cmd_ls(config);
  }
  if (std::strcmp(cmd, "cat") == 0 && argc > 2)
  {
    return cmd_cat(config, argc - 2, argv + 2);
  }
  if (std::strcmp(cmd, "fetch") == 0)
  {
    return cmd_fetch(config, argc - 2, argv + 2);
  }
  return usage();
}
