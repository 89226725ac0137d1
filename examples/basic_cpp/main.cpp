// Writes a short burst of entries into rotated segments, shows what landed on
// disk, and reads the WARNING stream back through the fetcher.
//
// Segments go to $SEGLOG_LOG_DIR (colon separated), else $TMPDIR, else /tmp.
#include <seglog/entry_fetcher.hpp>
#include <seglog/formatters/pattern_formatter.hpp>
#include <seglog/log_context.hpp>
#include <seglog/log_files.hpp>
#include <seglog/logger.hpp>
#include <seglog/sinks/console_sink.hpp>
#include <seglog/sinks/segment_file_sink.hpp>
#include <seglog/timestamp.hpp>

#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace
{

void install_sinks(const seglog::LogFileConfig& config)
{
  auto& logger = seglog::Logger::Instance();

  auto console = std::make_unique<seglog::ConsoleSink>();
  console->SetLevel(seglog::LogLevel::Info);
  console->SetFormatter(
      std::make_unique<seglog::PatternFormatter>("%T%e %C%l%R %k %m", console->ColorEnabled()));
  logger.AddSink(std::move(console));

  auto segments = std::make_unique<seglog::SegmentFileSink>(config);
  segments->SetLevel(seglog::LogLevel::Debug);
  logger.AddSink(std::move(segments));
}

void ingest(int shard, int batches)
{
  char name[16];
  std::snprintf(name, sizeof(name), "ingest-%d", shard);
  seglog::LogContext::SetThreadName(name);

  for (int batch = 0; batch < batches; ++batch)
  {
    LOG_DEBUG("shard %d: batch %d decoded", shard, batch);
    LOG_EVERY_N(Info, 4, "shard %d: %d batches committed", shard, batch + 1);
    LOG_WARN_IF(batch == batches - 1 && shard % 2 == 1, "shard %d: lagging behind", shard);
  }
}

void print_segments(const seglog::LogFileConfig& config, const std::string& program)
{
  std::vector<seglog::FileInfo> files;
  seglog::Status status = seglog::list_log_files(config.log_dirs, &files);
  if (!status.IsOk())
  {
    std::fprintf(stderr, "listing failed: %s\n", status.ToString().c_str());
    return;
  }

  std::printf("segments of %s:\n", program.c_str());
  for (const auto& file : files)
  {
    if (file.details.program != program) continue;
    std::printf("  %-7s %8lld bytes  %s\n",
                std::string(seglog::to_string(file.details.level)).c_str(),
                static_cast<long long>(file.size_bytes), file.name.c_str());
  }
}

}  // namespace

int main()
{
  seglog::LogFileConfig config = seglog::LogFileConfig::FromEnvironment();
  // small segments so the demo rotates
  config.max_file_size = 4 * 1024;

  install_sinks(config);
  seglog::Logger::Instance().SetLevel(seglog::LogLevel::Debug);
  seglog::LogContext::SetThreadName("main");

  // creation times in file names are truncated to the second
  int64_t started = static_cast<int64_t>(seglog::wall_clock_now_ns()) - seglog::kNanosPerSecond;

  LOG_INFO("pipeline starting with %d shards", 3);

  std::vector<std::thread> workers;
  for (int shard = 0; shard < 3; ++shard)
  {
    workers.emplace_back(ingest, shard, 12);
  }
  for (auto& worker : workers)
  {
    worker.join();
  }

  LOG_ONCE(Error, "checkpoint upload failed: %s", "connection reset");
  LOG_INFO("pipeline drained");
  seglog::Logger::Instance().Flush();

  print_segments(config, config.identity.program);

  std::vector<seglog::StoredEntry> warnings;
  seglog::FetchStats stats;
  seglog::Status status = seglog::fetch_entries_from_files(
      config, seglog::LogLevel::Warn, started,
      static_cast<int64_t>(seglog::wall_clock_now_ns()), &warnings, &stats);
  if (!status.IsOk())
  {
    std::fprintf(stderr, "fetch failed: %s\n", status.ToString().c_str());
    return 1;
  }

  std::printf("WARNING or worse since start (%zu of %zu entries read):\n", warnings.size(),
              stats.entries_read);
  for (const auto& entry : warnings)
  {
    std::printf("  %s %-7s [%s] %s\n", seglog::format_rfc3339(entry.wall_clock_ns).c_str(),
                std::string(seglog::to_string(entry.level)).c_str(), entry.thread_name.c_str(),
                entry.msg.c_str());
  }
  return 0;
}
