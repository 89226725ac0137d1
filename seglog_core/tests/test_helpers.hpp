#pragma once
#include <dirent.h>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "seglog/entry_codec.hpp"
#include "seglog/file_name.hpp"
#include "seglog/log_entry.hpp"
#include "seglog/log_file_config.hpp"
#include "seglog/timestamp.hpp"

namespace seglog_test
{

constexpr int64_t Sec(int64_t s) { return s * seglog::kNanosPerSecond; }

class TempDir
{
 public:
  TempDir()
  {
    char tmpl[] = "/tmp/seglog_test_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    if (dir) path_ = dir;
  }
  ~TempDir()
  {
    if (!path_.empty()) RemoveRecursive(path_);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& Path() const { return path_; }
  std::string File(const std::string& name) const { return path_ + "/" + name; }

  static void RemoveRecursive(const std::string& path)
  {
    DIR* d = ::opendir(path.c_str());
    if (!d) return;
    struct dirent* ent;
    while ((ent = ::readdir(d)) != nullptr)
    {
      std::string name = ent->d_name;
      if (name == "." || name == "..") continue;
      std::string full = path + "/" + name;
      struct stat st{};
      if (::lstat(full.c_str(), &st) == 0 && S_ISDIR(st.st_mode))
      {
        ::chmod(full.c_str(), 0755);
        RemoveRecursive(full);
      }
      else
      {
        std::remove(full.c_str());
      }
    }
    ::closedir(d);
    ::rmdir(path.c_str());
  }

 private:
  std::string path_;
};

inline seglog::ProcessIdentity TestIdentity()
{
  seglog::ProcessIdentity id;
  id.program = "testprog";
  id.host = "testhost";
  id.user_name = "tester";
  id.pid = 4242;
  return id;
}

inline seglog::LogFileConfig TestConfig(std::vector<std::string> dirs)
{
  seglog::LogFileConfig config;
  config.identity = TestIdentity();
  config.log_dirs = std::move(dirs);
  return config;
}

inline seglog::StoredEntry MakeStored(int64_t wall_ns,
                                      seglog::LogLevel level = seglog::LogLevel::Info,
                                      const std::string& msg = "message")
{
  seglog::StoredEntry entry;
  entry.wall_clock_ns = wall_ns;
  entry.level = level;
  entry.file_name = "main.cpp";
  entry.function_name = "run";
  entry.line = 7;
  entry.thread_id = 11;
  entry.process_id = 4242;
  entry.thread_name = "main";
  entry.msg = msg;
  return entry;
}

// 2015-06-30T14:03:20.250000Z, from thread "ingest" at segment_file.cpp:88.
inline seglog::LogEntry MakeLogEntry(seglog::LogLevel level = seglog::LogLevel::Info,
                                     const char* msg = "hello world")
{
  seglog::LogEntry e{};
  e.wall_clock_ns = 1435673000250000000ULL;
  e.timestamp_ns = 987654321ULL;
  e.level = level;
  e.file_name = "segment_file.cpp";
  e.function_name = "Append";
  e.line = 88;
  e.thread_id = 4321;
  e.process_id = 4242;
  std::strncpy(e.thread_name, "ingest", sizeof(e.thread_name) - 1);
  e.sequence_id = 77;
  e.msg_len = static_cast<uint16_t>(strnlen(msg, SEGLOG_MAX_MSG_LEN - 1));
  std::memcpy(e.msg, msg, e.msg_len);
  return e;
}

inline std::string ReadFile(const std::string& path)
{
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return "";
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

inline void WriteFile(const std::string& path, const std::string& content)
{
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << content;
}

inline bool FileExists(const std::string& path)
{
  struct stat st{};
  return ::lstat(path.c_str(), &st) == 0;
}

// Writes a segment named after TestIdentity() holding entries, returns its
// base name.
inline std::string WriteSegment(const std::string& dir, seglog::LogLevel level, int64_t time_ns,
                                const std::vector<seglog::StoredEntry>& entries,
                                const seglog::ProcessIdentity& id = TestIdentity())
{
  std::string name = seglog::make_segment_name(id, level, time_ns).file_name;
  std::string content;
  for (const auto& entry : entries)
  {
    seglog::encode_entry(entry, &content);
  }
  WriteFile(dir + "/" + name, content);
  return name;
}

}  // namespace seglog_test
