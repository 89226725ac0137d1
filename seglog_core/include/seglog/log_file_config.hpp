#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "platform.hpp"

namespace seglog
{

// Who writes the segments. Only the filename codec looks inside.
struct ProcessIdentity
{
  std::string program;
  std::string host;
  std::string user_name;
  int pid = 0;

  // Executable base name, short host name, login name and pid of this
  // process, with "unknownhost"/"unknownuser" fallbacks.
  static ProcessIdentity Current();
};

// "www.example.com" -> "www"
std::string short_hostname(std::string_view hostname);

// Candidate directories used when none are configured explicitly: the
// colon-separated SEGLOG_LOG_DIR list, else $TMPDIR, else /tmp. Computed
// once per process; safe to call from any thread afterwards.
const std::vector<std::string>& default_log_dirs();

// Reads the environment again, without caching.
std::vector<std::string> compute_log_dirs();

struct LogFileConfig
{
  ProcessIdentity identity;
  // Tried in order when creating a segment; all of them are listed.
  std::vector<std::string> log_dirs;
  uint64_t max_file_size = SEGLOG_MAX_FILE_SIZE;
  // 0 disables the cap.
  size_t entries_cutoff = SEGLOG_ENTRIES_CUTOFF;

  static LogFileConfig FromEnvironment();
};

}  // namespace seglog
