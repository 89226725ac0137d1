#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "log_file_config.hpp"
#include "log_level.hpp"

namespace seglog
{

// Everything a segment filename says about the segment.
struct FileDetails
{
  std::string program;
  std::string host;
  std::string user_name;
  LogLevel level = LogLevel::Info;
  int64_t time_ns = 0;  // creation time, whole seconds
  int pid = 0;
};

struct SegmentName
{
  std::string file_name;  // program.host.user.log.SEVERITY.time.pid
  std::string link_name;  // program.SEVERITY
  int64_t created_ns = 0;  // time_ns truncated to the second
};

// '_' -> "__", then '.' -> '_', so no field contains the separator.
std::string escape_for_filename(std::string_view s);

// Left to right: "__" -> '_', a lone '_' -> '.'.
std::string unescape_for_filename(std::string_view s);

std::string format_segment_name(const FileDetails& details);

SegmentName make_segment_name(const ProcessIdentity& identity, LogLevel level,
                              int64_t time_ns);

// nullopt for anything that is not exactly a segment filename. Never throws
// on malformed input.
// Non-canonical names also decode: a time token with an offset
// ("+02_00"), a fractional second, or a pid with leading zeros. Formatting
// the result yields the canonical name, not the input.
std::optional<FileDetails> parse_segment_name(std::string_view file_name);

}  // namespace seglog
