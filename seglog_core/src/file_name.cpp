#include "seglog/file_name.hpp"

#include <algorithm>
#include <array>
#include <charconv>

#include "seglog/timestamp.hpp"

namespace seglog
{

namespace
{

constexpr size_t kFieldCount = 7;
constexpr std::string_view kLogToken = "log";

// Splits on '.', failing unless there are exactly kFieldCount non-empty fields.
bool split_fields(std::string_view name, std::array<std::string_view, kFieldCount>& out)
{
  size_t count = 0;
  size_t start = 0;
  while (true)
  {
    size_t dot = name.find('.', start);
    size_t end = (dot == std::string_view::npos) ? name.size() : dot;
    if (count == kFieldCount || end == start)
    {
      return false;
    }
    out[count++] = name.substr(start, end - start);
    if (dot == std::string_view::npos)
    {
      break;
    }
    start = dot + 1;
  }
  return count == kFieldCount;
}

bool parse_pid(std::string_view text, int* pid)
{
  // from_chars 接受前导 '-'，这里只允许纯数字
  if (text.empty() ||
      !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; }))
  {
    return false;
  }
  int value = 0;
  auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size())
  {
    return false;
  }
  *pid = value;
  return true;
}

}  // namespace

std::string escape_for_filename(std::string_view s)
{
  std::string out;
  out.reserve(s.size() + 4);
  for (char c : s)
  {
    if (c == '_')
    {
      out += "__";
    }
    else if (c == '.')
    {
      out += '_';
    }
    else
    {
      out += c;
    }
  }
  return out;
}

std::string unescape_for_filename(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i)
  {
    if (s[i] != '_')
    {
      out += s[i];
    }
    else if (i + 1 < s.size() && s[i + 1] == '_')
    {
      out += '_';
      ++i;
    }
    else
    {
      out += '.';
    }
  }
  return out;
}

std::string format_segment_name(const FileDetails& details)
{
  std::string time_token = format_rfc3339(details.time_ns);
  std::replace(time_token.begin(), time_token.end(), ':', '_');

  std::string name = escape_for_filename(details.program);
  name += '.';
  name += escape_for_filename(details.host);
  name += '.';
  name += escape_for_filename(details.user_name);
  name += '.';
  name += kLogToken;
  name += '.';
  name += to_string(details.level);
  name += '.';
  name += time_token;
  name += '.';
  name += std::to_string(details.pid);
  return name;
}

SegmentName make_segment_name(const ProcessIdentity& identity, LogLevel level,
                              int64_t time_ns)
{
  FileDetails details;
  details.program = identity.program;
  details.host = identity.host;
  details.user_name = identity.user_name;
  details.level = level;
  details.time_ns = time_ns;
  details.pid = identity.pid;

  SegmentName result;
  result.file_name = format_segment_name(details);
  result.link_name = identity.program + "." + std::string(to_string(level));
  result.created_ns = truncate_to_second(time_ns);
  return result;
}

std::optional<FileDetails> parse_segment_name(std::string_view file_name)
{
  std::array<std::string_view, kFieldCount> fields;
  if (!split_fields(file_name, fields) || fields[3] != kLogToken)
  {
    return std::nullopt;
  }

  auto level = level_from_string(fields[4]);
  if (!level)
  {
    return std::nullopt;
  }

  std::string time_text(fields[5]);
  std::replace(time_text.begin(), time_text.end(), '_', ':');
  int64_t time_ns = 0;
  if (!parse_rfc3339(time_text, &time_ns))
  {
    return std::nullopt;
  }

  int pid = 0;
  if (!parse_pid(fields[6], &pid))
  {
    return std::nullopt;
  }

  FileDetails details;
  details.program = unescape_for_filename(fields[0]);
  details.host = unescape_for_filename(fields[1]);
  details.user_name = unescape_for_filename(fields[2]);
  details.level = *level;
  details.time_ns = time_ns;
  details.pid = pid;
  return details;
}

}  // namespace seglog
