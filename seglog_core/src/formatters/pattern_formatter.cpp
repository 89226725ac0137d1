#include "seglog/formatters/pattern_formatter.hpp"

#include <cinttypes>
#include <cstdio>
#include <cstring>

#include "seglog/log_level.hpp"
#include "seglog/timestamp.hpp"

namespace seglog
{

namespace
{

// Bounded cursor over the caller's buffer. Output past the end is dropped
// and one byte is always kept for the terminating NUL.
class LineWriter
{
 public:
  LineWriter(char* buf, size_t size) : buf_(buf), limit_(size - 1) {}

  void Put(const char* data, size_t len)
  {
    size_t room = limit_ - pos_;
    if (len > room) len = room;
    if (len == 0) return;
    std::memcpy(buf_ + pos_, data, len);
    pos_ += len;
  }

  void Put(std::string_view s) { Put(s.data(), s.size()); }

  void PutCStr(const char* s)
  {
    if (s) Put(s, std::strlen(s));
  }

  void PutUnsigned(uint64_t value)
  {
    char digits[24];
    int n = std::snprintf(digits, sizeof(digits), "%" PRIu64, value);
    if (n > 0) Put(digits, static_cast<size_t>(n));
  }

  size_t Finish()
  {
    buf_[pos_] = '\0';
    return pos_;
  }

 private:
  char* buf_;
  size_t limit_;
  size_t pos_ = 0;
};

std::string_view level_color(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Trace: return "\033[37m";
    case LogLevel::Debug: return "\033[36m";
    case LogLevel::Info: return "\033[32m";
    case LogLevel::Warn: return "\033[33m";
    case LogLevel::Error: return "\033[31m";
    case LogLevel::Fatal: return "\033[1;31m";
    default: return {};
  }
}

}  // namespace

PatternFormatter::PatternFormatter(std::string_view pattern, bool enable_color)
    : pattern_(pattern), enable_color_(enable_color)
{
  Compile();
}

bool PatternFormatter::FieldFor(char directive, Field* field)
{
  static const struct
  {
    char directive;
    Field field;
  } kDirectives[] = {
      {'D', Field::Date},      {'T', Field::Time},        {'e', Field::Micros},
      {'Z', Field::UtcTime},   {'L', Field::LevelName},   {'l', Field::LevelLetter},
      {'f', Field::File},      {'n', Field::Function},    {'#', Field::Line},
      {'t', Field::ThreadId},  {'k', Field::ThreadName},  {'P', Field::Pid},
      {'q', Field::Sequence},  {'m', Field::Message},     {'C', Field::ColorOn},
      {'R', Field::ColorOff},
  };
  for (const auto& d : kDirectives)
  {
    if (d.directive == directive)
    {
      *field = d.field;
      return true;
    }
  }
  return false;
}

void PatternFormatter::Compile()
{
  pieces_.clear();
  std::string text;

  size_t i = 0;
  while (i < pattern_.size())
  {
    char c = pattern_[i++];
    if (c != '%' || i == pattern_.size())
    {
      text += c;
      continue;
    }

    char directive = pattern_[i++];
    Field field = Field::Text;
    if (directive == '%')
    {
      text += '%';
    }
    else if (!FieldFor(directive, &field))
    {
      text += '%';
      text += directive;
    }
    else
    {
      if (!text.empty())
      {
        pieces_.push_back({Field::Text, std::move(text)});
        text.clear();
      }
      pieces_.push_back({field, {}});
    }
  }

  if (!text.empty())
  {
    pieces_.push_back({Field::Text, std::move(text)});
  }
}

size_t PatternFormatter::Format(const LogEntry& entry, char* buf, size_t buf_size)
{
  if (buf_size == 0) return 0;

  LineWriter out(buf, buf_size);
  char scratch[48];

  for (const auto& piece : pieces_)
  {
    switch (piece.field)
    {
      case Field::Text:
        out.Put(piece.text);
        break;
      case Field::Date:
        out.Put(scratch, format_date(entry.wall_clock_ns, scratch, sizeof(scratch)));
        break;
      case Field::Time:
        out.Put(scratch, format_time(entry.wall_clock_ns, scratch, sizeof(scratch)));
        break;
      case Field::Micros:
      {
        auto micros = static_cast<unsigned>(entry.wall_clock_ns / 1000ULL % 1'000'000ULL);
        int n = std::snprintf(scratch, sizeof(scratch), ".%06u", micros);
        if (n > 0) out.Put(scratch, static_cast<size_t>(n));
        break;
      }
      case Field::UtcTime:
        out.Put(format_rfc3339(static_cast<int64_t>(entry.wall_clock_ns)));
        break;
      case Field::LevelName:
        out.Put(to_string(entry.level));
        break;
      case Field::LevelLetter:
      {
        char letter = to_short_char(entry.level);
        out.Put(&letter, 1);
        break;
      }
      case Field::File:
        out.PutCStr(entry.file_name);
        break;
      case Field::Function:
        out.PutCStr(entry.function_name);
        break;
      case Field::Line:
        out.PutUnsigned(entry.line);
        break;
      case Field::ThreadId:
        out.PutUnsigned(entry.thread_id);
        break;
      case Field::ThreadName:
        out.Put(entry.thread_name, strnlen(entry.thread_name, sizeof(entry.thread_name)));
        break;
      case Field::Pid:
        out.PutUnsigned(entry.process_id);
        break;
      case Field::Sequence:
        out.PutUnsigned(entry.sequence_id);
        break;
      case Field::Message:
        out.Put(entry.msg, entry.msg_len);
        break;
      case Field::ColorOn:
        if (enable_color_) out.Put(level_color(entry.level));
        break;
      case Field::ColorOff:
        if (enable_color_) out.Put("\033[0m");
        break;
    }
  }

  return out.Finish();
}

}  // namespace seglog
