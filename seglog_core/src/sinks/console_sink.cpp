#include "seglog/sinks/console_sink.hpp"

#include <unistd.h>

#include <memory>

#include "seglog/formatters/pattern_formatter.hpp"

namespace seglog
{

namespace
{

bool is_terminal(FILE* stream) { return stream != nullptr && ::isatty(::fileno(stream)) != 0; }

}  // namespace

ConsoleSink::ConsoleSink(std::optional<bool> force_color, FILE* out, FILE* err)
    : out_(out),
      err_(err),
      color_(force_color.value_or(is_terminal(out) || is_terminal(err)))
{
  SetFormatter(std::make_unique<PatternFormatter>(kDefaultPattern, color_));
}

void ConsoleSink::Write(const LogEntry& entry)
{
  if (!ShouldLog(entry.level))
  {
    return;
  }

  std::string_view line = RenderLine(entry);
  if (line.empty())
  {
    return;
  }

  FILE* stream = StreamFor(entry.level);
  std::fwrite(line.data(), 1, line.size(), stream);
  std::fputc('\n', stream);
}

void ConsoleSink::Flush()
{
  std::fflush(out_);
  std::fflush(err_);
}

}  // namespace seglog
