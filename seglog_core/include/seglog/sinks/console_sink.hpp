#pragma once
#include <cstdio>
#include <optional>

#include "sink_interface.hpp"

namespace seglog
{

// Human readable sink for terminals. Entries at Warn or worse go to err,
// everything else to out. Colors follow isatty() unless forced.
class ConsoleSink : public ILogSink
{
 public:
  static constexpr const char* kDefaultPattern = "[%D %T%e] [%C%L%R] [tid:%t] [%f:%#] %m";

  explicit ConsoleSink(std::optional<bool> force_color = std::nullopt, FILE* out = stdout,
                       FILE* err = stderr);

  void Write(const LogEntry& entry) override;
  void Flush() override;

  bool ColorEnabled() const { return color_; }

 private:
  FILE* StreamFor(LogLevel level) const { return level >= LogLevel::Warn ? err_ : out_; }

  FILE* out_;
  FILE* err_;
  bool color_;
};

}  // namespace seglog
