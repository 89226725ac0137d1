#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "formatter_interface.hpp"

namespace seglog
{

// Renders entries through a printf-like pattern, compiled once.
//
//   %D local date        %T local time       %e .microseconds
//   %Z UTC RFC 3339 time %L level name       %l level letter
//   %f file              %n function         %# line
//   %t thread id         %k thread name      %P pid
//   %q sequence          %m message          %C / %R color on / off
//   %% a literal '%'
//
// Unknown directives are copied through unchanged.
class PatternFormatter : public IFormatter
{
 public:
  explicit PatternFormatter(std::string_view pattern = "[%D %T%e] [%C%L%R] [tid:%t] [%f:%#] %m",
                            bool enable_color = true);

  size_t Format(const LogEntry& entry, char* buf, size_t buf_size) override;

  const std::string& Pattern() const { return pattern_; }

 private:
  enum class Field : uint8_t
  {
    Text,
    Date,
    Time,
    Micros,
    UtcTime,
    LevelName,
    LevelLetter,
    File,
    Function,
    Line,
    ThreadId,
    ThreadName,
    Pid,
    Sequence,
    Message,
    ColorOn,
    ColorOff
  };

  struct Piece
  {
    Field field;
    std::string text;  // only for Field::Text
  };

  static bool FieldFor(char directive, Field* field);
  void Compile();

  std::string pattern_;
  bool enable_color_;
  std::vector<Piece> pieces_;
};

}  // namespace seglog
