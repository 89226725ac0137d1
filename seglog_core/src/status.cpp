#include "seglog/status.hpp"

#include <fmt/format.h>

namespace seglog
{

std::string Status::ToString() const
{
  if (IsOk())
  {
    return "OK";
  }
  return fmt::format("{}: {}", to_string(code_), message_);
}

}  // namespace seglog
