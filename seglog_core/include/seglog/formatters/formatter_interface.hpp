#pragma once
#include <cstddef>

#include "../log_entry.hpp"

namespace seglog
{

class IFormatter
{
 public:
  virtual ~IFormatter() = default;
  // Writes a NUL-terminated rendering of entry, returns its length.
  virtual size_t Format(const LogEntry& entry, char* buf, size_t buf_size) = 0;
};

}  // namespace seglog
