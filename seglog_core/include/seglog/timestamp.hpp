#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace seglog
{

constexpr int64_t kNanosPerSecond = 1'000'000'000LL;

uint64_t monotonic_now_ns();
uint64_t wall_clock_now_ns();

// Local-time rendering for human readable output.
// "YYYY-MM-DD HH:MM:SS.uuuuuu"
size_t format_timestamp(uint64_t wall_ns, char* buf, size_t buf_size);
// "YYYY-MM-DD"
size_t format_date(uint64_t wall_ns, char* buf, size_t buf_size);
// "HH:MM:SS"
size_t format_time(uint64_t wall_ns, char* buf, size_t buf_size);

// Rounds toward the past to a whole second, the resolution of file names.
int64_t truncate_to_second(int64_t unix_ns);

// RFC 3339 in UTC with second precision, e.g. "2015-06-30T14:03:07Z".
// Sub-second digits of unix_ns are truncated toward the past.
std::string format_rfc3339(int64_t unix_ns);

// Accepts "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)".
// Returns false on any deviation; *unix_ns is left untouched then.
bool parse_rfc3339(std::string_view text, int64_t* unix_ns);

}  // namespace seglog
