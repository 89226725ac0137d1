#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "log_entry.hpp"
#include "log_files.hpp"
#include "log_level.hpp"

namespace seglog
{

// An entry read back from a segment. Owns its strings.
struct StoredEntry
{
  int64_t wall_clock_ns = 0;
  LogLevel level = LogLevel::Info;
  std::string file_name;
  std::string function_name;
  uint32_t line = 0;
  uint32_t thread_id = 0;
  uint32_t process_id = 0;
  std::string thread_name;
  uint64_t sequence_id = 0;
  std::string msg;
};

// Record framing inside a segment:
//   [u32 magic][u32 body_len][body]
//   body = i64 wall_ns, u64 seq, u8 level, u32 line, u32 tid, u32 pid,
//          str16 file, str16 func, str8 thread_name, str16 msg
// All integers little-endian; strN = uN length followed by the bytes.
constexpr uint32_t kRecordMagic = 0x31454753;  // "SGE1"
constexpr size_t kRecordHeaderLen = 8;

// Append one framed record to *out.
void encode_entry(const LogEntry& entry, std::string* out);
void encode_entry(const StoredEntry& entry, std::string* out);

// Borrowing view for formatters. Pointers refer into stored and stay valid
// while it is alive and unmodified.
LogEntry to_log_entry(const StoredEntry& stored);

enum class DecodeStatus : uint8_t
{
  Ok = 0,
  EndOfStream,  // clean end, or a record cut short by a concurrent writer
  Corrupt,
  IoError,
};

// Sequential reader over one segment.
class EntryDecoder
{
 public:
  explicit EntryDecoder(LogFileReader& reader);

  DecodeStatus Decode(StoredEntry* entry);

  // Describes the last Corrupt/IoError result.
  const std::string& ErrorMessage() const { return error_; }

 private:
  // Makes at least n unread bytes available. False once the file ends first.
  bool Fill(size_t n);
  DecodeStatus Fail(DecodeStatus status, std::string message);

  LogFileReader& reader_;
  std::vector<char> buf_;
  size_t begin_ = 0;
  size_t end_ = 0;
  uint64_t offset_ = 0;  // file offset of buf_[begin_]
  bool io_error_ = false;
  std::string error_;
};

}  // namespace seglog
