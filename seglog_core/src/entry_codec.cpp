#include "seglog/entry_codec.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>
#include <string_view>
#include <utility>

#include "seglog/platform.hpp"

namespace seglog
{

namespace
{

constexpr size_t kReadChunk = 64 * 1024;

template <typename T>
void put_le(std::string* out, T value)
{
  for (size_t i = 0; i < sizeof(T); ++i)
  {
    out->push_back(static_cast<char>(static_cast<uint64_t>(value) >> (8 * i)));
  }
}

template <typename LenT>
void put_str(std::string* out, std::string_view s)
{
  size_t len = std::min<size_t>(s.size(), std::numeric_limits<LenT>::max());
  put_le<LenT>(out, static_cast<LenT>(len));
  out->append(s.data(), len);
}

template <typename T>
T get_le(const char* p)
{
  uint64_t value = 0;
  for (size_t i = 0; i < sizeof(T); ++i)
  {
    value |= static_cast<uint64_t>(static_cast<unsigned char>(p[i])) << (8 * i);
  }
  return static_cast<T>(value);
}

struct RecordFields
{
  int64_t wall_clock_ns;
  uint64_t sequence_id;
  LogLevel level;
  uint32_t line;
  uint32_t thread_id;
  uint32_t process_id;
  std::string_view file_name;
  std::string_view function_name;
  std::string_view thread_name;
  std::string_view msg;
};

void encode_fields(const RecordFields& f, std::string* out)
{
  size_t header_pos = out->size();
  put_le<uint32_t>(out, kRecordMagic);
  put_le<uint32_t>(out, 0);  // body length, patched below

  size_t body_pos = out->size();
  put_le<int64_t>(out, f.wall_clock_ns);
  put_le<uint64_t>(out, f.sequence_id);
  put_le<uint8_t>(out, static_cast<uint8_t>(f.level));
  put_le<uint32_t>(out, f.line);
  put_le<uint32_t>(out, f.thread_id);
  put_le<uint32_t>(out, f.process_id);
  put_str<uint16_t>(out, f.file_name);
  put_str<uint16_t>(out, f.function_name);
  put_str<uint8_t>(out, f.thread_name);
  put_str<uint16_t>(out, f.msg);

  auto body_len = static_cast<uint32_t>(out->size() - body_pos);
  for (size_t i = 0; i < 4; ++i)
  {
    (*out)[header_pos + 4 + i] = static_cast<char>(body_len >> (8 * i));
  }
}

// Bounds-checked cursor over one record body.
class BodyReader
{
 public:
  BodyReader(const char* data, size_t len) : p_(data), end_(data + len) {}

  template <typename T>
  bool Get(T* value)
  {
    if (static_cast<size_t>(end_ - p_) < sizeof(T)) return false;
    *value = get_le<T>(p_);
    p_ += sizeof(T);
    return true;
  }

  template <typename LenT>
  bool GetStr(std::string* value)
  {
    LenT len = 0;
    if (!Get(&len) || static_cast<size_t>(end_ - p_) < len) return false;
    value->assign(p_, len);
    p_ += len;
    return true;
  }

  bool AtEnd() const { return p_ == end_; }

 private:
  const char* p_;
  const char* end_;
};

}  // namespace

void encode_entry(const LogEntry& entry, std::string* out)
{
  RecordFields f;
  f.wall_clock_ns = static_cast<int64_t>(entry.wall_clock_ns);
  f.sequence_id = entry.sequence_id;
  f.level = entry.level;
  f.line = entry.line;
  f.thread_id = entry.thread_id;
  f.process_id = entry.process_id;
  f.file_name = entry.file_name ? std::string_view(entry.file_name) : std::string_view();
  f.function_name =
      entry.function_name ? std::string_view(entry.function_name) : std::string_view();
  f.thread_name = std::string_view(entry.thread_name,
                                   strnlen(entry.thread_name, sizeof(entry.thread_name)));
  f.msg = std::string_view(entry.msg, std::min<size_t>(entry.msg_len, sizeof(entry.msg)));
  encode_fields(f, out);
}

void encode_entry(const StoredEntry& entry, std::string* out)
{
  RecordFields f;
  f.wall_clock_ns = entry.wall_clock_ns;
  f.sequence_id = entry.sequence_id;
  f.level = entry.level;
  f.line = entry.line;
  f.thread_id = entry.thread_id;
  f.process_id = entry.process_id;
  f.file_name = entry.file_name;
  f.function_name = entry.function_name;
  f.thread_name = entry.thread_name;
  f.msg = entry.msg;
  encode_fields(f, out);
}

LogEntry to_log_entry(const StoredEntry& stored)
{
  LogEntry entry{};
  entry.timestamp_ns = 0;
  entry.wall_clock_ns = static_cast<uint64_t>(stored.wall_clock_ns);
  entry.level = stored.level;
  entry.file_name = stored.file_name.c_str();
  entry.function_name = stored.function_name.c_str();
  entry.line = stored.line;
  entry.thread_id = stored.thread_id;
  entry.process_id = stored.process_id;
  size_t name_len = std::min(stored.thread_name.size(), sizeof(entry.thread_name) - 1);
  std::memcpy(entry.thread_name, stored.thread_name.data(), name_len);
  entry.sequence_id = stored.sequence_id;
  size_t msg_len = std::min(stored.msg.size(), sizeof(entry.msg) - 1);
  std::memcpy(entry.msg, stored.msg.data(), msg_len);
  entry.msg_len = static_cast<uint16_t>(msg_len);
  return entry;
}

EntryDecoder::EntryDecoder(LogFileReader& reader) : reader_(reader) {}

bool EntryDecoder::Fill(size_t n)
{
  if (end_ - begin_ >= n)
  {
    return true;
  }
  if (io_error_)
  {
    return false;
  }

  // 把未读数据移到缓冲区开头
  if (begin_ > 0)
  {
    std::memmove(buf_.data(), buf_.data() + begin_, end_ - begin_);
    end_ -= begin_;
    begin_ = 0;
  }
  if (buf_.size() < std::max(n, kReadChunk))
  {
    buf_.resize(std::max(n, kReadChunk));
  }

  while (end_ < n)
  {
    ssize_t got = reader_.Read(buf_.data() + end_, buf_.size() - end_);
    if (got < 0)
    {
      io_error_ = true;
      error_ = fmt::format("read '{}': {}", reader_.Path(), std::strerror(errno));
      return false;
    }
    if (got == 0)
    {
      return false;
    }
    end_ += static_cast<size_t>(got);
  }
  return true;
}

DecodeStatus EntryDecoder::Fail(DecodeStatus status, std::string message)
{
  error_ = std::move(message);
  return status;
}

DecodeStatus EntryDecoder::Decode(StoredEntry* entry)
{
  if (!Fill(kRecordHeaderLen))
  {
    return io_error_ ? DecodeStatus::IoError : DecodeStatus::EndOfStream;
  }

  const char* header = buf_.data() + begin_;
  uint32_t magic = get_le<uint32_t>(header);
  uint32_t body_len = get_le<uint32_t>(header + 4);
  if (magic != kRecordMagic)
  {
    return Fail(DecodeStatus::Corrupt,
                fmt::format("{}: bad record magic at offset {}", reader_.Path(), offset_));
  }
  if (body_len > SEGLOG_MAX_RECORD_LEN)
  {
    return Fail(DecodeStatus::Corrupt,
                fmt::format("{}: record of {} bytes at offset {}", reader_.Path(), body_len,
                            offset_));
  }

  size_t record_len = kRecordHeaderLen + body_len;
  if (!Fill(record_len))
  {
    return io_error_ ? DecodeStatus::IoError : DecodeStatus::EndOfStream;
  }

  BodyReader body(buf_.data() + begin_ + kRecordHeaderLen, body_len);
  StoredEntry decoded;
  uint8_t level = 0;
  bool ok = body.Get(&decoded.wall_clock_ns) && body.Get(&decoded.sequence_id) &&
            body.Get(&level) && body.Get(&decoded.line) && body.Get(&decoded.thread_id) &&
            body.Get(&decoded.process_id) && body.GetStr<uint16_t>(&decoded.file_name) &&
            body.GetStr<uint16_t>(&decoded.function_name) &&
            body.GetStr<uint8_t>(&decoded.thread_name) && body.GetStr<uint16_t>(&decoded.msg) &&
            body.AtEnd();
  if (!ok || !is_file_level(static_cast<LogLevel>(level)))
  {
    return Fail(DecodeStatus::Corrupt,
                fmt::format("{}: malformed record at offset {}", reader_.Path(), offset_));
  }
  decoded.level = static_cast<LogLevel>(level);

  begin_ += record_len;
  offset_ += record_len;
  *entry = std::move(decoded);
  return DecodeStatus::Ok;
}

}  // namespace seglog
