#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace seglog
{

enum class ErrorCode : uint8_t
{
  Ok = 0,
  NotLogFile,           // name or file type does not match a segment
  DirectoryUnreadable,  // a candidate directory could not be listed
  Corrupt,              // a segment holds an undecodable record
  CreateFailed,         // no candidate directory accepted a new segment
  AccessDenied,         // absolute path or path separator refused by policy
  NoLogDirs,            // configuration has no candidate directory
  IoError
};

constexpr std::string_view to_string(ErrorCode code)
{
  switch (code)
  {
    case ErrorCode::Ok:
      return "OK";
    case ErrorCode::NotLogFile:
      return "NOT_LOG_FILE";
    case ErrorCode::DirectoryUnreadable:
      return "DIRECTORY_UNREADABLE";
    case ErrorCode::Corrupt:
      return "CORRUPT";
    case ErrorCode::CreateFailed:
      return "CREATE_FAILED";
    case ErrorCode::AccessDenied:
      return "ACCESS_DENIED";
    case ErrorCode::NoLogDirs:
      return "NO_LOG_DIRS";
    case ErrorCode::IoError:
      return "IO_ERROR";
  }
  return "UNKNOWN";
}

// Outcome of an operation. Errors are returned, never thrown.
class Status
{
 public:
  Status() = default;
  Status(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message))
  {
  }

  bool IsOk() const { return code_ == ErrorCode::Ok; }
  ErrorCode Code() const { return code_; }
  const std::string& Message() const { return message_; }

  // "CODE: message", or "OK".
  std::string ToString() const;

 private:
  ErrorCode code_ = ErrorCode::Ok;
  std::string message_;
};

}  // namespace seglog
