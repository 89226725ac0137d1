#pragma once
#include <sys/stat.h>
#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "file_name.hpp"
#include "status.hpp"

namespace seglog
{

// A verified segment as found on disk. Rebuilt on every listing.
struct FileInfo
{
  std::string name;  // base name
  std::string dir;
  int64_t size_bytes = 0;
  int64_t mod_time_ns = 0;
  FileDetails details;
};

// Read-only handle on one segment. Owns the descriptor.
class LogFileReader
{
 public:
  LogFileReader() = default;
  LogFileReader(int fd, std::string path);
  ~LogFileReader();

  LogFileReader(LogFileReader&& other) noexcept;
  LogFileReader& operator=(LogFileReader&& other) noexcept;
  LogFileReader(const LogFileReader&) = delete;
  LogFileReader& operator=(const LogFileReader&) = delete;

  bool IsOpen() const { return fd_ >= 0; }
  const std::string& Path() const { return path_; }

  // Bytes read, 0 at end of file, -1 on error (errno is set).
  ssize_t Read(void* buf, size_t len);
  void Close();

 private:
  int fd_ = -1;
  std::string path_;
};

// Decodes the name of a directory entry once it is known to be a regular
// file. Directories, symlinks and devices are rejected without decoding.
std::optional<FileDetails> verify_file_info(std::string_view name, const struct stat& st);

// stat()s path (lstat() when follow_symlinks is false) and verifies it.
Status verify_file(const std::string& path, bool follow_symlinks,
                   FileDetails* details = nullptr);

// All verified segments of all dirs, in no particular order. If any directory
// cannot be read, *out is left empty and DirectoryUnreadable is returned.
Status list_log_files(const std::vector<std::string>& dirs, std::vector<FileInfo>* out);

// Opens a segment by base name, searching dirs in order. Absolute paths are
// accepted only when allow_absolute is set (local tools); anything with a
// path separator is refused before touching the filesystem.
Status open_log_reader(const std::vector<std::string>& dirs, const std::string& filename,
                       bool allow_absolute, LogFileReader* out);

}  // namespace seglog
