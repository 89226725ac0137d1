#include "seglog/log_files.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <fmt/format.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "seglog/platform.hpp"
#include "seglog/timestamp.hpp"

namespace seglog
{

namespace
{

int64_t mod_time_ns(const struct stat& st)
{
#if defined(SEGLOG_PLATFORM_MACOS)
  const struct timespec& ts = st.st_mtimespec;
#else
  const struct timespec& ts = st.st_mtim;
#endif
  return static_cast<int64_t>(ts.tv_sec) * kNanosPerSecond +
         static_cast<int64_t>(ts.tv_nsec);
}

std::string join_path(const std::string& dir, const std::string& name)
{
  std::string path = dir;
  if (!path.empty() && path.back() != '/')
  {
    path += '/';
  }
  path += name;
  return path;
}

std::string base_name(const std::string& path)
{
  size_t slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

Status open_verified(const std::string& path, bool follow_symlinks, LogFileReader* out)
{
  Status status = verify_file(path, follow_symlinks);
  if (!status.IsOk())
  {
    return status;
  }
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC | (follow_symlinks ? 0 : O_NOFOLLOW));
  if (fd < 0)
  {
    return Status(ErrorCode::IoError,
                  fmt::format("cannot open '{}': {}", path, std::strerror(errno)));
  }
  *out = LogFileReader(fd, path);
  return Status();
}

}  // namespace

LogFileReader::LogFileReader(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

LogFileReader::~LogFileReader() { Close(); }

LogFileReader::LogFileReader(LogFileReader&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_))
{
  other.fd_ = -1;
}

LogFileReader& LogFileReader::operator=(LogFileReader&& other) noexcept
{
  if (this != &other)
  {
    Close();
    fd_ = other.fd_;
    path_ = std::move(other.path_);
    other.fd_ = -1;
  }
  return *this;
}

ssize_t LogFileReader::Read(void* buf, size_t len)
{
  if (fd_ < 0)
  {
    errno = EBADF;
    return -1;
  }
  ssize_t n;
  do
  {
    n = ::read(fd_, buf, len);
  } while (n < 0 && errno == EINTR);
  return n;
}

void LogFileReader::Close()
{
  if (fd_ >= 0)
  {
    ::close(fd_);
    fd_ = -1;
  }
}

std::optional<FileDetails> verify_file_info(std::string_view name, const struct stat& st)
{
  if (!S_ISREG(st.st_mode))
  {
    return std::nullopt;
  }
  return parse_segment_name(name);
}

Status verify_file(const std::string& path, bool follow_symlinks, FileDetails* details)
{
  struct stat st{};
  int rc = follow_symlinks ? ::stat(path.c_str(), &st) : ::lstat(path.c_str(), &st);
  if (rc != 0)
  {
    return Status(ErrorCode::IoError,
                  fmt::format("cannot stat '{}': {}", path, std::strerror(errno)));
  }
  auto parsed = verify_file_info(base_name(path), st);
  if (!parsed)
  {
    return Status(ErrorCode::NotLogFile, fmt::format("not a log file: {}", path));
  }
  if (details)
  {
    *details = std::move(*parsed);
  }
  return Status();
}

Status list_log_files(const std::vector<std::string>& dirs, std::vector<FileInfo>* out)
{
  out->clear();
  std::vector<FileInfo> results;

  for (const auto& dir : dirs)
  {
    DIR* d = ::opendir(dir.c_str());
    if (!d)
    {
      return Status(ErrorCode::DirectoryUnreadable,
                    fmt::format("cannot open log dir '{}': {}", dir, std::strerror(errno)));
    }

    struct dirent* ent;
    errno = 0;
    while ((ent = ::readdir(d)) != nullptr)
    {
      std::string name = ent->d_name;
      if (name == "." || name == "..") continue;

      // lstat: the "latest" symlink must not show up as a second copy
      struct stat st{};
      if (::fstatat(::dirfd(d), name.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0)
      {
        // removed between readdir and stat
        errno = 0;
        continue;
      }
      auto details = verify_file_info(name, st);
      if (details)
      {
        FileInfo info;
        info.name = std::move(name);
        info.dir = dir;
        info.size_bytes = static_cast<int64_t>(st.st_size);
        info.mod_time_ns = mod_time_ns(st);
        info.details = std::move(*details);
        results.push_back(std::move(info));
      }
      errno = 0;
    }
    int read_errno = errno;
    ::closedir(d);
    if (read_errno != 0)
    {
      return Status(ErrorCode::DirectoryUnreadable,
                    fmt::format("cannot read log dir '{}': {}", dir, std::strerror(read_errno)));
    }
  }

  *out = std::move(results);
  return Status();
}

Status open_log_reader(const std::vector<std::string>& dirs, const std::string& filename,
                       bool allow_absolute, LogFileReader* out)
{
  if (!filename.empty() && filename.front() == '/')
  {
    if (!allow_absolute)
    {
      return Status(ErrorCode::AccessDenied,
                    fmt::format("absolute pathnames are forbidden: {}", filename));
    }
    return open_verified(filename, true, out);
  }

  if (filename.find('/') != std::string::npos)
  {
    return Status(ErrorCode::AccessDenied,
                  fmt::format("pathnames must be basenames only: {}", filename));
  }
  if (!parse_segment_name(filename))
  {
    return Status(ErrorCode::NotLogFile,
                  fmt::format("filename is not a log file: {}", filename));
  }

  Status last(ErrorCode::IoError, fmt::format("log file not found: {}", filename));
  for (const auto& dir : dirs)
  {
    Status status = open_verified(join_path(dir, filename), false, out);
    if (status.IsOk())
    {
      return status;
    }
    last = std::move(status);
  }
  return last;
}

}  // namespace seglog
