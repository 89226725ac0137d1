#include "seglog/segment_file.hpp"

#include <fcntl.h>
#include <fmt/format.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

#include "seglog/file_name.hpp"
#include "seglog/platform.hpp"

namespace seglog
{

namespace
{

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

// Replaces dir/link with a relative symlink to target.
Status update_symlink(const std::string& dir, const std::string& link,
                      const std::string& target)
{
  std::string link_path = join_path(dir, link);
  if (::unlink(link_path.c_str()) != 0 && errno != ENOENT)
  {
    return Status(ErrorCode::IoError,
                  fmt::format("cannot remove '{}': {}", link_path, std::strerror(errno)));
  }
  if (::symlink(target.c_str(), link_path.c_str()) != 0)
  {
    return Status(ErrorCode::IoError,
                  fmt::format("cannot link '{}' -> '{}': {}", link_path, target,
                              std::strerror(errno)));
  }
  return Status();
}

}  // namespace

SegmentFile::~SegmentFile() { Close(); }

SegmentFile::SegmentFile(SegmentFile&& other) noexcept
    : fd_(other.fd_),
      path_(std::move(other.path_)),
      size_(other.size_),
      created_ns_(other.created_ns_),
      link_status_(std::move(other.link_status_))
{
  other.fd_ = -1;
  other.size_ = 0;
}

SegmentFile& SegmentFile::operator=(SegmentFile&& other) noexcept
{
  if (this != &other)
  {
    Close();
    fd_ = other.fd_;
    path_ = std::move(other.path_);
    size_ = other.size_;
    created_ns_ = other.created_ns_;
    link_status_ = std::move(other.link_status_);
    other.fd_ = -1;
    other.size_ = 0;
  }
  return *this;
}

bool SegmentFile::Append(const void* data, size_t len)
{
  if (fd_ < 0)
  {
    return false;
  }
  const char* p = static_cast<const char*>(data);
  size_t remaining = len;
  while (remaining > 0)
  {
    ssize_t written = ::write(fd_, p, remaining);
    if (written < 0)
    {
      if (errno == EINTR) continue;
      return false;
    }
    p += written;
    remaining -= static_cast<size_t>(written);
    size_ += static_cast<uint64_t>(written);
  }
  return true;
}

void SegmentFile::Sync()
{
  if (fd_ >= 0)
  {
    ::fsync(fd_);
  }
}

void SegmentFile::Close()
{
  if (fd_ >= 0)
  {
    ::fsync(fd_);
    ::close(fd_);
    fd_ = -1;
  }
}

Status create_segment(const LogFileConfig& config, LogLevel level, int64_t time_ns,
                      SegmentFile* out)
{
  if (config.log_dirs.empty())
  {
    return Status(ErrorCode::NoLogDirs, "no log dirs configured");
  }
  if (!is_file_level(level))
  {
    return Status(ErrorCode::CreateFailed,
                  fmt::format("level {} has no segment", to_string(level)));
  }

  SegmentName name = make_segment_name(config.identity, level, time_ns);
  std::string last_error;
  for (const auto& dir : config.log_dirs)
  {
    std::string path = join_path(dir, name.file_name);

    // O_APPEND: a name reused within the same second keeps its content
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, SEGLOG_FILE_MODE);
    if (fd < 0)
    {
      last_error = fmt::format("{}: {}", path, std::strerror(errno));
      continue;
    }

    SegmentFile file;
    file.fd_ = fd;
    file.path_ = path;
    file.created_ns_ = name.created_ns;
    struct stat st{};
    if (::fstat(fd, &st) == 0)
    {
      file.size_ = static_cast<uint64_t>(st.st_size);
    }

    file.link_status_ = update_symlink(dir, name.link_name, name.file_name);
    if (!file.link_status_.IsOk())
    {
      std::fprintf(stderr, "seglog: %s\n", file.link_status_.Message().c_str());
    }

    *out = std::move(file);
    return Status();
  }
  return Status(ErrorCode::CreateFailed, fmt::format("cannot create log: {}", last_error));
}

}  // namespace seglog
