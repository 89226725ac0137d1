#include "seglog/log_file_config.hpp"

#include <pwd.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <mutex>

#if defined(SEGLOG_PLATFORM_MACOS)
#include <stdlib.h>  // getprogname
#endif

namespace seglog
{

namespace
{

std::string current_program()
{
#if defined(SEGLOG_PLATFORM_LINUX)
  const char* name = program_invocation_short_name;
#else
  const char* name = getprogname();
#endif
  if (name == nullptr || *name == '\0')
  {
    return "unknownprogram";
  }
  return name;
}

std::string current_host()
{
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0')
  {
    return "unknownhost";
  }
  return short_hostname(buf);
}

std::string current_user()
{
  struct passwd pwd{};
  struct passwd* result = nullptr;
  char buf[4096];
  if (::getpwuid_r(::geteuid(), &pwd, buf, sizeof(buf), &result) != 0 ||
      result == nullptr || result->pw_name == nullptr || result->pw_name[0] == '\0')
  {
    return "unknownuser";
  }
  std::string name = result->pw_name;
  // 用户名可能包含路径分隔符（域账户）
  std::replace(name.begin(), name.end(), '\\', '_');
  return name;
}

}  // namespace

std::string short_hostname(std::string_view hostname)
{
  size_t dot = hostname.find('.');
  if (dot != std::string_view::npos)
  {
    hostname = hostname.substr(0, dot);
  }
  return std::string(hostname);
}

std::vector<std::string> compute_log_dirs()
{
  std::vector<std::string> dirs;
  auto add = [&dirs](std::string dir)
  {
    while (dir.size() > 1 && dir.back() == '/')
    {
      dir.pop_back();
    }
    if (!dir.empty() && std::find(dirs.begin(), dirs.end(), dir) == dirs.end())
    {
      dirs.push_back(std::move(dir));
    }
  };

  const char* env = std::getenv(SEGLOG_LOG_DIR_ENV);
  if (env != nullptr && *env != '\0')
  {
    std::string_view list(env);
    size_t start = 0;
    while (start <= list.size())
    {
      size_t colon = list.find(':', start);
      if (colon == std::string_view::npos)
      {
        colon = list.size();
      }
      add(std::string(list.substr(start, colon - start)));
      start = colon + 1;
    }
    if (!dirs.empty())
    {
      return dirs;
    }
  }

  const char* tmp = std::getenv("TMPDIR");
  if (tmp != nullptr && *tmp != '\0')
  {
    add(tmp);
  }
  else
  {
    add("/tmp");
  }
  return dirs;
}

ProcessIdentity ProcessIdentity::Current()
{
  ProcessIdentity id;
  id.program = current_program();
  id.host = current_host();
  id.user_name = current_user();
  id.pid = static_cast<int>(::getpid());
  return id;
}

const std::vector<std::string>& default_log_dirs()
{
  static std::once_flag once;
  static std::vector<std::string> dirs;
  std::call_once(once, [] { dirs = compute_log_dirs(); });
  return dirs;
}

LogFileConfig LogFileConfig::FromEnvironment()
{
  LogFileConfig config;
  config.identity = ProcessIdentity::Current();
  config.log_dirs = default_log_dirs();
  return config;
}

}  // namespace seglog
