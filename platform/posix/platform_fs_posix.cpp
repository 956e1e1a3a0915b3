#include "platform_fs.h"

#include <fcntl.h>
#include <pwd.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace {

void SetErrno(std::error_code& ec) {
  ec = std::error_code(errno, std::generic_category());
}

}  // namespace

namespace pbr::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::exists(path, ec);
}

bool IsDirectory(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::is_directory(path, ec);
}

bool IsRegularFile(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::is_regular_file(path, ec);
}

std::uint64_t FileSize(const std::filesystem::path& path,
                       std::error_code& ec) {
  const auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<std::uint64_t>(size);
}

bool Remove(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::remove(path, ec);
}

bool ListDir(const std::filesystem::path& path,
             std::vector<std::filesystem::path>& out,
             std::error_code& ec) {
  out.clear();
  ec.clear();
  std::filesystem::directory_iterator it(path, ec);
  if (ec) {
    return false;
  }
  const std::filesystem::directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      out.clear();
      return false;
    }
    out.push_back(it->path());
  }
  std::sort(out.begin(), out.end());
  return true;
}

bool ReadFileBytes(const std::filesystem::path& path,
                   std::vector<std::uint8_t>& out,
                   std::error_code& ec) {
  out.clear();
  ec.clear();
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    SetErrno(ec);
    return false;
  }
  std::uint8_t buf[4096];
  while (true) {
    const ssize_t got = ::read(fd, buf, sizeof(buf));
    if (got < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetErrno(ec);
      ::close(fd);
      out.clear();
      return false;
    }
    if (got == 0) {
      break;
    }
    out.insert(out.end(), buf, buf + got);
  }
  ::close(fd);
  return true;
}

std::filesystem::path TempDirectory(std::error_code& ec) {
  return std::filesystem::temp_directory_path(ec);
}

std::filesystem::path HomeDirectory() {
  const char* home = std::getenv("HOME");
  if (home && *home) {
    return std::filesystem::path(home);
  }
  const struct passwd* pw = ::getpwuid(::getuid());
  if (pw && pw->pw_dir) {
    return std::filesystem::path(pw->pw_dir);
  }
  return {};
}

}  // namespace pbr::platform::fs
