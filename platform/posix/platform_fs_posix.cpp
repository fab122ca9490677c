#include "platform_fs.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <ctime>
#include <string>
#include <utility>

namespace {

void SetErrno(std::error_code& ec) {
  ec = std::error_code(errno, std::generic_category());
}

bool WriteAllFd(int fd, const std::uint8_t* data, std::size_t len,
                std::error_code& ec) {
  std::size_t offset = 0;
  while (offset < len) {
    const std::size_t chunk = len - offset;
    const ssize_t rc =
        ::write(fd, data + offset, static_cast<size_t>(chunk));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetErrno(ec);
      return false;
    }
    offset += static_cast<std::size_t>(rc);
  }
  return true;
}

}  // namespace

namespace pc::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::exists(path, ec);
}

std::uint64_t FileSize(const std::filesystem::path& path,
                       std::error_code& ec) {
  const auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<std::uint64_t>(size);
}

bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec) {
  std::filesystem::create_directories(path, ec);
  return !ec;
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
  return true;
}

bool TruncateFile(const std::filesystem::path& path, std::uint64_t size,
                  std::error_code& ec) {
  ec.clear();
  if (::truncate(path.c_str(), static_cast<off_t>(size)) != 0) {
    SetErrno(ec);
    return false;
  }
  return true;
}

bool ReadFile(const std::filesystem::path& path,
              std::vector<std::uint8_t>& out,
              std::error_code& ec) {
  out.clear();
  ec.clear();
  const int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    SetErrno(ec);
    return false;
  }
  struct stat st {};
  if (::fstat(fd, &st) == 0 && st.st_size > 0) {
    out.reserve(static_cast<std::size_t>(st.st_size));
  }
  std::uint8_t buf[64 * 1024];
  while (true) {
    const ssize_t rc = ::read(fd, buf, sizeof(buf));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetErrno(ec);
      ::close(fd);
      out.clear();
      return false;
    }
    if (rc == 0) {
      break;
    }
    out.insert(out.end(), buf, buf + rc);
  }
  ::close(fd);
  return true;
}

bool LastWriteAge(const std::filesystem::path& path,
                  std::chrono::seconds& out_age,
                  std::error_code& ec) {
  ec.clear();
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    SetErrno(ec);
    return false;
  }
  const std::time_t now = std::time(nullptr);
  if (now == static_cast<std::time_t>(-1)) {
    ec = std::make_error_code(std::errc::io_error);
    return false;
  }
  const std::time_t mtime = st.st_mtime;
  out_age = std::chrono::seconds(now > mtime ? now - mtime : 0);
  return true;
}

AppendFile::~AppendFile() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

AppendFile::AppendFile(AppendFile&& other) noexcept : fd_(other.fd_) {
  other.fd_ = -1;
}

AppendFile& AppendFile::operator=(AppendFile&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = std::exchange(other.fd_, -1);
  return *this;
}

bool AppendFile::Open(const std::filesystem::path& path, std::error_code& ec) {
  ec.clear();
  if (fd_ >= 0) {
    ec = std::make_error_code(std::errc::device_or_resource_busy);
    return false;
  }
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0600);
  if (fd < 0) {
    SetErrno(ec);
    return false;
  }
  fd_ = fd;
  return true;
}

bool AppendFile::Write(const std::uint8_t* data, std::size_t len,
                       std::error_code& ec) {
  ec.clear();
  if (fd_ < 0) {
    ec = std::make_error_code(std::errc::bad_file_descriptor);
    return false;
  }
  if (len == 0) {
    return true;
  }
  if (!data) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  return WriteAllFd(fd_, data, len, ec);
}

bool AppendFile::Sync(std::error_code& ec) {
  ec.clear();
  if (fd_ < 0) {
    ec = std::make_error_code(std::errc::bad_file_descriptor);
    return false;
  }
  if (::fsync(fd_) != 0) {
    SetErrno(ec);
    return false;
  }
  return true;
}

bool AppendFile::Close(std::error_code& ec) {
  ec.clear();
  if (fd_ < 0) {
    return true;
  }
  const int fd = std::exchange(fd_, -1);
  if (::close(fd) != 0) {
    SetErrno(ec);
    return false;
  }
  return true;
}

}  // namespace pc::platform::fs
