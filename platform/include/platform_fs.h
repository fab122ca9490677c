#ifndef PC_TRANSPORT_PLATFORM_FS_H
#define PC_TRANSPORT_PLATFORM_FS_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

namespace pc::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec);
std::uint64_t FileSize(const std::filesystem::path& path,
                       std::error_code& ec);
bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec);
bool Remove(const std::filesystem::path& path, std::error_code& ec);
bool ListDir(const std::filesystem::path& path,
             std::vector<std::filesystem::path>& out,
             std::error_code& ec);
bool TruncateFile(const std::filesystem::path& path, std::uint64_t size,
                  std::error_code& ec);
bool ReadFile(const std::filesystem::path& path,
              std::vector<std::uint8_t>& out,
              std::error_code& ec);

// Time elapsed since the last modification of |path|. Returns false when the
// file is missing or the clock cannot be read.
bool LastWriteAge(const std::filesystem::path& path,
                  std::chrono::seconds& out_age,
                  std::error_code& ec);

// Append-only writer over a raw descriptor. Writes are unbuffered, so a
// returned Write() has reached the kernel.
class AppendFile {
 public:
  AppendFile() = default;
  ~AppendFile();

  AppendFile(const AppendFile&) = delete;
  AppendFile& operator=(const AppendFile&) = delete;
  AppendFile(AppendFile&& other) noexcept;
  AppendFile& operator=(AppendFile&& other) noexcept;

  bool Open(const std::filesystem::path& path, std::error_code& ec);
  bool Write(const std::uint8_t* data, std::size_t len, std::error_code& ec);
  bool Sync(std::error_code& ec);
  bool Close(std::error_code& ec);

  bool is_open() const { return fd_ >= 0; }

 private:
  int fd_{-1};
};

}  // namespace pc::platform::fs

#endif  // PC_TRANSPORT_PLATFORM_FS_H
