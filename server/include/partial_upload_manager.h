#ifndef PC_TRANSPORT_PARTIAL_UPLOAD_MANAGER_H
#define PC_TRANSPORT_PARTIAL_UPLOAD_MANAGER_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "../../platform/include/platform_fs.h"

namespace pc::transport {

constexpr std::size_t kMaxTransferIdLength = 128;
constexpr char kPartialSuffix[] = ".part";

// Staging files for resumable uploads, one "{transfer_id}.part" per transfer
// under a single directory.
class PartialUploadManager {
 public:
  explicit PartialUploadManager(std::filesystem::path partial_dir);

  // Non-empty, at most kMaxTransferIdLength, no path separators, no "..",
  // no control characters.
  static bool IsSafeTransferId(const std::string& transfer_id);

  const std::filesystem::path& partial_dir() const { return partial_dir_; }
  std::filesystem::path TempPath(const std::string& transfer_id) const;

  bool EnsureDir(std::string& error) const;
  // 0 when no staging file exists.
  std::uint64_t PartialSize(const std::string& transfer_id) const;
  bool OpenForAppend(const std::string& transfer_id,
                     platform::fs::AppendFile& out,
                     std::string& error) const;
  bool ReadComplete(const std::string& transfer_id,
                    std::vector<std::uint8_t>& out,
                    std::string& error) const;
  bool TruncateTo(const std::string& transfer_id, std::uint64_t size,
                  std::string& error) const;
  // Best effort; failures are logged.
  void Remove(const std::string& transfer_id) const;

  // Deletes staging files last written more than |max_age| ago. Returns the
  // number removed.
  std::size_t SweepStale(std::chrono::seconds max_age) const;

 private:
  std::filesystem::path partial_dir_;
};

}  // namespace pc::transport

#endif  // PC_TRANSPORT_PARTIAL_UPLOAD_MANAGER_H
