#include "partial_upload_manager.h"

#include <utility>

#include "../../platform/include/platform_log.h"

namespace pc::transport {

namespace pfs = pc::platform::fs;
namespace plog = pc::platform::log;

namespace {
constexpr char kLogTag[] = "partial";
}  // namespace

PartialUploadManager::PartialUploadManager(std::filesystem::path partial_dir)
    : partial_dir_(std::move(partial_dir)) {}

bool PartialUploadManager::IsSafeTransferId(const std::string& transfer_id) {
  if (transfer_id.empty() || transfer_id.size() > kMaxTransferIdLength) {
    return false;
  }
  if (transfer_id == "." || transfer_id.find("..") != std::string::npos) {
    return false;
  }
  for (const char c : transfer_id) {
    const auto uc = static_cast<unsigned char>(c);
    if (c == '/' || c == '\\' || uc < 0x20 || uc == 0x7F) {
      return false;
    }
  }
  return true;
}

std::filesystem::path PartialUploadManager::TempPath(
    const std::string& transfer_id) const {
  return partial_dir_ / (transfer_id + kPartialSuffix);
}

bool PartialUploadManager::EnsureDir(std::string& error) const {
  std::error_code ec;
  if (!pfs::CreateDirectories(partial_dir_, ec)) {
    error = "create partial dir failed: " + ec.message();
    return false;
  }
  return true;
}

std::uint64_t PartialUploadManager::PartialSize(
    const std::string& transfer_id) const {
  std::error_code ec;
  const auto size = pfs::FileSize(TempPath(transfer_id), ec);
  return ec ? 0 : size;
}

bool PartialUploadManager::OpenForAppend(const std::string& transfer_id,
                                         pfs::AppendFile& out,
                                         std::string& error) const {
  std::error_code ec;
  if (!out.Open(TempPath(transfer_id), ec)) {
    error = "open staging file failed: " + ec.message();
    return false;
  }
  return true;
}

bool PartialUploadManager::ReadComplete(const std::string& transfer_id,
                                        std::vector<std::uint8_t>& out,
                                        std::string& error) const {
  std::error_code ec;
  if (!pfs::ReadFile(TempPath(transfer_id), out, ec)) {
    error = "read staging file failed: " + ec.message();
    return false;
  }
  return true;
}

bool PartialUploadManager::TruncateTo(const std::string& transfer_id,
                                      std::uint64_t size,
                                      std::string& error) const {
  std::error_code ec;
  if (!pfs::TruncateFile(TempPath(transfer_id), size, ec)) {
    error = "truncate staging file failed: " + ec.message();
    return false;
  }
  return true;
}

void PartialUploadManager::Remove(const std::string& transfer_id) const {
  std::error_code ec;
  pfs::Remove(TempPath(transfer_id), ec);
  if (ec) {
    plog::Log(plog::Level::kWarn, kLogTag, "remove staging file failed",
              {{"transfer_id", transfer_id}, {"error", ec.message()}});
  }
}

std::size_t PartialUploadManager::SweepStale(
    std::chrono::seconds max_age) const {
  std::error_code ec;
  if (!pfs::Exists(partial_dir_, ec)) {
    return 0;
  }
  std::vector<std::filesystem::path> entries;
  if (!pfs::ListDir(partial_dir_, entries, ec)) {
    plog::Log(plog::Level::kWarn, kLogTag, "partial dir scan failed",
              {{"dir", partial_dir_.string()}, {"error", ec.message()}});
    return 0;
  }
  std::size_t removed = 0;
  for (const auto& path : entries) {
    if (path.extension() != kPartialSuffix) {
      continue;
    }
    std::chrono::seconds age{0};
    if (!pfs::LastWriteAge(path, age, ec)) {
      continue;
    }
    if (age <= max_age) {
      continue;
    }
    const std::string age_text = std::to_string(age.count());
    plog::Log(plog::Level::kInfo, kLogTag, "removing stale partial upload",
              {{"path", path.string()}, {"age_sec", age_text}});
    if (pfs::Remove(path, ec)) {
      ++removed;
    } else if (ec) {
      plog::Log(plog::Level::kWarn, kLogTag, "stale partial remove failed",
                {{"path", path.string()}, {"error", ec.message()}});
    }
  }
  return removed;
}

}  // namespace pc::transport
