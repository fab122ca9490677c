#include <cassert>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <utime.h>

#include "partial_upload_manager.h"

using pc::transport::PartialUploadManager;

namespace {

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream f(path, std::ios::binary);
  f << content;
}

void Backdate(const std::filesystem::path& path, std::time_t seconds) {
  const std::time_t when = std::time(nullptr) - seconds;
  utimbuf times{};
  times.actime = when;
  times.modtime = when;
  const int rc = ::utime(path.c_str(), &times);
  assert(rc == 0);
  (void)rc;
}

}  // namespace

int main() {
  assert(PartialUploadManager::IsSafeTransferId("abc-123_DEF.x"));
  assert(!PartialUploadManager::IsSafeTransferId(""));
  assert(!PartialUploadManager::IsSafeTransferId("../etc/passwd"));
  assert(!PartialUploadManager::IsSafeTransferId("a/b"));
  assert(!PartialUploadManager::IsSafeTransferId("a\\b"));
  assert(!PartialUploadManager::IsSafeTransferId(".."));
  assert(!PartialUploadManager::IsSafeTransferId("a\nb"));
  assert(!PartialUploadManager::IsSafeTransferId(std::string(129, 'x')));
  assert(PartialUploadManager::IsSafeTransferId(std::string(128, 'x')));

  const std::filesystem::path dir = "tmp_partial_upload_manager";
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  PartialUploadManager mgr(dir);
  assert(mgr.TempPath("t1") == dir / "t1.part");

  // Sweeping a directory that does not exist yet is a no-op.
  assert(mgr.SweepStale(std::chrono::seconds(0)) == 0);

  std::string err;
  bool ok = mgr.EnsureDir(err);
  assert(ok);
  ok = mgr.EnsureDir(err);
  assert(ok);
  assert(mgr.PartialSize("t1") == 0);

  {
    pc::platform::fs::AppendFile file;
    ok = mgr.OpenForAppend("t1", file, err);
    assert(ok);
    const std::uint8_t first[4] = {1, 2, 3, 4};
    ok = file.Write(first, sizeof(first), ec);
    assert(ok);
    ok = file.Close(ec);
    assert(ok);
  }
  {
    pc::platform::fs::AppendFile file;
    ok = mgr.OpenForAppend("t1", file, err);
    assert(ok);
    const std::uint8_t second[2] = {5, 6};
    ok = file.Write(second, sizeof(second), ec);
    assert(ok);
    ok = file.Sync(ec);
    assert(ok);
  }
  assert(mgr.PartialSize("t1") == 6);

  ok = mgr.TruncateTo("t1", 3, err);
  assert(ok);
  std::vector<std::uint8_t> data;
  ok = mgr.ReadComplete("t1", data, err);
  assert(ok);
  assert(data == (std::vector<std::uint8_t>{1, 2, 3}));

  ok = mgr.ReadComplete("missing", data, err);
  assert(!ok);
  assert(!err.empty());

  mgr.Remove("t1");
  assert(mgr.PartialSize("t1") == 0);
  mgr.Remove("t1");

  // Only stale ".part" files are swept.
  WriteFile(mgr.TempPath("old"), "old");
  WriteFile(mgr.TempPath("fresh"), "fresh");
  WriteFile(dir / "notes.txt", "keep");
  Backdate(mgr.TempPath("old"), 7200);
  Backdate(dir / "notes.txt", 7200);

  const std::size_t removed = mgr.SweepStale(std::chrono::seconds(3600));
  assert(removed == 1);
  assert(!std::filesystem::exists(mgr.TempPath("old")));
  assert(std::filesystem::exists(mgr.TempPath("fresh")));
  assert(std::filesystem::exists(dir / "notes.txt"));

  std::filesystem::remove_all(dir, ec);
  return 0;
}
