#include <cassert>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "transfer_tracker.h"

using pc::transport::TransferState;
using pc::transport::TransferTracker;

namespace {

TransferState MakeState(const std::string& id, std::uint64_t size) {
  TransferState s;
  s.transfer_id = id;
  s.user_id = 1;
  s.channel_id = 2;
  s.filename = id + ".bin";
  s.total_size = size;
  s.temp_path = "/tmp/" + id + ".part";
  return s;
}

}  // namespace

int main() {
  TransferTracker tracker;
  bool ok = tracker.TryInsert(MakeState("a", 100));
  assert(ok);
  ok = tracker.TryInsert(MakeState("a", 200));
  assert(!ok);
  assert(tracker.Size() == 1);
  assert(tracker.Contains("a"));
  assert(!tracker.Contains("b"));

  auto got = tracker.GetBytesReceived("a");
  assert(got.has_value() && *got == 0);
  tracker.UpdateBytesReceived("a", 50);
  tracker.UpdateBytesReceived("a", 10);  // ignored
  got = tracker.GetBytesReceived("a");
  assert(got.has_value() && *got == 50);
  assert(!tracker.GetBytesReceived("missing").has_value());

  auto snap = tracker.Snapshot("a");
  assert(snap.has_value());
  assert(snap->total_size == 100);
  assert(snap->filename == "a.bin");
  assert(!snap->cancelled);

  assert(!tracker.IsCancelled("a"));
  ok = tracker.Cancel("a");
  assert(ok);
  assert(tracker.IsCancelled("a"));
  ok = tracker.Cancel("missing");
  assert(!ok);
  assert(!tracker.IsCancelled("missing"));

  auto removed = tracker.Remove("a");
  assert(removed.has_value());
  assert(removed->bytes_received == 50);
  assert(removed->cancelled);
  assert(!tracker.Remove("a").has_value());
  assert(tracker.Size() == 0);

  // Concurrent transfers on distinct ids.
  const int kThreads = 8;
  const int kPerThread = 200;
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&tracker, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        const std::string id =
            "t" + std::to_string(t) + "-" + std::to_string(i);
        if (!tracker.TryInsert(MakeState(id, 1000))) {
          continue;
        }
        for (std::uint64_t b = 100; b <= 1000; b += 100) {
          tracker.UpdateBytesReceived(id, b);
        }
        if (i % 2 == 0) {
          tracker.Remove(id);
        }
      }
    });
  }
  for (auto& w : workers) {
    w.join();
  }
  assert(tracker.Size() ==
         static_cast<std::size_t>(kThreads * kPerThread / 2));
  const auto ids = tracker.ActiveIds();
  assert(ids.size() == tracker.Size());
  for (const auto& id : ids) {
    auto b = tracker.GetBytesReceived(id);
    assert(b.has_value() && *b == 1000);
  }

  return 0;
}
