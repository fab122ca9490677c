#ifndef PC_TRANSPORT_TRANSFER_TRACKER_H
#define PC_TRANSPORT_TRANSFER_TRACKER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pc::transport {

struct TransferState {
  std::string transfer_id;
  std::int64_t user_id{0};
  std::int64_t channel_id{0};
  std::string filename;
  std::uint64_t total_size{0};
  std::uint64_t bytes_received{0};
  std::filesystem::path temp_path;
  bool cancelled{false};
};

// In-flight transfers keyed by transfer id. Sharded so concurrent transfers
// only contend when their ids hash to the same shard.
class TransferTracker {
 public:
  TransferTracker() = default;

  TransferTracker(const TransferTracker&) = delete;
  TransferTracker& operator=(const TransferTracker&) = delete;

  // Fails if a transfer with the same id is already registered.
  bool TryInsert(TransferState state);

  std::optional<std::uint64_t> GetBytesReceived(
      const std::string& transfer_id) const;
  // Never moves the counter backwards.
  void UpdateBytesReceived(const std::string& transfer_id,
                           std::uint64_t bytes);

  // Flags the transfer; the receive loop notices at its next frame.
  bool Cancel(const std::string& transfer_id);
  bool IsCancelled(const std::string& transfer_id) const;

  std::optional<TransferState> Remove(const std::string& transfer_id);
  std::optional<TransferState> Snapshot(const std::string& transfer_id) const;
  bool Contains(const std::string& transfer_id) const;

  std::size_t Size() const;
  std::vector<std::string> ActiveIds() const;

 private:
  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<std::string, TransferState> transfers;
  };

  Shard& ShardFor(const std::string& transfer_id);
  const Shard& ShardFor(const std::string& transfer_id) const;

  static constexpr std::size_t kShardCount = 16;
  std::array<Shard, kShardCount> shards_{};
};

}  // namespace pc::transport

#endif  // PC_TRANSPORT_TRANSFER_TRACKER_H
