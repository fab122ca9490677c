#include "transfer_tracker.h"

#include <functional>
#include <utility>

namespace pc::transport {

TransferTracker::Shard& TransferTracker::ShardFor(
    const std::string& transfer_id) {
  return shards_[std::hash<std::string>{}(transfer_id) % shards_.size()];
}

const TransferTracker::Shard& TransferTracker::ShardFor(
    const std::string& transfer_id) const {
  return shards_[std::hash<std::string>{}(transfer_id) % shards_.size()];
}

bool TransferTracker::TryInsert(TransferState state) {
  auto& shard = ShardFor(state.transfer_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  const std::string key = state.transfer_id;
  return shard.transfers.try_emplace(key, std::move(state)).second;
}

std::optional<std::uint64_t> TransferTracker::GetBytesReceived(
    const std::string& transfer_id) const {
  const auto& shard = ShardFor(transfer_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  const auto it = shard.transfers.find(transfer_id);
  if (it == shard.transfers.end()) {
    return std::nullopt;
  }
  return it->second.bytes_received;
}

void TransferTracker::UpdateBytesReceived(const std::string& transfer_id,
                                          std::uint64_t bytes) {
  auto& shard = ShardFor(transfer_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  const auto it = shard.transfers.find(transfer_id);
  if (it == shard.transfers.end()) {
    return;
  }
  if (bytes > it->second.bytes_received) {
    it->second.bytes_received = bytes;
  }
}

bool TransferTracker::Cancel(const std::string& transfer_id) {
  auto& shard = ShardFor(transfer_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  const auto it = shard.transfers.find(transfer_id);
  if (it == shard.transfers.end()) {
    return false;
  }
  it->second.cancelled = true;
  return true;
}

bool TransferTracker::IsCancelled(const std::string& transfer_id) const {
  const auto& shard = ShardFor(transfer_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  const auto it = shard.transfers.find(transfer_id);
  return it != shard.transfers.end() && it->second.cancelled;
}

std::optional<TransferState> TransferTracker::Remove(
    const std::string& transfer_id) {
  auto& shard = ShardFor(transfer_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  const auto it = shard.transfers.find(transfer_id);
  if (it == shard.transfers.end()) {
    return std::nullopt;
  }
  TransferState state = std::move(it->second);
  shard.transfers.erase(it);
  return state;
}

std::optional<TransferState> TransferTracker::Snapshot(
    const std::string& transfer_id) const {
  const auto& shard = ShardFor(transfer_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  const auto it = shard.transfers.find(transfer_id);
  if (it == shard.transfers.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool TransferTracker::Contains(const std::string& transfer_id) const {
  const auto& shard = ShardFor(transfer_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  return shard.transfers.count(transfer_id) != 0;
}

std::size_t TransferTracker::Size() const {
  std::size_t total = 0;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    total += shard.transfers.size();
  }
  return total;
}

std::vector<std::string> TransferTracker::ActiveIds() const {
  std::vector<std::string> out;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (const auto& kv : shard.transfers) {
      out.push_back(kv.first);
    }
  }
  return out;
}

}  // namespace pc::transport
