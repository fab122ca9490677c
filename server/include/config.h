#ifndef PC_TRANSPORT_CONFIG_H
#define PC_TRANSPORT_CONFIG_H

#include <cstdint>
#include <string>

#include "transfer_types.h"
#include "transfer_token.h"

namespace pc::transport {

struct TransferSection {
  std::string partial_dir{"storage/partial"};
  std::uint32_t chunk_size{kDefaultChunkSize};
  std::uint64_t max_file_size{kMaxFileSize};
  std::uint64_t progress_interval{kProgressAckInterval};
  std::uint64_t partial_retention_sec{3600};
  std::uint64_t sweep_interval_sec{300};
};

struct AuthSection {
  std::string jwt_secret;
  std::uint64_t token_ttl_sec{kDefaultTokenTtlSec};
};

struct LogSection {
  bool debug_log{false};
};

struct TransferConfig {
  TransferSection transfer;
  AuthSection auth;
  LogSection log;
};

// INI file: [section] headers, key=value lines, '#' or ';' comments.
bool LoadConfig(const std::string& path, TransferConfig& out_config,
                std::string& error);

// Checks ranges on an already populated config.
bool ValidateConfig(const TransferConfig& config, std::string& error);

}  // namespace pc::transport

#endif  // PC_TRANSPORT_CONFIG_H
