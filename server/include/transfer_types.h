#ifndef PC_TRANSPORT_TRANSFER_TYPES_H
#define PC_TRANSPORT_TRANSFER_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace pc::transport {

constexpr std::uint32_t kDefaultChunkSize = 256 * 1024;
constexpr std::uint64_t kProgressAckInterval = 1024 * 1024;
constexpr std::uint64_t kMaxFileSize = 1024ull * 1024 * 1024;
constexpr std::size_t kStreamReadBufferSize = 32 * 1024;

// FileTransferError.code values.
constexpr std::uint32_t kErrorCodeSizeExceeded = 1;
constexpr std::uint32_t kErrorCodeProtocol = 2;
constexpr std::uint32_t kErrorCodeStorage = 3;

enum class TransferErrorKind : std::uint8_t {
  kNone = 0,
  kProtocolViolation,
  kAuthFailure,
  kResourceLimit,
  kCancelled,
  kTransientIo,
};

const char* TransferErrorKindName(TransferErrorKind kind);

struct TransferError {
  TransferErrorKind kind{TransferErrorKind::kNone};
  std::string message;

  bool ok() const { return kind == TransferErrorKind::kNone; }
};

inline TransferError MakeTransferError(TransferErrorKind kind,
                                       std::string message) {
  TransferError err;
  err.kind = kind;
  err.message = std::move(message);
  return err;
}

}  // namespace pc::transport

#endif  // PC_TRANSPORT_TRANSFER_TYPES_H
