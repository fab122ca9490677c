#ifndef PC_TRANSPORT_FRAME_CRYPTO_H
#define PC_TRANSPORT_FRAME_CRYPTO_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "../../shard/media_header.h"

namespace pc::transport {

constexpr std::size_t kFrameKeySize = 16;
constexpr std::size_t kFrameTagSize = 16;
constexpr std::size_t kFrameNonceSize = 12;
constexpr std::size_t kEpochCount = 256;

using FrameKey = std::array<std::uint8_t, kFrameKeySize>;
using FrameNonce = std::array<std::uint8_t, kFrameNonceSize>;

enum class CryptoStatus : std::uint8_t {
  kOk = 0,
  kNoKeyForEpoch = 1,
  kCiphertextTooShort = 2,
  kDecryptionFailed = 3,
  kInternal = 4,
};

const char* CryptoStatusName(CryptoStatus status);

// Bytes 0-3 ssrc (BE), byte 4 epoch, bytes 5-6 sequence (BE), 7-11 zero.
FrameNonce BuildFrameNonce(std::uint32_t ssrc, std::uint8_t epoch,
                           std::uint16_t sequence);

// Fixed table of AES-128 keys indexed by key epoch. Replaced and removed
// keys are wiped.
class EpochKeyRing {
 public:
  EpochKeyRing() = default;
  ~EpochKeyRing();

  EpochKeyRing(const EpochKeyRing&) = delete;
  EpochKeyRing& operator=(const EpochKeyRing&) = delete;

  void Set(std::uint8_t epoch, const FrameKey& key);
  void Remove(std::uint8_t epoch);
  bool Has(std::uint8_t epoch) const;
  // nullptr when no key is installed for |epoch|.
  const std::uint8_t* Find(std::uint8_t epoch) const;
  std::size_t size() const;

 private:
  struct Slot {
    bool present{false};
    FrameKey key{};
  };

  std::array<Slot, kEpochCount> slots_{};
};

// AES-128-GCM over one media payload. The serialized 16-byte media header is
// the additional authenticated data; output is ciphertext || 16-byte tag.
class FrameEncryptor {
 public:
  void SetKey(std::uint8_t epoch, const FrameKey& key) { keys_.Set(epoch, key); }
  void RemoveKey(std::uint8_t epoch) { keys_.Remove(epoch); }
  bool HasKey(std::uint8_t epoch) const { return keys_.Has(epoch); }

  CryptoStatus Encrypt(const media::MediaHeaderBytes& header,
                       std::uint32_t ssrc, std::uint8_t epoch,
                       std::uint16_t sequence,
                       const std::uint8_t* plaintext, std::size_t len,
                       std::vector<std::uint8_t>& out) const;

  // Takes ssrc, epoch and sequence from |header| itself.
  CryptoStatus EncryptFrame(const media::MediaHeaderBytes& header,
                            const std::uint8_t* plaintext, std::size_t len,
                            std::vector<std::uint8_t>& out) const;

 private:
  EpochKeyRing keys_;
};

// Several epochs may be installed at once so frames in flight across a key
// rotation still decrypt.
class FrameDecryptor {
 public:
  void SetKey(std::uint8_t epoch, const FrameKey& key) { keys_.Set(epoch, key); }
  void RemoveKey(std::uint8_t epoch) { keys_.Remove(epoch); }
  bool HasKey(std::uint8_t epoch) const { return keys_.Has(epoch); }

  CryptoStatus Decrypt(const media::MediaHeaderBytes& header,
                       std::uint32_t ssrc, std::uint8_t epoch,
                       std::uint16_t sequence,
                       const std::uint8_t* ciphertext, std::size_t len,
                       std::vector<std::uint8_t>& out) const;

  CryptoStatus DecryptFrame(const media::MediaHeaderBytes& header,
                            const std::uint8_t* ciphertext, std::size_t len,
                            std::vector<std::uint8_t>& out) const;

 private:
  EpochKeyRing keys_;
};

}  // namespace pc::transport

#endif  // PC_TRANSPORT_FRAME_CRYPTO_H
