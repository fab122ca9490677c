#include "frame_crypto.h"

#include <openssl/evp.h>

#include <cstring>
#include <limits>
#include <memory>
#include <utility>

#include "monocypher.h"

namespace pc::transport {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

bool FitsInt(std::size_t len) {
  return len <= static_cast<std::size_t>((std::numeric_limits<int>::max)());
}

CryptoStatus SealGcm(const std::uint8_t* key, const FrameNonce& nonce,
                     const media::MediaHeaderBytes& aad,
                     const std::uint8_t* plaintext, std::size_t len,
                     std::vector<std::uint8_t>& out) {
  out.clear();
  if (!FitsInt(len) || (len > 0 && !plaintext)) {
    return CryptoStatus::kInternal;
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    return CryptoStatus::kInternal;
  }
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(kFrameNonceSize), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key, nonce.data()) != 1) {
    return CryptoStatus::kInternal;
  }
  int n = 0;
  if (EVP_EncryptUpdate(ctx.get(), nullptr, &n, aad.data(),
                        static_cast<int>(aad.size())) != 1) {
    return CryptoStatus::kInternal;
  }
  std::vector<std::uint8_t> sealed(len + kFrameTagSize);
  int written = 0;
  if (len > 0) {
    if (EVP_EncryptUpdate(ctx.get(), sealed.data(), &n, plaintext,
                          static_cast<int>(len)) != 1) {
      return CryptoStatus::kInternal;
    }
    written = n;
  }
  if (EVP_EncryptFinal_ex(ctx.get(), sealed.data() + written, &n) != 1) {
    return CryptoStatus::kInternal;
  }
  written += n;
  if (static_cast<std::size_t>(written) != len) {
    return CryptoStatus::kInternal;
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(kFrameTagSize),
                          sealed.data() + len) != 1) {
    return CryptoStatus::kInternal;
  }
  out = std::move(sealed);
  return CryptoStatus::kOk;
}

CryptoStatus OpenGcm(const std::uint8_t* key, const FrameNonce& nonce,
                     const media::MediaHeaderBytes& aad,
                     const std::uint8_t* ciphertext, std::size_t len,
                     std::vector<std::uint8_t>& out) {
  out.clear();
  const std::size_t body_len = len - kFrameTagSize;
  if (!FitsInt(body_len)) {
    return CryptoStatus::kInternal;
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    return CryptoStatus::kInternal;
  }
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(kFrameNonceSize), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key, nonce.data()) != 1) {
    return CryptoStatus::kInternal;
  }
  int n = 0;
  if (EVP_DecryptUpdate(ctx.get(), nullptr, &n, aad.data(),
                        static_cast<int>(aad.size())) != 1) {
    return CryptoStatus::kInternal;
  }
  std::vector<std::uint8_t> plain(body_len);
  int written = 0;
  if (body_len > 0) {
    if (EVP_DecryptUpdate(ctx.get(), plain.data(), &n, ciphertext,
                          static_cast<int>(body_len)) != 1) {
      return CryptoStatus::kInternal;
    }
    written = n;
  }
  std::uint8_t tag[kFrameTagSize];
  std::memcpy(tag, ciphertext + body_len, kFrameTagSize);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(kFrameTagSize), tag) != 1) {
    return CryptoStatus::kInternal;
  }
  if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + written, &n) != 1) {
    crypto_wipe(plain.data(), plain.size());
    return CryptoStatus::kDecryptionFailed;
  }
  out = std::move(plain);
  return CryptoStatus::kOk;
}

}  // namespace

const char* CryptoStatusName(CryptoStatus status) {
  switch (status) {
    case CryptoStatus::kOk:
      return "ok";
    case CryptoStatus::kNoKeyForEpoch:
      return "no key for epoch";
    case CryptoStatus::kCiphertextTooShort:
      return "ciphertext too short";
    case CryptoStatus::kDecryptionFailed:
      return "decryption failed";
    case CryptoStatus::kInternal:
      return "crypto backend failure";
  }
  return "unknown";
}

FrameNonce BuildFrameNonce(std::uint32_t ssrc, std::uint8_t epoch,
                           std::uint16_t sequence) {
  FrameNonce nonce{};
  nonce[0] = static_cast<std::uint8_t>((ssrc >> 24) & 0xFF);
  nonce[1] = static_cast<std::uint8_t>((ssrc >> 16) & 0xFF);
  nonce[2] = static_cast<std::uint8_t>((ssrc >> 8) & 0xFF);
  nonce[3] = static_cast<std::uint8_t>(ssrc & 0xFF);
  nonce[4] = epoch;
  nonce[5] = static_cast<std::uint8_t>((sequence >> 8) & 0xFF);
  nonce[6] = static_cast<std::uint8_t>(sequence & 0xFF);
  return nonce;
}

EpochKeyRing::~EpochKeyRing() {
  for (auto& slot : slots_) {
    crypto_wipe(slot.key.data(), slot.key.size());
    slot.present = false;
  }
}

void EpochKeyRing::Set(std::uint8_t epoch, const FrameKey& key) {
  Slot& slot = slots_[epoch];
  crypto_wipe(slot.key.data(), slot.key.size());
  slot.key = key;
  slot.present = true;
}

void EpochKeyRing::Remove(std::uint8_t epoch) {
  Slot& slot = slots_[epoch];
  crypto_wipe(slot.key.data(), slot.key.size());
  slot.present = false;
}

bool EpochKeyRing::Has(std::uint8_t epoch) const {
  return slots_[epoch].present;
}

const std::uint8_t* EpochKeyRing::Find(std::uint8_t epoch) const {
  const Slot& slot = slots_[epoch];
  return slot.present ? slot.key.data() : nullptr;
}

std::size_t EpochKeyRing::size() const {
  std::size_t count = 0;
  for (const auto& slot : slots_) {
    if (slot.present) {
      ++count;
    }
  }
  return count;
}

CryptoStatus FrameEncryptor::Encrypt(const media::MediaHeaderBytes& header,
                                     std::uint32_t ssrc, std::uint8_t epoch,
                                     std::uint16_t sequence,
                                     const std::uint8_t* plaintext,
                                     std::size_t len,
                                     std::vector<std::uint8_t>& out) const {
  out.clear();
  const std::uint8_t* key = keys_.Find(epoch);
  if (!key) {
    return CryptoStatus::kNoKeyForEpoch;
  }
  return SealGcm(key, BuildFrameNonce(ssrc, epoch, sequence), header,
                 plaintext, len, out);
}

CryptoStatus FrameEncryptor::EncryptFrame(
    const media::MediaHeaderBytes& header, const std::uint8_t* plaintext,
    std::size_t len, std::vector<std::uint8_t>& out) const {
  media::MediaHeader parsed;
  if (!media::DecodeMediaHeader(header.data(), header.size(), parsed)) {
    out.clear();
    return CryptoStatus::kInternal;
  }
  return Encrypt(header, parsed.ssrc, parsed.key_epoch, parsed.sequence,
                 plaintext, len, out);
}

CryptoStatus FrameDecryptor::Decrypt(const media::MediaHeaderBytes& header,
                                     std::uint32_t ssrc, std::uint8_t epoch,
                                     std::uint16_t sequence,
                                     const std::uint8_t* ciphertext,
                                     std::size_t len,
                                     std::vector<std::uint8_t>& out) const {
  out.clear();
  if (!ciphertext || len < kFrameTagSize) {
    return CryptoStatus::kCiphertextTooShort;
  }
  const std::uint8_t* key = keys_.Find(epoch);
  if (!key) {
    return CryptoStatus::kNoKeyForEpoch;
  }
  return OpenGcm(key, BuildFrameNonce(ssrc, epoch, sequence), header,
                 ciphertext, len, out);
}

CryptoStatus FrameDecryptor::DecryptFrame(
    const media::MediaHeaderBytes& header, const std::uint8_t* ciphertext,
    std::size_t len, std::vector<std::uint8_t>& out) const {
  media::MediaHeader parsed;
  if (!media::DecodeMediaHeader(header.data(), header.size(), parsed)) {
    out.clear();
    return CryptoStatus::kInternal;
  }
  return Decrypt(header, parsed.ssrc, parsed.key_epoch, parsed.sequence,
                 ciphertext, len, out);
}

}  // namespace pc::transport
