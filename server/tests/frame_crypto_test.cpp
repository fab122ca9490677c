#include <cassert>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "../../common/hex_utils.h"
#include "frame_crypto.h"

using pc::media::MediaHeaderBytes;
using pc::transport::BuildFrameNonce;
using pc::transport::CryptoStatus;
using pc::transport::FrameDecryptor;
using pc::transport::FrameEncryptor;
using pc::transport::FrameKey;

namespace {

FrameKey KeyFromHex(const std::string& hex) {
  std::vector<std::uint8_t> raw;
  const bool ok = pc::common::HexToBytes(hex, raw);
  assert(ok && raw.size() == 16);
  (void)ok;
  FrameKey key{};
  std::memcpy(key.data(), raw.data(), key.size());
  return key;
}

MediaHeaderBytes HeaderFromHex(const std::string& hex) {
  std::vector<std::uint8_t> raw;
  const bool ok = pc::common::HexToBytes(hex, raw);
  assert(ok && raw.size() == 16);
  (void)ok;
  MediaHeaderBytes header{};
  std::memcpy(header.data(), raw.data(), header.size());
  return header;
}

std::vector<std::uint8_t> Bytes(const std::string& s) {
  return std::vector<std::uint8_t>(s.begin(), s.end());
}

}  // namespace

int main() {
  const FrameKey key = KeyFromHex("000102030405060708090a0b0c0d0e0f");
  const MediaHeaderBytes header =
      HeaderFromHex("800001000003c0deadbeef7f01003c00");
  const std::vector<std::uint8_t> voice = Bytes("Hello, voice data!");

  // Nonce layout.
  {
    const auto nonce = BuildFrameNonce(0xDEADBEEF, 1, 0x0102);
    const std::uint8_t expect[12] = {0xDE, 0xAD, 0xBE, 0xEF, 0x01, 0x01,
                                     0x02, 0,    0,    0,    0,    0};
    assert(std::memcmp(nonce.data(), expect, sizeof(expect)) == 0);
  }

  FrameEncryptor enc;
  FrameDecryptor dec;
  enc.SetKey(1, key);
  dec.SetKey(1, key);

  // Known vectors.
  {
    std::vector<std::uint8_t> out;
    CryptoStatus st = enc.Encrypt(header, 0xDEADBEEF, 1, 1, voice.data(),
                                  voice.size(), out);
    assert(st == CryptoStatus::kOk);
    assert(pc::common::BytesToHex(out) ==
           "c9611e22e84a7843baeea950f4874840d7de76e45bab8f2dc788366fe73643bb62"
           "f5");

    std::vector<std::uint8_t> again;
    st = enc.EncryptFrame(header, voice.data(), voice.size(), again);
    assert(st == CryptoStatus::kOk);
    assert(again == out);

    std::vector<std::uint8_t> plain;
    st = dec.DecryptFrame(header, out.data(), out.size(), plain);
    assert(st == CryptoStatus::kOk);
    assert(plain == voice);

    st = enc.Encrypt(header, 0xDEADBEEF, 1, 0, nullptr, 0, out);
    assert(st == CryptoStatus::kOk);
    assert(pc::common::BytesToHex(out) == "e4ee5cfea6b77f20fcb4d7c719b1f0a4");
    st = dec.Decrypt(header, 0xDEADBEEF, 1, 0, out.data(), out.size(), plain);
    assert(st == CryptoStatus::kOk);
    assert(plain.empty());
  }
  {
    FrameEncryptor enc5;
    enc5.SetKey(5, KeyFromHex("ffffffffffffffffffffffffffffffff"));
    const MediaHeaderBytes h5 =
        HeaderFromHex("80000a00000780112233446405000400");
    const std::uint8_t payload[4] = {0, 1, 2, 3};
    std::vector<std::uint8_t> out;
    CryptoStatus st =
        enc5.Encrypt(h5, 0x11223344, 5, 10, payload, sizeof(payload), out);
    assert(st == CryptoStatus::kOk);
    assert(pc::common::BytesToHex(out) ==
           "81c292b9fd8c98a87d786ee1f5698993b50ae66d");
  }

  std::vector<std::uint8_t> sealed;
  CryptoStatus st = enc.Encrypt(header, 0xDEADBEEF, 1, 1, voice.data(),
                                voice.size(), sealed);
  assert(st == CryptoStatus::kOk);

  // Any single-bit change to header or ciphertext fails authentication.
  for (std::size_t byte = 0; byte < header.size(); ++byte) {
    for (int bit = 0; bit < 8; ++bit) {
      MediaHeaderBytes h = header;
      h[byte] ^= static_cast<std::uint8_t>(1u << bit);
      std::vector<std::uint8_t> plain;
      st = dec.Decrypt(h, 0xDEADBEEF, 1, 1, sealed.data(), sealed.size(),
                       plain);
      assert(st == CryptoStatus::kDecryptionFailed);
    }
  }
  for (std::size_t byte = 0; byte < sealed.size(); ++byte) {
    for (int bit = 0; bit < 8; ++bit) {
      std::vector<std::uint8_t> c = sealed;
      c[byte] ^= static_cast<std::uint8_t>(1u << bit);
      std::vector<std::uint8_t> plain;
      st = dec.Decrypt(header, 0xDEADBEEF, 1, 1, c.data(), c.size(), plain);
      assert(st == CryptoStatus::kDecryptionFailed);
    }
  }

  // Wrong key, sequence or ssrc.
  {
    std::vector<std::uint8_t> plain;
    FrameKey other = key;
    other[15] ^= 0x01;
    FrameDecryptor wrong;
    wrong.SetKey(1, other);
    st = wrong.Decrypt(header, 0xDEADBEEF, 1, 1, sealed.data(), sealed.size(),
                       plain);
    assert(st == CryptoStatus::kDecryptionFailed);

    st = dec.Decrypt(header, 0xDEADBEEF, 1, 2, sealed.data(), sealed.size(),
                     plain);
    assert(st == CryptoStatus::kDecryptionFailed);
    st = dec.Decrypt(header, 0xDEADBEEE, 1, 1, sealed.data(), sealed.size(),
                     plain);
    assert(st == CryptoStatus::kDecryptionFailed);
  }

  // Wrong epoch: same key under another epoch still changes the nonce.
  {
    FrameDecryptor multi;
    multi.SetKey(1, key);
    multi.SetKey(2, key);
    std::vector<std::uint8_t> plain;
    st = multi.Decrypt(header, 0xDEADBEEF, 2, 1, sealed.data(), sealed.size(),
                       plain);
    assert(st == CryptoStatus::kDecryptionFailed);
    st = multi.Decrypt(header, 0xDEADBEEF, 1, 1, sealed.data(), sealed.size(),
                       plain);
    assert(st == CryptoStatus::kOk);
  }

  // Missing keys are hard failures on both sides.
  {
    std::vector<std::uint8_t> out;
    st = enc.Encrypt(header, 0xDEADBEEF, 9, 1, voice.data(), voice.size(),
                     out);
    assert(st == CryptoStatus::kNoKeyForEpoch);
    st = dec.Decrypt(header, 0xDEADBEEF, 9, 1, sealed.data(), sealed.size(),
                     out);
    assert(st == CryptoStatus::kNoKeyForEpoch);

    dec.RemoveKey(1);
    assert(!dec.HasKey(1));
    st = dec.Decrypt(header, 0xDEADBEEF, 1, 1, sealed.data(), sealed.size(),
                     out);
    assert(st == CryptoStatus::kNoKeyForEpoch);
    dec.SetKey(1, key);
  }

  // Shorter than a tag.
  {
    std::vector<std::uint8_t> out;
    st = dec.Decrypt(header, 0xDEADBEEF, 1, 1, sealed.data(), 15, out);
    assert(st == CryptoStatus::kCiphertextTooShort);
  }

  // Key ring bookkeeping.
  {
    pc::transport::EpochKeyRing ring;
    assert(ring.size() == 0);
    ring.Set(0, key);
    ring.Set(255, key);
    assert(ring.size() == 2);
    assert(ring.Find(0) != nullptr);
    assert(ring.Find(7) == nullptr);
    ring.Remove(0);
    assert(!ring.Has(0));
    assert(ring.size() == 1);
  }

  return 0;
}
