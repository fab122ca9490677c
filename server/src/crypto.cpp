#include "crypto.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <limits>

#include "monocypher.h"

namespace pc::transport::crypto {

bool HmacSha256(const std::uint8_t* key, std::size_t key_len,
                const std::uint8_t* data, std::size_t data_len,
                Sha256Digest& out) {
  out = Sha256Digest{};
  if (key_len > static_cast<std::size_t>((std::numeric_limits<int>::max)())) {
    return false;
  }
  static const std::uint8_t kEmpty = 0;
  unsigned int out_len = 0;
  const unsigned char* mac =
      HMAC(EVP_sha256(), key ? key : &kEmpty, static_cast<int>(key_len),
           data ? data : &kEmpty, data_len, out.bytes.data(), &out_len);
  if (!mac || out_len != out.bytes.size()) {
    crypto_wipe(out.bytes.data(), out.bytes.size());
    return false;
  }
  return true;
}

bool DigestEqual(const Sha256Digest& a, const Sha256Digest& b) {
  return crypto_verify32(a.bytes.data(), b.bytes.data()) == 0;
}

bool RandomBytes(std::uint8_t* out, std::size_t len) {
  if (!out || len == 0) {
    return len == 0;
  }
  if (len > static_cast<std::size_t>((std::numeric_limits<int>::max)())) {
    return false;
  }
  return RAND_bytes(out, static_cast<int>(len)) == 1;
}

}  // namespace pc::transport::crypto
