#ifndef PC_TRANSPORT_CRYPTO_H
#define PC_TRANSPORT_CRYPTO_H

#include <array>
#include <cstddef>
#include <cstdint>

namespace pc::transport::crypto {

struct Sha256Digest {
  std::array<std::uint8_t, 32> bytes{};
};

bool HmacSha256(const std::uint8_t* key, std::size_t key_len,
                const std::uint8_t* data, std::size_t data_len,
                Sha256Digest& out);

// Compares two digests without early exit.
bool DigestEqual(const Sha256Digest& a, const Sha256Digest& b);

bool RandomBytes(std::uint8_t* out, std::size_t len);

}  // namespace pc::transport::crypto

#endif  // PC_TRANSPORT_CRYPTO_H
