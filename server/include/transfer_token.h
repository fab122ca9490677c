#ifndef PC_TRANSPORT_TRANSFER_TOKEN_H
#define PC_TRANSPORT_TRANSFER_TOKEN_H

#include <cstdint>
#include <string>

namespace pc::transport {

constexpr std::uint64_t kDefaultTokenTtlSec = 900;
constexpr std::uint64_t kDefaultTokenLeewaySec = 60;

// Claims of an upload capability token. One token authorizes one transfer.
struct TransferClaims {
  std::int64_t sub{0};    // user id
  std::string tid;        // transfer id
  std::int64_t cid{0};    // channel id
  std::string fname;
  std::uint64_t fsize{0};
  std::uint64_t exp{0};
  std::uint64_t iat{0};
};

class TokenValidator {
 public:
  virtual ~TokenValidator() = default;
  virtual bool Validate(const std::string& token, TransferClaims& out,
                        std::string& error) = 0;
};

using UnixClock = std::uint64_t (*)();

// Compact HS256 JWT. Rejects any other "alg", a bad signature, missing
// claims, and tokens whose exp lies more than |leeway_sec| in the past.
class Hs256TokenValidator final : public TokenValidator {
 public:
  explicit Hs256TokenValidator(std::string secret,
                               UnixClock clock = nullptr,
                               std::uint64_t leeway_sec = kDefaultTokenLeewaySec);
  ~Hs256TokenValidator() override;

  Hs256TokenValidator(const Hs256TokenValidator&) = delete;
  Hs256TokenValidator& operator=(const Hs256TokenValidator&) = delete;

  bool Validate(const std::string& token, TransferClaims& out,
                std::string& error) override;

 private:
  std::string secret_;
  UnixClock clock_;
  std::uint64_t leeway_sec_;
};

bool MintTransferToken(const std::string& secret, const TransferClaims& claims,
                       std::string& out_token, std::string& error);

}  // namespace pc::transport

#endif  // PC_TRANSPORT_TRANSFER_TOKEN_H
