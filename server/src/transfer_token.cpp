#include "transfer_token.h"

#include <algorithm>
#include <limits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../../common/hex_utils.h"
#include "../../platform/include/platform_time.h"
#include "crypto.h"
#include "monocypher.h"

namespace pc::transport {

namespace {

using nlohmann::json;

constexpr char kJwtHeader[] = R"({"alg":"HS256","typ":"JWT"})";

bool Sign(const std::string& secret, const std::string& signing_input,
          crypto::Sha256Digest& out) {
  return crypto::HmacSha256(
      reinterpret_cast<const std::uint8_t*>(secret.data()), secret.size(),
      reinterpret_cast<const std::uint8_t*>(signing_input.data()),
      signing_input.size(), out);
}

bool ParseSegment(const std::string& segment, json& out) {
  std::vector<std::uint8_t> raw;
  if (!common::Base64UrlDecode(segment, raw)) {
    return false;
  }
  out = json::parse(raw.begin(), raw.end(), nullptr, false);
  return !out.is_discarded() && out.is_object();
}

bool ReadU64(const json& obj, const char* key, std::uint64_t& out) {
  const auto it = obj.find(key);
  if (it == obj.end()) {
    return false;
  }
  if (it->is_number_unsigned()) {
    out = it->get<std::uint64_t>();
    return true;
  }
  if (it->is_number_integer()) {
    const auto v = it->get<std::int64_t>();
    if (v < 0) {
      return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
  }
  return false;
}

bool ReadI64(const json& obj, const char* key, std::int64_t& out) {
  const auto it = obj.find(key);
  if (it == obj.end()) {
    return false;
  }
  if (it->is_number_unsigned()) {
    const auto v = it->get<std::uint64_t>();
    if (v > static_cast<std::uint64_t>(
                (std::numeric_limits<std::int64_t>::max)())) {
      return false;
    }
    out = static_cast<std::int64_t>(v);
    return true;
  }
  if (it->is_number_integer()) {
    out = it->get<std::int64_t>();
    return true;
  }
  return false;
}

bool ReadString(const json& obj, const char* key, std::string& out) {
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool ClaimsFromJson(const json& obj, TransferClaims& out) {
  return ReadI64(obj, "sub", out.sub) && ReadString(obj, "tid", out.tid) &&
         ReadI64(obj, "cid", out.cid) && ReadString(obj, "fname", out.fname) &&
         ReadU64(obj, "fsize", out.fsize) && ReadU64(obj, "exp", out.exp) &&
         ReadU64(obj, "iat", out.iat);
}

}  // namespace

Hs256TokenValidator::Hs256TokenValidator(std::string secret, UnixClock clock,
                                         std::uint64_t leeway_sec)
    : secret_(std::move(secret)),
      clock_(clock ? clock : &platform::NowUnixSeconds),
      leeway_sec_(leeway_sec) {}

Hs256TokenValidator::~Hs256TokenValidator() {
  if (!secret_.empty()) {
    crypto_wipe(&secret_[0], secret_.size());
  }
}

bool Hs256TokenValidator::Validate(const std::string& token,
                                   TransferClaims& out, std::string& error) {
  out = TransferClaims{};
  error.clear();
  if (secret_.empty()) {
    error = "token secret not configured";
    return false;
  }
  const auto dot1 = token.find('.');
  const auto dot2 =
      dot1 == std::string::npos ? std::string::npos : token.find('.', dot1 + 1);
  if (dot1 == std::string::npos || dot2 == std::string::npos ||
      token.find('.', dot2 + 1) != std::string::npos) {
    error = "malformed token";
    return false;
  }
  const std::string header_b64 = token.substr(0, dot1);
  const std::string payload_b64 = token.substr(dot1 + 1, dot2 - dot1 - 1);
  const std::string sig_b64 = token.substr(dot2 + 1);

  json header;
  if (!ParseSegment(header_b64, header)) {
    error = "malformed token header";
    return false;
  }
  std::string alg;
  if (!ReadString(header, "alg", alg) || alg != "HS256") {
    error = "unsupported token algorithm";
    return false;
  }

  std::vector<std::uint8_t> sig;
  if (!common::Base64UrlDecode(sig_b64, sig) || sig.size() != 32) {
    error = "invalid token signature";
    return false;
  }
  crypto::Sha256Digest expected;
  if (!Sign(secret_, token.substr(0, dot2), expected)) {
    error = "token signing failed";
    return false;
  }
  crypto::Sha256Digest presented;
  std::copy(sig.begin(), sig.end(), presented.bytes.begin());
  if (!crypto::DigestEqual(expected, presented)) {
    error = "invalid token signature";
    return false;
  }

  json payload;
  TransferClaims claims;
  if (!ParseSegment(payload_b64, payload) || !ClaimsFromJson(payload, claims)) {
    error = "invalid token claims";
    return false;
  }
  const std::uint64_t now = clock_();
  if (now == 0) {
    error = "clock unavailable";
    return false;
  }
  if (claims.exp < now && now - claims.exp > leeway_sec_) {
    error = "token expired";
    return false;
  }
  out = std::move(claims);
  return true;
}

bool MintTransferToken(const std::string& secret, const TransferClaims& claims,
                       std::string& out_token, std::string& error) {
  out_token.clear();
  error.clear();
  if (secret.empty()) {
    error = "token secret empty";
    return false;
  }
  json payload = json::object();
  payload["sub"] = claims.sub;
  payload["tid"] = claims.tid;
  payload["cid"] = claims.cid;
  payload["fname"] = claims.fname;
  payload["fsize"] = claims.fsize;
  payload["exp"] = claims.exp;
  payload["iat"] = claims.iat;
  const std::string body =
      payload.dump(-1, ' ', false, json::error_handler_t::replace);

  std::string signing_input = common::Base64UrlEncode(kJwtHeader);
  signing_input.push_back('.');
  signing_input.append(common::Base64UrlEncode(body));

  crypto::Sha256Digest sig;
  if (!Sign(secret, signing_input, sig)) {
    error = "token signing failed";
    return false;
  }
  out_token = std::move(signing_input);
  out_token.push_back('.');
  out_token.append(common::Base64UrlEncode(sig.bytes.data(), sig.bytes.size()));
  return true;
}

}  // namespace pc::transport
