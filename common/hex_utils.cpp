#include "hex_utils.h"

namespace pc::common {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

constexpr char kBase64UrlAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

int Base64UrlValue(char c) {
  if (c >= 'A' && c <= 'Z') {
    return c - 'A';
  }
  if (c >= 'a' && c <= 'z') {
    return 26 + (c - 'a');
  }
  if (c >= '0' && c <= '9') {
    return 52 + (c - '0');
  }
  if (c == '-') {
    return 62;
  }
  if (c == '_') {
    return 63;
  }
  return -1;
}

}  // namespace

std::string BytesToHex(const std::uint8_t* data, std::size_t len) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  if (!data || len == 0) {
    return out;
  }
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2] = kHex[data[i] >> 4];
    out[i * 2 + 1] = kHex[data[i] & 0x0F];
  }
  return out;
}

std::string BytesToHex(const std::vector<std::uint8_t>& data) {
  return BytesToHex(data.data(), data.size());
}

bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out) {
  out.clear();
  if ((hex.size() % 2) != 0) {
    return false;
  }
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexNibble(hex[i]);
    const int lo = HexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      out.clear();
      return false;
    }
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return true;
}

std::string Base64UrlEncode(const std::uint8_t* data, std::size_t len) {
  std::string out;
  if (!data || len == 0) {
    return out;
  }
  out.reserve(((len + 2) / 3) * 4);
  std::size_t i = 0;
  while (i + 3 <= len) {
    const std::uint32_t v = (static_cast<std::uint32_t>(data[i]) << 16) |
                            (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                            static_cast<std::uint32_t>(data[i + 2]);
    out.push_back(kBase64UrlAlphabet[(v >> 18) & 0x3F]);
    out.push_back(kBase64UrlAlphabet[(v >> 12) & 0x3F]);
    out.push_back(kBase64UrlAlphabet[(v >> 6) & 0x3F]);
    out.push_back(kBase64UrlAlphabet[v & 0x3F]);
    i += 3;
  }
  const std::size_t rem = len - i;
  if (rem == 1) {
    const std::uint32_t v = static_cast<std::uint32_t>(data[i]) << 16;
    out.push_back(kBase64UrlAlphabet[(v >> 18) & 0x3F]);
    out.push_back(kBase64UrlAlphabet[(v >> 12) & 0x3F]);
  } else if (rem == 2) {
    const std::uint32_t v = (static_cast<std::uint32_t>(data[i]) << 16) |
                            (static_cast<std::uint32_t>(data[i + 1]) << 8);
    out.push_back(kBase64UrlAlphabet[(v >> 18) & 0x3F]);
    out.push_back(kBase64UrlAlphabet[(v >> 12) & 0x3F]);
    out.push_back(kBase64UrlAlphabet[(v >> 6) & 0x3F]);
  }
  return out;
}

std::string Base64UrlEncode(std::string_view text) {
  return Base64UrlEncode(reinterpret_cast<const std::uint8_t*>(text.data()),
                         text.size());
}

bool Base64UrlDecode(std::string_view in, std::vector<std::uint8_t>& out) {
  out.clear();
  if ((in.size() % 4) == 1) {
    return false;
  }
  out.reserve((in.size() * 3) / 4);
  std::uint32_t acc = 0;
  int bits = 0;
  for (const char c : in) {
    const int v = Base64UrlValue(c);
    if (v < 0) {
      out.clear();
      return false;
    }
    acc = (acc << 6) | static_cast<std::uint32_t>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
    }
  }
  // Leftover bits must be zero padding, otherwise the encoding is not
  // canonical.
  if (bits > 0 && (acc & ((1u << bits) - 1u)) != 0) {
    out.clear();
    return false;
  }
  return true;
}

}  // namespace pc::common
