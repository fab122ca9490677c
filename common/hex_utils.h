#ifndef PC_TRANSPORT_HEX_UTILS_H
#define PC_TRANSPORT_HEX_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pc::common {

std::string BytesToHex(const std::uint8_t* data, std::size_t len);
std::string BytesToHex(const std::vector<std::uint8_t>& data);
bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out);

// Unpadded RFC 4648 base64url, as used by JWT segments.
std::string Base64UrlEncode(const std::uint8_t* data, std::size_t len);
std::string Base64UrlEncode(std::string_view text);
bool Base64UrlDecode(std::string_view in, std::vector<std::uint8_t>& out);

}  // namespace pc::common

#endif  // PC_TRANSPORT_HEX_UTILS_H
