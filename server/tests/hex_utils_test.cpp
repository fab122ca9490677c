#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "../../common/hex_utils.h"

using pc::common::Base64UrlDecode;
using pc::common::Base64UrlEncode;
using pc::common::BytesToHex;
using pc::common::HexToBytes;

int main() {
  std::vector<std::uint8_t> bytes;
  bool ok = HexToBytes("00ff10Ab", bytes);
  assert(ok);
  assert(bytes == (std::vector<std::uint8_t>{0x00, 0xFF, 0x10, 0xAB}));
  assert(BytesToHex(bytes) == "00ff10ab");
  ok = HexToBytes("abc", bytes);
  assert(!ok);
  ok = HexToBytes("zz", bytes);
  assert(!ok);

  // RFC 4648 vectors, unpadded, url alphabet.
  assert(Base64UrlEncode(std::string("")) == "");
  assert(Base64UrlEncode(std::string("f")) == "Zg");
  assert(Base64UrlEncode(std::string("fo")) == "Zm8");
  assert(Base64UrlEncode(std::string("foo")) == "Zm9v");
  assert(Base64UrlEncode(std::string("foobar")) == "Zm9vYmFy");
  const std::uint8_t special[3] = {0xFB, 0xFF, 0xBF};
  assert(Base64UrlEncode(special, sizeof(special)) == "-_-_");

  ok = Base64UrlDecode("Zm9vYg", bytes);
  assert(ok);
  assert(std::string(bytes.begin(), bytes.end()) == "foob");
  ok = Base64UrlDecode("-_-_", bytes);
  assert(ok);
  assert(bytes == std::vector<std::uint8_t>(special, special + 3));

  ok = Base64UrlDecode("Zm9vY", bytes);  // length % 4 == 1
  assert(!ok);
  ok = Base64UrlDecode("Zh", bytes);  // non-zero trailing bits
  assert(!ok);
  ok = Base64UrlDecode("Zm+v", bytes);
  assert(!ok);
  ok = Base64UrlDecode("Zg==", bytes);
  assert(!ok);

  return 0;
}
