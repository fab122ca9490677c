#include <array>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "../common/hex_utils.h"
#include "../platform/include/platform_time.h"
#include "config.h"
#include "crypto.h"
#include "transfer_token.h"

namespace {

struct Options {
  std::string config_path{"config.ini"};
  std::string transfer_id;
  std::string filename;
  std::int64_t user_id{0};
  std::int64_t channel_id{0};
  std::uint64_t file_size{0};
  std::uint64_t ttl_sec{0};
  bool have_user{false};
  bool have_size{false};
  bool show_help{false};
};

void PrintUsage() {
  std::cout
      << "Usage: pc_transfer_token --user ID --file NAME --size BYTES "
         "[--channel ID] [--tid ID] [--ttl SEC] [--config PATH]\n"
         "  --user ID       Uploading user id (token sub)\n"
         "  --file NAME     File name recorded in the token\n"
         "  --size BYTES    Declared file size\n"
         "  --channel ID    Channel id (default: 0)\n"
         "  --tid ID        Transfer id (default: random 32 hex chars)\n"
         "  --ttl SEC       Lifetime (default: auth.token_ttl_sec)\n"
         "  --config PATH   Server config providing auth.jwt_secret "
         "(default: config.ini)\n";
}

bool ParseInt64(const std::string& text, std::int64_t& out) {
  if (text.empty()) {
    return false;
  }
  errno = 0;
  char* end_ptr = nullptr;
  const long long value = std::strtoll(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || errno == ERANGE) {
    return false;
  }
  out = static_cast<std::int64_t>(value);
  return true;
}

bool ParseUint64(const std::string& text, std::uint64_t& out) {
  if (text.empty() || text.front() == '-') {
    return false;
  }
  errno = 0;
  char* end_ptr = nullptr;
  const unsigned long long value = std::strtoull(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || errno == ERANGE) {
    return false;
  }
  out = static_cast<std::uint64_t>(value);
  return true;
}

bool ParseArgs(int argc, char** argv, Options& out, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      out.show_help = true;
      return true;
    }
    if (i + 1 >= argc) {
      error = arg + " requires a value";
      return false;
    }
    const std::string value = argv[++i];
    if (arg == "--config") {
      out.config_path = value;
    } else if (arg == "--tid") {
      out.transfer_id = value;
    } else if (arg == "--file") {
      out.filename = value;
    } else if (arg == "--user") {
      if (!ParseInt64(value, out.user_id)) {
        error = "invalid --user";
        return false;
      }
      out.have_user = true;
    } else if (arg == "--channel") {
      if (!ParseInt64(value, out.channel_id)) {
        error = "invalid --channel";
        return false;
      }
    } else if (arg == "--size") {
      if (!ParseUint64(value, out.file_size)) {
        error = "invalid --size";
        return false;
      }
      out.have_size = true;
    } else if (arg == "--ttl") {
      if (!ParseUint64(value, out.ttl_sec) || out.ttl_sec == 0) {
        error = "invalid --ttl";
        return false;
      }
    } else {
      error = "unknown argument: " + arg;
      return false;
    }
  }
  if (!out.show_help && (!out.have_user || !out.have_size ||
                         out.filename.empty())) {
    error = "--user, --file and --size are required";
    return false;
  }
  return true;
}

bool RandomTransferId(std::string& out, std::string& error) {
  std::array<std::uint8_t, 16> raw{};
  if (!pc::transport::crypto::RandomBytes(raw.data(), raw.size())) {
    error = "random transfer id failed";
    return false;
  }
  out = pc::common::BytesToHex(raw.data(), raw.size());
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  Options opt;
  std::string error;
  if (!ParseArgs(argc, argv, opt, error)) {
    std::cerr << "[pc_transfer_token] " << error << "\n";
    PrintUsage();
    return 1;
  }
  if (opt.show_help) {
    PrintUsage();
    return 0;
  }

  pc::transport::TransferConfig cfg;
  if (!pc::transport::LoadConfig(opt.config_path, cfg, error)) {
    std::cerr << "[pc_transfer_token] " << error << "\n";
    return 1;
  }
  if (opt.transfer_id.empty() && !RandomTransferId(opt.transfer_id, error)) {
    std::cerr << "[pc_transfer_token] " << error << "\n";
    return 1;
  }

  pc::transport::TransferClaims claims;
  claims.sub = opt.user_id;
  claims.tid = opt.transfer_id;
  claims.cid = opt.channel_id;
  claims.fname = opt.filename;
  claims.fsize = opt.file_size;
  claims.iat = pc::platform::NowUnixSeconds();
  claims.exp =
      claims.iat + (opt.ttl_sec != 0 ? opt.ttl_sec : cfg.auth.token_ttl_sec);

  std::string token;
  if (!pc::transport::MintTransferToken(cfg.auth.jwt_secret, claims, token,
                                        error)) {
    std::cerr << "[pc_transfer_token] " << error << "\n";
    return 1;
  }
  std::cout << "transfer_id=" << claims.tid << "\n"
            << "expires=" << claims.exp << "\n"
            << "token=" << token << "\n";
  return 0;
}
