#include "config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include "stream_frame.h"

namespace pc::transport {

namespace {

std::string Trim(const std::string& input) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(input.begin(), input.end(), is_space);
  auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string StripInlineComment(const std::string& input) {
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 ||
         std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return Trim(input.substr(0, i));
    }
  }
  return input;
}

bool ParseUint64(const std::string& text, std::uint64_t& out) {
  if (text.empty() || text.front() == '-' || text.front() == '+') {
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

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  std::uint64_t value = 0;
  if (!ParseUint64(text, value) || value > 0xFFFFFFFFull) {
    return false;
  }
  out = static_cast<std::uint32_t>(value);
  return true;
}

bool ParseBool(const std::string& text, bool& out) {
  if (text == "1" || text == "true" || text == "on") {
    out = true;
    return true;
  }
  if (text == "0" || text == "false" || text == "off") {
    out = false;
    return true;
  }
  return false;
}

struct IniState {
  std::string section;
  TransferConfig* cfg{nullptr};
};

// Unknown sections and keys are ignored; a known key with an unparsable
// value fails the load.
bool ApplyKV(IniState& state, const std::string& key,
             const std::string& value) {
  if (state.section == "transfer") {
    auto& t = state.cfg->transfer;
    if (key == "partial_dir") {
      t.partial_dir = value;
      return true;
    }
    if (key == "chunk_size") {
      return ParseUint32(value, t.chunk_size);
    }
    if (key == "max_file_size") {
      return ParseUint64(value, t.max_file_size);
    }
    if (key == "progress_interval") {
      return ParseUint64(value, t.progress_interval);
    }
    if (key == "partial_retention_sec") {
      return ParseUint64(value, t.partial_retention_sec);
    }
    if (key == "sweep_interval_sec") {
      return ParseUint64(value, t.sweep_interval_sec);
    }
    return true;
  }
  if (state.section == "auth") {
    if (key == "jwt_secret") {
      state.cfg->auth.jwt_secret = value;
      return true;
    }
    if (key == "token_ttl_sec") {
      return ParseUint64(value, state.cfg->auth.token_ttl_sec);
    }
    return true;
  }
  if (state.section == "log") {
    if (key == "debug_log") {
      return ParseBool(value, state.cfg->log.debug_log);
    }
    return true;
  }
  return true;
}

bool ParseIni(const std::string& path, TransferConfig& out,
              std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "config file not found: " + path;
    return false;
  }

  IniState state;
  state.cfg = &out;

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    const std::string trimmed = StripInlineComment(Trim(line));
    if (trimmed.empty()) {
      continue;
    }
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      state.section = Trim(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    const auto pos = trimmed.find('=');
    if (pos == std::string::npos) {
      std::ostringstream oss;
      oss << "invalid line " << line_no;
      error = oss.str();
      return false;
    }
    const std::string key = Trim(trimmed.substr(0, pos));
    const std::string value = Trim(trimmed.substr(pos + 1));
    if (!ApplyKV(state, key, value)) {
      std::ostringstream oss;
      oss << "invalid value for " << state.section << "." << key << " (line "
          << line_no << ")";
      error = oss.str();
      return false;
    }
  }
  return true;
}

}  // namespace

bool ValidateConfig(const TransferConfig& config, std::string& error) {
  if (config.auth.jwt_secret.empty()) {
    error = "auth.jwt_secret missing";
    return false;
  }
  if (config.auth.token_ttl_sec == 0) {
    error = "auth.token_ttl_sec must be positive";
    return false;
  }
  if (config.transfer.partial_dir.empty()) {
    error = "transfer.partial_dir missing";
    return false;
  }
  if (config.transfer.chunk_size == 0 ||
      config.transfer.chunk_size > kMaxDataChunkSize) {
    error = "transfer.chunk_size out of range";
    return false;
  }
  if (config.transfer.max_file_size == 0 ||
      config.transfer.max_file_size > kMaxFileSize) {
    error = "transfer.max_file_size out of range";
    return false;
  }
  if (config.transfer.progress_interval == 0) {
    error = "transfer.progress_interval must be positive";
    return false;
  }
  if (config.transfer.sweep_interval_sec == 0) {
    error = "transfer.sweep_interval_sec must be positive";
    return false;
  }
  return true;
}

bool LoadConfig(const std::string& path, TransferConfig& out_config,
                std::string& error) {
  out_config = TransferConfig{};
  if (!ParseIni(path, out_config, error)) {
    return false;
  }
  return ValidateConfig(out_config, error);
}

}  // namespace pc::transport
