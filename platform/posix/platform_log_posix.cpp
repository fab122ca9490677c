#include "platform_log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

namespace pc::platform::log {

namespace {

std::mutex g_log_mutex;
LogCallback g_log_cb = nullptr;
void* g_log_user = nullptr;
std::atomic<std::uint8_t> g_min_level{static_cast<std::uint8_t>(Level::kInfo)};

const char* LevelToString(Level level) {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
  }
  return "INFO";
}

bool IsDelimiter(char ch) {
  const unsigned char uc = static_cast<unsigned char>(ch);
  return std::isspace(uc) != 0 || ch == ',' || ch == ';' || ch == '&';
}

std::string ToLowerAscii(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string RedactInline(std::string_view message) {
  std::string out(message);
  std::string lower = ToLowerAscii(out);
  static constexpr const char* kKeys[] = {"token", "secret", "key", "password"};
  for (const char* key : kKeys) {
    const std::string pattern = std::string(key) + "=";
    std::size_t pos = 0;
    while (true) {
      pos = lower.find(pattern, pos);
      if (pos == std::string::npos) {
        break;
      }
      const std::size_t start = pos + pattern.size();
      std::size_t end = start;
      while (end < out.size() && !IsDelimiter(out[end])) {
        ++end;
      }
      if (end > start) {
        out.replace(start, end - start, "***");
        lower.replace(start, end - start, "***");
        pos = start + 3;
      } else {
        pos = start;
      }
    }
  }
  return out;
}

void DefaultLog(Level level,
                std::string_view tag,
                const std::string& message,
                const std::vector<std::string>& rendered_fields) {
  std::string line;
  line.reserve(64 + message.size() + rendered_fields.size() * 16);
  line.append("[pc_transport] ");
  line.append(LevelToString(level));
  if (!tag.empty()) {
    line.push_back(' ');
    line.append(tag.data(), tag.size());
  }
  line.append(": ");
  line.append(message);
  for (const auto& field : rendered_fields) {
    line.push_back(' ');
    line.append(field);
  }
  line.push_back('\n');
  FILE* out = (level == Level::kError || level == Level::kWarn) ? stderr : stdout;
  std::fwrite(line.data(), 1, line.size(), out);
  std::fflush(out);
}

}  // namespace

void SetLogCallback(LogCallback cb, void* user_data) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_log_cb = cb;
  g_log_user = user_data;
}

void SetMinLevel(Level level) {
  g_min_level.store(static_cast<std::uint8_t>(level), std::memory_order_relaxed);
}

Level MinLevel() {
  return static_cast<Level>(g_min_level.load(std::memory_order_relaxed));
}

void Log(Level level, std::string_view tag, std::string_view message) {
  Log(level, tag, message, {});
}

void Log(Level level,
         std::string_view tag,
         std::string_view message,
         std::initializer_list<Field> fields) {
  if (static_cast<std::uint8_t>(level) <
      g_min_level.load(std::memory_order_relaxed)) {
    return;
  }
  const std::string redacted = RedactInline(message);

  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_log_cb) {
    std::vector<std::string> values;
    values.reserve(fields.size());
    std::vector<Field> safe;
    safe.reserve(fields.size());
    for (const auto& field : fields) {
      values.push_back(RedactValue(field.key, field.value));
    }
    std::size_t i = 0;
    for (const auto& field : fields) {
      safe.push_back(Field{field.key, values[i++]});
    }
    const std::string tag_str(tag);
    g_log_cb(level, tag_str.c_str(), redacted.c_str(), safe.data(),
             safe.size(), g_log_user);
    return;
  }

  std::vector<std::string> rendered;
  rendered.reserve(fields.size());
  for (const auto& field : fields) {
    if (field.key.empty()) {
      continue;
    }
    std::string kv(field.key);
    kv.push_back('=');
    kv.append(RedactValue(field.key, field.value));
    rendered.push_back(std::move(kv));
  }
  DefaultLog(level, tag, redacted, rendered);
}

bool IsSensitiveKey(std::string_view key) {
  if (key.empty()) {
    return false;
  }
  const std::string lower = ToLowerAscii(key);
  if (lower.find("token") != std::string::npos ||
      lower.find("secret") != std::string::npos ||
      lower.find("password") != std::string::npos) {
    return true;
  }
  if (lower.find("key") != std::string::npos) {
    // Epoch/key identifiers are not secret material.
    if (lower.find("key_id") != std::string::npos ||
        lower.find("keyid") != std::string::npos ||
        lower.find("key_epoch") != std::string::npos) {
      return false;
    }
    return true;
  }
  return false;
}

std::string RedactValue(std::string_view key, std::string_view value) {
  if (IsSensitiveKey(key)) {
    return "***";
  }
  return std::string(value);
}

std::string RedactMessage(std::string_view message) {
  return RedactInline(message);
}

}  // namespace pc::platform::log
