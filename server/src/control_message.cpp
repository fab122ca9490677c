#include "control_message.h"

#include <array>
#include <cstring>
#include <limits>

#include <nlohmann/json.hpp>

namespace pc::transport {

namespace {

using nlohmann::json;

struct ControlTypeEntry {
  ControlType type;
  const char* name;
};

constexpr std::array<ControlTypeEntry, 17> kControlTypes = {{
    {ControlType::kAuth, "auth"},
    {ControlType::kSubscribe, "subscribe"},
    {ControlType::kUnsubscribe, "unsubscribe"},
    {ControlType::kKeyAnnounce, "key_announce"},
    {ControlType::kKeyDeliver, "key_deliver"},
    {ControlType::kBandwidthFeedback, "bandwidth_feedback"},
    {ControlType::kPing, "ping"},
    {ControlType::kPong, "pong"},
    {ControlType::kFileTransferInit, "file_transfer_init"},
    {ControlType::kFileTransferAccept, "file_transfer_accept"},
    {ControlType::kFileTransferReject, "file_transfer_reject"},
    {ControlType::kFileDownloadRequest, "file_download_request"},
    {ControlType::kFileDownloadAccept, "file_download_accept"},
    {ControlType::kFileTransferProgress, "file_transfer_progress"},
    {ControlType::kFileTransferDone, "file_transfer_done"},
    {ControlType::kFileTransferError, "file_transfer_error"},
    {ControlType::kFileTransferCancel, "file_transfer_cancel"},
}};

bool ControlTypeFromName(const std::string& name, ControlType& out) {
  for (const auto& entry : kControlTypes) {
    if (name == entry.name) {
      out = entry.type;
      return true;
    }
  }
  return false;
}

const char* TrackKindName(TrackKind kind) {
  return kind == TrackKind::kVideo ? "video" : "audio";
}

std::uint32_t ReadUint32Be(const std::uint8_t* p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) |
         (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) |
         static_cast<std::uint32_t>(p[3]);
}

void WriteUint32Be(std::uint32_t v, std::uint8_t* out) {
  out[0] = static_cast<std::uint8_t>((v >> 24) & 0xFF);
  out[1] = static_cast<std::uint8_t>((v >> 16) & 0xFF);
  out[2] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
  out[3] = static_cast<std::uint8_t>(v & 0xFF);
}

json BytesToJson(const std::vector<std::uint8_t>& bytes) {
  json arr = json::array();
  for (const auto b : bytes) {
    arr.push_back(static_cast<unsigned>(b));
  }
  return arr;
}

bool ReadUnsigned(const json& v, std::uint64_t max, std::uint64_t& out) {
  if (v.is_number_unsigned()) {
    const auto x = v.get<std::uint64_t>();
    if (x > max) {
      return false;
    }
    out = x;
    return true;
  }
  if (v.is_number_integer()) {
    const auto x = v.get<std::int64_t>();
    if (x < 0 || static_cast<std::uint64_t>(x) > max) {
      return false;
    }
    out = static_cast<std::uint64_t>(x);
    return true;
  }
  return false;
}

bool ReadSigned(const json& v, std::int64_t& out) {
  if (v.is_number_unsigned()) {
    const auto x = v.get<std::uint64_t>();
    if (x > static_cast<std::uint64_t>(
                (std::numeric_limits<std::int64_t>::max)())) {
      return false;
    }
    out = static_cast<std::int64_t>(x);
    return true;
  }
  if (v.is_number_integer()) {
    out = v.get<std::int64_t>();
    return true;
  }
  return false;
}

bool ReadByteArray(const json& v, std::vector<std::uint8_t>& out) {
  out.clear();
  if (!v.is_array()) {
    return false;
  }
  out.reserve(v.size());
  for (const auto& item : v) {
    std::uint64_t b = 0;
    if (!ReadUnsigned(item, 0xFF, b)) {
      out.clear();
      return false;
    }
    out.push_back(static_cast<std::uint8_t>(b));
  }
  return true;
}

const json* Member(const json& obj, const char* key) {
  const auto it = obj.find(key);
  if (it == obj.end()) {
    return nullptr;
  }
  return &(*it);
}

bool GetString(const json& obj, const char* key, std::string& out) {
  const json* v = Member(obj, key);
  if (!v || !v->is_string()) {
    return false;
  }
  out = v->get<std::string>();
  return true;
}

// Absent or null leaves |out| empty.
bool GetOptionalString(const json& obj, const char* key,
                       std::optional<std::string>& out) {
  out.reset();
  const json* v = Member(obj, key);
  if (!v || v->is_null()) {
    return true;
  }
  if (!v->is_string()) {
    return false;
  }
  out = v->get<std::string>();
  return true;
}

bool GetU64(const json& obj, const char* key, std::uint64_t& out) {
  const json* v = Member(obj, key);
  return v && ReadUnsigned(*v, (std::numeric_limits<std::uint64_t>::max)(),
                           out);
}

bool GetOptionalU64(const json& obj, const char* key,
                    std::optional<std::uint64_t>& out) {
  out.reset();
  const json* v = Member(obj, key);
  if (!v || v->is_null()) {
    return true;
  }
  std::uint64_t value = 0;
  if (!ReadUnsigned(*v, (std::numeric_limits<std::uint64_t>::max)(), value)) {
    return false;
  }
  out = value;
  return true;
}

bool GetU32(const json& obj, const char* key, std::uint32_t& out) {
  const json* v = Member(obj, key);
  std::uint64_t value = 0;
  if (!v || !ReadUnsigned(*v, 0xFFFFFFFFull, value)) {
    return false;
  }
  out = static_cast<std::uint32_t>(value);
  return true;
}

bool GetU8(const json& obj, const char* key, std::uint8_t& out) {
  const json* v = Member(obj, key);
  std::uint64_t value = 0;
  if (!v || !ReadUnsigned(*v, 0xFF, value)) {
    return false;
  }
  out = static_cast<std::uint8_t>(value);
  return true;
}

bool GetI64(const json& obj, const char* key, std::int64_t& out) {
  const json* v = Member(obj, key);
  return v && ReadSigned(*v, out);
}

bool GetTrack(const json& obj, const char* key, TrackKind& out) {
  std::string name;
  if (!GetString(obj, key, name)) {
    return false;
  }
  if (name == "audio") {
    out = TrackKind::kAudio;
    return true;
  }
  if (name == "video") {
    out = TrackKind::kVideo;
    return true;
  }
  return false;
}

bool GetEncryptedKeys(const json& obj, const char* key,
                      std::vector<EncryptedKeyEntry>& out) {
  out.clear();
  const json* v = Member(obj, key);
  if (!v || !v->is_array()) {
    return false;
  }
  for (const auto& item : *v) {
    if (!item.is_array() || item.size() != 2) {
      out.clear();
      return false;
    }
    EncryptedKeyEntry entry;
    if (!ReadSigned(item[0], entry.first) ||
        !ReadByteArray(item[1], entry.second)) {
      out.clear();
      return false;
    }
    out.push_back(std::move(entry));
  }
  return true;
}

bool ParseFields(const json& obj, ControlMessage& m) {
  switch (m.type) {
    case ControlType::kAuth:
      return GetString(obj, "token", m.token);
    case ControlType::kSubscribe:
    case ControlType::kUnsubscribe:
      return GetI64(obj, "user_id", m.user_id) &&
             GetTrack(obj, "track_type", m.track_type);
    case ControlType::kKeyAnnounce:
      return GetU8(obj, "epoch", m.epoch) &&
             GetEncryptedKeys(obj, "encrypted_keys", m.encrypted_keys);
    case ControlType::kKeyDeliver: {
      const json* ct = Member(obj, "ciphertext");
      return GetI64(obj, "sender_user_id", m.sender_user_id) &&
             GetU8(obj, "epoch", m.epoch) && ct &&
             ReadByteArray(*ct, m.ciphertext);
    }
    case ControlType::kBandwidthFeedback:
      return GetU32(obj, "available_kbps", m.available_kbps);
    case ControlType::kPing:
    case ControlType::kPong:
      return true;
    case ControlType::kFileTransferInit:
      return GetString(obj, "transfer_id", m.transfer_id) &&
             GetString(obj, "upload_token", m.upload_token) &&
             GetOptionalU64(obj, "resume_offset", m.resume_offset);
    case ControlType::kFileTransferAccept:
      if (!GetString(obj, "transfer_id", m.transfer_id) ||
          !GetU32(obj, "chunk_size", m.chunk_size)) {
        return false;
      }
      m.offset = 0;
      return Member(obj, "offset") == nullptr ||
             GetU64(obj, "offset", m.offset);
    case ControlType::kFileTransferReject:
      return GetString(obj, "transfer_id", m.transfer_id) &&
             GetString(obj, "reason", m.reason);
    case ControlType::kFileDownloadRequest:
      return GetString(obj, "attachment_id", m.attachment_id) &&
             GetString(obj, "auth_token", m.auth_token) &&
             GetOptionalU64(obj, "range_start", m.range_start) &&
             GetOptionalU64(obj, "range_end", m.range_end);
    case ControlType::kFileDownloadAccept:
      return GetString(obj, "attachment_id", m.attachment_id) &&
             GetString(obj, "filename", m.filename) &&
             GetU64(obj, "size", m.size) &&
             GetString(obj, "content_type", m.content_type) &&
             GetU64(obj, "offset", m.offset);
    case ControlType::kFileTransferProgress:
      return GetString(obj, "transfer_id", m.transfer_id) &&
             GetU64(obj, "bytes_received", m.bytes_received);
    case ControlType::kFileTransferDone:
      return GetString(obj, "transfer_id", m.transfer_id) &&
             GetOptionalString(obj, "attachment_id", m.done_attachment_id) &&
             GetOptionalString(obj, "url", m.url);
    case ControlType::kFileTransferError:
      return GetString(obj, "transfer_id", m.transfer_id) &&
             GetU32(obj, "code", m.code) &&
             GetString(obj, "message", m.message);
    case ControlType::kFileTransferCancel:
      return GetString(obj, "transfer_id", m.transfer_id);
  }
  return false;
}

json BuildJson(const ControlMessage& m) {
  json obj = json::object();
  obj["type"] = ControlTypeName(m.type);
  switch (m.type) {
    case ControlType::kAuth:
      obj["token"] = m.token;
      break;
    case ControlType::kSubscribe:
    case ControlType::kUnsubscribe:
      obj["user_id"] = m.user_id;
      obj["track_type"] = TrackKindName(m.track_type);
      break;
    case ControlType::kKeyAnnounce: {
      obj["epoch"] = static_cast<unsigned>(m.epoch);
      json keys = json::array();
      for (const auto& entry : m.encrypted_keys) {
        json pair = json::array();
        pair.push_back(entry.first);
        pair.push_back(BytesToJson(entry.second));
        keys.push_back(std::move(pair));
      }
      obj["encrypted_keys"] = std::move(keys);
      break;
    }
    case ControlType::kKeyDeliver:
      obj["sender_user_id"] = m.sender_user_id;
      obj["epoch"] = static_cast<unsigned>(m.epoch);
      obj["ciphertext"] = BytesToJson(m.ciphertext);
      break;
    case ControlType::kBandwidthFeedback:
      obj["available_kbps"] = m.available_kbps;
      break;
    case ControlType::kPing:
    case ControlType::kPong:
      break;
    case ControlType::kFileTransferInit:
      obj["transfer_id"] = m.transfer_id;
      obj["upload_token"] = m.upload_token;
      if (m.resume_offset.has_value()) {
        obj["resume_offset"] = *m.resume_offset;
      }
      break;
    case ControlType::kFileTransferAccept:
      obj["transfer_id"] = m.transfer_id;
      obj["chunk_size"] = m.chunk_size;
      obj["offset"] = m.offset;
      break;
    case ControlType::kFileTransferReject:
      obj["transfer_id"] = m.transfer_id;
      obj["reason"] = m.reason;
      break;
    case ControlType::kFileDownloadRequest:
      obj["attachment_id"] = m.attachment_id;
      obj["auth_token"] = m.auth_token;
      if (m.range_start.has_value()) {
        obj["range_start"] = *m.range_start;
      }
      if (m.range_end.has_value()) {
        obj["range_end"] = *m.range_end;
      }
      break;
    case ControlType::kFileDownloadAccept:
      obj["attachment_id"] = m.attachment_id;
      obj["filename"] = m.filename;
      obj["size"] = m.size;
      obj["content_type"] = m.content_type;
      obj["offset"] = m.offset;
      break;
    case ControlType::kFileTransferProgress:
      obj["transfer_id"] = m.transfer_id;
      obj["bytes_received"] = m.bytes_received;
      break;
    case ControlType::kFileTransferDone:
      obj["transfer_id"] = m.transfer_id;
      if (m.done_attachment_id.has_value()) {
        obj["attachment_id"] = *m.done_attachment_id;
      }
      if (m.url.has_value()) {
        obj["url"] = *m.url;
      }
      break;
    case ControlType::kFileTransferError:
      obj["transfer_id"] = m.transfer_id;
      obj["code"] = m.code;
      obj["message"] = m.message;
      break;
    case ControlType::kFileTransferCancel:
      obj["transfer_id"] = m.transfer_id;
      break;
  }
  return obj;
}

ControlMessage WithType(ControlType type) {
  ControlMessage m;
  m.type = type;
  return m;
}

}  // namespace

const char* CodecStatusName(CodecStatus status) {
  switch (status) {
    case CodecStatus::kOk:
      return "ok";
    case CodecStatus::kNeedMoreData:
      return "need more data";
    case CodecStatus::kMessageTooLarge:
      return "message too large";
    case CodecStatus::kChunkTooLarge:
      return "data chunk too large";
    case CodecStatus::kUnknownFrameType:
      return "unknown frame type";
    case CodecStatus::kMalformedMessage:
      return "malformed message";
  }
  return "unknown";
}

const char* ControlTypeName(ControlType type) {
  for (const auto& entry : kControlTypes) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "unknown";
}

bool ControlMessage::operator==(const ControlMessage& o) const {
  return type == o.type && token == o.token && user_id == o.user_id &&
         track_type == o.track_type && epoch == o.epoch &&
         encrypted_keys == o.encrypted_keys &&
         sender_user_id == o.sender_user_id && ciphertext == o.ciphertext &&
         available_kbps == o.available_kbps && transfer_id == o.transfer_id &&
         upload_token == o.upload_token && resume_offset == o.resume_offset &&
         chunk_size == o.chunk_size && offset == o.offset &&
         reason == o.reason && attachment_id == o.attachment_id &&
         auth_token == o.auth_token && range_start == o.range_start &&
         range_end == o.range_end && filename == o.filename &&
         size == o.size && content_type == o.content_type &&
         bytes_received == o.bytes_received &&
         done_attachment_id == o.done_attachment_id && url == o.url &&
         code == o.code && message == o.message;
}

ControlMessage MakeAuth(std::string token) {
  ControlMessage m = WithType(ControlType::kAuth);
  m.token = std::move(token);
  return m;
}

ControlMessage MakeSubscribe(std::int64_t user_id, TrackKind track) {
  ControlMessage m = WithType(ControlType::kSubscribe);
  m.user_id = user_id;
  m.track_type = track;
  return m;
}

ControlMessage MakeUnsubscribe(std::int64_t user_id, TrackKind track) {
  ControlMessage m = WithType(ControlType::kUnsubscribe);
  m.user_id = user_id;
  m.track_type = track;
  return m;
}

ControlMessage MakeKeyAnnounce(std::uint8_t epoch,
                               std::vector<EncryptedKeyEntry> keys) {
  ControlMessage m = WithType(ControlType::kKeyAnnounce);
  m.epoch = epoch;
  m.encrypted_keys = std::move(keys);
  return m;
}

ControlMessage MakeKeyDeliver(std::int64_t sender_user_id, std::uint8_t epoch,
                              std::vector<std::uint8_t> ciphertext) {
  ControlMessage m = WithType(ControlType::kKeyDeliver);
  m.sender_user_id = sender_user_id;
  m.epoch = epoch;
  m.ciphertext = std::move(ciphertext);
  return m;
}

ControlMessage MakeBandwidthFeedback(std::uint32_t available_kbps) {
  ControlMessage m = WithType(ControlType::kBandwidthFeedback);
  m.available_kbps = available_kbps;
  return m;
}

ControlMessage MakePing() { return WithType(ControlType::kPing); }

ControlMessage MakePong() { return WithType(ControlType::kPong); }

ControlMessage MakeFileTransferInit(std::string transfer_id,
                                    std::string upload_token,
                                    std::optional<std::uint64_t> resume_offset) {
  ControlMessage m = WithType(ControlType::kFileTransferInit);
  m.transfer_id = std::move(transfer_id);
  m.upload_token = std::move(upload_token);
  m.resume_offset = resume_offset;
  return m;
}

ControlMessage MakeFileTransferAccept(std::string transfer_id,
                                      std::uint32_t chunk_size,
                                      std::uint64_t offset) {
  ControlMessage m = WithType(ControlType::kFileTransferAccept);
  m.transfer_id = std::move(transfer_id);
  m.chunk_size = chunk_size;
  m.offset = offset;
  return m;
}

ControlMessage MakeFileTransferReject(std::string transfer_id,
                                      std::string reason) {
  ControlMessage m = WithType(ControlType::kFileTransferReject);
  m.transfer_id = std::move(transfer_id);
  m.reason = std::move(reason);
  return m;
}

ControlMessage MakeFileDownloadRequest(std::string attachment_id,
                                       std::string auth_token,
                                       std::optional<std::uint64_t> range_start,
                                       std::optional<std::uint64_t> range_end) {
  ControlMessage m = WithType(ControlType::kFileDownloadRequest);
  m.attachment_id = std::move(attachment_id);
  m.auth_token = std::move(auth_token);
  m.range_start = range_start;
  m.range_end = range_end;
  return m;
}

ControlMessage MakeFileDownloadAccept(std::string attachment_id,
                                      std::string filename,
                                      std::uint64_t size,
                                      std::string content_type,
                                      std::uint64_t offset) {
  ControlMessage m = WithType(ControlType::kFileDownloadAccept);
  m.attachment_id = std::move(attachment_id);
  m.filename = std::move(filename);
  m.size = size;
  m.content_type = std::move(content_type);
  m.offset = offset;
  return m;
}

ControlMessage MakeFileTransferProgress(std::string transfer_id,
                                        std::uint64_t bytes_received) {
  ControlMessage m = WithType(ControlType::kFileTransferProgress);
  m.transfer_id = std::move(transfer_id);
  m.bytes_received = bytes_received;
  return m;
}

ControlMessage MakeFileTransferDone(std::string transfer_id,
                                    std::optional<std::string> attachment_id,
                                    std::optional<std::string> url) {
  ControlMessage m = WithType(ControlType::kFileTransferDone);
  m.transfer_id = std::move(transfer_id);
  m.done_attachment_id = std::move(attachment_id);
  m.url = std::move(url);
  return m;
}

ControlMessage MakeFileTransferError(std::string transfer_id,
                                     std::uint32_t code,
                                     std::string message) {
  ControlMessage m = WithType(ControlType::kFileTransferError);
  m.transfer_id = std::move(transfer_id);
  m.code = code;
  m.message = std::move(message);
  return m;
}

ControlMessage MakeFileTransferCancel(std::string transfer_id) {
  ControlMessage m = WithType(ControlType::kFileTransferCancel);
  m.transfer_id = std::move(transfer_id);
  return m;
}

bool SerializeControlJson(const ControlMessage& msg, std::string& out) {
  out.clear();
  const json obj = BuildJson(msg);
  // Replace invalid UTF-8 instead of throwing from dump().
  out = obj.dump(-1, ' ', false, json::error_handler_t::replace);
  return !out.empty();
}

bool ParseControlJson(const std::uint8_t* data, std::size_t len,
                      ControlMessage& out) {
  out = ControlMessage{};
  if (!data || len == 0) {
    return false;
  }
  const json obj = json::parse(data, data + len, nullptr, false);
  if (obj.is_discarded() || !obj.is_object()) {
    return false;
  }
  std::string type_name;
  if (!GetString(obj, "type", type_name)) {
    return false;
  }
  ControlMessage parsed;
  if (!ControlTypeFromName(type_name, parsed.type)) {
    return false;
  }
  if (!ParseFields(obj, parsed)) {
    return false;
  }
  out = std::move(parsed);
  return true;
}

CodecStatus EncodeControlMessage(const ControlMessage& msg,
                                 std::vector<std::uint8_t>& out) {
  out.clear();
  std::string body;
  if (!SerializeControlJson(msg, body)) {
    return CodecStatus::kMalformedMessage;
  }
  if (body.size() > kMaxControlMessageSize) {
    return CodecStatus::kMessageTooLarge;
  }
  out.resize(kControlLengthPrefixSize + body.size());
  WriteUint32Be(static_cast<std::uint32_t>(body.size()), out.data());
  std::memcpy(out.data() + kControlLengthPrefixSize, body.data(), body.size());
  return CodecStatus::kOk;
}

CodecStatus DecodeControlMessage(const std::uint8_t* data, std::size_t len,
                                 ControlMessage& out, std::size_t& consumed) {
  consumed = 0;
  if (!data || len < kControlLengthPrefixSize) {
    return CodecStatus::kNeedMoreData;
  }
  const std::uint32_t body_len = ReadUint32Be(data);
  if (body_len > kMaxControlMessageSize) {
    return CodecStatus::kMessageTooLarge;
  }
  const std::size_t total = kControlLengthPrefixSize + body_len;
  if (len < total) {
    return CodecStatus::kNeedMoreData;
  }
  if (!ParseControlJson(data + kControlLengthPrefixSize, body_len, out)) {
    return CodecStatus::kMalformedMessage;
  }
  consumed = total;
  return CodecStatus::kOk;
}

ControlCodec::ControlCodec() { buf_.reserve(4096); }

void ControlCodec::Feed(const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0) {
    return;
  }
  Compact();
  buf_.insert(buf_.end(), data, data + len);
}

CodecStatus ControlCodec::DecodeNext(ControlMessage& out) {
  std::size_t consumed = 0;
  const CodecStatus status = DecodeControlMessage(
      buf_.data() + read_pos_, buf_.size() - read_pos_, out, consumed);
  if (status == CodecStatus::kOk) {
    read_pos_ += consumed;
  }
  return status;
}

void ControlCodec::Compact() {
  if (read_pos_ == 0) {
    return;
  }
  buf_.erase(buf_.begin(),
             buf_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
  read_pos_ = 0;
}

}  // namespace pc::transport
