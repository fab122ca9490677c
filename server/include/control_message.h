#ifndef PC_TRANSPORT_CONTROL_MESSAGE_H
#define PC_TRANSPORT_CONTROL_MESSAGE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pc::transport {

constexpr std::size_t kControlLengthPrefixSize = 4;
constexpr std::size_t kMaxControlMessageSize = 256 * 1024;

enum class CodecStatus : std::uint8_t {
  kOk = 0,
  kNeedMoreData = 1,
  kMessageTooLarge = 2,
  kChunkTooLarge = 3,
  kUnknownFrameType = 4,
  kMalformedMessage = 5,
};

const char* CodecStatusName(CodecStatus status);

enum class ControlType : std::uint8_t {
  kAuth = 0,
  kSubscribe,
  kUnsubscribe,
  kKeyAnnounce,
  kKeyDeliver,
  kBandwidthFeedback,
  kPing,
  kPong,
  kFileTransferInit,
  kFileTransferAccept,
  kFileTransferReject,
  kFileDownloadRequest,
  kFileDownloadAccept,
  kFileTransferProgress,
  kFileTransferDone,
  kFileTransferError,
  kFileTransferCancel,
};

// snake_case wire tag carried in the "type" field.
const char* ControlTypeName(ControlType type);

enum class TrackKind : std::uint8_t {
  kAudio = 0,
  kVideo = 1,
};

using EncryptedKeyEntry = std::pair<std::int64_t, std::vector<std::uint8_t>>;

// One struct for every control kind; only the fields listed next to a kind
// are meaningful for it. The Make* helpers below build each kind.
struct ControlMessage {
  ControlType type{ControlType::kPing};

  // auth
  std::string token;
  // subscribe, unsubscribe
  std::int64_t user_id{0};
  TrackKind track_type{TrackKind::kAudio};
  // key_announce, key_deliver
  std::uint8_t epoch{0};
  std::vector<EncryptedKeyEntry> encrypted_keys;
  std::int64_t sender_user_id{0};
  std::vector<std::uint8_t> ciphertext;
  // bandwidth_feedback
  std::uint32_t available_kbps{0};

  // file transfer kinds
  std::string transfer_id;
  std::string upload_token;
  std::optional<std::uint64_t> resume_offset;
  std::uint32_t chunk_size{0};
  std::uint64_t offset{0};
  std::string reason;
  std::string attachment_id;
  std::string auth_token;
  std::optional<std::uint64_t> range_start;
  std::optional<std::uint64_t> range_end;
  std::string filename;
  std::uint64_t size{0};
  std::string content_type;
  std::uint64_t bytes_received{0};
  // file_transfer_done; sent on the wire as "attachment_id" and "url"
  std::optional<std::string> done_attachment_id;
  std::optional<std::string> url;
  std::uint32_t code{0};
  std::string message;

  bool operator==(const ControlMessage& other) const;
  bool operator!=(const ControlMessage& other) const {
    return !(*this == other);
  }
};

ControlMessage MakeAuth(std::string token);
ControlMessage MakeSubscribe(std::int64_t user_id, TrackKind track);
ControlMessage MakeUnsubscribe(std::int64_t user_id, TrackKind track);
ControlMessage MakeKeyAnnounce(std::uint8_t epoch,
                               std::vector<EncryptedKeyEntry> keys);
ControlMessage MakeKeyDeliver(std::int64_t sender_user_id, std::uint8_t epoch,
                              std::vector<std::uint8_t> ciphertext);
ControlMessage MakeBandwidthFeedback(std::uint32_t available_kbps);
ControlMessage MakePing();
ControlMessage MakePong();
ControlMessage MakeFileTransferInit(std::string transfer_id,
                                    std::string upload_token,
                                    std::optional<std::uint64_t> resume_offset);
ControlMessage MakeFileTransferAccept(std::string transfer_id,
                                      std::uint32_t chunk_size,
                                      std::uint64_t offset);
ControlMessage MakeFileTransferReject(std::string transfer_id,
                                      std::string reason);
ControlMessage MakeFileDownloadRequest(std::string attachment_id,
                                       std::string auth_token,
                                       std::optional<std::uint64_t> range_start,
                                       std::optional<std::uint64_t> range_end);
ControlMessage MakeFileDownloadAccept(std::string attachment_id,
                                      std::string filename,
                                      std::uint64_t size,
                                      std::string content_type,
                                      std::uint64_t offset);
ControlMessage MakeFileTransferProgress(std::string transfer_id,
                                        std::uint64_t bytes_received);
ControlMessage MakeFileTransferDone(std::string transfer_id,
                                    std::optional<std::string> attachment_id,
                                    std::optional<std::string> url);
ControlMessage MakeFileTransferError(std::string transfer_id,
                                     std::uint32_t code,
                                     std::string message);
ControlMessage MakeFileTransferCancel(std::string transfer_id);

// JSON body without the length prefix. Returns false if the message cannot
// be represented.
bool SerializeControlJson(const ControlMessage& msg, std::string& out);
// Unknown object members are ignored; an unknown "type" or a missing or
// mistyped required member fails.
bool ParseControlJson(const std::uint8_t* data, std::size_t len,
                      ControlMessage& out);

// 4-byte big-endian length followed by the JSON body. |out| is left empty
// on failure.
CodecStatus EncodeControlMessage(const ControlMessage& msg,
                                 std::vector<std::uint8_t>& out);

// kOk sets |out| and |consumed|. A declared length above the cap fails
// immediately, even if the body has not arrived yet.
CodecStatus DecodeControlMessage(const std::uint8_t* data, std::size_t len,
                                 ControlMessage& out, std::size_t& consumed);

class ControlCodec {
 public:
  ControlCodec();

  void Feed(const std::uint8_t* data, std::size_t len);
  // The buffer only advances past a fully decoded message.
  CodecStatus DecodeNext(ControlMessage& out);
  std::size_t buffered() const { return buf_.size() - read_pos_; }

 private:
  void Compact();

  std::vector<std::uint8_t> buf_;
  std::size_t read_pos_{0};
};

}  // namespace pc::transport

#endif  // PC_TRANSPORT_CONTROL_MESSAGE_H
