#include "stream_frame.h"

#include <cstring>
#include <string>
#include <utility>

namespace pc::transport {

namespace {

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

void WriteFrame(StreamFrameType type, const std::uint8_t* payload,
                std::size_t len, std::vector<std::uint8_t>& out) {
  out.resize(kStreamFrameHeaderSize + len);
  out[0] = static_cast<std::uint8_t>(type);
  WriteUint32Be(static_cast<std::uint32_t>(len), out.data() + 1);
  if (len > 0) {
    std::memcpy(out.data() + kStreamFrameHeaderSize, payload, len);
  }
}

}  // namespace

bool StreamFrame::operator==(const StreamFrame& other) const {
  if (type != other.type) {
    return false;
  }
  switch (type) {
    case StreamFrameType::kControl:
      return control == other.control;
    case StreamFrameType::kData:
      return data == other.data;
    case StreamFrameType::kEndOfData:
      return true;
  }
  return false;
}

StreamFrame MakeControlFrame(ControlMessage msg) {
  StreamFrame frame;
  frame.type = StreamFrameType::kControl;
  frame.control = std::move(msg);
  return frame;
}

StreamFrame MakeDataFrame(std::vector<std::uint8_t> data) {
  StreamFrame frame;
  frame.type = StreamFrameType::kData;
  frame.data = std::move(data);
  return frame;
}

StreamFrame MakeDataFrame(const std::uint8_t* data, std::size_t len) {
  StreamFrame frame;
  frame.type = StreamFrameType::kData;
  if (data && len > 0) {
    frame.data.assign(data, data + len);
  }
  return frame;
}

StreamFrame MakeEndOfDataFrame() { return StreamFrame{}; }

CodecStatus EncodeStreamFrame(const StreamFrame& frame,
                              std::vector<std::uint8_t>& out) {
  out.clear();
  switch (frame.type) {
    case StreamFrameType::kControl: {
      std::string body;
      if (!SerializeControlJson(frame.control, body)) {
        return CodecStatus::kMalformedMessage;
      }
      if (body.size() > kMaxControlMessageSize) {
        return CodecStatus::kMessageTooLarge;
      }
      WriteFrame(frame.type, reinterpret_cast<const std::uint8_t*>(body.data()),
                 body.size(), out);
      return CodecStatus::kOk;
    }
    case StreamFrameType::kData:
      if (frame.data.size() > kMaxDataChunkSize) {
        return CodecStatus::kChunkTooLarge;
      }
      WriteFrame(frame.type, frame.data.data(), frame.data.size(), out);
      return CodecStatus::kOk;
    case StreamFrameType::kEndOfData:
      out.push_back(static_cast<std::uint8_t>(StreamFrameType::kEndOfData));
      return CodecStatus::kOk;
  }
  return CodecStatus::kUnknownFrameType;
}

CodecStatus DecodeStreamFrame(const std::uint8_t* data, std::size_t len,
                              StreamFrame& out, std::size_t& consumed) {
  consumed = 0;
  if (!data || len == 0) {
    return CodecStatus::kNeedMoreData;
  }
  const std::uint8_t disc = data[0];
  if (disc == static_cast<std::uint8_t>(StreamFrameType::kEndOfData)) {
    out = MakeEndOfDataFrame();
    consumed = 1;
    return CodecStatus::kOk;
  }
  if (disc != static_cast<std::uint8_t>(StreamFrameType::kControl) &&
      disc != static_cast<std::uint8_t>(StreamFrameType::kData)) {
    return CodecStatus::kUnknownFrameType;
  }
  if (len < kStreamFrameHeaderSize) {
    return CodecStatus::kNeedMoreData;
  }
  const std::uint32_t payload_len = ReadUint32Be(data + 1);
  const bool is_control =
      disc == static_cast<std::uint8_t>(StreamFrameType::kControl);
  if (is_control && payload_len > kMaxControlMessageSize) {
    return CodecStatus::kMessageTooLarge;
  }
  if (!is_control && payload_len > kMaxDataChunkSize) {
    return CodecStatus::kChunkTooLarge;
  }
  const std::size_t total = kStreamFrameHeaderSize + payload_len;
  if (len < total) {
    return CodecStatus::kNeedMoreData;
  }
  const std::uint8_t* payload = data + kStreamFrameHeaderSize;
  if (is_control) {
    ControlMessage msg;
    if (!ParseControlJson(payload, payload_len, msg)) {
      return CodecStatus::kMalformedMessage;
    }
    out = MakeControlFrame(std::move(msg));
  } else {
    out = MakeDataFrame(payload, payload_len);
  }
  consumed = total;
  return CodecStatus::kOk;
}

StreamFrameCodec::StreamFrameCodec() { buf_.reserve(8192); }

void StreamFrameCodec::Feed(const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0) {
    return;
  }
  Compact();
  buf_.insert(buf_.end(), data, data + len);
}

CodecStatus StreamFrameCodec::DecodeNext(StreamFrame& out) {
  std::size_t consumed = 0;
  const CodecStatus status = DecodeStreamFrame(
      buf_.data() + read_pos_, buf_.size() - read_pos_, out, consumed);
  if (status == CodecStatus::kOk) {
    read_pos_ += consumed;
  }
  return status;
}

void StreamFrameCodec::Compact() {
  if (read_pos_ == 0) {
    return;
  }
  buf_.erase(buf_.begin(),
             buf_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
  read_pos_ = 0;
}

}  // namespace pc::transport
