#ifndef PC_TRANSPORT_STREAM_FRAME_H
#define PC_TRANSPORT_STREAM_FRAME_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "control_message.h"

namespace pc::transport {

constexpr std::size_t kMaxDataChunkSize = 512 * 1024;
constexpr std::size_t kStreamFrameHeaderSize = 5;

// One-byte discriminator at the front of every frame on a transfer stream.
enum class StreamFrameType : std::uint8_t {
  kControl = 0x00,    // [u32 BE len][JSON]
  kData = 0x01,       // [u32 BE len][raw bytes]
  kEndOfData = 0x02,  // no payload
};

struct StreamFrame {
  StreamFrameType type{StreamFrameType::kEndOfData};
  ControlMessage control;           // kControl only
  std::vector<std::uint8_t> data;   // kData only

  bool operator==(const StreamFrame& other) const;
  bool operator!=(const StreamFrame& other) const { return !(*this == other); }
};

StreamFrame MakeControlFrame(ControlMessage msg);
StreamFrame MakeDataFrame(std::vector<std::uint8_t> data);
StreamFrame MakeDataFrame(const std::uint8_t* data, std::size_t len);
StreamFrame MakeEndOfDataFrame();

CodecStatus EncodeStreamFrame(const StreamFrame& frame,
                              std::vector<std::uint8_t>& out);

// Same contract as DecodeControlMessage. An unknown discriminator fails as
// soon as one byte is available.
CodecStatus DecodeStreamFrame(const std::uint8_t* data, std::size_t len,
                              StreamFrame& out, std::size_t& consumed);

class StreamFrameCodec {
 public:
  StreamFrameCodec();

  void Feed(const std::uint8_t* data, std::size_t len);
  CodecStatus DecodeNext(StreamFrame& out);
  std::size_t buffered() const { return buf_.size() - read_pos_; }

 private:
  void Compact();

  std::vector<std::uint8_t> buf_;
  std::size_t read_pos_{0};
};

}  // namespace pc::transport

#endif  // PC_TRANSPORT_STREAM_FRAME_H
