#ifndef PC_TRANSPORT_MEDIA_HEADER_H
#define PC_TRANSPORT_MEDIA_HEADER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pc::media {

constexpr std::uint8_t kMediaHeaderVersion = 1;
constexpr std::size_t kMediaHeaderSize = 16;

enum class TrackType : std::uint8_t {
  kAudio = 0,
  kVideo = 1,
};

// Byte 0:      [V:1][T:1][R:2][SimLayer:4]
// Bytes 1-2:   sequence (BE)
// Bytes 3-6:   timestamp (BE, 48 kHz audio / 90 kHz video)
// Bytes 7-10:  ssrc (BE)
// Byte 11:     audio level (dBov, 127 = silence)
// Byte 12:     key epoch
// Bytes 13-14: payload length (BE)
// Byte 15:     reserved
struct MediaHeader {
  std::uint8_t version{kMediaHeaderVersion};
  TrackType track_type{TrackType::kAudio};
  std::uint8_t simulcast_layer{0};
  std::uint16_t sequence{0};
  std::uint32_t timestamp{0};
  std::uint32_t ssrc{0};
  std::uint8_t audio_level{127};
  std::uint8_t key_epoch{0};
  std::uint16_t payload_length{0};

  bool operator==(const MediaHeader& other) const;
  bool operator!=(const MediaHeader& other) const { return !(*this == other); }
};

using MediaHeaderBytes = std::array<std::uint8_t, kMediaHeaderSize>;

MediaHeaderBytes EncodeMediaHeader(const MediaHeader& header);
bool DecodeMediaHeader(const std::uint8_t* data, std::size_t len,
                       MediaHeader& out);

std::string DescribeMediaHeader(const MediaHeader& header);

}  // namespace pc::media

#endif  // PC_TRANSPORT_MEDIA_HEADER_H
