#include "media_header.h"

#include <cstdio>

namespace pc::media {

namespace {
void WriteBe16(std::uint16_t v, std::uint8_t* out) {
  out[0] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
  out[1] = static_cast<std::uint8_t>(v & 0xFF);
}

void WriteBe32(std::uint32_t v, std::uint8_t* out) {
  out[0] = static_cast<std::uint8_t>((v >> 24) & 0xFF);
  out[1] = static_cast<std::uint8_t>((v >> 16) & 0xFF);
  out[2] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
  out[3] = static_cast<std::uint8_t>(v & 0xFF);
}

std::uint16_t ReadBe16(const std::uint8_t* p) {
  return static_cast<std::uint16_t>((static_cast<std::uint16_t>(p[0]) << 8) |
                                    static_cast<std::uint16_t>(p[1]));
}

std::uint32_t ReadBe32(const std::uint8_t* p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) |
         (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) |
         static_cast<std::uint32_t>(p[3]);
}
}  // namespace

bool MediaHeader::operator==(const MediaHeader& other) const {
  return version == other.version && track_type == other.track_type &&
         simulcast_layer == other.simulcast_layer &&
         sequence == other.sequence && timestamp == other.timestamp &&
         ssrc == other.ssrc && audio_level == other.audio_level &&
         key_epoch == other.key_epoch &&
         payload_length == other.payload_length;
}

MediaHeaderBytes EncodeMediaHeader(const MediaHeader& header) {
  MediaHeaderBytes out{};
  out[0] = static_cast<std::uint8_t>(
      ((header.version & 0x01) << 7) |
      ((static_cast<std::uint8_t>(header.track_type) & 0x01) << 6) |
      (header.simulcast_layer & 0x0F));
  WriteBe16(header.sequence, out.data() + 1);
  WriteBe32(header.timestamp, out.data() + 3);
  WriteBe32(header.ssrc, out.data() + 7);
  out[11] = header.audio_level;
  out[12] = header.key_epoch;
  WriteBe16(header.payload_length, out.data() + 13);
  out[15] = 0;  // reserved
  return out;
}

bool DecodeMediaHeader(const std::uint8_t* data, std::size_t len,
                       MediaHeader& out) {
  out = MediaHeader{};
  if (!data || len < kMediaHeaderSize) {
    return false;
  }
  const std::uint8_t byte0 = data[0];
  out.version = static_cast<std::uint8_t>((byte0 >> 7) & 0x01);
  out.track_type = ((byte0 >> 6) & 0x01) != 0 ? TrackType::kVideo
                                              : TrackType::kAudio;
  out.simulcast_layer = static_cast<std::uint8_t>(byte0 & 0x0F);
  out.sequence = ReadBe16(data + 1);
  out.timestamp = ReadBe32(data + 3);
  out.ssrc = ReadBe32(data + 7);
  out.audio_level = data[11];
  out.key_epoch = data[12];
  out.payload_length = ReadBe16(data + 13);
  return true;
}

std::string DescribeMediaHeader(const MediaHeader& header) {
  char buf[160];
  std::snprintf(buf, sizeof(buf),
                "MediaHeader(v=%u, %s, layer=%u, seq=%u, ts=%u, ssrc=0x%x, "
                "level=%u, epoch=%u, len=%u)",
                static_cast<unsigned>(header.version),
                header.track_type == TrackType::kVideo ? "video" : "audio",
                static_cast<unsigned>(header.simulcast_layer),
                static_cast<unsigned>(header.sequence),
                static_cast<unsigned>(header.timestamp),
                static_cast<unsigned>(header.ssrc),
                static_cast<unsigned>(header.audio_level),
                static_cast<unsigned>(header.key_epoch),
                static_cast<unsigned>(header.payload_length));
  return std::string(buf);
}

}  // namespace pc::media
