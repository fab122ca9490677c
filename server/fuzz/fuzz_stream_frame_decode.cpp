#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <vector>

#include "stream_frame.h"

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data,
                                      std::size_t size) {
  if (!data || size == 0) {
    return 0;
  }
  pc::transport::StreamFrame frame;
  std::size_t consumed = 0;
  if (pc::transport::DecodeStreamFrame(data, size, frame, consumed) ==
      pc::transport::CodecStatus::kOk) {
    std::vector<std::uint8_t> encoded;
    (void)pc::transport::EncodeStreamFrame(frame, encoded);
  }

  // Same bytes fed one at a time through the incremental codec.
  pc::transport::StreamFrameCodec codec;
  for (std::size_t i = 0; i < size; ++i) {
    codec.Feed(data + i, 1);
    while (codec.DecodeNext(frame) == pc::transport::CodecStatus::kOk) {
    }
  }
  return 0;
}

#if defined(PC_TRANSPORT_FUZZ_STANDALONE)
int main(int argc, char** argv) {
  if (argc < 2 || !argv[1]) {
    return 0;
  }
  std::ifstream ifs(argv[1], std::ios::binary);
  if (!ifs) {
    return 0;
  }
  std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(ifs)),
                                 std::istreambuf_iterator<char>());
  if (data.empty()) {
    return 0;
  }
  (void)LLVMFuzzerTestOneInput(data.data(), data.size());
  return 0;
}
#endif
