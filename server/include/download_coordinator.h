#ifndef PC_TRANSPORT_DOWNLOAD_COORDINATOR_H
#define PC_TRANSPORT_DOWNLOAD_COORDINATOR_H

#include <cstdint>
#include <string>
#include <vector>

#include "control_message.h"
#include "transfer_stream.h"
#include "transfer_types.h"

namespace pc::transport {

// An attachment the caller already authorized for this stream.
struct AttachmentData {
  std::string attachment_id;
  std::string filename;
  std::string content_type;
  std::vector<std::uint8_t> data;
};

// Byte window [offset, end) actually served for a request.
struct DownloadRange {
  std::uint64_t offset{0};
  std::uint64_t end{0};

  std::uint64_t size() const { return end - offset; }
};

// range_start is clamped to the file, range_end (exclusive) to
// [offset, file_size].
DownloadRange ResolveDownloadRange(const ControlMessage& request,
                                   std::uint64_t file_size);

class DownloadCoordinator {
 public:
  explicit DownloadCoordinator(std::uint32_t chunk_size = kDefaultChunkSize);

  bool Run(TransferStream& stream, const AttachmentData& attachment,
           TransferError& error);

  // |request| is the FileDownloadRequest already read off the stream.
  bool Continue(TransferStream& stream, const ControlMessage& request,
                const AttachmentData& attachment, TransferError& error);

 private:
  std::uint32_t chunk_size_;
};

}  // namespace pc::transport

#endif  // PC_TRANSPORT_DOWNLOAD_COORDINATOR_H
