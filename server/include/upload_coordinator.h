#ifndef PC_TRANSPORT_UPLOAD_COORDINATOR_H
#define PC_TRANSPORT_UPLOAD_COORDINATOR_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "control_message.h"
#include "partial_upload_manager.h"
#include "stream_frame.h"
#include "transfer_stream.h"
#include "transfer_token.h"
#include "transfer_tracker.h"
#include "transfer_types.h"

namespace pc::transport {

struct UploadOptions {
  std::uint32_t chunk_size{kDefaultChunkSize};
  std::uint64_t max_file_size{kMaxFileSize};
  std::uint64_t progress_interval{kProgressAckInterval};
};

struct UploadResult {
  std::string transfer_id;
  std::int64_t user_id{0};
  std::int64_t channel_id{0};
  std::string filename;
  std::string content_type;  // left empty; resolved by the storage layer
  std::vector<std::uint8_t> data;
};

// Server side of one upload stream:
//   AwaitingInit -> Accepted -> Receiving -> Completed | Cancelled | Failed
// The peer always gets a Reject, Error or Cancel before a failure returns,
// unless the stream itself is gone.
class UploadCoordinator {
 public:
  UploadCoordinator(TokenValidator* validator,
                    TransferTracker* tracker,
                    const PartialUploadManager* partials,
                    UploadOptions options = {});

  bool Run(TransferStream& stream, UploadResult& out, TransferError& error);

  // |first| is the control message already read from |codec|; any bytes the
  // codec still buffers belong to this upload.
  bool Continue(TransferStream& stream, StreamFrameCodec& codec,
                const ControlMessage& first, UploadResult& out,
                TransferError& error);

  // Sent once the caller has persisted the upload.
  static bool SendUploadDone(TransferStream& stream,
                             const std::string& transfer_id,
                             const std::optional<std::string>& attachment_id,
                             const std::optional<std::string>& url,
                             std::string& error);

 private:
  struct ActiveUpload {
    std::string transfer_id;
    TransferClaims claims;
    std::uint64_t bytes_received{0};
    std::uint64_t last_ack_at{0};
    platform::fs::AppendFile file;
  };

  bool Admit(TransferStream& stream, const ControlMessage& init,
             TransferClaims& claims, TransferError& error);
  bool PrepareStaging(TransferStream& stream, const ControlMessage& init,
                      std::uint64_t declared_size, std::uint64_t& resume_from,
                      TransferError& error);
  bool Receive(TransferStream& stream, StreamFrameCodec& codec,
               ActiveUpload& upload, UploadResult& out, TransferError& error);
  bool HandleData(TransferStream& stream, const std::vector<std::uint8_t>& data,
                  ActiveUpload& upload, TransferError& error);
  bool Complete(TransferStream& stream, ActiveUpload& upload,
                UploadResult& out, TransferError& error);

  // Tears down a registered transfer. |discard_staging| deletes the partial
  // file; otherwise it is kept for a later resume.
  void Abort(ActiveUpload& upload, bool discard_staging);

  TokenValidator* validator_;
  TransferTracker* tracker_;
  const PartialUploadManager* partials_;
  UploadOptions options_;
};

}  // namespace pc::transport

#endif  // PC_TRANSPORT_UPLOAD_COORDINATOR_H
