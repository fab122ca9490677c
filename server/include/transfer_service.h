#ifndef PC_TRANSPORT_TRANSFER_SERVICE_H
#define PC_TRANSPORT_TRANSFER_SERVICE_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "config.h"
#include "download_coordinator.h"
#include "partial_upload_manager.h"
#include "transfer_stream.h"
#include "transfer_token.h"
#include "transfer_tracker.h"
#include "upload_coordinator.h"

namespace pc::transport {

// Persists a finished upload and names the attachment it became.
class UploadSink {
 public:
  virtual ~UploadSink() = default;
  virtual bool Store(const UploadResult& result,
                     std::optional<std::string>& out_attachment_id,
                     std::optional<std::string>& out_url,
                     std::string& error) = 0;
};

// Authorizes a download request and supplies the attachment bytes.
class AttachmentSource {
 public:
  virtual ~AttachmentSource() = default;
  virtual bool Load(const ControlMessage& request, AttachmentData& out,
                    std::string& error) = 0;
};

class TransferService {
 public:
  TransferService();
  ~TransferService();

  TransferService(const TransferService&) = delete;
  TransferService& operator=(const TransferService&) = delete;

  // Builds an Hs256TokenValidator from auth.jwt_secret.
  bool Init(const TransferConfig& config, std::string& error);
  bool Init(const TransferConfig& config,
            std::unique_ptr<TokenValidator> validator, std::string& error);

  // Serves the single transfer carried by |stream|. |sink| may be null, in
  // which case FileTransferDone carries no attachment id. A null |source|
  // rejects every download.
  bool ServeStream(TransferStream& stream, UploadSink* sink,
                   AttachmentSource* source, TransferError& error);

  // Flags an active upload; its stream notices at the next frame boundary.
  bool Cancel(const std::string& transfer_id);

  // Sweeps stale staging files once per sweep interval.
  bool RunOnce(std::string& error);
  std::size_t SweepNow();

  bool MintUploadToken(std::int64_t user_id, const std::string& transfer_id,
                       std::int64_t channel_id, const std::string& filename,
                       std::uint64_t file_size, std::string& out_token,
                       std::string& error) const;

  const TransferConfig& config() const { return config_; }
  TransferTracker* tracker() { return tracker_.get(); }
  const PartialUploadManager* partials() const { return partials_.get(); }

 private:
  bool ServeUpload(TransferStream& stream, StreamFrameCodec& codec,
                   const ControlMessage& init, UploadSink* sink,
                   TransferError& error);
  bool ServeDownload(TransferStream& stream, const ControlMessage& request,
                     AttachmentSource* source, TransferError& error);

  TransferConfig config_;
  std::unique_ptr<TokenValidator> validator_;
  std::unique_ptr<TransferTracker> tracker_;
  std::unique_ptr<PartialUploadManager> partials_;
  std::chrono::steady_clock::time_point last_sweep_{};
  bool ready_{false};
};

}  // namespace pc::transport

#endif  // PC_TRANSPORT_TRANSFER_SERVICE_H
