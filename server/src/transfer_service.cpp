#include "transfer_service.h"

#include <utility>
#include <vector>

#include "../../platform/include/platform_log.h"
#include "../../platform/include/platform_time.h"

namespace pc::transport {

namespace plog = pc::platform::log;

namespace {

constexpr char kLogTag[] = "service";

void Notify(TransferStream& stream, const ControlMessage& msg) {
  std::string error;
  if (!SendControl(stream, msg, error)) {
    plog::Log(plog::Level::kDebug, kLogTag, "peer notice not delivered",
              {{"type", ControlTypeName(msg.type)}, {"error", error}});
  }
}

}  // namespace

TransferService::TransferService() = default;

TransferService::~TransferService() = default;

bool TransferService::Init(const TransferConfig& config, std::string& error) {
  if (config.auth.jwt_secret.empty()) {
    error = "auth.jwt_secret missing";
    return false;
  }
  return Init(config,
              std::make_unique<Hs256TokenValidator>(config.auth.jwt_secret),
              error);
}

bool TransferService::Init(const TransferConfig& config,
                           std::unique_ptr<TokenValidator> validator,
                           std::string& error) {
  ready_ = false;
  if (!validator) {
    error = "token validator missing";
    return false;
  }
  if (!ValidateConfig(config, error)) {
    return false;
  }
  config_ = config;
  validator_ = std::move(validator);
  tracker_ = std::make_unique<TransferTracker>();
  partials_ = std::make_unique<PartialUploadManager>(
      config_.transfer.partial_dir);
  if (!partials_->EnsureDir(error)) {
    return false;
  }
  last_sweep_ = std::chrono::steady_clock::now();
  ready_ = true;
  plog::Log(plog::Level::kInfo, kLogTag, "transfer service ready",
            {{"partial_dir", config_.transfer.partial_dir},
             {"chunk_size", std::to_string(config_.transfer.chunk_size)}});
  return true;
}

bool TransferService::ServeStream(TransferStream& stream, UploadSink* sink,
                                  AttachmentSource* source,
                                  TransferError& error) {
  error = TransferError{};
  if (!ready_) {
    error = MakeTransferError(TransferErrorKind::kTransientIo,
                              "transfer service not initialized");
    return false;
  }

  StreamFrameCodec codec;
  std::vector<std::uint8_t> scratch;
  ControlMessage first;
  if (!ReadNextControl(stream, codec, scratch, first, error)) {
    if (error.kind == TransferErrorKind::kProtocolViolation) {
      Notify(stream, MakeFileTransferError("", kErrorCodeProtocol,
                                           error.message));
    }
    return false;
  }

  switch (first.type) {
    case ControlType::kFileTransferInit:
      return ServeUpload(stream, codec, first, sink, error);
    case ControlType::kFileDownloadRequest:
      return ServeDownload(stream, first, source, error);
    default:
      break;
  }
  const std::string message =
      std::string("unexpected opening message: ") + ControlTypeName(first.type);
  Notify(stream, MakeFileTransferError(first.transfer_id, kErrorCodeProtocol,
                                       message));
  error = MakeTransferError(TransferErrorKind::kProtocolViolation, message);
  return false;
}

bool TransferService::ServeUpload(TransferStream& stream,
                                  StreamFrameCodec& codec,
                                  const ControlMessage& init,
                                  UploadSink* sink, TransferError& error) {
  UploadOptions options;
  options.chunk_size = config_.transfer.chunk_size;
  options.max_file_size = config_.transfer.max_file_size;
  options.progress_interval = config_.transfer.progress_interval;
  UploadCoordinator upload(validator_.get(), tracker_.get(), partials_.get(),
                           options);

  UploadResult result;
  if (!upload.Continue(stream, codec, init, result, error)) {
    plog::Log(plog::Level::kInfo, kLogTag, "upload ended",
              {{"transfer_id", init.transfer_id},
               {"kind", TransferErrorKindName(error.kind)},
               {"error", error.message}});
    return false;
  }

  std::optional<std::string> attachment_id;
  std::optional<std::string> url;
  if (sink) {
    std::string store_error;
    if (!sink->Store(result, attachment_id, url, store_error)) {
      Notify(stream, MakeFileTransferError(result.transfer_id,
                                           kErrorCodeStorage,
                                           "failed to store upload"));
      plog::Log(plog::Level::kError, kLogTag, "upload store failed",
                {{"transfer_id", result.transfer_id},
                 {"error", store_error}});
      error = MakeTransferError(TransferErrorKind::kTransientIo, store_error);
      return false;
    }
  }

  std::string io_error;
  if (!UploadCoordinator::SendUploadDone(stream, result.transfer_id,
                                         attachment_id, url, io_error)) {
    error = MakeTransferError(TransferErrorKind::kTransientIo, io_error);
    return false;
  }
  return true;
}

bool TransferService::ServeDownload(TransferStream& stream,
                                    const ControlMessage& request,
                                    AttachmentSource* source,
                                    TransferError& error) {
  AttachmentData attachment;
  std::string load_error = "downloads unavailable";
  if (!source || !source->Load(request, attachment, load_error)) {
    Notify(stream, MakeFileTransferReject(request.attachment_id,
                                          "download not authorized: " +
                                              load_error));
    error = MakeTransferError(TransferErrorKind::kAuthFailure, load_error);
    return false;
  }

  DownloadCoordinator download(config_.transfer.chunk_size);
  if (!download.Continue(stream, request, attachment, error)) {
    plog::Log(plog::Level::kInfo, kLogTag, "download ended",
              {{"attachment_id", request.attachment_id},
               {"kind", TransferErrorKindName(error.kind)},
               {"error", error.message}});
    return false;
  }
  return true;
}

bool TransferService::Cancel(const std::string& transfer_id) {
  if (!tracker_) {
    return false;
  }
  return tracker_->Cancel(transfer_id);
}

bool TransferService::RunOnce(std::string& error) {
  if (!ready_) {
    error = "transfer service not initialized";
    return false;
  }
  const auto now = std::chrono::steady_clock::now();
  if (now - last_sweep_ <
      std::chrono::seconds(config_.transfer.sweep_interval_sec)) {
    return true;
  }
  last_sweep_ = now;
  SweepNow();
  return true;
}

std::size_t TransferService::SweepNow() {
  if (!partials_) {
    return 0;
  }
  const std::size_t removed = partials_->SweepStale(
      std::chrono::seconds(config_.transfer.partial_retention_sec));
  if (removed > 0) {
    plog::Log(plog::Level::kInfo, kLogTag, "stale partial uploads removed",
              {{"count", std::to_string(removed)}});
  }
  return removed;
}

bool TransferService::MintUploadToken(std::int64_t user_id,
                                      const std::string& transfer_id,
                                      std::int64_t channel_id,
                                      const std::string& filename,
                                      std::uint64_t file_size,
                                      std::string& out_token,
                                      std::string& error) const {
  TransferClaims claims;
  claims.sub = user_id;
  claims.tid = transfer_id;
  claims.cid = channel_id;
  claims.fname = filename;
  claims.fsize = file_size;
  claims.iat = platform::NowUnixSeconds();
  claims.exp = claims.iat + config_.auth.token_ttl_sec;
  return MintTransferToken(config_.auth.jwt_secret, claims, out_token, error);
}

}  // namespace pc::transport
