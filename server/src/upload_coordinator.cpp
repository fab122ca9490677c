#include "upload_coordinator.h"

#include <algorithm>
#include <utility>

#include "../../platform/include/platform_log.h"

namespace pc::transport {

namespace plog = pc::platform::log;

namespace {

constexpr char kLogTag[] = "upload";

// Delivery failures of terminal notices are only logged.
void Notify(TransferStream& stream, const ControlMessage& msg) {
  std::string error;
  if (!SendControl(stream, msg, error)) {
    plog::Log(plog::Level::kDebug, kLogTag, "peer notice not delivered",
              {{"type", ControlTypeName(msg.type)}, {"error", error}});
  }
}

void Reject(TransferStream& stream, const std::string& transfer_id,
            const std::string& reason) {
  Notify(stream, MakeFileTransferReject(transfer_id, reason));
}

}  // namespace

UploadCoordinator::UploadCoordinator(TokenValidator* validator,
                                     TransferTracker* tracker,
                                     const PartialUploadManager* partials,
                                     UploadOptions options)
    : validator_(validator),
      tracker_(tracker),
      partials_(partials),
      options_(options) {}

bool UploadCoordinator::Run(TransferStream& stream, UploadResult& out,
                            TransferError& error) {
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
  return Continue(stream, codec, first, out, error);
}

bool UploadCoordinator::Continue(TransferStream& stream,
                                 StreamFrameCodec& codec,
                                 const ControlMessage& first,
                                 UploadResult& out, TransferError& error) {
  out = UploadResult{};
  error = TransferError{};
  if (!validator_ || !tracker_ || !partials_) {
    error = MakeTransferError(TransferErrorKind::kTransientIo,
                              "upload coordinator not initialized");
    return false;
  }
  if (first.type != ControlType::kFileTransferInit) {
    Notify(stream, MakeFileTransferError(first.transfer_id, kErrorCodeProtocol,
                                         "expected file_transfer_init"));
    error = MakeTransferError(TransferErrorKind::kProtocolViolation,
                              "expected file_transfer_init");
    return false;
  }

  ActiveUpload upload;
  upload.transfer_id = first.transfer_id;
  if (!Admit(stream, first, upload.claims, error)) {
    return false;
  }

  std::uint64_t resume_from = 0;
  if (!PrepareStaging(stream, first, upload.claims.fsize, resume_from,
                      error)) {
    tracker_->Remove(upload.transfer_id);
    return false;
  }
  upload.bytes_received = resume_from;
  upload.last_ack_at = resume_from;
  tracker_->UpdateBytesReceived(upload.transfer_id, resume_from);

  std::string io_error;
  if (!SendControl(stream,
                   MakeFileTransferAccept(upload.transfer_id,
                                          options_.chunk_size, resume_from),
                   io_error)) {
    tracker_->Remove(upload.transfer_id);
    error = MakeTransferError(TransferErrorKind::kTransientIo, io_error);
    return false;
  }

  if (!partials_->OpenForAppend(upload.transfer_id, upload.file, io_error)) {
    Notify(stream, MakeFileTransferError(upload.transfer_id, kErrorCodeStorage,
                                         "staging storage unavailable"));
    Abort(upload, false);
    error = MakeTransferError(TransferErrorKind::kTransientIo, io_error);
    return false;
  }

  plog::Log(plog::Level::kInfo, kLogTag, "upload accepted",
            {{"transfer_id", upload.transfer_id},
             {"size", std::to_string(upload.claims.fsize)},
             {"offset", std::to_string(resume_from)}});
  return Receive(stream, codec, upload, out, error);
}

bool UploadCoordinator::Admit(TransferStream& stream,
                              const ControlMessage& init,
                              TransferClaims& claims, TransferError& error) {
  const std::string& transfer_id = init.transfer_id;
  std::string auth_error;
  if (!validator_->Validate(init.upload_token, claims, auth_error)) {
    Reject(stream, transfer_id, "authentication failed: " + auth_error);
    error = MakeTransferError(TransferErrorKind::kAuthFailure, auth_error);
    return false;
  }
  if (claims.tid != transfer_id) {
    Reject(stream, transfer_id, "transfer_id mismatch");
    error = MakeTransferError(TransferErrorKind::kProtocolViolation,
                              "transfer_id mismatch");
    return false;
  }
  if (claims.fsize > options_.max_file_size) {
    Reject(stream, transfer_id, "file too large");
    error = MakeTransferError(
        TransferErrorKind::kResourceLimit,
        "file too large: " + std::to_string(claims.fsize) + " bytes");
    return false;
  }
  if (!PartialUploadManager::IsSafeTransferId(transfer_id)) {
    Reject(stream, transfer_id, "invalid transfer_id");
    error = MakeTransferError(TransferErrorKind::kProtocolViolation,
                              "invalid transfer_id");
    return false;
  }

  // Registered before the staging file is touched, so a duplicate init never
  // reaches the active transfer's partial.
  TransferState state;
  state.transfer_id = transfer_id;
  state.user_id = claims.sub;
  state.channel_id = claims.cid;
  state.filename = claims.fname;
  state.total_size = claims.fsize;
  state.temp_path = partials_->TempPath(transfer_id);
  if (!tracker_->TryInsert(std::move(state))) {
    Reject(stream, transfer_id, "transfer already active");
    error = MakeTransferError(TransferErrorKind::kProtocolViolation,
                              "transfer already active");
    return false;
  }
  return true;
}

bool UploadCoordinator::PrepareStaging(TransferStream& stream,
                                       const ControlMessage& init,
                                       std::uint64_t declared_size,
                                       std::uint64_t& resume_from,
                                       TransferError& error) {
  const std::string& transfer_id = init.transfer_id;
  resume_from = 0;
  std::string io_error;
  if (!partials_->EnsureDir(io_error)) {
    Notify(stream, MakeFileTransferError(transfer_id, kErrorCodeStorage,
                                         "staging storage unavailable"));
    error = MakeTransferError(TransferErrorKind::kTransientIo, io_error);
    return false;
  }
  const std::uint64_t on_disk = partials_->PartialSize(transfer_id);
  if (init.resume_offset.has_value()) {
    resume_from = std::min(*init.resume_offset, on_disk);
    if (resume_from > declared_size) {
      Notify(stream, MakeFileTransferError(
                         transfer_id, kErrorCodeSizeExceeded,
                         "staged data exceeds declared file size"));
      partials_->Remove(transfer_id);
      error = MakeTransferError(TransferErrorKind::kResourceLimit,
                                "resume offset exceeds declared size");
      return false;
    }
    if (resume_from < on_disk &&
        !partials_->TruncateTo(transfer_id, resume_from, io_error)) {
      Notify(stream, MakeFileTransferError(transfer_id, kErrorCodeStorage,
                                           "staging storage unavailable"));
      error = MakeTransferError(TransferErrorKind::kTransientIo, io_error);
      return false;
    }
  } else if (on_disk > 0) {
    partials_->Remove(transfer_id);
  }
  return true;
}

bool UploadCoordinator::Receive(TransferStream& stream,
                                StreamFrameCodec& codec, ActiveUpload& upload,
                                UploadResult& out, TransferError& error) {
  std::vector<std::uint8_t> buf(kStreamReadBufferSize);
  while (true) {
    while (true) {
      if (tracker_->IsCancelled(upload.transfer_id)) {
        Notify(stream, MakeFileTransferCancel(upload.transfer_id));
        Abort(upload, true);
        plog::Log(plog::Level::kInfo, kLogTag, "upload cancelled locally",
                  {{"transfer_id", upload.transfer_id}});
        error = MakeTransferError(TransferErrorKind::kCancelled,
                                  "transfer cancelled");
        return false;
      }

      StreamFrame frame;
      const CodecStatus status = codec.DecodeNext(frame);
      if (status == CodecStatus::kNeedMoreData) {
        break;
      }
      if (status != CodecStatus::kOk) {
        Notify(stream, MakeFileTransferError(upload.transfer_id,
                                             kErrorCodeProtocol,
                                             CodecStatusName(status)));
        Abort(upload, true);
        error = MakeTransferError(TransferErrorKind::kProtocolViolation,
                                  CodecStatusName(status));
        return false;
      }

      switch (frame.type) {
        case StreamFrameType::kData:
          if (!HandleData(stream, frame.data, upload, error)) {
            return false;
          }
          break;
        case StreamFrameType::kEndOfData:
          return Complete(stream, upload, out, error);
        case StreamFrameType::kControl:
          if (frame.control.type == ControlType::kFileTransferCancel) {
            Abort(upload, true);
            plog::Log(plog::Level::kInfo, kLogTag, "upload cancelled by peer",
                      {{"transfer_id", upload.transfer_id}});
            error = MakeTransferError(TransferErrorKind::kCancelled,
                                      "cancelled by peer");
            return false;
          }
          plog::Log(plog::Level::kDebug, kLogTag, "ignoring control message",
                    {{"transfer_id", upload.transfer_id},
                     {"type", ControlTypeName(frame.control.type)}});
          break;
      }
    }

    std::size_t n = 0;
    std::string io_error;
    if (!stream.Read(buf.data(), buf.size(), n, io_error)) {
      Abort(upload, false);
      error = MakeTransferError(TransferErrorKind::kTransientIo, io_error);
      return false;
    }
    if (n == 0) {
      Abort(upload, false);
      plog::Log(plog::Level::kInfo, kLogTag,
                "stream closed before end of data; partial kept",
                {{"transfer_id", upload.transfer_id},
                 {"bytes", std::to_string(upload.bytes_received)}});
      error = MakeTransferError(TransferErrorKind::kTransientIo,
                                "stream closed unexpectedly");
      return false;
    }
    codec.Feed(buf.data(), n);
  }
}

bool UploadCoordinator::HandleData(TransferStream& stream,
                                   const std::vector<std::uint8_t>& data,
                                   ActiveUpload& upload,
                                   TransferError& error) {
  const std::uint64_t declared = upload.claims.fsize;
  if (upload.bytes_received > declared ||
      data.size() > declared - upload.bytes_received) {
    Notify(stream, MakeFileTransferError(
                       upload.transfer_id, kErrorCodeSizeExceeded,
                       "received more data than declared file size"));
    Abort(upload, true);
    error = MakeTransferError(TransferErrorKind::kResourceLimit,
                              "data exceeds declared size");
    return false;
  }

  std::error_code ec;
  if (!upload.file.Write(data.data(), data.size(), ec)) {
    Notify(stream, MakeFileTransferError(upload.transfer_id, kErrorCodeStorage,
                                         "staging write failed"));
    Abort(upload, false);
    error = MakeTransferError(TransferErrorKind::kTransientIo,
                              "staging write failed: " + ec.message());
    return false;
  }
  upload.bytes_received += data.size();
  tracker_->UpdateBytesReceived(upload.transfer_id, upload.bytes_received);

  if (upload.bytes_received - upload.last_ack_at >= options_.progress_interval) {
    std::string io_error;
    if (!SendControl(stream,
                     MakeFileTransferProgress(upload.transfer_id,
                                              upload.bytes_received),
                     io_error)) {
      Abort(upload, false);
      error = MakeTransferError(TransferErrorKind::kTransientIo, io_error);
      return false;
    }
    upload.last_ack_at = upload.bytes_received;
  }
  return true;
}

bool UploadCoordinator::Complete(TransferStream& stream, ActiveUpload& upload,
                                 UploadResult& out, TransferError& error) {
  std::error_code ec;
  if (!upload.file.Sync(ec) || !upload.file.Close(ec)) {
    Notify(stream, MakeFileTransferError(upload.transfer_id, kErrorCodeStorage,
                                         "staging flush failed"));
    Abort(upload, false);
    error = MakeTransferError(TransferErrorKind::kTransientIo,
                              "staging flush failed: " + ec.message());
    return false;
  }

  std::vector<std::uint8_t> data;
  std::string io_error;
  if (!partials_->ReadComplete(upload.transfer_id, data, io_error)) {
    Notify(stream, MakeFileTransferError(upload.transfer_id, kErrorCodeStorage,
                                         "staging read failed"));
    Abort(upload, false);
    error = MakeTransferError(TransferErrorKind::kTransientIo, io_error);
    return false;
  }
  partials_->Remove(upload.transfer_id);
  tracker_->Remove(upload.transfer_id);

  out.transfer_id = upload.transfer_id;
  out.user_id = upload.claims.sub;
  out.channel_id = upload.claims.cid;
  out.filename = upload.claims.fname;
  out.data = std::move(data);
  plog::Log(plog::Level::kInfo, kLogTag, "upload complete",
            {{"transfer_id", out.transfer_id},
             {"bytes", std::to_string(out.data.size())}});
  return true;
}

void UploadCoordinator::Abort(ActiveUpload& upload, bool discard_staging) {
  std::error_code ec;
  if (!upload.file.Close(ec)) {
    plog::Log(plog::Level::kWarn, kLogTag, "staging close failed",
              {{"transfer_id", upload.transfer_id}, {"error", ec.message()}});
  }
  tracker_->Remove(upload.transfer_id);
  if (discard_staging) {
    partials_->Remove(upload.transfer_id);
  }
}

bool UploadCoordinator::SendUploadDone(
    TransferStream& stream, const std::string& transfer_id,
    const std::optional<std::string>& attachment_id,
    const std::optional<std::string>& url, std::string& error) {
  return SendControl(stream,
                     MakeFileTransferDone(transfer_id, attachment_id, url),
                     error);
}

}  // namespace pc::transport
