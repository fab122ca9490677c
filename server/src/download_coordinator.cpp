#include "download_coordinator.h"

#include <algorithm>

#include "../../platform/include/platform_log.h"

namespace pc::transport {

namespace plog = pc::platform::log;

namespace {

constexpr char kLogTag[] = "download";

void NotifyError(TransferStream& stream, const std::string& id,
                 const std::string& message) {
  std::string error;
  if (!SendControl(stream,
                   MakeFileTransferError(id, kErrorCodeProtocol, message),
                   error)) {
    plog::Log(plog::Level::kDebug, kLogTag, "peer notice not delivered",
              {{"attachment_id", id}, {"error", error}});
  }
}

}  // namespace

DownloadRange ResolveDownloadRange(const ControlMessage& request,
                                   std::uint64_t file_size) {
  DownloadRange range;
  range.offset = std::min(request.range_start.value_or(0), file_size);
  range.end = file_size;
  if (request.range_end.has_value()) {
    range.end = std::clamp(*request.range_end, range.offset, file_size);
  }
  return range;
}

DownloadCoordinator::DownloadCoordinator(std::uint32_t chunk_size)
    : chunk_size_(chunk_size == 0
                      ? kDefaultChunkSize
                      : std::min<std::uint32_t>(
                            chunk_size,
                            static_cast<std::uint32_t>(kMaxDataChunkSize))) {}

bool DownloadCoordinator::Run(TransferStream& stream,
                              const AttachmentData& attachment,
                              TransferError& error) {
  StreamFrameCodec codec;
  std::vector<std::uint8_t> scratch;
  ControlMessage request;
  if (!ReadNextControl(stream, codec, scratch, request, error)) {
    if (error.kind == TransferErrorKind::kProtocolViolation) {
      NotifyError(stream, attachment.attachment_id, error.message);
    }
    return false;
  }
  return Continue(stream, request, attachment, error);
}

bool DownloadCoordinator::Continue(TransferStream& stream,
                                   const ControlMessage& request,
                                   const AttachmentData& attachment,
                                   TransferError& error) {
  error = TransferError{};
  if (request.type != ControlType::kFileDownloadRequest) {
    NotifyError(stream, attachment.attachment_id,
                "expected file_download_request");
    error = MakeTransferError(TransferErrorKind::kProtocolViolation,
                              "expected file_download_request");
    return false;
  }
  if (request.attachment_id != attachment.attachment_id) {
    NotifyError(stream, request.attachment_id, "attachment mismatch");
    error = MakeTransferError(TransferErrorKind::kProtocolViolation,
                              "attachment mismatch");
    return false;
  }

  const DownloadRange range =
      ResolveDownloadRange(request, attachment.data.size());
  std::string io_error;
  if (!SendControl(stream,
                   MakeFileDownloadAccept(request.attachment_id,
                                          attachment.filename, range.size(),
                                          attachment.content_type,
                                          range.offset),
                   io_error)) {
    error = MakeTransferError(TransferErrorKind::kTransientIo, io_error);
    return false;
  }

  const std::uint8_t* base = attachment.data.data();
  for (std::uint64_t pos = range.offset; pos < range.end;) {
    const std::uint64_t n =
        std::min<std::uint64_t>(chunk_size_, range.end - pos);
    if (!SendStreamFrame(stream,
                         MakeDataFrame(base + pos, static_cast<std::size_t>(n)),
                         io_error)) {
      error = MakeTransferError(TransferErrorKind::kTransientIo, io_error);
      return false;
    }
    pos += n;
  }

  if (!SendStreamFrame(stream, MakeEndOfDataFrame(), io_error) ||
      !SendControl(stream,
                   MakeFileTransferDone(request.attachment_id,
                                        attachment.attachment_id,
                                        std::nullopt),
                   io_error)) {
    error = MakeTransferError(TransferErrorKind::kTransientIo, io_error);
    return false;
  }
  plog::Log(plog::Level::kInfo, kLogTag, "download served",
            {{"attachment_id", attachment.attachment_id},
             {"offset", std::to_string(range.offset)},
             {"bytes", std::to_string(range.size())}});
  return true;
}

}  // namespace pc::transport
