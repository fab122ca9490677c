#include <cassert>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/socket.h>

#include "download_coordinator.h"
#include "transfer_stream.h"

using pc::transport::AttachmentData;
using pc::transport::ControlMessage;
using pc::transport::ControlType;
using pc::transport::DownloadCoordinator;
using pc::transport::DownloadRange;
using pc::transport::FdTransferStream;
using pc::transport::ResolveDownloadRange;
using pc::transport::StreamFrame;
using pc::transport::StreamFrameCodec;
using pc::transport::StreamFrameType;
using pc::transport::TransferError;
using pc::transport::TransferErrorKind;

namespace {

struct Received {
  ControlMessage accept;
  std::vector<std::uint8_t> body;
  std::size_t data_frames{0};
  bool saw_end{false};
  ControlMessage done;
};

// Drains the client side until the server closes it.
Received Drain(FdTransferStream& client) {
  Received r;
  StreamFrameCodec codec;
  std::vector<std::uint8_t> buf(4096);
  bool have_accept = false;
  while (true) {
    StreamFrame frame;
    const auto st = codec.DecodeNext(frame);
    if (st == pc::transport::CodecStatus::kOk) {
      if (frame.type == StreamFrameType::kControl) {
        if (!have_accept) {
          r.accept = frame.control;
          have_accept = true;
        } else {
          r.done = frame.control;
        }
      } else if (frame.type == StreamFrameType::kData) {
        assert(!r.saw_end);
        r.body.insert(r.body.end(), frame.data.begin(), frame.data.end());
        ++r.data_frames;
      } else {
        r.saw_end = true;
      }
      continue;
    }
    assert(st == pc::transport::CodecStatus::kNeedMoreData);
    std::size_t n = 0;
    std::string err;
    const bool ok = client.Read(buf.data(), buf.size(), n, err);
    assert(ok);
    (void)ok;
    if (n == 0) {
      return r;
    }
    codec.Feed(buf.data(), n);
  }
}

struct Result {
  bool ok{false};
  TransferError error;
  Received received;
};

Result Serve(const AttachmentData& attachment, const ControlMessage& request,
             std::uint32_t chunk) {
  int fds[2] = {-1, -1};
  const int rc = ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds);
  assert(rc == 0);
  (void)rc;
  FdTransferStream client(fds[0]);
  FdTransferStream server(fds[1]);

  Result result;
  std::thread t([&]() {
    DownloadCoordinator coordinator(chunk);
    result.ok = coordinator.Run(server, attachment, result.error);
    server.Close();
  });
  std::string err;
  const bool sent = pc::transport::SendControl(client, request, err);
  assert(sent);
  (void)sent;
  result.received = Drain(client);
  t.join();
  return result;
}

std::vector<std::uint8_t> Body(std::size_t n) {
  std::vector<std::uint8_t> out(n);
  for (std::size_t i = 0; i < n; ++i) {
    out[i] = static_cast<std::uint8_t>(i * 7 + 3);
  }
  return out;
}

}  // namespace

int main() {
  // Range resolution.
  {
    ControlMessage req = pc::transport::MakeFileDownloadRequest(
        "a", "t", std::nullopt, std::nullopt);
    DownloadRange r = ResolveDownloadRange(req, 100);
    assert(r.offset == 0 && r.end == 100 && r.size() == 100);

    req.range_start = 40;
    r = ResolveDownloadRange(req, 100);
    assert(r.offset == 40 && r.size() == 60);

    req.range_start = 500;
    r = ResolveDownloadRange(req, 100);
    assert(r.offset == 100 && r.size() == 0);

    req.range_start = 10;
    req.range_end = 20;
    r = ResolveDownloadRange(req, 100);
    assert(r.offset == 10 && r.end == 20);

    req.range_end = 5;
    r = ResolveDownloadRange(req, 100);
    assert(r.offset == 10 && r.size() == 0);

    req.range_end = 1000;
    r = ResolveDownloadRange(req, 100);
    assert(r.end == 100);
  }

  AttachmentData attachment;
  attachment.attachment_id = "att-1";
  attachment.filename = "photo.jpg";
  attachment.content_type = "image/jpeg";
  attachment.data = Body(10000);

  // Whole file in chunk-sized frames.
  {
    Result res = Serve(attachment,
                       pc::transport::MakeFileDownloadRequest(
                           "att-1", "tok", std::nullopt, std::nullopt),
                       4096);
    assert(res.ok);
    const Received& r = res.received;
    assert(r.accept.type == ControlType::kFileDownloadAccept);
    assert(r.accept.attachment_id == "att-1");
    assert(r.accept.filename == "photo.jpg");
    assert(r.accept.content_type == "image/jpeg");
    assert(r.accept.size == 10000);
    assert(r.accept.offset == 0);
    assert(r.data_frames == 3);
    assert(r.body == attachment.data);
    assert(r.saw_end);
    assert(r.done.type == ControlType::kFileTransferDone);
    assert(r.done.transfer_id == "att-1");
    assert(r.done.done_attachment_id == std::optional<std::string>("att-1"));
    assert(!r.done.url.has_value());
  }

  // Resumed download from an offset with an exclusive end.
  {
    Result res = Serve(attachment,
                       pc::transport::MakeFileDownloadRequest("att-1", "tok",
                                                              2500, 7000),
                       1000);
    assert(res.ok);
    const Received& r = res.received;
    assert(r.accept.offset == 2500);
    assert(r.accept.size == 4500);
    assert(r.body == std::vector<std::uint8_t>(attachment.data.begin() + 2500,
                                               attachment.data.begin() + 7000));
  }

  // Offset past the end sends no data but still completes.
  {
    Result res = Serve(attachment,
                       pc::transport::MakeFileDownloadRequest(
                           "att-1", "tok", 99999, std::nullopt),
                       0);
    assert(res.ok);
    assert(res.received.accept.offset == 10000);
    assert(res.received.accept.size == 0);
    assert(res.received.data_frames == 0);
    assert(res.received.saw_end);
  }

  // Request for another attachment.
  {
    Result res = Serve(attachment,
                       pc::transport::MakeFileDownloadRequest(
                           "att-2", "tok", std::nullopt, std::nullopt),
                       0);
    assert(!res.ok);
    assert(res.error.kind == TransferErrorKind::kProtocolViolation);
    assert(res.received.accept.type == ControlType::kFileTransferError);
    assert(res.received.accept.code == pc::transport::kErrorCodeProtocol);
    assert(res.received.data_frames == 0);
  }

  // Wrong opening message.
  {
    Result res = Serve(attachment, pc::transport::MakePing(), 0);
    assert(!res.ok);
    assert(res.error.kind == TransferErrorKind::kProtocolViolation);
    assert(res.received.accept.type == ControlType::kFileTransferError);
  }

  return 0;
}
