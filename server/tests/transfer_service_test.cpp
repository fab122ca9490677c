#include <algorithm>
#include <cassert>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/socket.h>
#include <utime.h>

#include "transfer_service.h"

using pc::transport::AttachmentData;
using pc::transport::AttachmentSource;
using pc::transport::ControlMessage;
using pc::transport::ControlType;
using pc::transport::FdTransferStream;
using pc::transport::StreamFrameCodec;
using pc::transport::TransferConfig;
using pc::transport::TransferError;
using pc::transport::TransferErrorKind;
using pc::transport::TransferService;
using pc::transport::UploadResult;
using pc::transport::UploadSink;

namespace {

const std::filesystem::path kDir = "tmp_transfer_service";

class MemorySink final : public UploadSink {
 public:
  bool Store(const UploadResult& result,
             std::optional<std::string>& out_attachment_id,
             std::optional<std::string>& out_url,
             std::string& error) override {
    if (fail) {
      error = "object store offline";
      return false;
    }
    stored.push_back(result);
    out_attachment_id = "att-" + std::to_string(stored.size());
    out_url = "https://files.example/" + *out_attachment_id;
    return true;
  }

  bool fail{false};
  std::vector<UploadResult> stored;
};

class MemorySource final : public AttachmentSource {
 public:
  bool Load(const ControlMessage& request, AttachmentData& out,
            std::string& error) override {
    if (request.auth_token != "let-me-in") {
      error = "not a member of this channel";
      return false;
    }
    out = attachment;
    return true;
  }

  AttachmentData attachment;
};

struct Session {
  std::unique_ptr<FdTransferStream> client;
  std::unique_ptr<FdTransferStream> server;
  StreamFrameCodec codec;
  std::vector<std::uint8_t> scratch;
  std::thread thread;
  bool ok{false};
  TransferError error;
};

void Start(Session& s, TransferService& service, UploadSink* sink,
           AttachmentSource* source) {
  int fds[2] = {-1, -1};
  const int rc = ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds);
  assert(rc == 0);
  (void)rc;
  s.client = std::make_unique<FdTransferStream>(fds[0]);
  s.server = std::make_unique<FdTransferStream>(fds[1]);
  s.thread = std::thread([&s, &service, sink, source]() {
    s.ok = service.ServeStream(*s.server, sink, source, s.error);
    s.server->Close();
  });
}

void Send(Session& s, const ControlMessage& msg) {
  std::string err;
  const bool ok = pc::transport::SendControl(*s.client, msg, err);
  assert(ok);
  (void)ok;
}

void SendFrame(Session& s, const pc::transport::StreamFrame& frame) {
  std::string err;
  const bool ok = pc::transport::SendStreamFrame(*s.client, frame, err);
  assert(ok);
  (void)ok;
}

ControlMessage Next(Session& s) {
  ControlMessage msg;
  TransferError err;
  const bool ok =
      pc::transport::ReadNextControl(*s.client, s.codec, s.scratch, msg, err);
  assert(ok);
  (void)ok;
  return msg;
}

TransferConfig TestConfig() {
  TransferConfig cfg;
  cfg.transfer.partial_dir = kDir.string();
  cfg.transfer.chunk_size = 1024;
  cfg.transfer.progress_interval = 4096;
  cfg.auth.jwt_secret = "service-test-secret";
  return cfg;
}

}  // namespace

int main() {
  std::error_code ec;
  std::filesystem::remove_all(kDir, ec);

  // Init validation.
  {
    TransferService service;
    std::string err;
    TransferConfig cfg = TestConfig();
    cfg.auth.jwt_secret.clear();
    bool ok = service.Init(cfg, err);
    assert(!ok);
    std::string tick_err;
    ok = service.RunOnce(tick_err);
    assert(!ok);
    assert(!service.Cancel("anything"));
  }

  TransferService service;
  std::string err;
  bool ok = service.Init(TestConfig(), err);
  assert(ok);
  assert(std::filesystem::is_directory(kDir));

  MemorySink sink;
  MemorySource source;
  source.attachment.attachment_id = "att-77";
  source.attachment.filename = "notes.txt";
  source.attachment.content_type = "text/plain";
  source.attachment.data.assign(3000, 'n');

  // Upload through the service ends with Done naming the stored attachment.
  {
    std::string token;
    ok = service.MintUploadToken(5, "svc-up", 9, "a.bin", 5000, token, err);
    assert(ok);

    Session s;
    Start(s, service, &sink, &source);
    Send(s, pc::transport::MakeFileTransferInit("svc-up", token,
                                                std::nullopt));
    ControlMessage accept = Next(s);
    assert(accept.type == ControlType::kFileTransferAccept);
    assert(accept.chunk_size == 1024);

    std::vector<std::uint8_t> data(5000);
    for (std::size_t i = 0; i < data.size(); ++i) {
      data[i] = static_cast<std::uint8_t>(i);
    }
    for (std::size_t pos = 0; pos < data.size(); pos += 1024) {
      const std::size_t n = std::min<std::size_t>(1024, data.size() - pos);
      SendFrame(s, pc::transport::MakeDataFrame(data.data() + pos, n));
    }
    SendFrame(s, pc::transport::MakeEndOfDataFrame());

    ControlMessage progress = Next(s);
    assert(progress.type == ControlType::kFileTransferProgress);
    assert(progress.bytes_received == 4096);
    ControlMessage done = Next(s);
    s.thread.join();
    assert(s.ok);
    assert(done.type == ControlType::kFileTransferDone);
    assert(done.transfer_id == "svc-up");
    assert(done.done_attachment_id == std::optional<std::string>("att-1"));
    assert(done.url ==
           std::optional<std::string>("https://files.example/att-1"));
    assert(sink.stored.size() == 1);
    assert(sink.stored[0].data == data);
    assert(sink.stored[0].user_id == 5);
    assert(sink.stored[0].channel_id == 9);
  }

  // Storage failure after a complete upload.
  {
    sink.fail = true;
    std::string token;
    ok = service.MintUploadToken(5, "svc-fail", 9, "b.bin", 10, token, err);
    assert(ok);
    Session s;
    Start(s, service, &sink, &source);
    Send(s, pc::transport::MakeFileTransferInit("svc-fail", token,
                                                std::nullopt));
    Next(s);
    SendFrame(s, pc::transport::MakeDataFrame(
                     std::vector<std::uint8_t>(10, 1)));
    SendFrame(s, pc::transport::MakeEndOfDataFrame());
    ControlMessage reply = Next(s);
    s.thread.join();
    assert(!s.ok);
    assert(s.error.kind == TransferErrorKind::kTransientIo);
    assert(reply.type == ControlType::kFileTransferError);
    assert(reply.code == pc::transport::kErrorCodeStorage);
    sink.fail = false;
  }

  // Authorized download.
  {
    Session s;
    Start(s, service, &sink, &source);
    Send(s, pc::transport::MakeFileDownloadRequest("att-77", "let-me-in", 1000,
                                                   std::nullopt));
    ControlMessage accept = Next(s);
    assert(accept.type == ControlType::kFileDownloadAccept);
    assert(accept.offset == 1000);
    assert(accept.size == 2000);
    ControlMessage done = Next(s);
    s.thread.join();
    assert(s.ok);
    assert(done.type == ControlType::kFileTransferDone);
  }

  // Download the source refuses.
  {
    Session s;
    Start(s, service, &sink, &source);
    Send(s, pc::transport::MakeFileDownloadRequest("att-77", "wrong",
                                                   std::nullopt, std::nullopt));
    ControlMessage reply = Next(s);
    s.thread.join();
    assert(!s.ok);
    assert(s.error.kind == TransferErrorKind::kAuthFailure);
    assert(reply.type == ControlType::kFileTransferReject);
    assert(reply.transfer_id == "att-77");
  }

  // No source at all.
  {
    Session s;
    Start(s, service, &sink, nullptr);
    Send(s, pc::transport::MakeFileDownloadRequest("att-77", "let-me-in",
                                                   std::nullopt, std::nullopt));
    ControlMessage reply = Next(s);
    s.thread.join();
    assert(reply.type == ControlType::kFileTransferReject);
  }

  // Anything else as the first message.
  {
    Session s;
    Start(s, service, &sink, &source);
    Send(s, pc::transport::MakeSubscribe(1, pc::transport::TrackKind::kAudio));
    ControlMessage reply = Next(s);
    s.thread.join();
    assert(!s.ok);
    assert(s.error.kind == TransferErrorKind::kProtocolViolation);
    assert(reply.type == ControlType::kFileTransferError);
  }

  // External cancel of an in-flight upload.
  {
    std::string token;
    ok = service.MintUploadToken(5, "svc-cancel", 9, "c.bin", 4000, token,
                                 err);
    assert(ok);
    Session s;
    Start(s, service, &sink, &source);
    Send(s, pc::transport::MakeFileTransferInit("svc-cancel", token,
                                                std::nullopt));
    Next(s);
    assert(service.tracker()->Contains("svc-cancel"));
    ok = service.Cancel("svc-cancel");
    assert(ok);
    // Wakes the receive loop; the server may already have hung up.
    std::string send_err;
    (void)pc::transport::SendStreamFrame(
        *s.client,
        pc::transport::MakeDataFrame(std::vector<std::uint8_t>(100, 2)),
        send_err);
    ControlMessage reply = Next(s);
    s.thread.join();
    assert(reply.type == ControlType::kFileTransferCancel);
    assert(s.error.kind == TransferErrorKind::kCancelled);
    assert(!service.Cancel("svc-cancel"));
  }

  // Sweep removes staging files past the retention window.
  {
    const auto old_part = kDir / "abandoned.part";
    {
      std::ofstream f(old_part, std::ios::binary);
      f << "partial";
    }
    const std::time_t when = std::time(nullptr) - 2 * 3600;
    utimbuf times{};
    times.actime = when;
    times.modtime = when;
    const int rc = ::utime(old_part.c_str(), &times);
    assert(rc == 0);
    (void)rc;

    std::string tick_err;
    ok = service.RunOnce(tick_err);
    assert(ok);
    assert(std::filesystem::exists(old_part));  // interval not yet elapsed
    assert(service.SweepNow() == 1);
    assert(!std::filesystem::exists(old_part));
  }

  std::filesystem::remove_all(kDir, ec);
  return 0;
}
