#include "transfer_stream.h"

#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace pc::transport {

namespace {

std::string ErrnoText(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

ssize_t WriteSome(int fd, const std::uint8_t* data, std::size_t len) {
  const ssize_t n = ::send(fd, data, len, MSG_NOSIGNAL);
  if (n < 0 && errno == ENOTSOCK) {
    return ::write(fd, data, len);
  }
  return n;
}

}  // namespace

FdTransferStream::FdTransferStream(int fd) : fd_(fd) {}

FdTransferStream::~FdTransferStream() { Close(); }

bool FdTransferStream::Read(std::uint8_t* buf, std::size_t cap,
                            std::size_t& out_n, std::string& error) {
  out_n = 0;
  if (fd_ < 0) {
    error = "stream closed";
    return false;
  }
  if (!buf || cap == 0) {
    error = "read buffer empty";
    return false;
  }
  while (true) {
    const ssize_t n = ::read(fd_, buf, cap);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = ErrnoText("stream read failed");
      return false;
    }
    out_n = static_cast<std::size_t>(n);
    return true;
  }
}

bool FdTransferStream::WriteAll(const std::uint8_t* data, std::size_t len,
                                std::string& error) {
  if (fd_ < 0) {
    error = "stream closed";
    return false;
  }
  std::size_t sent = 0;
  while (sent < len) {
    const ssize_t n = WriteSome(fd_, data + sent, len - sent);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = ErrnoText("stream write failed");
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

bool FdTransferStream::ShutdownWrite(std::string& error) {
  if (fd_ < 0) {
    error = "stream closed";
    return false;
  }
  if (::shutdown(fd_, SHUT_WR) != 0) {
    error = ErrnoText("stream shutdown failed");
    return false;
  }
  return true;
}

void FdTransferStream::Close() {
  const int fd = std::exchange(fd_, -1);
  if (fd >= 0) {
    ::close(fd);
  }
}

bool SendStreamFrame(TransferStream& stream, const StreamFrame& frame,
                     std::string& error) {
  std::vector<std::uint8_t> wire;
  const CodecStatus status = EncodeStreamFrame(frame, wire);
  if (status != CodecStatus::kOk) {
    error = std::string("encode frame failed: ") + CodecStatusName(status);
    return false;
  }
  return stream.WriteAll(wire.data(), wire.size(), error);
}

bool SendControl(TransferStream& stream, const ControlMessage& msg,
                 std::string& error) {
  return SendStreamFrame(stream, MakeControlFrame(msg), error);
}

bool ReadNextControl(TransferStream& stream, StreamFrameCodec& codec,
                     std::vector<std::uint8_t>& scratch, ControlMessage& out,
                     TransferError& error) {
  if (scratch.size() < kStreamReadBufferSize) {
    scratch.resize(kStreamReadBufferSize);
  }
  while (true) {
    StreamFrame frame;
    const CodecStatus status = codec.DecodeNext(frame);
    if (status == CodecStatus::kOk) {
      if (frame.type == StreamFrameType::kControl) {
        out = std::move(frame.control);
        return true;
      }
      continue;
    }
    if (status != CodecStatus::kNeedMoreData) {
      error = MakeTransferError(TransferErrorKind::kProtocolViolation,
                                CodecStatusName(status));
      return false;
    }
    std::size_t n = 0;
    std::string read_error;
    if (!stream.Read(scratch.data(), scratch.size(), n, read_error)) {
      error = MakeTransferError(TransferErrorKind::kTransientIo, read_error);
      return false;
    }
    if (n == 0) {
      error = MakeTransferError(TransferErrorKind::kTransientIo,
                                "stream closed");
      return false;
    }
    codec.Feed(scratch.data(), n);
  }
}

}  // namespace pc::transport
