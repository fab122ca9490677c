#ifndef PC_TRANSPORT_TRANSFER_STREAM_H
#define PC_TRANSPORT_TRANSFER_STREAM_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "control_message.h"
#include "stream_frame.h"
#include "transfer_types.h"

namespace pc::transport {

// One bidirectional byte stream carrying a single transfer. Implementations
// block; each transfer runs on its own thread.
class TransferStream {
 public:
  virtual ~TransferStream() = default;

  // Reads up to |cap| bytes. Success with |out_n| == 0 means the peer
  // finished its side of the stream.
  virtual bool Read(std::uint8_t* buf, std::size_t cap, std::size_t& out_n,
                    std::string& error) = 0;
  virtual bool WriteAll(const std::uint8_t* data, std::size_t len,
                        std::string& error) = 0;
};

// Stream over a connected socket or pipe descriptor (socketpair in tests,
// a plain TCP carrier in development).
class FdTransferStream final : public TransferStream {
 public:
  explicit FdTransferStream(int fd);
  ~FdTransferStream() override;

  FdTransferStream(const FdTransferStream&) = delete;
  FdTransferStream& operator=(const FdTransferStream&) = delete;

  bool Read(std::uint8_t* buf, std::size_t cap, std::size_t& out_n,
            std::string& error) override;
  bool WriteAll(const std::uint8_t* data, std::size_t len,
                std::string& error) override;

  // Half-close: the peer reads end of stream, reading here still works.
  bool ShutdownWrite(std::string& error);
  void Close();
  int fd() const { return fd_; }

 private:
  int fd_{-1};
};

bool SendStreamFrame(TransferStream& stream, const StreamFrame& frame,
                     std::string& error);
bool SendControl(TransferStream& stream, const ControlMessage& msg,
                 std::string& error);

// Pulls bytes until the next Control frame, skipping Data and EndOfData
// frames. Codec failures are protocol violations; a closed or failing stream
// is transient.
bool ReadNextControl(TransferStream& stream, StreamFrameCodec& codec,
                     std::vector<std::uint8_t>& scratch, ControlMessage& out,
                     TransferError& error);

}  // namespace pc::transport

#endif  // PC_TRANSPORT_TRANSFER_STREAM_H
