#include "transfer_types.h"

namespace pc::transport {

const char* TransferErrorKindName(TransferErrorKind kind) {
  switch (kind) {
    case TransferErrorKind::kNone:
      return "none";
    case TransferErrorKind::kProtocolViolation:
      return "protocol violation";
    case TransferErrorKind::kAuthFailure:
      return "authentication failed";
    case TransferErrorKind::kResourceLimit:
      return "resource limit";
    case TransferErrorKind::kCancelled:
      return "cancelled";
    case TransferErrorKind::kTransientIo:
      return "transient io";
  }
  return "unknown";
}

}  // namespace pc::transport
