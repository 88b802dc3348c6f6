#include "runtime/backends/generation_backend.h"

namespace fimgate {

const char *GenerateStatusString(GenerateResult::Status status) {
  switch (status) {
  case GenerateResult::Status::kCompleted:
    return "completed";
  case GenerateResult::Status::kEndOfStream:
    return "end_of_stream";
  case GenerateResult::Status::kCancelled:
    return "cancelled";
  case GenerateResult::Status::kDeadlineExceeded:
    return "deadline_exceeded";
  case GenerateResult::Status::kConnectFailed:
    return "connect_failed";
  case GenerateResult::Status::kBackendError:
    return "backend_error";
  }
  return "unknown";
}

} // namespace fimgate
