#pragma once

#include <cstddef>
#include <string>

namespace fimgate {

// Incremental decoder for HTTP/1.1 "Transfer-Encoding: chunked" bodies.
// Bytes may arrive split at any position; decoded payload is appended to the
// caller's buffer as soon as it is available.
class ChunkedDecoder {
 public:
  // Returns false when the framing is malformed. Once Finished() is true,
  // further input is ignored.
  bool Feed(const char *data, std::size_t length, std::string *out);
  bool Finished() const { return state_ == State::kDone; }

 private:
  enum class State { kSize, kData, kDataEnd, kTrailer, kDone, kError };

  State state_{State::kSize};
  std::string line_;
  std::size_t remaining_{0};
};

} // namespace fimgate
