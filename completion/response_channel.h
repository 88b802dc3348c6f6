#pragma once

#include <map>
#include <string>

namespace fimgate {

// Write side of one HTTP exchange. Status and headers are committed by the
// first Respond() or BeginStream() call; after that only SendRecord() is
// meaningful. Write failures (peer gone) are returned, never thrown.
class ResponseChannel {
 public:
  virtual ~ResponseChannel() = default;

  // Adds a header to the eventual response. Ignored once committed.
  virtual void AddHeader(const std::string &name, const std::string &value) = 0;

  // Complete, non-streamed response.
  virtual bool Respond(int status, const std::string &content_type,
                       const std::string &body) = 0;

  // Commits status and headers for a streamed body delimited by close.
  virtual bool BeginStream(int status,
                           const std::map<std::string, std::string> &headers) = 0;

  // Writes one already-framed record and flushes it.
  virtual bool SendRecord(const std::string &record) = 0;

  virtual bool Committed() const = 0;
  // Committed status, 0 before commit.
  virtual int Status() const = 0;
};

} // namespace fimgate
