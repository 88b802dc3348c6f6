#include "net/chunked_decoder.h"

#include <algorithm>

namespace fimgate {

namespace {

bool ParseChunkSize(const std::string &line, std::size_t *size) {
  // Chunk extensions (";name=value") are ignored.
  auto end = line.find(';');
  std::string digits = line.substr(0, end);
  while (!digits.empty() && (digits.back() == ' ' || digits.back() == '\t')) {
    digits.pop_back();
  }
  if (digits.empty() || digits.size() > 15) {
    return false;
  }
  std::size_t value = 0;
  for (char c : digits) {
    int nibble;
    if (c >= '0' && c <= '9') {
      nibble = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      nibble = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      nibble = c - 'A' + 10;
    } else {
      return false;
    }
    value = value * 16 + static_cast<std::size_t>(nibble);
  }
  *size = value;
  return true;
}

} // namespace

bool ChunkedDecoder::Feed(const char *data, std::size_t length,
                          std::string *out) {
  std::size_t pos = 0;
  while (pos < length) {
    switch (state_) {
    case State::kDone:
      return true;
    case State::kError:
      return false;
    case State::kSize:
    case State::kTrailer:
    case State::kDataEnd: {
      char c = data[pos++];
      if (c != '\n') {
        line_.push_back(c);
        if (line_.size() > 1024) {
          state_ = State::kError;
          return false;
        }
        continue;
      }
      if (!line_.empty() && line_.back() == '\r') {
        line_.pop_back();
      }
      std::string line;
      line.swap(line_);
      if (state_ == State::kDataEnd) {
        if (!line.empty()) {
          state_ = State::kError;
          return false;
        }
        state_ = State::kSize;
      } else if (state_ == State::kTrailer) {
        if (line.empty()) {
          state_ = State::kDone;
        }
      } else {
        std::size_t size = 0;
        if (!ParseChunkSize(line, &size)) {
          state_ = State::kError;
          return false;
        }
        if (size == 0) {
          state_ = State::kTrailer;
        } else {
          remaining_ = size;
          state_ = State::kData;
        }
      }
      break;
    }
    case State::kData: {
      std::size_t take = std::min(remaining_, length - pos);
      out->append(data + pos, take);
      pos += take;
      remaining_ -= take;
      if (remaining_ == 0) {
        state_ = State::kDataEnd;
      }
      break;
    }
    }
  }
  return state_ != State::kError;
}

} // namespace fimgate
