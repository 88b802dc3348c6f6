#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace fimgate {

// Per-request transform applied to every backend fragment before emission.
// Instances are stateful and used by one relay at a time.
class ChunkFilter {
 public:
  virtual ~ChunkFilter() = default;

  // Returns false when the fragment is suppressed; otherwise writes the text
  // to forward into `out`.
  virtual bool Apply(const std::string &fragment, std::string *out) = 0;
};

// Drops fragments whose whitespace-trimmed text is exactly a known formatting
// artifact (a bare code fence, a bare language name). When the fragment right
// after a dropped one starts with '\n', that newline is removed once.
class ArtifactFilter : public ChunkFilter {
 public:
  explicit ArtifactFilter(std::vector<std::string> artifacts);

  bool Apply(const std::string &fragment, std::string *out) override;

 private:
  std::unordered_set<std::string> artifacts_;
  bool previous_suppressed_{false};
};

// Forwards every fragment unchanged.
class PassthroughFilter : public ChunkFilter {
 public:
  bool Apply(const std::string &fragment, std::string *out) override {
    *out = fragment;
    return true;
  }
};

class ChunkFilterFactory {
 public:
  virtual ~ChunkFilterFactory() = default;
  // `language` is the request's language hint.
  virtual std::unique_ptr<ChunkFilter> Create(const std::string &language) const = 0;
};

struct ArtifactFilterConfig {
  std::vector<std::string> artifacts{"```", "python"};
  // Also drop fragments equal to the request's own language hint.
  bool suppress_language_hint{false};
};

class ArtifactFilterFactory : public ChunkFilterFactory {
 public:
  explicit ArtifactFilterFactory(ArtifactFilterConfig config = {});

  std::unique_ptr<ChunkFilter> Create(const std::string &language) const override;

 private:
  ArtifactFilterConfig config_;
};

// Creates the filter factory named in configuration: "artifact" or "none".
// Returns nullptr for an unknown name.
std::shared_ptr<ChunkFilterFactory>
MakeChunkFilterFactory(const std::string &kind, const ArtifactFilterConfig &config);

} // namespace fimgate
