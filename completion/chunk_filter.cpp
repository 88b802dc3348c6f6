#include "completion/chunk_filter.h"

#include <utility>

namespace fimgate {

namespace {

std::string TrimSpace(const std::string &text) {
  const char *kSpace = " \t\r\n\v\f";
  auto start = text.find_first_not_of(kSpace);
  if (start == std::string::npos) {
    return "";
  }
  auto end = text.find_last_not_of(kSpace);
  return text.substr(start, end - start + 1);
}

class NoFilterFactory : public ChunkFilterFactory {
 public:
  std::unique_ptr<ChunkFilter> Create(const std::string &) const override {
    return std::make_unique<PassthroughFilter>();
  }
};

} // namespace

ArtifactFilter::ArtifactFilter(std::vector<std::string> artifacts) {
  for (auto &artifact : artifacts) {
    auto trimmed = TrimSpace(artifact);
    if (!trimmed.empty()) {
      artifacts_.insert(std::move(trimmed));
    }
  }
}

bool ArtifactFilter::Apply(const std::string &fragment, std::string *out) {
  if (artifacts_.count(TrimSpace(fragment)) > 0) {
    previous_suppressed_ = true;
    return false;
  }
  if (previous_suppressed_ && !fragment.empty() && fragment.front() == '\n') {
    *out = fragment.substr(1);
  } else {
    *out = fragment;
  }
  previous_suppressed_ = false;
  return true;
}

ArtifactFilterFactory::ArtifactFilterFactory(ArtifactFilterConfig config)
    : config_(std::move(config)) {}

std::unique_ptr<ChunkFilter>
ArtifactFilterFactory::Create(const std::string &language) const {
  auto artifacts = config_.artifacts;
  if (config_.suppress_language_hint && !language.empty()) {
    artifacts.push_back(language);
  }
  return std::make_unique<ArtifactFilter>(std::move(artifacts));
}

std::shared_ptr<ChunkFilterFactory>
MakeChunkFilterFactory(const std::string &kind, const ArtifactFilterConfig &config) {
  if (kind == "artifact") {
    return std::make_shared<ArtifactFilterFactory>(config);
  }
  if (kind == "none") {
    return std::make_shared<NoFilterFactory>();
  }
  return nullptr;
}

} // namespace fimgate
