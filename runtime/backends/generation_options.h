#pragma once

#include <string>
#include <vector>

namespace fimgate {

// Server-side bounds applied to every backend call.
struct GenerationLimits {
  int num_predict_ceiling{200};
  // End-of-turn marker the backend must always stop on.
  std::string reserved_stop{"<|im_end|>"};
};

// Backend-bound sampling parameters. Only BuildGenerationOptions() produces
// values that satisfy the invariants: num_predict in [1, ceiling], stop set
// deduplicated with the reserved marker present exactly once.
struct GenerationOptions {
  double temperature{0.0};
  double top_p{1.0};
  std::vector<std::string> stop;
  int num_predict{0};
};

struct GenerationOptionsResult {
  bool ok{false};
  GenerationOptions options;
  std::string error;
};

// temperature must lie in [0, 2] and top_p in [0, 1]. A requested token
// count <= 0 means the client set no limit and the ceiling applies.
GenerationOptionsResult BuildGenerationOptions(const GenerationLimits &limits,
                                               double temperature, double top_p,
                                               const std::vector<std::string> &stop,
                                               int requested_tokens);

} // namespace fimgate
