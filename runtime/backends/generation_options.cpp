#include "runtime/backends/generation_options.h"

#include <algorithm>
#include <unordered_set>

namespace fimgate {

GenerationOptionsResult BuildGenerationOptions(const GenerationLimits &limits,
                                               double temperature, double top_p,
                                               const std::vector<std::string> &stop,
                                               int requested_tokens) {
  GenerationOptionsResult result;
  // Written as negated ranges so NaN is rejected as well.
  if (!(temperature >= 0.0 && temperature <= 2.0)) {
    result.error = "temperature must be within [0, 2]";
    return result;
  }
  if (!(top_p >= 0.0 && top_p <= 1.0)) {
    result.error = "top_p must be within [0, 1]";
    return result;
  }
  if (limits.num_predict_ceiling <= 0) {
    result.error = "num_predict ceiling must be positive";
    return result;
  }

  GenerationOptions &options = result.options;
  options.temperature = temperature;
  options.top_p = top_p;
  options.num_predict = requested_tokens > 0
                            ? std::min(requested_tokens, limits.num_predict_ceiling)
                            : limits.num_predict_ceiling;

  std::unordered_set<std::string> seen;
  for (const auto &sequence : stop) {
    if (sequence.empty() || !seen.insert(sequence).second) {
      continue;
    }
    options.stop.push_back(sequence);
  }
  if (!limits.reserved_stop.empty() && seen.count(limits.reserved_stop) == 0) {
    options.stop.push_back(limits.reserved_stop);
  }
  result.ok = true;
  return result;
}

} // namespace fimgate
