#pragma once

#include "completion/completion_relay.h"
#include "server/http/router.h"
#include "server/metrics/metrics.h"

#include <memory>
#include <string>
#include <vector>

namespace fimgate {

// Path aliases IDE integrations post completions to.
const std::vector<std::string> &CompletionRoutes();

// GET /health -> {"status":"ok"}
RouteHandler MakeHealthHandler();

// Stub for the token exchange clients perform before completing. The token is
// opaque and never checked.
RouteHandler MakeTokenHandler();

// Prometheus text exposition of `metrics`.
RouteHandler MakeMetricsHandler(const MetricsRegistry *metrics);

// POST-only entry into `relay`. The request's cancel token is handed through
// so a client disconnect aborts the backend call.
RouteHandler MakeCompletionHandler(std::shared_ptr<const CompletionRelay> relay);

// Answers 503 with `reason`, used when the backend failed its startup probe.
RouteHandler MakeUnavailableHandler(std::string reason);

// Registers /health, the token stub, /metrics and every completion alias.
// A null relay routes completions to MakeUnavailableHandler(unavailable_reason).
void RegisterApiRoutes(Router &router, std::shared_ptr<const CompletionRelay> relay,
                       const MetricsRegistry *metrics,
                       const std::string &unavailable_reason = "backend unavailable");

} // namespace fimgate
