#pragma once

#include "fast_path.hpp"
#include "heuristic_parser.hpp"
#include "model_fallback.hpp"

#include "toolroute/agent/agent.hpp"
#include "toolroute/core/config.hpp"

#include <memory>
#include <string>

namespace toolroute::router {

inline constexpr size_t kMaxInputLength = 10000;

struct RouteOutcome {
    ToolCall call;
    DebugInfo debug;
};

// Resolves free text to one ToolCall: fast path, then heuristic, then the
// model. Stops at the first stage that names a registered tool. Routing never
// executes anything and never consults permissions.
class Router {
public:
    Router(tools::RegistryPtr registry,
           const RouterConfig& config,
           std::unique_ptr<ModelFallback> fallback = nullptr);

    KResult<RouteOutcome> route(const std::string& input, const agent::Agent& agent) const;

    const FastPath& fast_path() const { return fast_path_; }
    const HeuristicParser& heuristic() const { return heuristic_; }
    const ModelFallback* fallback() const { return fallback_.get(); }

private:
    tools::RegistryPtr registry_;
    RouterConfig config_;
    FastPath fast_path_;
    HeuristicParser heuristic_;
    std::unique_ptr<ModelFallback> fallback_;
};

}  // namespace toolroute::router
