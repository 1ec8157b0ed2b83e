#include "toolroute/router/router.hpp"
#include "toolroute/core/hash.hpp"

#include <spdlog/spdlog.h>

namespace toolroute::router {

namespace {

Duration since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start);
}

}  // namespace

Router::Router(tools::RegistryPtr registry,
               const RouterConfig& config,
               std::unique_ptr<ModelFallback> fallback)
    : registry_(std::move(registry))
    , config_(config)
    , heuristic_(HeuristicOptions{
          .threshold = config.heuristic_threshold,
          .margin = config.heuristic_margin
      })
    , fallback_(std::move(fallback))
{
}

KResult<RouteOutcome> Router::route(const std::string& input, const agent::Agent& agent) const {
    TimePoint start = Clock::now();

    if (trim(input).empty()) {
        return Error{ErrorCode::ValidationError, "Input is empty"};
    }
    if (input.size() > kMaxInputLength) {
        return Error::with_details(
            ErrorCode::ValidationError,
            "Input exceeds " + std::to_string(kMaxInputLength) + " characters",
            Json{{"length", input.size()}, {"max", kMaxInputLength}}
        );
    }

    auto outcome = [&](ToolCall call, bool cache_hit, std::optional<std::string> model) {
        DebugInfo debug;
        debug.stage = call.stage;
        debug.start = start;
        debug.elapsed = since(start);
        debug.cache_hit = cache_hit;
        debug.model = std::move(model);
        spdlog::info("Routed to {} via {} in {}ms", call.tool_name,
                     stage_to_string(call.stage), debug.elapsed.count());
        return KResult<RouteOutcome>::ok(RouteOutcome{std::move(call), std::move(debug)});
    };

    if (config_.fast_path_enabled) {
        if (auto call = fast_path_.match(input, *registry_)) {
            return outcome(std::move(*call), false, std::nullopt);
        }
    }

    if (config_.heuristic_enabled) {
        if (auto call = heuristic_.parse(input, *registry_)) {
            return outcome(std::move(*call), false, std::nullopt);
        }
    }

    if (!config_.model_fallback_enabled || !fallback_ || !fallback_->available()) {
        return Error{ErrorCode::RoutingNoMatch,
                     "No tool matched the input and model fallback is unavailable"};
    }

    auto resolved = fallback_->resolve(input, registry_,
        [&agent](const tools::ToolSpec& spec) { return agent.may_use(spec.name); });
    if (resolved.is_err()) {
        Error e = std::move(resolved).error();
        if (e.code == ErrorCode::LLMUnavailable) {
            e = Error{ErrorCode::RoutingNoMatch, e.message};
        }
        spdlog::info("Model fallback gave no call: {}", e.to_string());
        return e;
    }

    auto& resolution = resolved.value();
    return outcome(std::move(resolution.call), resolution.cache_hit, resolution.model);
}

}  // namespace toolroute::router
