#include "toolroute/app/runtime.hpp"
#include "toolroute/core/uuid.hpp"

#include <spdlog/spdlog.h>

#include <future>

namespace toolroute::app {

namespace {

tools::RegistryPtr build_registry(const PluginsConfig& plugins, tools::PluginLoadReport& report) {
    tools::ToolRegistryBuilder builder;
    builder.add_builtins();

    if (plugins.enabled) {
        report = tools::load_plugins(plugins.dir, builder);
        if (report.plugins > 0) {
            spdlog::info("Loaded {} plugin tool(s) from {} plugin(s), skipped {}",
                         report.tools_loaded, report.plugins, report.tools_skipped);
        }
    }

    return builder.build();
}

cache::CacheOptions cache_options(const CacheConfig& config) {
    return cache::CacheOptions{
        .ttl = std::chrono::seconds(config.ttl_seconds),
        .max_entries = static_cast<size_t>(config.max_entries)
    };
}

}  // namespace

Runtime::Runtime(Config config, llm::ChatModelPtr model)
    : config_(std::move(config))
    , agents_(config_.agents)
    , audit_(config_.audit_file(), config_.storage.audit_enabled)
    , cache_(cache_options(config_.cache))
    , model_(model ? std::move(model) : llm::create_chat_model(config_.llm))
{
    permissions_ = security::load_permissions(permissions_lookup());
    registry_ = build_registry(config_.plugins, plugin_report_);

    pool_ = std::make_unique<ThreadPool>(static_cast<size_t>(config_.concurrency.worker_threads));

    std::unique_ptr<router::ModelFallback> fallback;
    if (model_ && config_.router.model_fallback_enabled) {
        fallback = std::make_unique<router::ModelFallback>(
            model_, cache_, *pool_,
            router::ModelFallbackOptions{
                .max_attempts = config_.router.model_max_attempts,
                .timeout = Duration(config_.router.model_timeout_ms),
                .temperature = config_.llm.temperature
            });
    } else {
        spdlog::debug("Model fallback disabled");
    }

    router_ = std::make_unique<router::Router>(registry_, config_.router, std::move(fallback));
    executor_ = std::make_unique<agent::Executor>(registry_, config_, audit_);

    spdlog::debug("Runtime ready: {} tools, permissions from {}",
                  registry_->size(), permissions_->source.string());
}

Runtime::~Runtime() {
    if (pool_) {
        pool_->shutdown();
    }
}

security::PermissionsLookup Runtime::permissions_lookup() const {
    return security::PermissionsLookup{
        .configured = config_.permissions.path,
        .base_dir = config_.base_dir()
    };
}

security::PermissionsPtr Runtime::permissions() const {
    std::lock_guard<std::mutex> lock(permissions_mutex_);
    return permissions_;
}

security::PermissionsPtr Runtime::reload_permissions() {
    auto fresh = security::load_permissions(permissions_lookup());
    {
        std::lock_guard<std::mutex> lock(permissions_mutex_);
        permissions_ = fresh;
    }
    cache_.clear();
    spdlog::info("Permissions reloaded from {}", fresh->source.string());
    return fresh;
}

KResult<router::RouteOutcome> Runtime::route(const std::string& input, const agent::Agent& agent) const {
    return router_->route(input, agent);
}

ToolResult Runtime::handle(const std::string& input, const agent::Agent& agent) const {
    TimePoint start = Clock::now();
    std::string invocation = generate_invocation_id();
    spdlog::debug("[{}] {} <- '{}'", invocation, agent.name, input);

    auto routed = router_->route(input, agent);
    if (routed.is_err()) {
        spdlog::debug("[{}] not routed: {}", invocation, routed.error().message);
        auto result = ToolResult::failure(std::move(routed).error());
        result.debug.start = start;
        result.debug.elapsed = std::chrono::duration_cast<Duration>(Clock::now() - start);
        return result;
    }

    auto& outcome = routed.value();
    return executor_->execute(outcome.call, agent, permissions(), outcome.debug);
}

ToolResult Runtime::execute(const ToolCall& call, const agent::Agent& agent) const {
    return executor_->execute(call, agent, permissions());
}

ToolResult Runtime::execute_json(const Json& tool_call, const agent::Agent& agent) const {
    if (!tool_call.is_object()) {
        return ToolResult::failure(ErrorCode::ValidationError, "Tool call must be a JSON object");
    }

    const Json* name = nullptr;
    if (tool_call.contains("tool_name")) {
        name = &tool_call["tool_name"];
    } else if (tool_call.contains("tool")) {
        name = &tool_call["tool"];
    }
    if (!name || !name->is_string() || name->get<std::string>().empty()) {
        return ToolResult::failure(Error::with_details(
            ErrorCode::MissingArgument, "Tool call has no tool name", Json{{"field", "tool_name"}}));
    }

    ToolCall call;
    call.tool_name = name->get<std::string>();
    call.args = tool_call.contains("args") ? tool_call["args"] : Json::object();
    call.stage = ResolutionStage::Direct;
    return execute(call, agent);
}

std::vector<ToolResult> Runtime::handle_batch(const std::vector<std::string>& inputs,
                                              const agent::Agent& agent) const {
    // Separate workers so batch items never starve model fallback of the shared pool
    ThreadPool workers(static_cast<size_t>(config_.concurrency.worker_threads));

    std::vector<std::future<ToolResult>> futures;
    futures.reserve(inputs.size());
    for (const auto& input : inputs) {
        futures.push_back(workers.submit([this, &input, &agent]() {
            return handle(input, agent);
        }));
    }

    std::vector<ToolResult> results;
    results.reserve(futures.size());
    for (auto& future : futures) {
        try {
            results.push_back(future.get());
        } catch (const std::exception& e) {
            results.push_back(ToolResult::failure(Error::from_exception(e)));
        }
    }
    return results;
}

}  // namespace toolroute::app
