#include "toolroute/agent/executor.hpp"
#include "toolroute/security/permission_gate.hpp"

#include <spdlog/spdlog.h>

namespace toolroute::agent {

Executor::Executor(tools::RegistryPtr registry, const Config& config, const storage::AuditLog& audit)
    : registry_(std::move(registry))
    , config_(config)
    , audit_(audit)
{
}

ToolResult Executor::execute(const ToolCall& call,
                             const Agent& agent,
                             const security::PermissionsPtr& permissions,
                             const std::optional<DebugInfo>& routed) const {
    TimePoint started = Clock::now();

    const auto* tool = registry_->find(call.tool_name);
    if (!tool) {
        auto result = ToolResult::failure(Error::with_details(
            ErrorCode::UnknownTool,
            "Unknown tool: " + call.tool_name,
            Json{{"tool", call.tool_name}}
        ));
        complete(result, call, agent, started, routed, true);
        return result;
    }

    security::PermissionGate gate(permissions);

    auto checked = validate_and_check(*tool, call.args, agent, gate);
    if (checked.is_err()) {
        auto result = ToolResult::failure(std::move(checked).error());
        complete(result, call, agent, started, routed, true);
        return result;
    }

    tools::ExecutorContext ctx(gate, config_, agent, started);
    auto result = dispatch(*tool, tools::strip_reserved(checked.value()), ctx);
    complete(result, call, agent, started, routed, false);
    return result;
}

KResult<Json> Executor::validate_and_check(const tools::RegisteredTool& tool,
                                           const Json& args,
                                           const Agent& agent,
                                           const security::PermissionGate& gate) const {
    auto validated = tools::validate_args(tool.spec, args);
    if (validated.is_err()) {
        spdlog::debug("Validation failed for {}: {}", tool.spec.name, validated.error().to_string());
        return validated;
    }

    auto permitted = gate.check(tool.spec, validated.value(), agent);
    if (permitted.is_err()) {
        spdlog::info("Permission denied for {} (agent {}): {}",
                     tool.spec.name, agent.name, permitted.error().to_string());
        return std::move(permitted).error();
    }

    return validated;
}

ToolResult Executor::dispatch(const tools::RegisteredTool& tool,
                              const Json& args,
                              const tools::ExecutorContext& ctx) const {
    if (!tool.spec.dispatchable()) {
        return ToolResult::failure(ErrorCode::ExecError,
                                   "Tool '" + tool.spec.name + "' is not implemented");
    }

    try {
        return tool.handler(args, ctx);
    } catch (const std::exception& e) {
        spdlog::error("Tool {} threw: {}", tool.spec.name, e.what());
        Error err = Error::from_exception(e);
        err.context = tool.spec.name;
        return ToolResult::failure(std::move(err));
    }
}

void Executor::complete(ToolResult& result,
                        const ToolCall& call,
                        const Agent& agent,
                        TimePoint started,
                        const std::optional<DebugInfo>& routed,
                        bool denied) const {
    TimePoint finished = Clock::now();

    DebugInfo debug;
    if (routed) {
        debug = *routed;
    } else {
        debug.stage = ResolutionStage::Direct;
        debug.start = started;
    }
    debug.elapsed = std::chrono::duration_cast<Duration>(finished - debug.start);
    result.debug = std::move(debug);

    storage::AuditRecord record;
    record.ts = started;
    record.tool = call.tool_name;
    record.agent = agent.name;
    record.args_redacted = storage::redact_args(call.args);
    record.ok = result.ok;
    if (!result.ok) {
        record.error_code = std::string(error_code_name(result.code()));
    }
    record.duration_ms = std::chrono::duration_cast<Duration>(finished - started).count();
    audit_.record(record);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_executions++;
        if (result.ok) {
            stats_.successful++;
        } else {
            stats_.failed++;
            if (denied) stats_.denied++;
        }
    }

    if (result.ok) {
        spdlog::debug("{} completed in {}ms", call.tool_name, record.duration_ms);
    } else {
        spdlog::debug("{} failed: {}", call.tool_name, error_code_name(result.code()));
    }
}

Executor::Stats Executor::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void Executor::reset_stats() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = Stats{};
}

}  // namespace toolroute::agent
