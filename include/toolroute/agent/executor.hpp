#pragma once

#include "agent.hpp"

#include "toolroute/core/config.hpp"
#include "toolroute/core/result.hpp"
#include "toolroute/core/types.hpp"
#include "toolroute/security/permissions.hpp"
#include "toolroute/storage/audit_log.hpp"
#include "toolroute/tools/tool_registry.hpp"

#include <mutex>
#include <optional>

namespace toolroute::agent {

using namespace toolroute::core;

// Runs one resolved tool call: Validate -> PermissionCheck -> Dispatch -> Complete.
// Every outcome, denials included, is returned as a ToolResult carrying debug
// metadata and is written to the audit log.
class Executor {
public:
    Executor(tools::RegistryPtr registry, const Config& config, const storage::AuditLog& audit);

    // permissions is the snapshot used for the whole invocation. routed carries
    // the router's debug info when the call came from free text.
    ToolResult execute(const ToolCall& call,
                       const Agent& agent,
                       const security::PermissionsPtr& permissions,
                       const std::optional<DebugInfo>& routed = std::nullopt) const;

    struct Stats {
        int total_executions = 0;
        int successful = 0;
        int failed = 0;
        int denied = 0;   // stopped by validation or the permission gate
    };
    Stats stats() const;
    void reset_stats();

private:
    KResult<Json> validate_and_check(const tools::RegisteredTool& tool,
                                     const Json& args,
                                     const Agent& agent,
                                     const security::PermissionGate& gate) const;

    ToolResult dispatch(const tools::RegisteredTool& tool,
                        const Json& args,
                        const tools::ExecutorContext& ctx) const;

    void complete(ToolResult& result,
                  const ToolCall& call,
                  const Agent& agent,
                  TimePoint started,
                  const std::optional<DebugInfo>& routed,
                  bool denied) const;

    tools::RegistryPtr registry_;
    const Config& config_;
    const storage::AuditLog& audit_;

    mutable std::mutex stats_mutex_;
    mutable Stats stats_;
};

}  // namespace toolroute::agent
