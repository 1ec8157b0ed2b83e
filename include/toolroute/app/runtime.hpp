#pragma once

#include "toolroute/agent/agent.hpp"
#include "toolroute/agent/executor.hpp"
#include "toolroute/cache/cache.hpp"
#include "toolroute/core/config.hpp"
#include "toolroute/core/thread_pool.hpp"
#include "toolroute/llm/chat_model.hpp"
#include "toolroute/router/router.hpp"
#include "toolroute/security/permissions.hpp"
#include "toolroute/storage/audit_log.hpp"
#include "toolroute/tools/plugin_loader.hpp"
#include "toolroute/tools/tool_registry.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace toolroute::app {

using namespace toolroute::core;

// Owns one wired instance of the system:
// Config -> permissions -> registry -> cache -> model -> router -> executor.
class Runtime {
public:
    // model == nullptr builds one from config.llm (which may still be nullptr)
    explicit Runtime(Config config, llm::ChatModelPtr model = nullptr);
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // Route free text, then execute
    ToolResult handle(const std::string& input, const agent::Agent& agent) const;

    // Route only; nothing is executed or audited
    KResult<router::RouteOutcome> route(const std::string& input, const agent::Agent& agent) const;

    // Execute {"tool_name"|"tool": ..., "args": {...}} without routing
    ToolResult execute_json(const Json& tool_call, const agent::Agent& agent) const;
    ToolResult execute(const ToolCall& call, const agent::Agent& agent) const;

    // Inputs run concurrently; results come back in input order
    std::vector<ToolResult> handle_batch(const std::vector<std::string>& inputs,
                                         const agent::Agent& agent) const;

    // Re-read the permissions file into a fresh snapshot and drop cached routes
    security::PermissionsPtr reload_permissions();

    security::PermissionsPtr permissions() const;
    const Config& config() const { return config_; }
    const agent::AgentDirectory& agents() const { return agents_; }
    const tools::RegistryPtr& registry() const { return registry_; }
    const cache::Cache<ToolCall>& cache() const { return cache_; }
    const agent::Executor& executor() const { return *executor_; }
    const tools::PluginLoadReport& plugin_report() const { return plugin_report_; }

private:
    security::PermissionsLookup permissions_lookup() const;

    Config config_;
    agent::AgentDirectory agents_;

    mutable std::mutex permissions_mutex_;
    security::PermissionsPtr permissions_;

    tools::PluginLoadReport plugin_report_;
    tools::RegistryPtr registry_;
    storage::AuditLog audit_;
    cache::Cache<ToolCall> cache_;
    llm::ChatModelPtr model_;

    std::unique_ptr<router::Router> router_;
    std::unique_ptr<agent::Executor> executor_;

    // Declared last so its workers are joined before anything they use goes away
    std::unique_ptr<ThreadPool> pool_;
};

}  // namespace toolroute::app
