#pragma once

#include "command_guard.hpp"
#include "path_guard.hpp"
#include "permissions.hpp"
#include "toolroute/agent/agent.hpp"
#include "toolroute/tools/tool_spec.hpp"

#include <string>

namespace toolroute::security {

using agent::Agent;
using tools::ToolSpec;

// Ordered permission rules, evaluated per invocation:
//   1. deny-list             DENIED_TOOL
//   2. confirmation          CONFIRMATION_REQUIRED
//   3. agent capability      DENIED_AGENT_TOOLSET (system agents skip)
//   4. resource confinement  DENIED_PATH_ALLOWLIST / DENIED_COMMAND_ALLOWLIST
// The first failing rule decides the error. Nothing is mutated; rule 4 only
// reads the filesystem to resolve symlinks.
class PermissionGate {
public:
    explicit PermissionGate(PermissionsPtr permissions);

    Result<void, Error> check(const ToolSpec& spec, const Json& args, const Agent& agent) const;

    Result<void, Error> check_deny_list(const std::string& tool) const;
    Result<void, Error> check_confirmation(const std::string& tool, const Json& args) const;
    Result<void, Error> check_agent(const std::string& tool, const Agent& agent) const;
    Result<void, Error> check_resources(const ToolSpec& spec, const Json& args) const;

    const PathGuard& paths() const { return paths_; }
    const CommandGuard& commands() const { return commands_; }
    const PermissionsPtr& permissions() const { return permissions_; }

private:
    PermissionsPtr permissions_;
    PathGuard paths_;
    CommandGuard commands_;
};

}  // namespace toolroute::security
