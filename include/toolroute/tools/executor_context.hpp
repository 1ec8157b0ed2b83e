#pragma once

#include "toolroute/agent/agent.hpp"
#include "toolroute/core/config.hpp"
#include "toolroute/core/process.hpp"
#include "toolroute/security/permission_gate.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace toolroute::tools {

namespace fs = std::filesystem;
using security::PathOperation;

// What a handler may touch. Paths and commands only go through the
// permission snapshot captured when the invocation started.
class ExecutorContext {
public:
    ExecutorContext(const security::PermissionGate& gate,
                    const Config& config,
                    const agent::Agent& agent,
                    TimePoint started_at);

    Result<fs::path, Error> resolve(const std::string& path, PathOperation op) const;

    Result<void, Error> validate_command(const std::string& executable) const;

    // Tokenized command line with an allowed executable
    Result<std::vector<std::string>, Error> parse_command(const std::string& command_line) const;

    // Validate argv[0], then run it from the base directory
    Result<ProcessResult, Error> run(const std::vector<std::string>& argv,
                                     ProcessOptions options = {}) const;

    // Plugin executables were confined to their plugin directory at load time
    // and are not subject to allow_commands
    Result<ProcessResult, Error> run_plugin(const fs::path& executable,
                                            ProcessOptions options = {}) const;

    const fs::path& data_dir() const { return config_.storage.data_dir; }
    fs::path data_file(const std::string& name) const { return config_.storage.data_dir / name; }
    const fs::path& base_dir() const { return base_dir_; }

    TimePoint started_at() const { return started_at_; }
    const Config& config() const { return config_; }
    const agent::Agent& agent() const { return agent_; }

private:
    const security::PermissionGate& gate_;
    const Config& config_;
    const agent::Agent& agent_;
    TimePoint started_at_;
    fs::path base_dir_;
};

}  // namespace toolroute::tools
