#include "toolroute/tools/executor_context.hpp"

namespace toolroute::tools {

ExecutorContext::ExecutorContext(const security::PermissionGate& gate,
                                 const Config& config,
                                 const agent::Agent& agent,
                                 TimePoint started_at)
    : gate_(gate)
    , config_(config)
    , agent_(agent)
    , started_at_(started_at)
    , base_dir_(gate.permissions()->base_dir)
{
}

Result<fs::path, Error> ExecutorContext::resolve(const std::string& path, PathOperation op) const {
    return gate_.paths().resolve(path, op);
}

Result<void, Error> ExecutorContext::validate_command(const std::string& executable) const {
    return gate_.commands().validate(executable);
}

Result<std::vector<std::string>, Error> ExecutorContext::parse_command(
    const std::string& command_line) const {
    return gate_.commands().parse(command_line);
}

Result<ProcessResult, Error> ExecutorContext::run(const std::vector<std::string>& argv,
                                                  ProcessOptions options) const {
    if (argv.empty()) {
        return Result<ProcessResult, Error>::err(ErrorCode::DeniedCommandAllowlist, "Empty command");
    }

    auto allowed = validate_command(argv.front());
    if (allowed.is_err()) {
        return Result<ProcessResult, Error>::err(std::move(allowed).error());
    }

    if (options.working_dir.empty()) {
        options.working_dir = base_dir_.string();
    }
    return run_process(argv, options);
}

Result<ProcessResult, Error> ExecutorContext::run_plugin(const fs::path& executable,
                                                         ProcessOptions options) const {
    if (options.working_dir.empty()) {
        options.working_dir = base_dir_.string();
    }
    return run_process({executable.string()}, options);
}

}  // namespace toolroute::tools
