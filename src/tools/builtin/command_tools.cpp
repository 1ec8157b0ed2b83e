#include "toolroute/tools/builtin.hpp"

#include <spdlog/spdlog.h>

namespace toolroute::tools::builtin {

namespace {

constexpr int kCommandTimeoutMs = 30000;

ToolResult run_cmd_handler(const Json& args, const ExecutorContext& ctx) {
    auto argv = ctx.parse_command(args.at("command").get<std::string>());
    if (argv.is_err()) {
        return ToolResult::failure(std::move(argv).error());
    }

    auto proc = ctx.run(argv.value(), ProcessOptions{.timeout_ms = kCommandTimeoutMs});
    if (proc.is_err()) {
        return ToolResult::failure(std::move(proc).error());
    }

    return process_to_result(proc.value(), argv.value().front());
}

}  // namespace

ToolResult process_to_result(const ProcessResult& proc, const std::string& what) {
    Json output{
        {"exit_code", proc.exit_code},
        {"stdout", proc.stdout_output},
        {"stderr", proc.stderr_output},
        {"truncated", proc.truncated}
    };

    if (proc.timed_out) {
        return ToolResult::failure(Error::with_details(
            ErrorCode::ExecError, what + " timed out", std::move(output)));
    }

    if (proc.exit_code != 0) {
        return ToolResult::failure(Error::with_details(
            ErrorCode::ExecError,
            what + " exited with code " + std::to_string(proc.exit_code),
            std::move(output)
        ));
    }

    return ToolResult::success(std::move(output));
}

void register_command_tools(ToolRegistryBuilder& builder) {
    builder.add_builtin(
        ToolSpec{
            .name = "run_cmd",
            .description = "Run an allowed command (no shell) from the base directory.",
            .parameters = {
                {"command", "Command line; the executable must be in allow_commands",
                 ParamType::String, true, std::nullopt, ResourceRole::Command}
            },
            .keywords = {"run", "command", "execute", "shell"}
        },
        run_cmd_handler
    );
}

}  // namespace toolroute::tools::builtin
