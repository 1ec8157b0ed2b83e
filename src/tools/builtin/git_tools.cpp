#include "toolroute/tools/builtin.hpp"

#include <filesystem>

namespace toolroute::tools::builtin {

namespace fs = std::filesystem;

namespace {

constexpr int kGitTimeoutMs = 15000;
constexpr int64_t kMaxLogEntries = 200;

ToolResult run_git(std::vector<std::string> argv, const ExecutorContext& ctx) {
    argv.insert(argv.begin(), "git");
    auto proc = ctx.run(argv, ProcessOptions{.timeout_ms = kGitTimeoutMs});
    if (proc.is_err()) {
        return ToolResult::failure(std::move(proc).error());
    }
    return process_to_result(proc.value(), "git " + argv[1]);
}

ToolResult git_status_handler(const Json&, const ExecutorContext& ctx) {
    return run_git({"status", "--short", "--branch"}, ctx);
}

ToolResult git_diff_handler(const Json& args, const ExecutorContext& ctx) {
    std::vector<std::string> argv{"diff"};
    if (args.value("staged", false)) {
        argv.push_back("--staged");
    }
    if (args.contains("path")) {
        auto path = ctx.resolve(args["path"].get<std::string>(), PathOperation::Read);
        if (path.is_err()) {
            return ToolResult::failure(std::move(path).error());
        }
        argv.push_back("--");
        argv.push_back(path.value().string());
    }

    auto result = run_git(std::move(argv), ctx);
    if (result.ok && result.result["stdout"].get<std::string>().empty()) {
        result.result["summary"] = "No changes";
    }
    return result;
}

ToolResult git_log_handler(const Json& args, const ExecutorContext& ctx) {
    int64_t limit = args.value("limit", int64_t{10});
    if (limit < 1 || limit > kMaxLogEntries) {
        return ToolResult::failure(Error::with_details(
            ErrorCode::ValidationError, "limit must be between 1 and 200",
            Json{{"field", "limit"}, {"expected", "1..200"}}));
    }

    return run_git({"log", "-n", std::to_string(limit), "--format=%h %ad | %s [%an]", "--date=short"}, ctx);
}

}  // namespace

void register_git_tools(ToolRegistryBuilder& builder) {
    builder.add_builtin(
        ToolSpec{
            .name = "git_status",
            .description = "Show the working tree status of the repository in the base directory.",
            .parameters = {},
            .keywords = {"git", "status", "changes"}
        },
        git_status_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "git_diff",
            .description = "Show unstaged (or staged) changes, optionally for one path.",
            .parameters = {
                {"staged", "Show staged changes", ParamType::Boolean, false},
                {"path", "Limit the diff to this path", ParamType::String, false,
                 std::nullopt, ResourceRole::Path}
            },
            .keywords = {"git", "diff", "changes"}
        },
        git_diff_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "git_log",
            .description = "Show recent commits.",
            .parameters = {
                {"limit", "Number of commits (default 10)", ParamType::Integer, false}
            },
            .keywords = {"git", "log", "history", "commits"}
        },
        git_log_handler
    );
}

}  // namespace toolroute::tools::builtin
