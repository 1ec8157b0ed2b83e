#include "toolroute/tools/builtin.hpp"
#include "toolroute/core/hash.hpp"
#include "toolroute/storage/jsonl.hpp"

#include <spdlog/spdlog.h>

namespace toolroute::tools::builtin {

namespace {

int64_t next_id(const std::vector<Json>& entries) {
    int64_t max_id = 0;
    for (const auto& e : entries) {
        if (e.contains("id") && e["id"].is_number_integer()) {
            max_id = std::max(max_id, e["id"].get<int64_t>());
        }
    }
    return max_id + 1;
}

ToolResult task_add_handler(const Json& args, const ExecutorContext& ctx) {
    std::string text = trim(args.at("text").get<std::string>());
    if (text.empty()) {
        return ToolResult::failure(Error::with_details(
            ErrorCode::ValidationError, "Task text is empty", Json{{"field", "text"}}));
    }

    Json task{
        {"text", text},
        {"status", "open"},
        {"priority", args.value("priority", "medium")},
        {"created_at", format_timestamp(ctx.started_at())}
    };
    if (args.contains("due")) {
        task["due"] = args["due"];
    }

    storage::JsonlFile file(ctx.data_file("tasks.jsonl"));
    auto written = file.update([&](std::vector<Json>& tasks) {
        task["id"] = next_id(tasks);
        tasks.push_back(task);
        return Result<void, Error>::ok();
    });
    if (written.is_err()) {
        return ToolResult::failure(std::move(written).error());
    }

    return ToolResult::success(task);
}

ToolResult task_list_handler(const Json& args, const ExecutorContext& ctx) {
    std::string status = args.value("status", "open");

    storage::JsonlFile file(ctx.data_file("tasks.jsonl"));
    auto tasks = file.read_all();
    if (tasks.is_err()) {
        return ToolResult::failure(std::move(tasks).error());
    }

    Json out = Json::array();
    for (const auto& task : tasks.value()) {
        if (status == "all" || task.value("status", "") == status) {
            out.push_back(task);
        }
    }

    return ToolResult::success(Json{{"status", status}, {"tasks", out}});
}

ToolResult task_done_handler(const Json& args, const ExecutorContext& ctx) {
    int64_t id = args.at("id").get<int64_t>();

    storage::JsonlFile file(ctx.data_file("tasks.jsonl"));
    Json completed;
    auto written = file.update([&](std::vector<Json>& tasks) {
        for (auto& task : tasks) {
            if (task.value("id", int64_t{-1}) == id) {
                task["status"] = "done";
                task["done_at"] = format_timestamp(ctx.started_at());
                completed = task;
                return Result<void, Error>::ok();
            }
        }
        return Result<void, Error>::err(Error::with_details(
            ErrorCode::ExecError, "Task not found", Json{{"id", id}}));
    });
    if (written.is_err()) {
        return ToolResult::failure(std::move(written).error());
    }

    return ToolResult::success(completed);
}

ToolResult reminder_add_handler(const Json& args, const ExecutorContext& ctx) {
    std::string text = trim(args.at("text").get<std::string>());
    int64_t in_seconds = args.at("in_seconds").get<int64_t>();

    if (in_seconds <= 0) {
        return ToolResult::failure(Error::with_details(
            ErrorCode::ValidationError, "in_seconds must be positive",
            Json{{"field", "in_seconds"}, {"expected", "positive integer"}}));
    }

    Json reminder{
        {"text", text},
        {"created_at", format_timestamp(ctx.started_at())},
        {"due_at", format_timestamp(ctx.started_at() + std::chrono::seconds(in_seconds))}
    };

    storage::JsonlFile file(ctx.data_file("reminders.jsonl"));
    auto written = file.update([&](std::vector<Json>& reminders) {
        reminder["id"] = next_id(reminders);
        reminders.push_back(reminder);
        return Result<void, Error>::ok();
    });
    if (written.is_err()) {
        return ToolResult::failure(std::move(written).error());
    }

    // Delivery is not scheduled; the reminder is only recorded
    return ToolResult::success(reminder);
}

}  // namespace

void register_task_tools(ToolRegistryBuilder& builder) {
    builder.add_builtin(
        ToolSpec{
            .name = "task_add",
            .description = "Add a task to the todo list.",
            .parameters = {
                {"text", "What needs doing", ParamType::String, true},
                {"due", "Due date, free form", ParamType::String, false},
                {"priority", "Task priority", ParamType::String, false,
                 std::vector<std::string>{"low", "medium", "high"}}
            },
            .keywords = {"task", "todo", "add", "create"}
        },
        task_add_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "task_list",
            .description = "List tasks from the todo list.",
            .parameters = {
                {"status", "Which tasks to show (default open)", ParamType::String, false,
                 std::vector<std::string>{"open", "done", "all"}}
            },
            .keywords = {"tasks", "todos", "list", "show"}
        },
        task_list_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "task_done",
            .description = "Mark a task as done by id.",
            .parameters = {
                {"id", "Task id", ParamType::Integer, true}
            },
            .keywords = {"task", "done", "complete", "finish"}
        },
        task_done_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "reminder_add",
            .status = ToolStatus::Experimental,
            .description = "Record a reminder due after a number of seconds.",
            .parameters = {
                {"text", "What to be reminded of", ParamType::String, true},
                {"in_seconds", "Delay in seconds", ParamType::Integer, true}
            },
            .keywords = {"reminder", "remind", "alarm"}
        },
        reminder_add_handler
    );
}

}  // namespace toolroute::tools::builtin
