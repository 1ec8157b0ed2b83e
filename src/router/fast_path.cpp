#include "toolroute/router/fast_path.hpp"
#include "toolroute/core/hash.hpp"

#include <spdlog/spdlog.h>

namespace toolroute::router {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

std::optional<int64_t> to_int(const std::string& digits) {
    try {
        return std::stoll(digits);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

FastPathPattern make(std::string name, std::string tool, const char* pattern,
                     std::function<std::optional<Json>(const std::smatch&)> build,
                     std::vector<std::string> samples) {
    return FastPathPattern{
        .name = std::move(name),
        .tool = std::move(tool),
        .regex = std::regex(pattern, kFlags),
        .build_args = std::move(build),
        .samples = std::move(samples)
    };
}

// Single capture group mapped to one string argument
std::function<std::optional<Json>(const std::smatch&)> capture(const char* key) {
    std::string k = key;
    return [k](const std::smatch& m) -> std::optional<Json> {
        std::string value = trim(m[1].str());
        if (value.empty()) return std::nullopt;
        return Json{{k, value}};
    };
}

std::optional<Json> no_args(const std::smatch&) {
    return Json::object();
}

}  // namespace

std::vector<FastPathPattern> FastPath::default_patterns() {
    std::vector<FastPathPattern> p;

    p.push_back(make("remember", "remember", R"(remember:\s*(.+))",
        capture("text"), {"remember: buy milk", "Remember:call mom at 5"}));

    p.push_back(make("recall", "recall", R"(recall:\s*(.+))",
        capture("query"), {"recall: milk", "recall: mom"}));

    p.push_back(make("task_add", "task_add", R"(task add\s+(.+))",
        capture("text"), {"task add write report", "task add call the bank"}));

    p.push_back(make("task_list", "task_list", R"(task list(?:\s+(open|done|all))?)",
        [](const std::smatch& m) -> std::optional<Json> {
            if (!m[1].matched) return Json::object();
            return Json{{"status", to_lower(m[1].str())}};
        },
        {"task list", "task list done", "task list all"}));

    p.push_back(make("task_done", "task_done", R"(task done\s+#?(\d+))",
        [](const std::smatch& m) -> std::optional<Json> {
            auto id = to_int(m[1].str());
            if (!id) return std::nullopt;
            return Json{{"id", *id}};
        },
        {"task done 3", "task done #12"}));

    p.push_back(make("memory_add", "memory_add", R"(memory add\s+(.+))",
        capture("text"), {"memory add met Sam at the conference"}));

    p.push_back(make("memory_search", "memory_search", R"(memory search\s+(.+))",
        capture("query"), {"memory search conference"}));

    p.push_back(make("read_file", "read_file", R"(read\s+(\S+))",
        capture("path"), {"read notes.txt", "read src/main.cpp"}));

    p.push_back(make("write_file", "write_file", R"(write\s+(\S+)\s+(.+))",
        [](const std::smatch& m) -> std::optional<Json> {
            return Json{{"path", m[1].str()}, {"content", m[2].str()}};
        },
        {"write notes.txt hello world"}));

    p.push_back(make("list_files", "list_files", R"((?:list|ls)(?:\s+files)?(?:\s+(\S+))?)",
        [](const std::smatch& m) -> std::optional<Json> {
            if (!m[1].matched) return Json::object();
            return Json{{"path", m[1].str()}};
        },
        {"list", "list files", "ls src", "list files docs"}));

    p.push_back(make("delete_file", "delete_file", R"((?:delete|delete_file|rm)\s+(\S+))",
        capture("path"), {"delete old.txt", "delete_file /etc/passwd", "rm tmp.log"}));

    p.push_back(make("copy_file", "copy_file", R"((?:copy|cp)\s+(\S+)\s+(\S+))",
        [](const std::smatch& m) -> std::optional<Json> {
            return Json{{"source", m[1].str()}, {"destination", m[2].str()}};
        },
        {"copy a.txt b.txt", "cp a.txt backup/"}));

    p.push_back(make("move_file", "move_file", R"((?:move|mv)\s+(\S+)\s+(\S+))",
        [](const std::smatch& m) -> std::optional<Json> {
            return Json{{"source", m[1].str()}, {"destination", m[2].str()}};
        },
        {"move a.txt b.txt", "mv draft.md final.md"}));

    p.push_back(make("file_info", "file_info", R"((?:stat|file info)\s+(\S+))",
        capture("path"), {"stat notes.txt", "file info README.md"}));

    p.push_back(make("count_words", "count_words", R"((?:count words(?:\s+in)?|wc)\s+(\S+))",
        capture("path"), {"count words essay.txt", "count words in essay.txt", "wc essay.txt"}));

    p.push_back(make("run_cmd", "run_cmd", R"(run\s+(.+))",
        capture("command"), {"run ls -la", "run git status"}));

    p.push_back(make("get_time", "get_time", R"(time|what time is it\??|current time)",
        no_args, {"time", "what time is it?", "current time"}));

    p.push_back(make("calculate", "calculate", R"((?:calc|calculate)\s+(.+))",
        capture("expression"), {"calc 2 + 2", "calculate (3 * 4) / 2"}));

    p.push_back(make("git_status", "git_status", R"(git status)",
        no_args, {"git status"}));

    p.push_back(make("git_diff", "git_diff", R"(git diff(?:\s+(--staged|--cached))?(?:\s+([^-\s]\S*))?)",
        [](const std::smatch& m) -> std::optional<Json> {
            Json args = Json::object();
            if (m[1].matched) args["staged"] = true;
            if (m[2].matched) args["path"] = m[2].str();
            return args;
        },
        {"git diff", "git diff --staged", "git diff src/main.cpp"}));

    p.push_back(make("git_log", "git_log", R"(git log(?:\s+-n\s*(\d+))?)",
        [](const std::smatch& m) -> std::optional<Json> {
            if (!m[1].matched) return Json::object();
            auto n = to_int(m[1].str());
            if (!n) return std::nullopt;
            return Json{{"limit", *n}};
        },
        {"git log", "git log -n 5"}));

    p.push_back(make("reminder_add", "reminder_add", R"(remind me in (\d+) seconds? to (.+))",
        [](const std::smatch& m) -> std::optional<Json> {
            auto secs = to_int(m[1].str());
            if (!secs) return std::nullopt;
            return Json{{"text", trim(m[2].str())}, {"in_seconds", *secs}};
        },
        {"remind me in 60 seconds to stretch"}));

    return p;
}

FastPath::FastPath()
    : patterns_(default_patterns())
{
}

FastPath::FastPath(std::vector<FastPathPattern> patterns)
    : patterns_(std::move(patterns))
{
}

std::optional<ToolCall> FastPath::match(const std::string& input, const ToolRegistry& registry) const {
    std::string text = trim(input);
    std::smatch m;

    for (const auto& pattern : patterns_) {
        if (!std::regex_match(text, m, pattern.regex)) {
            continue;
        }
        if (!registry.contains(pattern.tool)) {
            spdlog::debug("Fast path '{}' names unregistered tool {}", pattern.name, pattern.tool);
            continue;
        }
        auto args = pattern.build_args(m);
        if (!args) {
            continue;
        }

        spdlog::debug("Fast path '{}' matched", pattern.name);
        return ToolCall{
            .tool_name = pattern.tool,
            .args = std::move(*args),
            .stage = ResolutionStage::FastPath,
            .confidence = 1.0
        };
    }

    return std::nullopt;
}

std::vector<std::string> FastPath::matching_patterns(const std::string& input) const {
    std::string text = trim(input);
    std::vector<std::string> names;
    for (const auto& pattern : patterns_) {
        if (std::regex_match(text, pattern.regex)) {
            names.push_back(pattern.name);
        }
    }
    return names;
}

}  // namespace toolroute::router
