#include "toolroute/agent/agent.hpp"

#include <spdlog/spdlog.h>

namespace toolroute::agent {

namespace {

std::vector<Agent> builtin_agents() {
    return {
        Agent{
            .name = "system",
            .kind = AgentKind::System,
            .allowed_tools = {},
            .description = "Direct CLI access with every registered tool."
        },
        Agent{
            .name = "supervisor",
            .kind = AgentKind::User,
            .allowed_tools = {"calculate", "get_time", "task_list", "task_add", "task_done",
                              "remember", "recall"},
            .description = "Triage agent for quick lookups, tasks and notes."
        },
        Agent{
            .name = "coder",
            .kind = AgentKind::User,
            .allowed_tools = {"read_file", "write_file", "list_files", "delete_file",
                              "copy_file", "move_file", "file_info", "count_words",
                              "run_cmd", "git_status", "git_diff", "git_log"},
            .description = "Files, commands and version control."
        },
        Agent{
            .name = "organizer",
            .kind = AgentKind::User,
            .allowed_tools = {"task_add", "task_list", "task_done", "remember", "recall",
                              "memory_add", "memory_search", "reminder_add"},
            .description = "Tasks, reminders and long-term memory."
        },
        Agent{
            .name = "assistant",
            .kind = AgentKind::User,
            .allowed_tools = {"remember", "recall", "get_time", "calculate", "reminder_add"},
            .description = "General personal assistant."
        },
    };
}

}  // namespace

AgentDirectory::AgentDirectory() {
    for (auto& agent : builtin_agents()) {
        agents_.emplace(agent.name, std::move(agent));
    }
}

AgentDirectory::AgentDirectory(const std::map<std::string, AgentConfig>& extra)
    : AgentDirectory()
{
    for (const auto& [name, cfg] : extra) {
        if (agents_.count(name)) {
            spdlog::warn("Agent '{}' from config shadows a built-in agent; ignored", name);
            continue;
        }
        Agent agent;
        agent.name = name;
        agent.kind = cfg.kind == "plugin" ? AgentKind::Plugin : AgentKind::User;
        agent.allowed_tools = std::set<std::string>(cfg.tools.begin(), cfg.tools.end());
        agent.description = cfg.description;
        agents_.emplace(name, std::move(agent));
    }
}

Result<Agent, Error> AgentDirectory::find(const std::string& name) const {
    auto it = agents_.find(name);
    if (it == agents_.end()) {
        return Result<Agent, Error>::err(ErrorCode::ValidationError, "Unknown agent", name);
    }
    return Result<Agent, Error>::ok(it->second);
}

std::vector<Agent> AgentDirectory::list() const {
    std::vector<Agent> out;
    out.reserve(agents_.size());
    for (const auto& [_, agent] : agents_) {
        out.push_back(agent);
    }
    return out;
}

Agent AgentDirectory::system() {
    return builtin_agents().front();
}

}  // namespace toolroute::agent
