#pragma once

#include "toolroute/core/config.hpp"
#include "toolroute/core/result.hpp"

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace toolroute::agent {

using namespace toolroute::core;

enum class AgentKind {
    System,   // bypasses the tool-set check
    User,
    Plugin
};

inline std::string_view agent_kind_to_string(AgentKind kind) {
    switch (kind) {
        case AgentKind::System: return "system";
        case AgentKind::User: return "user";
        case AgentKind::Plugin: return "plugin";
    }
    return "user";
}

// The invoking principal
struct Agent {
    std::string name;
    AgentKind kind = AgentKind::User;
    std::set<std::string> allowed_tools;
    std::string description;

    bool is_system() const { return kind == AgentKind::System; }
    bool may_use(const std::string& tool) const {
        return is_system() || allowed_tools.count(tool) > 0;
    }
};

// Built-in agents plus the ones declared under `agents:` in config.yaml
class AgentDirectory {
public:
    AgentDirectory();
    explicit AgentDirectory(const std::map<std::string, AgentConfig>& extra);

    Result<Agent, Error> find(const std::string& name) const;
    std::vector<Agent> list() const;

    static Agent system();

private:
    std::map<std::string, Agent> agents_;
};

}  // namespace toolroute::agent
