#include "toolroute/tools/tool_registry.hpp"
#include "toolroute/tools/builtin.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace toolroute::tools {

const RegisteredTool* ToolRegistry::find(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : &it->second;
}

std::vector<ToolSpec> ToolRegistry::list() const {
    std::vector<ToolSpec> specs;
    specs.reserve(tools_.size());
    for (const auto& [_, tool] : tools_) {
        specs.push_back(tool.spec);
    }
    return specs;
}

std::string ToolRegistry::compact_schema_text(
    const std::function<bool(const ToolSpec&)>& filter) const {
    std::ostringstream ss;
    for (const auto& [_, tool] : tools_) {
        if (filter && !filter(tool.spec)) {
            continue;
        }
        ss << tool.spec.compact() << "\n";
    }
    return ss.str();
}

ToolRegistryBuilder& ToolRegistryBuilder::add_builtin(ToolSpec spec, ToolHandler handler) {
    auto it = tools_.find(spec.name);
    if (it != tools_.end()) {
        if (it->second.source == "builtin") {
            spdlog::error("Built-in tool '{}' registered twice; keeping the first", spec.name);
            return *this;
        }
        spdlog::warn("Plugin tool '{}' ({}) shadowed by built-in", spec.name, it->second.source);
    }

    std::string name = spec.name;
    tools_.insert_or_assign(name, RegisteredTool{
        .spec = std::move(spec),
        .handler = std::move(handler),
        .source = "builtin"
    });
    return *this;
}

bool ToolRegistryBuilder::add_plugin(ToolSpec spec, ToolHandler handler, const std::string& source) {
    auto it = tools_.find(spec.name);
    if (it != tools_.end()) {
        spdlog::warn("Skipping plugin tool '{}' from {}: name already registered by {}",
                     spec.name, source, it->second.source);
        return false;
    }

    std::string name = spec.name;
    tools_.emplace(name, RegisteredTool{
        .spec = std::move(spec),
        .handler = std::move(handler),
        .source = source
    });
    return true;
}

ToolRegistryBuilder& ToolRegistryBuilder::add_builtins() {
    builtin::register_memory_tools(*this);
    builtin::register_task_tools(*this);
    builtin::register_file_tools(*this);
    builtin::register_command_tools(*this);
    builtin::register_git_tools(*this);
    builtin::register_utility_tools(*this);
    return *this;
}

RegistryPtr ToolRegistryBuilder::build() {
    auto registry = std::make_shared<ToolRegistry>();
    registry->tools_ = std::move(tools_);
    tools_.clear();
    spdlog::debug("Tool registry built with {} tools", registry->size());
    return registry;
}

}  // namespace toolroute::tools
