#pragma once

#include "tool_registry.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace toolroute::tools {

namespace fs = std::filesystem;

struct PluginLoadReport {
    size_t plugins = 0;
    size_t tools_loaded = 0;
    size_t tools_skipped = 0;
    std::vector<std::string> warnings;
};

// Scan <dir>/*/plugin.json and add every valid tool to the builder.
//
// plugin.json: {name, version, description?, tools: [{<descriptor>, "exec": "<relative path>"}]}
// Invalid descriptors, executables outside the plugin directory and name
// collisions are skipped with a warning. Nothing here aborts startup.
PluginLoadReport load_plugins(const fs::path& dir, ToolRegistryBuilder& builder);

// Handler that runs the executable with the args as JSON on stdin
ToolHandler make_plugin_handler(fs::path executable, std::string tool_name);

}  // namespace toolroute::tools
