#pragma once

#include "executor_context.hpp"
#include "tool_spec.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace toolroute::tools {

// Tool handler function type
using ToolHandler = std::function<ToolResult(const Json& args, const ExecutorContext& ctx)>;

// Tool registration entry
struct RegisteredTool {
    ToolSpec spec;
    ToolHandler handler;
    std::string source;  // "builtin" or "plugin:<name>"
};

// Immutable name -> (schema, handler) table. Built once by ToolRegistryBuilder;
// every method is a side-effect free read.
class ToolRegistry {
public:
    const RegisteredTool* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    // Sorted by name
    std::vector<ToolSpec> list() const;

    // One line per tool for model prompts; filter may be empty
    std::string compact_schema_text(
        const std::function<bool(const ToolSpec&)>& filter = {}) const;

    size_t size() const { return tools_.size(); }

private:
    friend class ToolRegistryBuilder;
    std::map<std::string, RegisteredTool> tools_;
};

using RegistryPtr = std::shared_ptr<const ToolRegistry>;

class ToolRegistryBuilder {
public:
    // Built-ins always win a name collision with a plugin
    ToolRegistryBuilder& add_builtin(ToolSpec spec, ToolHandler handler);

    // Returns false (and logs) when the tool is skipped
    bool add_plugin(ToolSpec spec, ToolHandler handler, const std::string& source);

    // Register the closed set of built-in tools
    ToolRegistryBuilder& add_builtins();

    RegistryPtr build();

private:
    std::map<std::string, RegisteredTool> tools_;
};

}  // namespace toolroute::tools
