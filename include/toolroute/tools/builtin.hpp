#pragma once

#include "tool_registry.hpp"

namespace toolroute::tools::builtin {

void register_memory_tools(ToolRegistryBuilder& builder);
void register_task_tools(ToolRegistryBuilder& builder);
void register_file_tools(ToolRegistryBuilder& builder);
void register_command_tools(ToolRegistryBuilder& builder);
void register_git_tools(ToolRegistryBuilder& builder);
void register_utility_tools(ToolRegistryBuilder& builder);

// Shared by run_cmd, git and plugin handlers: nonzero exit or timeout -> EXEC_ERROR
ToolResult process_to_result(const ProcessResult& proc, const std::string& what);

// Recursive-descent arithmetic (+ - * / % ^, parentheses, unary minus)
Result<double, Error> evaluate_expression(const std::string& expression);

}  // namespace toolroute::tools::builtin
