#pragma once

#include "toolroute/core/types.hpp"

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace toolroute::app {

inline constexpr std::string_view kVersion = "0.1.0";

inline constexpr int kExitOk = 0;
inline constexpr int kExitInternal = 1;
inline constexpr int kExitUser = 2;
inline constexpr int kExitUsage = 64;

// 0 on success, 2 for user/policy errors, 1 for everything else
int exit_code_for(const core::ToolResult& result);

// args excludes the program name
int run_cli(std::vector<std::string> args, std::istream& in, std::ostream& out, std::ostream& err);

int run_cli(int argc, char** argv);

}  // namespace toolroute::app
