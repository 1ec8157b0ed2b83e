#pragma once

#include "toolroute/tools/tool_registry.hpp"

#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace toolroute::router {

using namespace toolroute::core;
using tools::ToolRegistry;

// One canonical command shape
struct FastPathPattern {
    std::string name;                 // e.g. "task_add"
    std::string tool;
    std::regex regex;                 // matched against the whole trimmed input
    std::function<std::optional<Json>(const std::smatch&)> build_args;
    std::vector<std::string> samples; // canonical inputs this pattern owns
};

// Deterministic first stage. Patterns are tried in order; the first match
// naming a registered tool wins. No I/O.
class FastPath {
public:
    FastPath();
    explicit FastPath(std::vector<FastPathPattern> patterns);

    std::optional<ToolCall> match(const std::string& input, const ToolRegistry& registry) const;

    // Names of every pattern whose regex matches input, in table order
    std::vector<std::string> matching_patterns(const std::string& input) const;

    const std::vector<FastPathPattern>& patterns() const { return patterns_; }

    static std::vector<FastPathPattern> default_patterns();

private:
    std::vector<FastPathPattern> patterns_;
};

}  // namespace toolroute::router
