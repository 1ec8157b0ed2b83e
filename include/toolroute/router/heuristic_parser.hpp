#pragma once

#include "toolroute/tools/tool_registry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace toolroute::router {

using namespace toolroute::core;
using tools::ToolRegistry;
using tools::ToolSpec;

struct HeuristicOptions {
    int threshold = 10;   // minimum winning score
    int margin = 3;       // winner must beat the runner-up by more than this
};

struct HeuristicCandidate {
    std::string tool;
    int score = 0;
};

// Keyword scoring over tool names, keywords and descriptions.
//
// Per distinct input token:
//   +10 when it equals a segment of the tool name (split on '_')
//   +5  when it equals one of the tool's keywords
//   +2  when it appears among the description words or required parameter names
//
// Arguments are only extracted for tools with zero or one required parameter;
// the single argument is the raw input after its first word.
class HeuristicParser {
public:
    HeuristicParser() = default;
    explicit HeuristicParser(HeuristicOptions options) : options_(options) {}

    std::optional<ToolCall> parse(const std::string& input, const ToolRegistry& registry) const;

    // Dispatchable tools with a positive score, best first (ties by name)
    std::vector<HeuristicCandidate> score(const std::string& input, const ToolRegistry& registry) const;

    // Lowercase alphanumeric words with stop words removed
    static std::vector<std::string> tokenize(const std::string& input);

    static int score_tool(const ToolSpec& spec, const std::vector<std::string>& tokens);

    const HeuristicOptions& options() const { return options_; }

private:
    HeuristicOptions options_;
};

}  // namespace toolroute::router
