#pragma once

#include "toolroute/cache/cache.hpp"
#include "toolroute/core/thread_pool.hpp"
#include "toolroute/llm/chat_model.hpp"
#include "toolroute/tools/tool_registry.hpp"

#include <functional>
#include <string>

namespace toolroute::router {

using namespace toolroute::core;
using tools::ToolRegistry;
using tools::ToolSpec;

using ToolFilter = std::function<bool(const ToolSpec&)>;

struct ModelFallbackOptions {
    int max_attempts = 3;
    Duration timeout{30000};
    double temperature = 0.0;
};

struct ModelResolution {
    ToolCall call;
    bool cache_hit = false;
    std::string model;
};

// Last routing stage. Asks the chat model to pick a tool from the compact
// schema list, validates the reply, and memoizes accepted calls keyed by
// (model id, normalized input, schema text). Concurrent identical requests
// share one model call through the cache.
class ModelFallback {
public:
    ModelFallback(llm::ChatModelPtr model,
                  cache::Cache<ToolCall>& cache,
                  ThreadPool& pool,
                  ModelFallbackOptions options = {});

    bool available() const;

    // The registry is shared with the background computation, which may
    // outlive this call when the deadline passes.
    KResult<ModelResolution> resolve(const std::string& input,
                                     tools::RegistryPtr registry,
                                     const ToolFilter& filter = {}) const;

    cache::CacheKey cache_key(const std::string& input, const std::string& schema_text) const;

    // Interpret one reply: native tool call first, then a JSON object in the
    // content (code fences allowed). ROUTING_NO_MATCH when the model declines.
    static KResult<ToolCall> parse_reply(const llm::ChatResponse& response,
                                         const ToolRegistry& registry,
                                         const ToolFilter& filter = {});

    static std::string build_system_prompt(const std::string& schema_text);

    const ModelFallbackOptions& options() const { return options_; }

private:
    llm::ChatModelPtr model_;
    cache::Cache<ToolCall>& cache_;
    ThreadPool& pool_;
    ModelFallbackOptions options_;
};

}  // namespace toolroute::router
