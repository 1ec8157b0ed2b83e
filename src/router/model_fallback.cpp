#include "toolroute/router/model_fallback.hpp"
#include "toolroute/core/hash.hpp"

#include <spdlog/spdlog.h>

namespace toolroute::router {

namespace {

using SteadyClock = std::chrono::steady_clock;

// Strip ``` fences and surrounding prose, leaving the outermost {...}
std::string extract_json_object(const std::string& content) {
    std::string text = content;

    auto fence = text.find("```");
    if (fence != std::string::npos) {
        auto body_start = text.find('\n', fence);
        if (body_start != std::string::npos) {
            auto body_end = text.find("```", body_start);
            text = text.substr(body_start + 1,
                body_end == std::string::npos ? std::string::npos : body_end - body_start - 1);
        }
    }

    auto open = text.find('{');
    auto close = text.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return "";
    }
    return text.substr(open, close - open + 1);
}

Error invalid_reply(std::string message) {
    return Error{ErrorCode::LLMInvalidResponse, std::move(message)};
}

std::string describe_reply(const llm::ChatResponse& response) {
    if (!response.tool_calls.empty()) {
        const auto& call = response.tool_calls.front();
        return Json{{"tool", call.name}, {"args", call.arguments}}.dump();
    }
    return response.content;
}

KResult<ToolCall> ask_model(const llm::ChatModelPtr& model,
                            const ModelFallbackOptions& options,
                            const std::string& input,
                            const tools::RegistryPtr& registry,
                            const ToolFilter& filter,
                            const std::string& schema_text,
                            SteadyClock::time_point deadline) {
    llm::ChatRequest request;
    request.system_prompt = ModelFallback::build_system_prompt(schema_text);
    request.temperature = options.temperature;
    request.messages.push_back({"user", input});
    for (const auto& spec : registry->list()) {
        if (filter(spec)) {
            request.tools.push_back(spec.to_function_format());
        }
    }

    Error last{ErrorCode::RoutingNoMatch};
    int attempts = 0;

    for (int attempt = 1; attempt <= options.max_attempts; ++attempt) {
        if (SteadyClock::now() >= deadline) {
            return Error{ErrorCode::RoutingTimeout, "Model fallback deadline passed"};
        }
        attempts = attempt;

        auto reply = model->complete(request);
        if (reply.is_err()) {
            last = reply.error();
            if (!last.is_retriable()) {
                return last;
            }
            spdlog::warn("Model request failed (attempt {}/{}): {}",
                         attempt, options.max_attempts, last.to_string());
            continue;
        }

        auto parsed = ModelFallback::parse_reply(reply.value(), *registry, filter);
        if (parsed.is_ok()) {
            spdlog::debug("Model resolved '{}' on attempt {}", parsed.value().tool_name, attempt);
            return parsed;
        }

        if (parsed.error().code == ErrorCode::RoutingNoMatch) {
            return parsed;
        }

        last = parsed.error();
        spdlog::warn("Model reply rejected (attempt {}/{}): {}",
                     attempt, options.max_attempts, last.message);

        request.messages.push_back({"assistant", describe_reply(reply.value())});
        request.messages.push_back({"user",
            "That reply was rejected: " + last.message +
            ". Reply again with only the JSON object {\"tool\": ..., \"args\": {...}}."});
    }

    return Error::with_details(
        ErrorCode::RoutingNoMatch,
        "Model did not produce a valid tool call after " + std::to_string(attempts) + " attempts",
        Json{{"attempts", attempts}, {"last_error", last.to_json()}}
    );
}

}  // namespace

ModelFallback::ModelFallback(llm::ChatModelPtr model,
                             cache::Cache<ToolCall>& cache,
                             ThreadPool& pool,
                             ModelFallbackOptions options)
    : model_(std::move(model))
    , cache_(cache)
    , pool_(pool)
    , options_(options)
{
}

bool ModelFallback::available() const {
    return model_ && model_->is_available();
}

std::string ModelFallback::build_system_prompt(const std::string& schema_text) {
    return
        "You route a user request to exactly one tool.\n"
        "Reply with a single JSON object: {\"tool\": \"<name>\", \"args\": {...}}.\n"
        "Use only the tools listed below and only their declared parameters.\n"
        "Parameters marked * are required. If no tool fits, reply {\"tool\": null}.\n"
        "\n"
        "Tools:\n" + schema_text;
}

cache::CacheKey ModelFallback::cache_key(const std::string& input, const std::string& schema_text) const {
    return cache::CacheKey{
        .scope = model_ ? model_->id() : std::string("none"),
        .digest = sha256_hex(normalize_text(input) + "\n" + schema_text)
    };
}

KResult<ToolCall> ModelFallback::parse_reply(const llm::ChatResponse& response,
                                             const ToolRegistry& registry,
                                             const ToolFilter& filter) {
    std::string tool_name;
    Json args = Json::object();

    if (!response.tool_calls.empty()) {
        tool_name = response.tool_calls.front().name;
        args = response.tool_calls.front().arguments;
    } else {
        std::string body = extract_json_object(response.content);
        if (body.empty()) {
            return invalid_reply("Reply does not contain a JSON object");
        }

        Json reply = Json::parse(body, nullptr, false);
        if (reply.is_discarded() || !reply.is_object()) {
            return invalid_reply("Reply is not valid JSON");
        }
        if (!reply.contains("tool")) {
            return invalid_reply("Reply has no 'tool' field");
        }
        if (reply["tool"].is_null()) {
            return Error{ErrorCode::RoutingNoMatch, "Model found no matching tool"};
        }
        if (!reply["tool"].is_string()) {
            return invalid_reply("'tool' must be a string or null");
        }
        tool_name = reply["tool"].get<std::string>();

        if (reply.contains("args")) {
            args = reply["args"];
        } else if (reply.contains("arguments")) {
            args = reply["arguments"];
        }
        if (args.is_null()) {
            args = Json::object();
        }
    }

    const auto* entry = registry.find(tool_name);
    if (!entry || !entry->spec.dispatchable() || (filter && !filter(entry->spec))) {
        return invalid_reply("Unknown tool '" + tool_name + "'");
    }

    auto validated = tools::validate_args(entry->spec, args);
    if (validated.is_err()) {
        Error e = invalid_reply("Arguments for '" + tool_name + "' are invalid: " +
                                validated.error().message);
        e.details = validated.error().to_json();
        return e;
    }

    return ToolCall{
        .tool_name = tool_name,
        .args = std::move(validated).value(),
        .stage = ResolutionStage::ModelFallback,
        .confidence = 1.0
    };
}

KResult<ModelResolution> ModelFallback::resolve(const std::string& input,
                                                tools::RegistryPtr registry,
                                                const ToolFilter& filter) const {
    if (!available()) {
        return Error{ErrorCode::LLMUnavailable, "No chat model configured"};
    }

    ToolFilter allowed = [filter](const ToolSpec& spec) {
        return spec.dispatchable() && (!filter || filter(spec));
    };

    std::string schema_text = registry->compact_schema_text(allowed);
    if (schema_text.empty()) {
        return Error{ErrorCode::RoutingNoMatch, "No tools available for model routing"};
    }

    auto key = cache_key(input, schema_text);
    auto deadline = SteadyClock::now() + options_.timeout;

    auto compute = [model = model_, options = options_, input, registry, allowed, schema_text, deadline]() {
        return ask_model(model, options, input, registry, allowed, schema_text, deadline);
    };

    auto launch = [this](std::function<void()> task) {
        pool_.submit(std::move(task));
    };

    auto pending = cache_.get_or_compute(key, std::move(compute), launch);

    if (pending.future.wait_until(deadline) == std::future_status::timeout) {
        spdlog::warn("Model fallback timed out after {}ms", options_.timeout.count());
        return Error::with_details(
            ErrorCode::RoutingTimeout,
            "Model fallback did not finish within " + std::to_string(options_.timeout.count()) + "ms",
            Json{{"timeout_ms", options_.timeout.count()}}
        );
    }

    const auto& value = pending.future.get();
    if (value.is_err()) {
        return value.error();
    }

    return ModelResolution{
        .call = value.value(),
        .cache_hit = pending.cache_hit || pending.joined,
        .model = model_->id()
    };
}

}  // namespace toolroute::router
