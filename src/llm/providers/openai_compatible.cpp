#include "toolroute/llm/providers/openai_compatible.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace toolroute::llm {

namespace {

// Split "https://host:port/v1" into origin and path prefix
std::pair<std::string, std::string> split_base_url(const std::string& url) {
    auto scheme_end = url.find("://");
    size_t host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto path_start = url.find('/', host_start);
    if (path_start == std::string::npos) {
        return {url, ""};
    }
    std::string prefix = url.substr(path_start);
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    return {url.substr(0, path_start), prefix};
}

}  // namespace

OpenAICompatibleModel::OpenAICompatibleModel(const LLMConfig& config)
    : api_key_(config.api_key)
    , model_(config.model)
    , timeout_ms_(config.request_timeout_ms)
{
    auto [origin, prefix] = split_base_url(config.base_url);
    origin_ = origin;
    path_prefix_ = prefix;
}

bool OpenAICompatibleModel::is_available() const {
    return !api_key_.empty() && !origin_.empty();
}

Json OpenAICompatibleModel::build_body(const ChatRequest& request) const {
    Json messages = Json::array();
    if (!request.system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", request.system_prompt}});
    }
    for (const auto& msg : request.messages) {
        messages.push_back({{"role", msg.role}, {"content", msg.content}});
    }

    Json body{
        {"model", model_},
        {"messages", messages},
        {"temperature", request.temperature},
        {"max_tokens", request.max_tokens}
    };

    if (!request.tools.empty()) {
        body["tools"] = request.tools;
    }
    if (request.json_mode) {
        body["response_format"] = {{"type", "json_object"}};
    }

    return body;
}

Result<ChatResponse, Error> OpenAICompatibleModel::parse_response(const std::string& body) {
    using R = Result<ChatResponse, Error>;

    Json j = Json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return R::err(ErrorCode::LLMInvalidResponse, "Response body is not JSON");
    }

    if (j.contains("error")) {
        std::string message = j["error"].is_object()
            ? j["error"].value("message", "Unknown provider error")
            : j["error"].dump();
        return R::err(ErrorCode::LLMRequestFailed, message);
    }

    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        return R::err(ErrorCode::LLMInvalidResponse, "Response has no choices");
    }

    const auto& message = j["choices"][0].value("message", Json::object());
    ChatResponse response;
    response.model = j.value("model", "");

    if (message.contains("content") && message["content"].is_string()) {
        response.content = message["content"].get<std::string>();
    }

    if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
        for (const auto& call : message["tool_calls"]) {
            const auto& fn = call.value("function", Json::object());
            ChatToolCall tc;
            tc.name = fn.value("name", "");
            const auto& raw = fn.value("arguments", Json());
            if (raw.is_string()) {
                Json parsed = Json::parse(raw.get<std::string>(), nullptr, false);
                tc.arguments = parsed.is_discarded() ? Json() : parsed;
            } else {
                tc.arguments = raw;
            }
            response.tool_calls.push_back(std::move(tc));
        }
    }

    return R::ok(std::move(response));
}

Result<ChatResponse, Error> OpenAICompatibleModel::complete(const ChatRequest& request) {
    if (!is_available()) {
        return Result<ChatResponse, Error>::err(
            ErrorCode::LLMUnavailable,
            "API key or base URL not set"
        );
    }

    auto start = std::chrono::steady_clock::now();

    httplib::Client client(origin_);
    auto timeout = std::chrono::milliseconds(timeout_ms_);
    client.set_connection_timeout(std::chrono::duration_cast<std::chrono::seconds>(timeout).count(),
                                  (timeout_ms_ % 1000) * 1000);
    client.set_read_timeout(std::chrono::duration_cast<std::chrono::seconds>(timeout).count(),
                            (timeout_ms_ % 1000) * 1000);

    httplib::Headers headers = {
        {"Authorization", "Bearer " + api_key_}
    };

    auto res = client.Post(path_prefix_ + "/chat/completions", headers,
                           build_body(request).dump(), "application/json");

    if (!res) {
        return Result<ChatResponse, Error>::err(
            ErrorCode::LLMRequestFailed,
            "Connection failed: " + httplib::to_string(res.error()),
            origin_
        );
    }

    if (res->status == 429 || res->status >= 500) {
        return Result<ChatResponse, Error>::err(
            ErrorCode::LLMRequestFailed,
            "Provider returned status " + std::to_string(res->status)
        );
    }

    if (res->status != 200) {
        auto parsed = parse_response(res->body);
        if (parsed.is_err()) {
            return parsed;
        }
        return Result<ChatResponse, Error>::err(
            ErrorCode::LLMInvalidResponse,
            "Unexpected status code: " + std::to_string(res->status)
        );
    }

    auto result = parse_response(res->body);
    if (result.is_ok()) {
        result.value().latency = std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - start);
    }
    return result;
}

ChatModelPtr create_chat_model(const LLMConfig& config) {
    if (config.provider == "none") {
        return nullptr;
    }
    if (config.api_key.empty()) {
        spdlog::debug("No API key configured; model fallback disabled");
        return nullptr;
    }
    return std::make_shared<OpenAICompatibleModel>(config);
}

}  // namespace toolroute::llm
