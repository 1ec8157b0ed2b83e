#pragma once

#include "toolroute/core/config.hpp"
#include "toolroute/core/result.hpp"
#include "toolroute/core/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace toolroute::llm {

using namespace toolroute::core;

struct ChatMessage {
    std::string role;      // "user" or "assistant"
    std::string content;
};

struct ChatRequest {
    std::string system_prompt;
    std::vector<ChatMessage> messages;
    Json tools = Json::array();     // function-style tool schemas
    double temperature = 0.0;
    int max_tokens = 512;
    bool json_mode = true;          // ask for a JSON object reply
};

struct ChatToolCall {
    std::string name;
    Json arguments = Json::object();
};

struct ChatResponse {
    std::string content;
    std::vector<ChatToolCall> tool_calls;
    std::string model;
    Duration latency{0};
};

// Chat-completion collaborator used by the model fallback stage
class ChatModel {
public:
    virtual ~ChatModel() = default;

    virtual std::string provider() const = 0;
    virtual std::string model() const = 0;
    virtual bool is_available() const = 0;

    virtual Result<ChatResponse, Error> complete(const ChatRequest& request) = 0;

    // "<provider>/<model>", used as cache scope and in debug output
    std::string id() const { return provider() + "/" + model(); }
};

using ChatModelPtr = std::shared_ptr<ChatModel>;

// nullptr when the provider is "none" or no API key is configured
ChatModelPtr create_chat_model(const LLMConfig& config);

}  // namespace toolroute::llm
