#pragma once

#include "toolroute/llm/chat_model.hpp"

#include <string>

namespace toolroute::llm {

// Any server speaking POST {base_url}/chat/completions
class OpenAICompatibleModel : public ChatModel {
public:
    explicit OpenAICompatibleModel(const LLMConfig& config);

    std::string provider() const override { return "openai_compatible"; }
    std::string model() const override { return model_; }
    bool is_available() const override;

    Result<ChatResponse, Error> complete(const ChatRequest& request) override;

    Json build_body(const ChatRequest& request) const;
    static Result<ChatResponse, Error> parse_response(const std::string& body);

private:
    std::string api_key_;
    std::string model_;
    std::string origin_;      // scheme://host[:port]
    std::string path_prefix_; // e.g. /v1
    int timeout_ms_;
};

}  // namespace toolroute::llm
