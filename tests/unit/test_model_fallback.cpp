#include <catch2/catch_test_macros.hpp>
#include "toolroute/router/model_fallback.hpp"
#include "mock_chat_model.hpp"

#include <thread>

using namespace toolroute::core;
using namespace toolroute::router;
using toolroute::test::MockChatModel;
using toolroute::tools::ToolRegistryBuilder;

namespace {

struct FallbackFixture {
    std::shared_ptr<MockChatModel> model = std::make_shared<MockChatModel>();
    toolroute::tools::RegistryPtr registry = ToolRegistryBuilder().add_builtins().build();
    toolroute::cache::Cache<ToolCall> cache;
    ThreadPool pool{4};

    ModelFallback fallback(ModelFallbackOptions options = {}) {
        return ModelFallback(model, cache, pool, options);
    }
};

template<typename Pred>
bool wait_until(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

}  // namespace

TEST_CASE("Model reply in JSON content is accepted and cached", "[model_fallback]") {
    FallbackFixture f;
    f.model->reply_content(R"({"tool": "remember", "args": {"text": "buy milk"}})");
    auto fallback = f.fallback();

    auto first = fallback.resolve("please keep in mind that I need milk", f.registry);
    REQUIRE(first.is_ok());
    REQUIRE(first.value().call.tool_name == "remember");
    REQUIRE(first.value().call.args["text"] == "buy milk");
    REQUIRE(first.value().call.stage == ResolutionStage::ModelFallback);
    REQUIRE_FALSE(first.value().cache_hit);
    REQUIRE(first.value().model == "mock/scripted");

    // Normalization: case and whitespace do not change the key
    auto second = fallback.resolve("Please keep in mind   that I need milk ", f.registry);
    REQUIRE(second.is_ok());
    REQUIRE(second.value().cache_hit);
    REQUIRE(f.model->calls() == 1);
}

TEST_CASE("Native tool calls and fenced JSON are understood", "[model_fallback]") {
    auto registry = ToolRegistryBuilder().add_builtins().build();

    toolroute::llm::ChatResponse native;
    native.tool_calls.push_back({"task_add", Json{{"text", "file taxes"}}});
    auto a = ModelFallback::parse_reply(native, *registry);
    REQUIRE(a.value().tool_name == "task_add");

    toolroute::llm::ChatResponse fenced;
    fenced.content = "Sure!\n```json\n{\"tool\": \"get_time\", \"args\": {}}\n```";
    auto b = ModelFallback::parse_reply(fenced, *registry);
    REQUIRE(b.value().tool_name == "get_time");
}

TEST_CASE("Invalid replies are rejected with retriable errors", "[model_fallback]") {
    auto registry = ToolRegistryBuilder().add_builtins().build();
    toolroute::llm::ChatResponse reply;

    reply.content = "I think you want the calculator";
    REQUIRE(ModelFallback::parse_reply(reply, *registry).error().code == ErrorCode::LLMInvalidResponse);

    reply.content = R"({"tool": "launch_rockets", "args": {}})";
    REQUIRE(ModelFallback::parse_reply(reply, *registry).error().code == ErrorCode::LLMInvalidResponse);

    reply.content = R"({"tool": "task_done", "args": {"id": "seven"}})";
    REQUIRE(ModelFallback::parse_reply(reply, *registry).error().code == ErrorCode::LLMInvalidResponse);

    reply.content = R"({"tool": null})";
    REQUIRE(ModelFallback::parse_reply(reply, *registry).error().code == ErrorCode::RoutingNoMatch);
}

TEST_CASE("Three invalid replies end in ROUTING_NO_MATCH", "[model_fallback]") {
    FallbackFixture f;
    f.model->reply_content("not json at all");
    auto fallback = f.fallback(ModelFallbackOptions{.max_attempts = 3});

    auto result = fallback.resolve("do something clever", f.registry);
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::RoutingNoMatch);
    REQUIRE(result.error().details->at("attempts") == 3);
    REQUIRE(f.model->calls() == 3);
    REQUIRE(f.cache.size() == 0);
}

TEST_CASE("A retry carries feedback about the rejected reply", "[model_fallback]") {
    FallbackFixture f;
    f.model->reply_content(R"({"tool": "task_add", "args": {}})");
    f.model->reply_content(R"({"tool": "task_add", "args": {"text": "call the bank"}})");
    auto fallback = f.fallback();

    auto result = fallback.resolve("I should call the bank", f.registry);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().call.args["text"] == "call the bank");
    REQUIRE(f.model->calls() == 2);

    auto request = f.model->last_request();
    REQUIRE(request.messages.size() == 3);
    REQUIRE(request.messages.back().content.find("rejected") != std::string::npos);
}

TEST_CASE("A declined request is not retried", "[model_fallback]") {
    FallbackFixture f;
    f.model->reply_content(R"({"tool": null})");
    auto fallback = f.fallback();

    auto result = fallback.resolve("sing me a song", f.registry);
    REQUIRE(result.error().code == ErrorCode::RoutingNoMatch);
    REQUIRE(f.model->calls() == 1);
}

TEST_CASE("Transport failures are retried", "[model_fallback]") {
    FallbackFixture f;
    f.model->reply_error(ErrorCode::LLMRequestFailed, "HTTP 503");
    f.model->reply_content(R"({"tool": "get_time", "args": {}})");
    auto fallback = f.fallback();

    auto result = fallback.resolve("what's the hour", f.registry);
    REQUIRE(result.is_ok());
    REQUIRE(f.model->calls() == 2);
}

TEST_CASE("Prompt only offers tools passing the filter", "[model_fallback]") {
    FallbackFixture f;
    f.model->reply_content(R"({"tool": "read_file", "args": {"path": "a.txt"}})");
    auto fallback = f.fallback(ModelFallbackOptions{.max_attempts = 2});

    auto only_memory = [](const toolroute::tools::ToolSpec& spec) {
        return spec.name == "remember" || spec.name == "recall";
    };
    auto result = fallback.resolve("open a.txt", f.registry, only_memory);

    REQUIRE(result.error().code == ErrorCode::RoutingNoMatch);
    auto request = f.model->last_request();
    REQUIRE(request.tools.size() == 2);
    REQUIRE(request.system_prompt.find("recall(") != std::string::npos);
    REQUIRE(request.system_prompt.find("read_file(") == std::string::npos);
}

TEST_CASE("Concurrent identical requests make one model call", "[model_fallback][concurrency]") {
    FallbackFixture f;
    f.model->reply_content(R"({"tool": "get_time", "args": {}})");
    f.model->block();
    auto fallback = f.fallback();

    constexpr int kCallers = 4;
    std::vector<KResult<ModelResolution>> results(kCallers, Error{ErrorCode::ExecError});
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&, i]() {
            results[i] = fallback.resolve("what hour is it over there", f.registry);
        });
    }

    REQUIRE(wait_until([&] { return f.cache.stats().joins == kCallers - 1; }));
    REQUIRE(f.cache.in_flight() == 1);
    f.model->unblock();

    for (auto& t : callers) t.join();

    REQUIRE(f.model->calls() == 1);
    for (const auto& r : results) {
        REQUIRE(r.is_ok());
        REQUIRE(r.value().call.tool_name == "get_time");
    }
}

TEST_CASE("Slow model yields ROUTING_TIMEOUT", "[model_fallback]") {
    FallbackFixture f;
    f.model->reply_content(R"({"tool": "get_time", "args": {}})");
    f.model->block();
    auto fallback = f.fallback(ModelFallbackOptions{.timeout = std::chrono::milliseconds(50)});

    auto result = fallback.resolve("what hour is it", f.registry);
    f.model->unblock();

    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::RoutingTimeout);
}

TEST_CASE("Cache key depends on model, input and schema", "[model_fallback]") {
    FallbackFixture f;
    auto fallback = f.fallback();

    auto a = fallback.cache_key("Show Tasks", "schema-1");
    auto b = fallback.cache_key("show   tasks", "schema-1");
    auto c = fallback.cache_key("show tasks", "schema-2");

    REQUIRE(a == b);
    REQUIRE_FALSE(a == c);
    REQUIRE(a.scope == "mock/scripted");
}
