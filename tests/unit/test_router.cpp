#include <catch2/catch_test_macros.hpp>
#include "toolroute/router/router.hpp"
#include "mock_chat_model.hpp"

using namespace toolroute::core;
using namespace toolroute::router;
using toolroute::agent::AgentDirectory;
using toolroute::test::MockChatModel;
using toolroute::tools::ToolRegistryBuilder;

namespace {

struct RouterFixture {
    std::shared_ptr<MockChatModel> model = std::make_shared<MockChatModel>();
    toolroute::tools::RegistryPtr registry = ToolRegistryBuilder().add_builtins().build();
    toolroute::cache::Cache<ToolCall> cache;
    ThreadPool pool{2};
    RouterConfig config;

    Router router(bool with_model = true) {
        std::unique_ptr<ModelFallback> fallback;
        if (with_model) {
            fallback = std::make_unique<ModelFallback>(model, cache, pool);
        }
        return Router(registry, config, std::move(fallback));
    }
};

}  // namespace

TEST_CASE("Fast path never calls the model", "[router]") {
    RouterFixture f;
    auto router = f.router();

    auto routed = router.route("remember: buy milk", AgentDirectory::system());
    REQUIRE(routed.is_ok());
    REQUIRE(routed.value().call.tool_name == "remember");
    REQUIRE(routed.value().debug.stage == ResolutionStage::FastPath);
    REQUIRE_FALSE(routed.value().debug.model.has_value());
    REQUIRE(f.model->calls() == 0);
}

TEST_CASE("Heuristic runs when no pattern matches", "[router]") {
    RouterFixture f;
    auto router = f.router();

    auto routed = router.route("show my tasks", AgentDirectory::system());
    REQUIRE(routed.is_ok());
    REQUIRE(routed.value().call.tool_name == "task_list");
    REQUIRE(routed.value().debug.stage == ResolutionStage::Heuristic);
    REQUIRE(f.model->calls() == 0);
}

TEST_CASE("Model fallback resolves what the earlier stages cannot", "[router]") {
    RouterFixture f;
    f.model->reply_content(R"({"tool": "git_log", "args": {"limit": 3}})");
    auto router = f.router();

    auto routed = router.route("git", AgentDirectory::system());
    REQUIRE(routed.is_ok());
    REQUIRE(routed.value().call.tool_name == "git_log");
    REQUIRE(routed.value().debug.stage == ResolutionStage::ModelFallback);
    REQUIRE(routed.value().debug.model == std::optional<std::string>("mock/scripted"));
    REQUIRE(f.model->calls() == 1);
}

TEST_CASE("Model prompt is limited to the agent's tools", "[router]") {
    RouterFixture f;
    f.model->reply_content(R"({"tool": null})");
    auto router = f.router();

    auto organizer = AgentDirectory().find("organizer").value();
    auto routed = router.route("something vague entirely", organizer);
    REQUIRE(routed.error().code == ErrorCode::RoutingNoMatch);
    REQUIRE(f.model->last_request().tools.size() == organizer.allowed_tools.size());
}

TEST_CASE("No model means ROUTING_NO_MATCH", "[router]") {
    RouterFixture f;
    auto router = f.router(false);

    auto routed = router.route("something vague entirely", AgentDirectory::system());
    REQUIRE(routed.is_err());
    REQUIRE(routed.error().code == ErrorCode::RoutingNoMatch);
}

TEST_CASE("Disabled stages are skipped", "[router]") {
    RouterFixture f;
    f.config.fast_path_enabled = false;
    f.config.heuristic_enabled = false;
    f.model->reply_content(R"({"tool": "remember", "args": {"text": "buy milk"}})");
    auto router = f.router();

    auto routed = router.route("remember: buy milk", AgentDirectory::system());
    REQUIRE(routed.value().debug.stage == ResolutionStage::ModelFallback);
    REQUIRE(f.model->calls() == 1);
}

TEST_CASE("Input bounds", "[router]") {
    RouterFixture f;
    auto router = f.router();

    REQUIRE(router.route("", AgentDirectory::system()).error().code == ErrorCode::ValidationError);
    REQUIRE(router.route("   \n", AgentDirectory::system()).error().code == ErrorCode::ValidationError);

    std::string huge(kMaxInputLength + 1, 'a');
    REQUIRE(router.route(huge, AgentDirectory::system()).error().code == ErrorCode::ValidationError);
    REQUIRE(f.model->calls() == 0);
}
