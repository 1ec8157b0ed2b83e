#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "toolroute/router/heuristic_parser.hpp"

using namespace toolroute::core;
using namespace toolroute::router;
using toolroute::tools::ToolRegistryBuilder;

TEST_CASE("Tokenizer lowercases and drops stop words", "[heuristic]") {
    auto tokens = HeuristicParser::tokenize("Please show me THE tasks, now!");
    REQUIRE(tokens == std::vector<std::string>{"show", "tasks"});
}

TEST_CASE("Decisive winner with no required arguments", "[heuristic]") {
    auto registry = ToolRegistryBuilder().add_builtins().build();
    HeuristicParser parser;

    auto call = parser.parse("show my tasks", *registry);
    REQUIRE(call.has_value());
    REQUIRE(call->tool_name == "task_list");
    REQUIRE(call->args == Json::object());
    REQUIRE(call->stage == ResolutionStage::Heuristic);
    REQUIRE(call->confidence > 0.0);
    REQUIRE(call->confidence <= 1.0);
}

TEST_CASE("Single required argument comes from the text after the verb", "[heuristic]") {
    auto registry = ToolRegistryBuilder().add_builtins().build();
    HeuristicParser parser;

    auto call = parser.parse("calculate 2 * (3 + 4)", *registry);
    REQUIRE(call.has_value());
    REQUIRE(call->tool_name == "calculate");
    REQUIRE(call->args["expression"] == "2 * (3 + 4)");
}

TEST_CASE("Ambiguous input yields nothing", "[heuristic]") {
    auto registry = ToolRegistryBuilder().add_builtins().build();
    HeuristicParser parser;

    // git_status, git_diff and git_log tie
    REQUIRE_FALSE(parser.parse("git", *registry).has_value());
}

TEST_CASE("Below threshold yields nothing", "[heuristic]") {
    auto registry = ToolRegistryBuilder().add_builtins().build();
    HeuristicParser parser;

    REQUIRE_FALSE(parser.parse("the weather in paris", *registry).has_value());
    REQUIRE_FALSE(parser.parse("", *registry).has_value());
}

TEST_CASE("Tools with several required arguments are deferred", "[heuristic]") {
    auto registry = ToolRegistryBuilder().add_builtins().build();
    HeuristicParser parser;

    // copy_file wins the scoring but needs source and destination
    auto candidates = parser.score("copy duplicate", *registry);
    REQUIRE_FALSE(candidates.empty());
    REQUIRE(candidates.front().tool == "copy_file");
    REQUIRE_FALSE(parser.parse("copy duplicate", *registry).has_value());
}

TEST_CASE("Integer argument conversion", "[heuristic]") {
    auto registry = ToolRegistryBuilder().add_builtins().build();
    HeuristicParser parser(HeuristicOptions{.threshold = 10, .margin = 3});

    auto call = parser.parse("done 7", *registry);
    REQUIRE(call.has_value());
    REQUIRE(call->tool_name == "task_done");
    REQUIRE(call->args["id"] == 7);

    REQUIRE_FALSE(parser.parse("done seven", *registry).has_value());
}

TEST_CASE("Scoring weights", "[heuristic]") {
    toolroute::tools::ToolSpec spec{
        .name = "weather_lookup",
        .description = "Forecast for a city",
        .parameters = {{"city", "City", toolroute::tools::ParamType::String, true}},
        .keywords = {"rain"}
    };

    REQUIRE(HeuristicParser::score_tool(spec, {"weather"}) == 10);
    REQUIRE(HeuristicParser::score_tool(spec, {"rain"}) == 5);
    REQUIRE(HeuristicParser::score_tool(spec, {"forecast"}) == 2);
    REQUIRE(HeuristicParser::score_tool(spec, {"city"}) == 2);
    REQUIRE(HeuristicParser::score_tool(spec, {"weather", "weather", "rain"}) == 15);
}

namespace {

toolroute::tools::RegistryPtr notes_registry() {
    auto echo = [](const Json& args, const toolroute::tools::ExecutorContext&) {
        return ToolResult::success(args);
    };
    return ToolRegistryBuilder()
        .add_builtin(toolroute::tools::ToolSpec{
            .name = "remember",
            .description = "Store a note",
            .parameters = {{"text", "Note", toolroute::tools::ParamType::String, true}}
        }, echo)
        .add_builtin(toolroute::tools::ToolSpec{
            .name = "recall",
            .description = "Search stored notes",
            .parameters = {{"query", "Words", toolroute::tools::ParamType::String, true}}
        }, echo)
        .build();
}

}  // namespace

TEST_CASE("Leading stop words are not part of the argument", "[heuristic]") {
    auto registry = notes_registry();
    HeuristicParser parser;

    auto polite = parser.parse("please remember buy milk", *registry);
    REQUIRE(polite.has_value());
    REQUIRE(polite->tool_name == "remember");
    REQUIRE(polite->args["text"] == "buy milk");

    auto question = parser.parse("can you recall milk", *registry);
    REQUIRE(question.has_value());
    REQUIRE(question->tool_name == "recall");
    REQUIRE(question->args["query"] == "milk");

    auto punctuated = parser.parse("  Please, REMEMBER: call the bank ", *registry);
    REQUIRE(punctuated.has_value());
    REQUIRE(punctuated->args["text"] == "call the bank");

    REQUIRE_FALSE(parser.parse("please remember", *registry).has_value());
}
