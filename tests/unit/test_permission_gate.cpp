#include <catch2/catch_test_macros.hpp>
#include "toolroute/security/permission_gate.hpp"
#include "toolroute/tools/tool_registry.hpp"
#include "test_support.hpp"

using namespace toolroute::core;
using namespace toolroute::security;
using toolroute::agent::Agent;
using toolroute::agent::AgentDirectory;
using toolroute::agent::AgentKind;
using toolroute::test::TempDir;
using toolroute::tools::ToolRegistryBuilder;

namespace {

struct GateFixture {
    TempDir dir;
    toolroute::tools::RegistryPtr registry = ToolRegistryBuilder().add_builtins().build();

    PermissionGate gate(Json permissions) const {
        fs::create_directories(dir / "work");
        auto parsed = PermissionsConfig::from_json(permissions, dir / "work", dir / "permissions.json");
        return PermissionGate(std::make_shared<const PermissionsConfig>(std::move(parsed).value()));
    }

    const toolroute::tools::ToolSpec& spec(const std::string& name) const {
        return registry->find(name)->spec;
    }

    std::string work() const { return (dir / "work").string(); }
};

Agent coder() {
    return AgentDirectory().find("coder").value();
}

}  // namespace

TEST_CASE("Deny-list is checked before everything else", "[gate]") {
    GateFixture f;
    auto gate = f.gate(Json{
        {"allow_paths", Json::array()},
        {"deny_tools", {"delete_file"}},
        {"require_confirmation_for", {"delete_file"}}
    });

    // Also unconfirmed, outside the toolset of 'organizer' and outside allow_paths
    Agent organizer = AgentDirectory().find("organizer").value();
    auto result = gate.check(f.spec("delete_file"), Json{{"path", "/etc/passwd"}}, organizer);
    REQUIRE(result.error().code == ErrorCode::DeniedTool);
    REQUIRE(result.error().message.find("permissions.json") != std::string::npos);
}

TEST_CASE("Confirmation comes before the agent check", "[gate]") {
    GateFixture f;
    auto gate = f.gate(Json{
        {"allow_paths", {f.work()}},
        {"require_confirmation_for", {"delete_file"}}
    });
    Agent organizer = AgentDirectory().find("organizer").value();

    auto unconfirmed = gate.check(f.spec("delete_file"), Json{{"path", "old.txt"}}, organizer);
    REQUIRE(unconfirmed.error().code == ErrorCode::ConfirmationRequired);
    REQUIRE(unconfirmed.error().message.find("confirm: true") != std::string::npos);

    auto confirmed = gate.check(f.spec("delete_file"),
                                Json{{"path", "old.txt"}, {"confirm", true}}, organizer);
    REQUIRE(confirmed.error().code == ErrorCode::DeniedAgentToolset);

    auto confirmed_coder = gate.check(f.spec("delete_file"),
                                      Json{{"path", "old.txt"}, {"confirm", true}}, coder());
    REQUIRE(confirmed_coder.is_ok());
}

TEST_CASE("Agent tool sets, system agents bypass", "[gate]") {
    GateFixture f;
    auto gate = f.gate(Json{{"allow_paths", {f.work()}}});

    auto denied = gate.check(f.spec("remember"), Json{{"text", "x"}}, coder());
    REQUIRE(denied.error().code == ErrorCode::DeniedAgentToolset);
    REQUIRE(denied.error().message == "Permission denied: agent 'coder' cannot use tool 'remember'");

    REQUIRE(gate.check(f.spec("remember"), Json{{"text", "x"}}, AgentDirectory::system()).is_ok());
}

TEST_CASE("Resource confinement runs last", "[gate]") {
    GateFixture f;
    auto gate = f.gate(Json{{"allow_paths", {f.work()}}, {"allow_commands", {"ls"}}});

    auto outside = gate.check(f.spec("read_file"), Json{{"path", "/etc/passwd"}}, coder());
    REQUIRE(outside.error().code == ErrorCode::DeniedPathAllowlist);

    REQUIRE(gate.check(f.spec("read_file"), Json{{"path", "notes.txt"}}, coder()).is_ok());

    auto copy_out = gate.check(f.spec("copy_file"),
                               Json{{"source", "a.txt"}, {"destination", "/tmp/../etc/x"}}, coder());
    REQUIRE(copy_out.error().code == ErrorCode::DeniedPathAllowlist);
}

TEST_CASE("Command arguments are confined too", "[gate]") {
    GateFixture f;
    auto gate = f.gate(Json{{"allow_paths", {f.work()}}, {"allow_commands", {"ls", "cat"}}});

    REQUIRE(gate.check(f.spec("run_cmd"), Json{{"command", "ls -la"}}, coder()).is_ok());
    REQUIRE(gate.check(f.spec("run_cmd"), Json{{"command", "ls src/"}}, coder()).is_ok());

    auto not_allowed = gate.check(f.spec("run_cmd"), Json{{"command", "rm -rf build"}}, coder());
    REQUIRE(not_allowed.error().code == ErrorCode::DeniedCommandAllowlist);

    auto escaping = gate.check(f.spec("run_cmd"), Json{{"command", "cat /etc/shadow"}}, coder());
    REQUIRE(escaping.error().code == ErrorCode::DeniedPathAllowlist);

    auto piped = gate.check(f.spec("run_cmd"), Json{{"command", "ls | sh"}}, coder());
    REQUIRE(piped.error().code == ErrorCode::DeniedCommandAllowlist);
}

TEST_CASE("Tools without resource parameters skip confinement", "[gate]") {
    GateFixture f;
    auto gate = f.gate(Json::object());

    REQUIRE(gate.check(f.spec("calculate"), Json{{"expression", "1+1"}},
                       AgentDirectory::system()).is_ok());
}
