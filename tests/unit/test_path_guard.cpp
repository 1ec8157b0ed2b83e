#include <catch2/catch_test_macros.hpp>
#include "toolroute/security/path_guard.hpp"
#include "test_support.hpp"

using namespace toolroute::core;
using namespace toolroute::security;
using toolroute::test::TempDir;
using toolroute::test::write_file;

namespace {

PermissionsPtr allow(const TempDir& dir, const std::vector<std::string>& paths) {
    auto result = PermissionsConfig::from_json(
        Json{{"allow_paths", paths}}, dir / "work", dir / "permissions.json");
    return std::make_shared<const PermissionsConfig>(std::move(result).value());
}

}  // namespace

TEST_CASE("Paths inside an allowed root resolve", "[path_guard]") {
    TempDir dir;
    fs::create_directories(dir / "work/src");
    write_file(dir / "work/src/main.cpp", "int main() {}");

    PathGuard guard(allow(dir, {(dir / "work").string()}));

    auto relative = guard.resolve("src/main.cpp", PathOperation::Read);
    REQUIRE(relative.is_ok());
    REQUIRE(relative.value() == dir / "work/src/main.cpp");

    auto not_yet = guard.resolve("src/new_file.txt", PathOperation::Write);
    REQUIRE(not_yet.is_ok());
    REQUIRE(not_yet.value() == dir / "work/src/new_file.txt");
}

TEST_CASE("Paths outside every root are denied", "[path_guard]") {
    TempDir dir;
    fs::create_directories(dir / "work");
    PathGuard guard(allow(dir, {(dir / "work").string()}));

    auto result = guard.resolve("/etc/passwd", PathOperation::Write);
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::DeniedPathAllowlist);
    REQUIRE(result.error().message.find("permissions.json") != std::string::npos);
    REQUIRE(result.error().details->at("operation") == "write");
}

TEST_CASE("Traversal sequences cannot escape", "[path_guard]") {
    TempDir dir;
    fs::create_directories(dir / "work");
    write_file(dir / "secret.txt", "s3cret");
    PathGuard guard(allow(dir, {(dir / "work").string()}));

    REQUIRE(guard.resolve("../secret.txt", PathOperation::Read).is_err());
    REQUIRE(guard.resolve("sub/../../secret.txt", PathOperation::Read).is_err());
    REQUIRE(guard.resolve("sub/../inside.txt", PathOperation::Read).is_ok());
}

TEST_CASE("Symlinks pointing outside a root are denied", "[path_guard]") {
    TempDir dir;
    fs::create_directories(dir / "work");
    fs::create_directories(dir / "outside");
    write_file(dir / "outside/data.txt", "private");
    fs::create_directory_symlink(dir / "outside", dir / "work/link");

    PathGuard guard(allow(dir, {(dir / "work").string()}));

    REQUIRE(guard.resolve("link/data.txt", PathOperation::Read).is_err());
    REQUIRE(guard.resolve("link/new.txt", PathOperation::Write).is_err());
}

TEST_CASE("Symlinks after a missing component are still resolved", "[path_guard]") {
    TempDir dir;
    fs::create_directories(dir / "work");
    fs::create_directories(dir / "outside");
    write_file(dir / "outside/secret.txt", "SECRET");
    fs::create_directory_symlink(dir / "outside", dir / "work/link");

    PathGuard guard(allow(dir, {(dir / "work").string()}));

    auto read = guard.resolve("nonexist/../link/secret.txt", PathOperation::Read);
    REQUIRE(read.is_err());
    REQUIRE(read.error().details->at("resolved") == (dir / "outside/secret.txt").string());
    REQUIRE(guard.resolve("nonexist/../link/new.txt", PathOperation::Write).is_err());
    REQUIRE(guard.resolve("a/b/../../link/secret.txt", PathOperation::Read).is_err());
}

TEST_CASE("Links are replaced by their targets", "[path_guard]") {
    TempDir dir;
    fs::create_directories(dir / "work/real");
    fs::create_directory_symlink(dir / "work/real", dir / "work/alias");
    fs::create_symlink(dir / "outside/gone.txt", dir / "work/dangling");

    PathGuard guard(allow(dir, {(dir / "work").string()}));

    auto inside = guard.resolve("alias/notes.txt", PathOperation::Write);
    REQUIRE(inside.is_ok());
    REQUIRE(inside.value() == dir / "work/real/notes.txt");

    REQUIRE(guard.resolve("dangling", PathOperation::Write).is_err());
}

TEST_CASE("Sibling directories sharing a prefix are not inside", "[path_guard]") {
    TempDir dir;
    fs::create_directories(dir / "work");
    fs::create_directories(dir / "workshop");
    PathGuard guard(allow(dir, {(dir / "work").string()}));

    REQUIRE(guard.resolve((dir / "workshop/file").string(), PathOperation::Read).is_err());
    REQUIRE(PathGuard::is_within_root(dir / "work", dir / "work/a/b"));
    REQUIRE_FALSE(PathGuard::is_within_root(dir / "work", dir / "workshop"));
}

TEST_CASE("File roots admit only themselves", "[path_guard]") {
    TempDir dir;
    fs::create_directories(dir / "work");
    write_file(dir / "work/todo.md", "- item");
    write_file(dir / "work/other.md", "- item");

    PathGuard guard(allow(dir, {(dir / "work/todo.md").string()}));
    REQUIRE(guard.resolve("todo.md", PathOperation::Write).is_ok());
    REQUIRE(guard.resolve("other.md", PathOperation::Read).is_err());
}

TEST_CASE("Protected segments are always denied", "[path_guard]") {
    TempDir dir;
    fs::create_directories(dir / "work/.git");
    PathGuard guard(allow(dir, {(dir / "work").string()}));

    REQUIRE(guard.resolve(".git/config", PathOperation::Read).is_err());
    REQUIRE(guard.resolve(".env", PathOperation::Read).is_err());
    REQUIRE(guard.resolve("web/node_modules/pkg/index.js", PathOperation::Read).is_err());
    REQUIRE(guard.resolve("docs/.gitignore", PathOperation::Read).is_ok());
    REQUIRE(PathGuard::is_protected_segment(".ENV"));
}

TEST_CASE("Empty allow list and bad input are denied", "[path_guard]") {
    TempDir dir;
    PathGuard guard(allow(dir, {}));
    REQUIRE(guard.resolve("anything.txt", PathOperation::Read).is_err());

    PathGuard open(allow(dir, {dir.path().string()}));
    REQUIRE(open.resolve("", PathOperation::Read).is_err());
    REQUIRE(open.resolve(std::string("a\0b", 3), PathOperation::Read).is_err());
}
