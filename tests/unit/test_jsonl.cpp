#include <catch2/catch_test_macros.hpp>
#include "toolroute/storage/jsonl.hpp"
#include "test_support.hpp"

#include <thread>

using namespace toolroute::core;
using toolroute::storage::JsonlFile;
using toolroute::test::TempDir;
using toolroute::test::read_file;
using toolroute::test::write_file;

TEST_CASE("Missing file reads as empty", "[jsonl]") {
    TempDir dir;
    JsonlFile file(dir / "nothing.jsonl");

    auto entries = file.read_all();
    REQUIRE(entries.is_ok());
    REQUIRE(entries.value().empty());
    REQUIRE_FALSE(fs::exists(dir / "nothing.jsonl"));
}

TEST_CASE("Append creates parents and keeps one value per line", "[jsonl]") {
    TempDir dir;
    JsonlFile file(dir / "nested" / "log.jsonl");

    REQUIRE(file.append(Json{{"n", 1}}).is_ok());
    REQUIRE(file.append(Json{{"n", 2}}).is_ok());

    REQUIRE(read_file(file.path()) == "{\"n\":1}\n{\"n\":2}\n");

    auto entries = file.read_all().value();
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[1]["n"] == 2);
}

TEST_CASE("Append repairs a missing trailing newline", "[jsonl]") {
    TempDir dir;
    write_file(dir / "log.jsonl", "{\"n\":1}");
    JsonlFile file(dir / "log.jsonl");

    REQUIRE(file.append(Json{{"n", 2}}).is_ok());
    REQUIRE(file.read_all().value().size() == 2);
}

TEST_CASE("Corrupt lines are skipped and quarantined", "[jsonl]") {
    TempDir dir;
    write_file(dir / "tasks.jsonl", "{\"id\":1}\nnot json\r\n\n{\"id\":2}\n{broken\n");
    JsonlFile file(dir / "tasks.jsonl");

    auto entries = file.read_all();
    REQUIRE(entries.is_ok());
    REQUIRE(entries.value().size() == 2);
    REQUIRE(entries.value()[0]["id"] == 1);
    REQUIRE(entries.value()[1]["id"] == 2);

    REQUIRE(read_file(dir / "tasks.jsonl.corrupt") == "not json\n{broken\n");
}

TEST_CASE("Update is read-modify-write", "[jsonl]") {
    TempDir dir;
    JsonlFile file(dir / "tasks.jsonl");
    REQUIRE(file.write_all({Json{{"id", 1}, {"status", "open"}}, Json{{"id", 2}, {"status", "open"}}})
                .is_ok());

    auto updated = file.update([](std::vector<Json>& entries) {
        entries[0]["status"] = "done";
        return Result<void, Error>::ok();
    });
    REQUIRE(updated.is_ok());
    REQUIRE(file.read_all().value()[0]["status"] == "done");

    SECTION("a failing mutator writes nothing") {
        auto failed = file.update([](std::vector<Json>& entries) {
            entries.clear();
            return Result<void, Error>::err(ErrorCode::ExecError, "nope");
        });
        REQUIRE(failed.is_err());
        REQUIRE(file.read_all().value().size() == 2);
    }
}

TEST_CASE("No temporary files are left behind", "[jsonl]") {
    TempDir dir;
    JsonlFile file(dir / "log.jsonl");
    REQUIRE(file.append(Json{{"a", 1}}).is_ok());
    REQUIRE(file.write_all({Json{{"b", 2}}}).is_ok());

    size_t count = 0;
    for (const auto& entry : fs::directory_iterator(dir.path())) {
        (void)entry;
        ++count;
    }
    REQUIRE(count == 1);
}

TEST_CASE("Concurrent appends to one path are serialized", "[jsonl]") {
    TempDir dir;
    fs::path path = dir / "log.jsonl";

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&path, t]() {
            JsonlFile file(path);
            for (int i = 0; i < 25; ++i) {
                auto written = file.append(Json{{"t", t}, {"i", i}});
                (void)written;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(JsonlFile(path).read_all().value().size() == 100);
}

TEST_CASE("Invalid UTF-8 is replaced rather than rejected", "[jsonl]") {
    TempDir dir;
    JsonlFile file(dir / "log.jsonl");

    REQUIRE(file.append(Json{{"text", std::string("ok \xD1")}}).is_ok());
    auto entries = file.read_all().value();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0]["text"] == "ok \xEF\xBF\xBD");
}

TEST_CASE("Append extends the existing file in place", "[jsonl]") {
    TempDir dir;
    JsonlFile file(dir / "audit.jsonl");
    REQUIRE(file.append(Json{{"n", 1}}).is_ok());
    fs::create_hard_link(file.path(), dir / "audit.link");

    REQUIRE(file.append(Json{{"n", 2}}).is_ok());
    REQUIRE(read_file(dir / "audit.link") == "{\"n\":1}\n{\"n\":2}\n");
}
