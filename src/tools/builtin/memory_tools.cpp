#include "toolroute/tools/builtin.hpp"
#include "toolroute/core/hash.hpp"
#include "toolroute/core/uuid.hpp"
#include "toolroute/storage/jsonl.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace toolroute::tools::builtin {

namespace {

constexpr int kDefaultRecallLimit = 5;

std::set<std::string> word_set(const std::string& text) {
    std::set<std::string> words;
    std::string word;
    for (char c : to_lower(text)) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            word.push_back(c);
        } else if (!word.empty()) {
            words.insert(word);
            word.clear();
        }
    }
    if (!word.empty()) {
        words.insert(word);
    }
    return words;
}

// Fraction of query words present in the entry; a full substring match scores 1
double match_score(const std::string& query, const std::string& text) {
    auto lowered = to_lower(text);
    auto needle = normalize_text(query);
    if (!needle.empty() && lowered.find(needle) != std::string::npos) {
        return 1.0;
    }
    auto query_words = word_set(query);
    if (query_words.empty()) {
        return 0.0;
    }
    auto text_words = word_set(text);
    size_t hits = 0;
    for (const auto& w : query_words) {
        if (text_words.count(w)) ++hits;
    }
    return static_cast<double>(hits) / static_cast<double>(query_words.size());
}

Result<void, Error> append_bounded(const storage::JsonlFile& file, Json entry, int limit) {
    if (limit <= 0) {
        return file.append(entry);
    }
    return file.update([&](std::vector<Json>& entries) {
        entries.push_back(std::move(entry));
        if (entries.size() > static_cast<size_t>(limit)) {
            entries.erase(entries.begin(), entries.end() - limit);
        }
        return Result<void, Error>::ok();
    });
}

struct Scored {
    double score;
    size_t index;
};

// Best matches first, newer entries win ties
std::vector<Json> search_entries(const std::vector<Json>& entries, const std::string& query,
                                 size_t offset, size_t limit) {
    std::vector<Scored> scored;
    for (size_t i = 0; i < entries.size(); ++i) {
        double s = match_score(query, entries[i].value("text", ""));
        if (s > 0.0) {
            scored.push_back({s, i});
        }
    }
    std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.index > b.index;
    });

    std::vector<Json> out;
    for (size_t i = offset; i < scored.size() && out.size() < limit; ++i) {
        Json item = entries[scored[i].index];
        item["score"] = scored[i].score;
        out.push_back(std::move(item));
    }
    return out;
}

ToolResult remember_handler(const Json& args, const ExecutorContext& ctx) {
    std::string text = trim(args.at("text").get<std::string>());
    if (text.empty()) {
        return ToolResult::failure(Error::with_details(
            ErrorCode::ValidationError, "Nothing to remember", Json{{"field", "text"}}));
    }

    storage::JsonlFile file(ctx.data_file("memory.jsonl"));
    Json entry{{"ts", format_timestamp(ctx.started_at())}, {"text", text}};

    auto written = append_bounded(file, entry, ctx.config().storage.memory_limit);
    if (written.is_err()) {
        return ToolResult::failure(std::move(written).error());
    }

    return ToolResult::success(Json{{"remembered", text}});
}

ToolResult recall_handler(const Json& args, const ExecutorContext& ctx) {
    std::string query = args.at("query").get<std::string>();

    storage::JsonlFile file(ctx.data_file("memory.jsonl"));
    auto entries = file.read_all();
    if (entries.is_err()) {
        return ToolResult::failure(std::move(entries).error());
    }

    auto matches = search_entries(entries.value(), query, 0, kDefaultRecallLimit);
    return ToolResult::success(Json{{"query", query}, {"matches", matches}});
}

ToolResult memory_add_handler(const Json& args, const ExecutorContext& ctx) {
    std::string text = trim(args.at("text").get<std::string>());
    if (text.empty()) {
        return ToolResult::failure(Error::with_details(
            ErrorCode::ValidationError, "Nothing to store", Json{{"field", "text"}}));
    }

    storage::JsonlFile file(ctx.data_file("memory_log.jsonl"));
    Json entry{
        {"id", short_id("mem_")},
        {"ts", format_timestamp(ctx.started_at())},
        {"text", text}
    };

    auto written = append_bounded(file, entry, ctx.config().storage.memory_limit);
    if (written.is_err()) {
        return ToolResult::failure(std::move(written).error());
    }

    return ToolResult::success(entry);
}

ToolResult memory_search_handler(const Json& args, const ExecutorContext& ctx) {
    std::string query = args.at("query").get<std::string>();
    int64_t limit = args.value("limit", int64_t{kDefaultRecallLimit});
    int64_t offset = args.value("offset", int64_t{0});

    if (limit < 1 || limit > 100 || offset < 0) {
        return ToolResult::failure(Error::with_details(
            ErrorCode::ValidationError,
            "limit must be 1..100 and offset non-negative",
            Json{{"field", limit < 1 || limit > 100 ? "limit" : "offset"}}
        ));
    }

    storage::JsonlFile file(ctx.data_file("memory_log.jsonl"));
    auto entries = file.read_all();
    if (entries.is_err()) {
        return ToolResult::failure(std::move(entries).error());
    }

    auto matches = search_entries(entries.value(), query,
                                  static_cast<size_t>(offset), static_cast<size_t>(limit));
    return ToolResult::success(Json{
        {"query", query},
        {"offset", offset},
        {"limit", limit},
        {"matches", matches}
    });
}

}  // namespace

void register_memory_tools(ToolRegistryBuilder& builder) {
    builder.add_builtin(
        ToolSpec{
            .name = "remember",
            .description = "Store a note in long-term memory.",
            .parameters = {
                {"text", "The text to remember", ParamType::String, true}
            },
            .keywords = {"remember", "note", "save", "store", "memorize"}
        },
        remember_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "recall",
            .description = "Find notes previously stored with remember.",
            .parameters = {
                {"query", "Words to look for", ParamType::String, true}
            },
            .keywords = {"recall", "remind", "notes", "remembered", "lookup"}
        },
        recall_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "memory_add",
            .description = "Add an entry to the searchable memory log.",
            .parameters = {
                {"text", "The entry text", ParamType::String, true}
            },
            .keywords = {"memory", "log", "add", "journal"}
        },
        memory_add_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "memory_search",
            .description = "Search the memory log by keyword overlap.",
            .parameters = {
                {"query", "Search words", ParamType::String, true},
                {"limit", "Maximum results (default 5)", ParamType::Integer, false},
                {"offset", "Results to skip", ParamType::Integer, false}
            },
            .keywords = {"memory", "search", "find", "log"}
        },
        memory_search_handler
    );
}

}  // namespace toolroute::tools::builtin
