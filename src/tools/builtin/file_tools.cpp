#include "toolroute/tools/builtin.hpp"
#include "toolroute/core/uuid.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace toolroute::tools::builtin {

namespace fs = std::filesystem;

namespace {

constexpr uintmax_t kMaxReadBytes = 1024 * 1024;
constexpr size_t kMaxListEntries = 1000;

ToolResult io_failure(const std::string& message, const fs::path& path) {
    return ToolResult::failure(Error::with_details(
        ErrorCode::ExecError, message, Json{{"path", path.string()}}));
}

// Display form relative to the base directory when possible
std::string display_path(const fs::path& path, const ExecutorContext& ctx) {
    auto rel = path.lexically_relative(ctx.base_dir());
    if (rel.empty() || *rel.begin() == "..") {
        return path.string();
    }
    return rel.string();
}

Result<std::string, Error> read_text(const fs::path& path) {
    using R = Result<std::string, Error>;
    std::error_code ec;

    if (!fs::exists(path, ec)) {
        return R::err(Error::with_details(ErrorCode::ExecError, "File not found",
                                          Json{{"path", path.string()}}));
    }
    if (!fs::is_regular_file(path, ec)) {
        return R::err(Error::with_details(ErrorCode::ExecError, "Not a regular file",
                                          Json{{"path", path.string()}}));
    }
    if (fs::file_size(path, ec) > kMaxReadBytes) {
        return R::err(Error::with_details(ErrorCode::ExecError, "File is larger than 1 MiB",
                                          Json{{"path", path.string()}}));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return R::err(Error::with_details(ErrorCode::ExecError, "Failed to open file",
                                          Json{{"path", path.string()}}));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return R::ok(ss.str());
}

ToolResult read_file_handler(const Json& args, const ExecutorContext& ctx) {
    auto path = ctx.resolve(args.at("path").get<std::string>(), PathOperation::Read);
    if (path.is_err()) {
        return ToolResult::failure(std::move(path).error());
    }

    auto content = read_text(path.value());
    if (content.is_err()) {
        return ToolResult::failure(std::move(content).error());
    }

    return ToolResult::success(Json{
        {"path", display_path(path.value(), ctx)},
        {"content", content.value()}
    });
}

ToolResult write_file_handler(const Json& args, const ExecutorContext& ctx) {
    auto path = ctx.resolve(args.at("path").get<std::string>(), PathOperation::Write);
    if (path.is_err()) {
        return ToolResult::failure(std::move(path).error());
    }
    const auto& target = path.value();
    const auto& content = args.at("content").get_ref<const std::string&>();

    std::error_code ec;
    if (fs::is_directory(target, ec)) {
        return io_failure("Path is a directory", target);
    }
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return io_failure("Cannot create parent directory: " + ec.message(), target);
    }

    fs::path temp = target;
    temp += ".tmp." + generate_temp_suffix();
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        out << content;
        if (!out) {
            out.close();
            fs::remove(temp, ec);
            return io_failure("Failed to write file", target);
        }
    }
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(temp, cleanup);
        return io_failure("Failed to write file: " + ec.message(), target);
    }

    return ToolResult::success(Json{
        {"path", display_path(target, ctx)},
        {"bytes", content.size()}
    });
}

ToolResult list_files_handler(const Json& args, const ExecutorContext& ctx) {
    auto path = ctx.resolve(args.value("path", std::string(".")), PathOperation::Read);
    if (path.is_err()) {
        return ToolResult::failure(std::move(path).error());
    }
    const auto& dir = path.value();

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return io_failure("Not a directory", dir);
    }

    std::vector<Json> entries;
    bool truncated = false;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        auto name = entry.path().filename();
        if (security::PathGuard::is_protected_segment(name)) {
            continue;
        }
        if (entries.size() >= kMaxListEntries) {
            truncated = true;
            break;
        }
        std::error_code type_ec;
        bool is_dir = entry.is_directory(type_ec);
        entries.push_back(Json{
            {"name", name.string()},
            {"type", is_dir ? "dir" : "file"}
        });
    }
    if (ec) {
        return io_failure("Cannot list directory: " + ec.message(), dir);
    }

    std::sort(entries.begin(), entries.end(), [](const Json& a, const Json& b) {
        return a["name"].get<std::string>() < b["name"].get<std::string>();
    });

    return ToolResult::success(Json{
        {"path", display_path(dir, ctx)},
        {"entries", entries},
        {"truncated", truncated}
    });
}

ToolResult delete_file_handler(const Json& args, const ExecutorContext& ctx) {
    auto path = ctx.resolve(args.at("path").get<std::string>(), PathOperation::Write);
    if (path.is_err()) {
        return ToolResult::failure(std::move(path).error());
    }
    const auto& target = path.value();

    std::error_code ec;
    if (!fs::exists(target, ec)) {
        return io_failure("File not found", target);
    }
    if (fs::is_directory(target, ec)) {
        return io_failure("Refusing to delete a directory", target);
    }
    if (!fs::remove(target, ec) || ec) {
        return io_failure("Failed to delete file", target);
    }

    return ToolResult::success(Json{{"deleted", display_path(target, ctx)}});
}

// copy_file and move_file share argument handling
ToolResult transfer(const Json& args, const ExecutorContext& ctx, bool move) {
    auto source = ctx.resolve(args.at("source").get<std::string>(),
                              move ? PathOperation::Write : PathOperation::Read);
    if (source.is_err()) {
        return ToolResult::failure(std::move(source).error());
    }
    auto destination = ctx.resolve(args.at("destination").get<std::string>(), PathOperation::Write);
    if (destination.is_err()) {
        return ToolResult::failure(std::move(destination).error());
    }

    fs::path from = source.value();
    fs::path to = destination.value();
    std::error_code ec;

    if (!fs::is_regular_file(from, ec)) {
        return io_failure("Source is not a regular file", from);
    }
    if (fs::is_directory(to, ec)) {
        to /= from.filename();
    }
    if (fs::exists(to, ec)) {
        return io_failure("Destination already exists", to);
    }

    if (move) {
        fs::rename(from, to, ec);
    } else {
        fs::copy_file(from, to, ec);
    }
    if (ec) {
        return io_failure(std::string(move ? "Move" : "Copy") + " failed: " + ec.message(), from);
    }

    return ToolResult::success(Json{
        {"source", display_path(from, ctx)},
        {"destination", display_path(to, ctx)}
    });
}

ToolResult copy_file_handler(const Json& args, const ExecutorContext& ctx) {
    return transfer(args, ctx, false);
}

ToolResult move_file_handler(const Json& args, const ExecutorContext& ctx) {
    return transfer(args, ctx, true);
}

ToolResult file_info_handler(const Json& args, const ExecutorContext& ctx) {
    auto path = ctx.resolve(args.at("path").get<std::string>(), PathOperation::Read);
    if (path.is_err()) {
        return ToolResult::failure(std::move(path).error());
    }
    const auto& target = path.value();

    std::error_code ec;
    auto status = fs::status(target, ec);
    if (ec || status.type() == fs::file_type::not_found) {
        return io_failure("File not found", target);
    }

    Json info{
        {"path", display_path(target, ctx)},
        {"type", fs::is_directory(status) ? "dir" : (fs::is_regular_file(status) ? "file" : "other")}
    };
    if (fs::is_regular_file(status)) {
        info["size"] = fs::file_size(target, ec);
    }
    auto mtime = fs::last_write_time(target, ec);
    if (!ec) {
        auto sys = std::chrono::file_clock::to_sys(mtime);
        info["modified"] = format_timestamp(std::chrono::time_point_cast<Clock::duration>(sys));
    }

    return ToolResult::success(info);
}

ToolResult count_words_handler(const Json& args, const ExecutorContext& ctx) {
    auto path = ctx.resolve(args.at("path").get<std::string>(), PathOperation::Read);
    if (path.is_err()) {
        return ToolResult::failure(std::move(path).error());
    }

    auto content = read_text(path.value());
    if (content.is_err()) {
        return ToolResult::failure(std::move(content).error());
    }

    const auto& text = content.value();
    size_t words = 0;
    size_t lines = 0;
    bool in_word = false;
    for (char c : text) {
        if (c == '\n') ++lines;
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++words;
        }
    }
    if (!text.empty() && text.back() != '\n') ++lines;

    return ToolResult::success(Json{
        {"path", display_path(path.value(), ctx)},
        {"words", words},
        {"lines", lines},
        {"bytes", text.size()}
    });
}

ParamSpec path_param(const std::string& name, const std::string& description, bool required = true) {
    return ParamSpec{name, description, ParamType::String, required, std::nullopt, ResourceRole::Path};
}

}  // namespace

void register_file_tools(ToolRegistryBuilder& builder) {
    builder.add_builtin(
        ToolSpec{
            .name = "read_file",
            .description = "Read a text file (up to 1 MiB).",
            .parameters = {path_param("path", "File to read")},
            .keywords = {"read", "file", "show", "cat", "open", "view"}
        },
        read_file_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "write_file",
            .description = "Write content to a file, replacing it if it exists.",
            .parameters = {
                path_param("path", "File to write"),
                {"content", "Text to write", ParamType::String, true}
            },
            .keywords = {"write", "save", "create", "file"},
            .mutating = true
        },
        write_file_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "list_files",
            .description = "List the entries of a directory (default: the base directory).",
            .parameters = {path_param("path", "Directory to list", false)},
            .keywords = {"list", "files", "ls", "directory", "dir"}
        },
        list_files_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "delete_file",
            .description = "Delete a single file.",
            .parameters = {path_param("path", "File to delete")},
            .keywords = {"delete", "remove", "rm", "erase"},
            .mutating = true
        },
        delete_file_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "copy_file",
            .description = "Copy a file to a new location.",
            .parameters = {
                path_param("source", "File to copy"),
                path_param("destination", "Target file or directory")
            },
            .keywords = {"copy", "cp", "duplicate"},
            .mutating = true
        },
        copy_file_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "move_file",
            .description = "Move or rename a file.",
            .parameters = {
                path_param("source", "File to move"),
                path_param("destination", "Target file or directory")
            },
            .keywords = {"move", "mv", "rename"},
            .mutating = true
        },
        move_file_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "file_info",
            .description = "Show type, size and modification time of a path.",
            .parameters = {path_param("path", "Path to inspect")},
            .keywords = {"stat", "info", "size", "modified"}
        },
        file_info_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "count_words",
            .description = "Count words, lines and bytes in a text file.",
            .parameters = {path_param("path", "File to count")},
            .keywords = {"count", "words", "wc", "lines"}
        },
        count_words_handler
    );
}

}  // namespace toolroute::tools::builtin
