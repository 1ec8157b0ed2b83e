#include "toolroute/tools/plugin_loader.hpp"
#include "toolroute/tools/builtin.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <unistd.h>

namespace toolroute::tools {

namespace {

constexpr int kPluginTimeoutMs = 30000;

void skip(PluginLoadReport& report, const std::string& message) {
    spdlog::warn("{}", message);
    report.warnings.push_back(message);
    report.tools_skipped++;
}

Result<fs::path, Error> resolve_executable(const fs::path& plugin_dir, const std::string& exec) {
    using R = Result<fs::path, Error>;

    std::error_code ec;
    fs::path root = fs::weakly_canonical(plugin_dir, ec);
    if (ec) {
        return R::err(ErrorCode::PluginInvalid, "Cannot resolve plugin directory", plugin_dir.string());
    }

    fs::path exe(exec);
    if (exec.empty() || exe.is_absolute()) {
        return R::err(ErrorCode::PluginInvalid, "'exec' must be a relative path", exec);
    }

    fs::path resolved = fs::weakly_canonical(root / exe, ec);
    if (ec || !security::PathGuard::is_within_root(root, resolved) || resolved == root) {
        return R::err(ErrorCode::PluginInvalid, "'exec' escapes the plugin directory", exec);
    }
    if (!fs::is_regular_file(resolved, ec) || access(resolved.c_str(), X_OK) != 0) {
        return R::err(ErrorCode::PluginInvalid, "'exec' is not an executable file", resolved.string());
    }

    return R::ok(std::move(resolved));
}

ToolResult stub_handler(const Json&, const ExecutorContext&) {
    return ToolResult::failure(ErrorCode::ExecError, "Tool is not implemented");
}

void load_plugin(const fs::path& plugin_dir, ToolRegistryBuilder& builder, PluginLoadReport& report) {
    fs::path manifest_path = plugin_dir / "plugin.json";

    std::ifstream in(manifest_path);
    Json manifest = in ? Json::parse(in, nullptr, false) : Json();
    if (!in || manifest.is_discarded() || !manifest.is_object()) {
        skip(report, "Skipping plugin " + plugin_dir.string() + ": plugin.json is not a JSON object");
        return;
    }

    auto name_it = manifest.find("name");
    auto tools_it = manifest.find("tools");
    if (name_it == manifest.end() || !name_it->is_string() ||
        tools_it == manifest.end() || !tools_it->is_array()) {
        skip(report, "Skipping plugin " + plugin_dir.string() + ": needs a string 'name' and a 'tools' array");
        return;
    }

    std::string plugin_name = name_it->get<std::string>();
    std::string source = "plugin:" + plugin_name;
    report.plugins++;

    for (const auto& descriptor : *tools_it) {
        auto spec = ToolSpec::from_descriptor(descriptor);
        if (spec.is_err()) {
            skip(report, "Skipping tool in plugin " + plugin_name + ": " + spec.error().to_string());
            continue;
        }

        ToolHandler handler;
        if (spec.value().status == ToolStatus::Stub) {
            handler = stub_handler;
        } else {
            std::string exec = descriptor.value("exec", "");
            auto executable = resolve_executable(plugin_dir, exec);
            if (executable.is_err()) {
                skip(report, "Skipping tool " + spec.value().name + " in plugin " + plugin_name +
                                 ": " + executable.error().to_string());
                continue;
            }
            handler = make_plugin_handler(std::move(executable).value(), spec.value().name);
        }

        std::string tool_name = spec.value().name;
        if (builder.add_plugin(std::move(spec).value(), std::move(handler), source)) {
            report.tools_loaded++;
        } else {
            report.tools_skipped++;
            report.warnings.push_back("Tool " + tool_name + " in plugin " + plugin_name +
                                      " collides with an existing tool");
        }
    }
}

}  // namespace

ToolHandler make_plugin_handler(fs::path executable, std::string tool_name) {
    return [executable = std::move(executable), tool_name = std::move(tool_name)](
               const Json& args, const ExecutorContext& ctx) -> ToolResult {
        auto proc = ctx.run_plugin(executable, ProcessOptions{
            .stdin_data = args.dump(),
            .timeout_ms = kPluginTimeoutMs
        });
        if (proc.is_err()) {
            return ToolResult::failure(std::move(proc).error());
        }

        const auto& out = proc.value();
        if (out.timed_out || out.exit_code != 0) {
            return builtin::process_to_result(out, tool_name);
        }

        Json parsed = Json::parse(out.stdout_output, nullptr, false);
        if (parsed.is_discarded()) {
            return ToolResult::success(Json{{"output", out.stdout_output}});
        }

        // Plugins may answer with the ToolResult shape themselves
        if (parsed.is_object() && parsed.contains("ok") && parsed["ok"].is_boolean()) {
            if (parsed["ok"].get<bool>()) {
                return ToolResult::success(parsed.value("result", Json()));
            }
            std::string message = "Plugin tool failed";
            if (parsed.contains("error") && parsed["error"].is_object()) {
                message = parsed["error"].value("message", message);
            }
            return ToolResult::failure(Error::with_details(
                ErrorCode::ExecError, message, Json{{"tool", tool_name}}));
        }

        return ToolResult::success(std::move(parsed));
    };
}

PluginLoadReport load_plugins(const fs::path& dir, ToolRegistryBuilder& builder) {
    PluginLoadReport report;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        spdlog::debug("Plugin directory {} does not exist", dir.string());
        return report;
    }

    std::vector<fs::path> plugin_dirs;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::error_code entry_ec;
        if (entry.is_directory(entry_ec) && fs::exists(entry.path() / "plugin.json", entry_ec)) {
            plugin_dirs.push_back(entry.path());
        }
    }
    if (ec) {
        spdlog::warn("Cannot scan plugin directory {}: {}", dir.string(), ec.message());
        return report;
    }

    // Deterministic collision handling between plugins
    std::sort(plugin_dirs.begin(), plugin_dirs.end());
    for (const auto& plugin_dir : plugin_dirs) {
        load_plugin(plugin_dir, builder, report);
    }

    spdlog::debug("Loaded {} plugin tools ({} skipped)", report.tools_loaded, report.tools_skipped);
    return report;
}

}  // namespace toolroute::tools
