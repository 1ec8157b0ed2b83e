#include "toolroute/app/cli.hpp"
#include "toolroute/app/runtime.hpp"
#include "toolroute/core/hash.hpp"
#include "toolroute/core/logging.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>

namespace toolroute::app {

namespace {

struct CliOptions {
    std::optional<std::string> config_path;
    std::string agent = "system";
    bool json = false;
    bool dry_run = false;
    bool repl = false;
    bool batch = false;
    bool list_tools = false;
    bool help = false;
    bool version = false;
    std::optional<std::string> tool_json;
    std::string input;
};

bool take_option(std::vector<std::string>& args, const std::string& long_name,
                 const std::string& short_name, std::string& out_value, std::string& error) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
            if (i + 1 >= args.size()) {
                error = "missing value for " + long_name;
                return false;
            }
            out_value = args[i + 1];
            args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
            return true;
        }
    }
    return false;
}

bool take_flag(std::vector<std::string>& args, const std::string& name,
               const std::string& short_name = "") {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == name || (!short_name.empty() && args[i] == short_name)) {
            args.erase(args.begin() + static_cast<long>(i));
            return true;
        }
    }
    return false;
}

void print_usage(std::ostream& out) {
    out << "Usage: toolroute [options] \"<input>\"\n"
           "       toolroute [options] --tool-json '<json>'\n"
           "       toolroute [options] --repl | --batch | --tools\n"
           "\n"
           "Options:\n"
           "  --config PATH      configuration file (default: $TOOLROUTE_CONFIG or ~/.toolroute/config.yaml)\n"
           "  --agent NAME       invoking agent (default: system)\n"
           "  --json             print results as JSON\n"
           "  --dry-run          route only, print the resolved tool call\n"
           "  --tool-json JSON   execute {\"tool_name\": ..., \"args\": {...}} without routing\n"
           "  --repl             read commands interactively\n"
           "  --batch            read one input per stdin line and run them concurrently\n"
           "  --tools            list registered tools\n"
           "  -h, --help         show this help\n"
           "  --version          show version\n";
}

// Returns an error message on a usage problem
std::optional<std::string> parse_args(std::vector<std::string> args, CliOptions& options) {
    std::string error;
    std::string value;

    if (take_option(args, "--config", "-c", value, error)) options.config_path = value;
    if (!error.empty()) return error;
    if (take_option(args, "--agent", "-a", value, error)) options.agent = value;
    if (!error.empty()) return error;
    if (take_option(args, "--tool-json", "", value, error)) options.tool_json = value;
    if (!error.empty()) return error;

    options.json = take_flag(args, "--json");
    options.dry_run = take_flag(args, "--dry-run");
    options.repl = take_flag(args, "--repl");
    options.batch = take_flag(args, "--batch");
    options.list_tools = take_flag(args, "--tools");
    options.help = take_flag(args, "--help", "-h");
    options.version = take_flag(args, "--version");

    for (const auto& arg : args) {
        if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            return "unknown option " + arg;
        }
    }

    if (options.help || options.version) {
        return std::nullopt;
    }

    int modes = (options.repl ? 1 : 0) + (options.batch ? 1 : 0) +
                (options.list_tools ? 1 : 0) + (options.tool_json ? 1 : 0);
    if (modes > 1) {
        return "--repl, --batch, --tools and --tool-json are mutually exclusive";
    }

    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) joined += " ";
        joined += arg;
    }
    options.input = joined;

    if (modes == 0 && trim(options.input).empty()) {
        return "missing input";
    }
    if (modes == 1 && !options.input.empty()) {
        return "unexpected argument: " + options.input;
    }
    if (options.dry_run && (options.tool_json || options.list_tools)) {
        return "--dry-run only applies to routed input";
    }

    return std::nullopt;
}

std::string render(const Json& j, int indent = -1) {
    return j.dump(indent, ' ', false, Json::error_handler_t::replace);
}

void print_result(const ToolResult& result, bool json, std::ostream& out, std::ostream& err) {
    if (json) {
        out << render(result.to_json()) << "\n";
        return;
    }

    if (result.ok) {
        if (result.result.is_string()) {
            out << result.result.get<std::string>() << "\n";
        } else {
            out << render(result.result, 2) << "\n";
        }
        return;
    }

    if (result.error) {
        err << "error: " << result.error->name() << ": " << result.error->message << "\n";
    } else {
        err << "error: " << error_code_name(result.code()) << "\n";
    }
}

int print_route(const KResult<router::RouteOutcome>& routed, bool json,
                std::ostream& out, std::ostream& err) {
    if (routed.is_err()) {
        ToolResult failure = ToolResult::failure(routed.error());
        print_result(failure, json, out, err);
        return exit_code_for(failure);
    }

    const auto& outcome = routed.value();
    Json j = outcome.call.to_json();
    j["debug"] = outcome.debug.to_json();
    out << render(j, json ? -1 : 2) << "\n";
    return kExitOk;
}

int list_tools(const Runtime& runtime, bool json, std::ostream& out) {
    auto specs = runtime.registry()->list();
    if (json) {
        Json arr = Json::array();
        for (const auto& spec : specs) {
            arr.push_back(spec.to_descriptor());
        }
        out << arr.dump() << "\n";
        return kExitOk;
    }

    for (const auto& spec : specs) {
        out << spec.name;
        if (spec.status != tools::ToolStatus::Ready) {
            out << " [" << tools::tool_status_to_string(spec.status) << "]";
        }
        out << "  " << spec.description << "\n";
    }
    return kExitOk;
}

int run_repl(Runtime& runtime, const agent::Agent& agent, bool json,
             std::istream& in, std::ostream& out, std::ostream& err) {
    int last = kExitOk;
    std::string line;

    out << "> " << std::flush;
    while (std::getline(in, line)) {
        std::string command = trim(line);

        if (command == ":quit" || command == ":exit") {
            break;
        }
        if (command.empty()) {
            out << "> " << std::flush;
            continue;
        }

        try {
            if (command == ":tools") {
                list_tools(runtime, json, out);
            } else if (command == ":reload") {
                auto snapshot = runtime.reload_permissions();
                out << "permissions reloaded from " << snapshot->source.string() << "\n";
            } else {
                auto result = runtime.handle(command, agent);
                print_result(result, json, out, err);
                last = exit_code_for(result);
            }
        } catch (const std::exception& e) {
            spdlog::error("REPL command failed: {}", e.what());
            err << "error: EXEC_ERROR: " << e.what() << "\n";
            last = kExitInternal;
        }

        out << "> " << std::flush;
    }

    return last;
}

int run_batch(const Runtime& runtime, const agent::Agent& agent, bool json,
              std::istream& in, std::ostream& out, std::ostream& err) {
    std::vector<std::string> inputs;
    std::string line;
    while (std::getline(in, line)) {
        if (!trim(line).empty()) {
            inputs.push_back(line);
        }
    }

    auto results = runtime.handle_batch(inputs, agent);

    bool any_internal = false;
    bool any_user = false;
    for (const auto& result : results) {
        print_result(result, json, out, err);
        int code = exit_code_for(result);
        any_internal = any_internal || code == kExitInternal;
        any_user = any_user || code == kExitUser;
    }

    if (any_internal) return kExitInternal;
    if (any_user) return kExitUser;
    return kExitOk;
}

}  // namespace

int exit_code_for(const ToolResult& result) {
    if (result.ok) {
        return kExitOk;
    }
    switch (error_class(result.code())) {
        case ErrorClass::Ok: return kExitOk;
        case ErrorClass::User: return kExitUser;
        case ErrorClass::Internal: return kExitInternal;
    }
    return kExitInternal;
}

int run_cli(std::vector<std::string> args, std::istream& in, std::ostream& out, std::ostream& err) {
    CliOptions options;
    if (auto usage_error = parse_args(std::move(args), options)) {
        err << "toolroute: " << *usage_error << "\n\n";
        print_usage(err);
        return kExitUsage;
    }

    if (options.help) {
        print_usage(out);
        return kExitOk;
    }
    if (options.version) {
        out << "toolroute " << kVersion << "\n";
        return kExitOk;
    }

    Config config;
    if (options.config_path) {
        auto loaded = Config::load(*options.config_path);
        if (loaded.is_err()) {
            err << "error: " << loaded.error().to_string() << "\n";
            return kExitInternal;
        }
        config = std::move(loaded).value();
    } else {
        config = Config::load_or_default(Config::default_path());
    }

    init_logging(config.observability);

    try {
        Runtime runtime(std::move(config));

        auto agent = runtime.agents().find(options.agent);
        if (agent.is_err()) {
            ToolResult failure = ToolResult::failure(agent.error());
            print_result(failure, options.json, out, err);
            return exit_code_for(failure);
        }

        if (options.list_tools) {
            return list_tools(runtime, options.json, out);
        }
        if (options.repl) {
            return run_repl(runtime, agent.value(), options.json, in, out, err);
        }
        if (options.batch) {
            return run_batch(runtime, agent.value(), options.json, in, out, err);
        }

        if (options.tool_json) {
            Json call = Json::parse(*options.tool_json, nullptr, false);
            if (call.is_discarded()) {
                err << "toolroute: --tool-json is not valid JSON\n";
                return kExitUsage;
            }
            auto result = runtime.execute_json(call, agent.value());
            print_result(result, options.json, out, err);
            return exit_code_for(result);
        }

        if (options.dry_run) {
            return print_route(runtime.route(options.input, agent.value()), options.json, out, err);
        }

        auto result = runtime.handle(options.input, agent.value());
        print_result(result, options.json, out, err);
        return exit_code_for(result);

    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        err << "error: EXEC_ERROR: " << e.what() << "\n";
        return kExitInternal;
    }
}

int run_cli(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return run_cli(std::move(args), std::cin, std::cout, std::cerr);
}

}  // namespace toolroute::app
