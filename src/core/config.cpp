#include "toolroute/core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <regex>

namespace toolroute::core {

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

fs::path expand_path(const fs::path& path) {
    return fs::path(expand_path(path.string()));
}

fs::path Config::default_path() {
    if (const char* env = std::getenv("TOOLROUTE_CONFIG")) {
        return fs::path(expand_path(std::string(env)));
    }
    return fs::path(expand_path(std::string("~/.toolroute/config.yaml")));
}

void Config::expand_paths() {
    storage.data_dir = expand_path(storage.data_dir);
    if (!storage.file_base_dir.empty()) {
        storage.file_base_dir = expand_path(storage.file_base_dir);
    }
    if (!storage.audit_path.empty()) {
        storage.audit_path = expand_path(storage.audit_path);
    }
    if (!permissions.path.empty()) {
        permissions.path = expand_path(permissions.path);
    }
    plugins.dir = expand_path(plugins.dir);
    if (!observability.log_path.empty()) {
        observability.log_path = expand_path(observability.log_path);
    }
}

void Config::apply_env() {
    if (const char* key = std::getenv("TOOLROUTE_API_KEY")) {
        llm.api_key = key;
    }
    if (const char* level = std::getenv("TOOLROUTE_LOG_LEVEL")) {
        observability.log_level = level;
    }
}

fs::path Config::audit_file() const {
    if (!storage.audit_path.empty()) {
        return storage.audit_path;
    }
    return storage.data_dir / "audit.jsonl";
}

fs::path Config::base_dir() const {
    if (!storage.file_base_dir.empty()) {
        return storage.file_base_dir;
    }
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    return ec ? fs::path(".") : cwd;
}

Result<void, Error> Config::validate() const {
    if (router.model_max_attempts < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigInvalid,
            "router.model_max_attempts must be at least 1"
        );
    }

    if (router.model_timeout_ms <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigInvalid,
            "router.model_timeout_ms must be positive"
        );
    }

    if (router.heuristic_threshold <= 0 || router.heuristic_margin < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigInvalid,
            "router.heuristic_threshold must be positive and heuristic_margin non-negative"
        );
    }

    if (llm.provider != "openai_compatible" && llm.provider != "none") {
        return Result<void, Error>::err(
            ErrorCode::ConfigInvalid,
            "Unknown llm.provider: " + llm.provider
        );
    }

    if (concurrency.worker_threads < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigInvalid,
            "concurrency.worker_threads must be at least 1"
        );
    }

    if (cache.ttl_seconds <= 0 || cache.max_entries <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigInvalid,
            "cache.ttl_seconds and cache.max_entries must be positive"
        );
    }

    for (const auto& [name, agent] : agents) {
        if (agent.kind != "user" && agent.kind != "plugin") {
            return Result<void, Error>::err(
                ErrorCode::ConfigInvalid,
                "agents." + name + ".kind must be 'user' or 'plugin'"
            );
        }
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = expand_path(path);

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        if (auto node = root["router"]) {
            config.router.fast_path_enabled = node["fast_path_enabled"].as<bool>(config.router.fast_path_enabled);
            config.router.heuristic_enabled = node["heuristic_enabled"].as<bool>(config.router.heuristic_enabled);
            config.router.heuristic_threshold = node["heuristic_threshold"].as<int>(config.router.heuristic_threshold);
            config.router.heuristic_margin = node["heuristic_margin"].as<int>(config.router.heuristic_margin);
            config.router.model_fallback_enabled = node["model_fallback_enabled"].as<bool>(config.router.model_fallback_enabled);
            config.router.model_max_attempts = node["model_max_attempts"].as<int>(config.router.model_max_attempts);
            config.router.model_timeout_ms = node["model_timeout_ms"].as<int>(config.router.model_timeout_ms);
        }

        if (auto node = root["llm"]) {
            config.llm.provider = node["provider"].as<std::string>(config.llm.provider);
            config.llm.model = node["model"].as<std::string>(config.llm.model);
            config.llm.base_url = node["base_url"].as<std::string>(config.llm.base_url);
            config.llm.api_key = expand_path(node["api_key"].as<std::string>(""));
            config.llm.temperature = node["temperature"].as<double>(config.llm.temperature);
            config.llm.request_timeout_ms = node["request_timeout_ms"].as<int>(config.llm.request_timeout_ms);
        }

        if (auto node = root["cache"]) {
            config.cache.enabled = node["enabled"].as<bool>(config.cache.enabled);
            config.cache.ttl_seconds = node["ttl_seconds"].as<int>(config.cache.ttl_seconds);
            config.cache.max_entries = node["max_entries"].as<int>(config.cache.max_entries);
        }

        if (auto node = root["storage"]) {
            config.storage.data_dir = node["data_dir"].as<std::string>(config.storage.data_dir.string());
            config.storage.file_base_dir = node["file_base_dir"].as<std::string>(config.storage.file_base_dir.string());
            config.storage.audit_enabled = node["audit_enabled"].as<bool>(config.storage.audit_enabled);
            config.storage.audit_path = node["audit_path"].as<std::string>(config.storage.audit_path.string());
            config.storage.memory_limit = node["memory_limit"].as<int>(config.storage.memory_limit);
        }

        if (auto node = root["permissions"]) {
            config.permissions.path = node["path"].as<std::string>("");
        }

        if (auto node = root["plugins"]) {
            config.plugins.enabled = node["enabled"].as<bool>(config.plugins.enabled);
            config.plugins.dir = node["dir"].as<std::string>(config.plugins.dir.string());
        }

        if (auto node = root["concurrency"]) {
            config.concurrency.worker_threads = node["worker_threads"].as<int>(config.concurrency.worker_threads);
        }

        if (auto node = root["observability"]) {
            config.observability.log_level = node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_path = node["log_path"].as<std::string>("");
        }

        if (auto agents_node = root["agents"]) {
            for (const auto& entry : agents_node) {
                std::string name = entry.first.as<std::string>();
                AgentConfig ac;
                if (entry.second.IsMap()) {
                    ac.kind = entry.second["kind"].as<std::string>("user");
                    ac.description = entry.second["description"].as<std::string>("");
                    if (auto tools_node = entry.second["tools"]) {
                        for (const auto& t : tools_node) {
                            ac.tools.push_back(t.as<std::string>());
                        }
                    }
                }
                config.agents[name] = std::move(ac);
            }
        }

        config.apply_env();
        config.expand_paths();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(std::move(validation).error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    Config config;
    config.apply_env();
    config.expand_paths();
    return config;
}

}  // namespace toolroute::core
