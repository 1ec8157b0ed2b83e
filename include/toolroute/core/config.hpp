#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace toolroute::core {

namespace fs = std::filesystem;

// Router stage configuration
struct RouterConfig {
    bool fast_path_enabled = true;
    bool heuristic_enabled = true;
    int heuristic_threshold = 10;
    int heuristic_margin = 3;
    bool model_fallback_enabled = true;
    int model_max_attempts = 3;
    int model_timeout_ms = 30000;
};

// Chat-completion provider configuration
struct LLMConfig {
    std::string provider = "openai_compatible";  // openai_compatible | none
    std::string model = "gpt-4o-mini";
    std::string base_url = "https://api.openai.com/v1";
    std::string api_key;                          // From env: TOOLROUTE_API_KEY
    double temperature = 0.0;
    int request_timeout_ms = 20000;
};

struct CacheConfig {
    bool enabled = true;
    int ttl_seconds = 86400;
    int max_entries = 512;
};

struct StorageConfig {
    fs::path data_dir = "~/.toolroute/data";
    fs::path file_base_dir;   // empty = current directory
    bool audit_enabled = true;
    fs::path audit_path;      // empty = <data_dir>/audit.jsonl
    int memory_limit = 0;     // 0 = unbounded
};

struct PermissionsLocation {
    fs::path path;            // empty = standard lookup order
};

struct PluginsConfig {
    bool enabled = true;
    fs::path dir = "~/.toolroute/plugins";
};

struct ConcurrencyConfig {
    int worker_threads = 4;
};

struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error, off
    fs::path log_path;               // empty = stderr only
};

// Extra agent declared in config.yaml
struct AgentConfig {
    std::string kind = "user";  // user | plugin
    std::string description;
    std::vector<std::string> tools;
};

// Main configuration
struct Config {
    RouterConfig router;
    LLMConfig llm;
    CacheConfig cache;
    StorageConfig storage;
    PermissionsLocation permissions;
    PluginsConfig plugins;
    ConcurrencyConfig concurrency;
    ObservabilityConfig observability;
    std::map<std::string, AgentConfig> agents;

    // Load configuration from file
    static Result<Config, Error> load(const fs::path& path);

    // Load with defaults, falling back if file doesn't exist
    static Config load_or_default(const fs::path& path);

    // Get default config path (TOOLROUTE_CONFIG or ~/.toolroute/config.yaml)
    static fs::path default_path();

    // Expand ~ and environment variables, fill derived paths
    void expand_paths();

    // Apply environment overrides (API key, log level)
    void apply_env();

    Result<void, Error> validate() const;

    fs::path audit_file() const;
    fs::path base_dir() const;
};

// Helper to expand ~ and environment variables in paths
std::string expand_path(const std::string& path);
fs::path expand_path(const fs::path& path);

}  // namespace toolroute::core
