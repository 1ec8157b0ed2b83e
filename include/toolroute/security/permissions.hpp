#pragma once

#include "toolroute/core/result.hpp"
#include "toolroute/core/types.hpp"

#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace toolroute::security {

using namespace toolroute::core;
namespace fs = std::filesystem;

// An allow_paths entry after canonicalization
struct AllowedRoot {
    fs::path path;
    bool is_dir = false;   // directories admit descendants, files only themselves
};

// Snapshot of permissions.json. Never mutated after load; a reload builds a new one.
struct PermissionsConfig {
    int version = 1;
    std::vector<AllowedRoot> allow_paths;
    std::set<std::string> allow_commands;
    std::set<std::string> require_confirmation_for;
    std::set<std::string> deny_tools;

    fs::path base_dir;   // relative tool paths are joined to this
    fs::path source;     // file the snapshot came from, or where one would be read
    bool from_file = false;

    static Result<PermissionsConfig, Error> from_json(const Json& j,
                                                      const fs::path& base_dir,
                                                      const fs::path& source);

    // Every list empty: all paths and commands denied
    static PermissionsConfig deny_all(const fs::path& base_dir, const fs::path& source);

    Json to_json() const;
};

using PermissionsPtr = std::shared_ptr<const PermissionsConfig>;

struct PermissionsLookup {
    fs::path configured;   // permissions.path from config.yaml, may be empty
    fs::path base_dir;
};

// Candidate files in lookup order:
// TOOLROUTE_PERMISSIONS_PATH, configured path, <base_dir>/permissions.json,
// ~/.toolroute/permissions.json
std::vector<fs::path> permissions_candidates(const PermissionsLookup& lookup);

Result<PermissionsConfig, Error> load_permissions_file(const fs::path& file,
                                                       const fs::path& base_dir);

// First existing candidate wins. Missing or unparsable files give deny-all.
PermissionsPtr load_permissions(const PermissionsLookup& lookup);

}  // namespace toolroute::security
