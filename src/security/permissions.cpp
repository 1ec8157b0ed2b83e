#include "toolroute/security/permissions.hpp"
#include "toolroute/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace toolroute::security {

namespace {

Result<std::vector<std::string>, Error> string_list(const Json& j, const char* key,
                                                    const fs::path& source) {
    using R = Result<std::vector<std::string>, Error>;
    std::vector<std::string> out;

    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return R::ok(std::move(out));
    }
    if (!it->is_array()) {
        return R::err(ErrorCode::ConfigInvalid,
                      std::string("'") + key + "' must be an array of strings",
                      source.string());
    }
    for (const auto& v : *it) {
        if (!v.is_string()) {
            return R::err(ErrorCode::ConfigInvalid,
                          std::string("'") + key + "' must be an array of strings",
                          source.string());
        }
        out.push_back(v.get<std::string>());
    }
    return R::ok(std::move(out));
}

}  // namespace

Result<PermissionsConfig, Error> PermissionsConfig::from_json(const Json& j,
                                                              const fs::path& base_dir,
                                                              const fs::path& source) {
    using R = Result<PermissionsConfig, Error>;

    if (!j.is_object()) {
        return R::err(ErrorCode::ConfigInvalid, "Permissions must be a JSON object", source.string());
    }

    PermissionsConfig config;
    config.base_dir = base_dir;
    config.source = source;
    config.from_file = true;
    if (auto v = j.find("version"); v != j.end() && v->is_number_integer()) {
        config.version = v->get<int>();
    }

    auto paths = string_list(j, "allow_paths", source);
    if (paths.is_err()) return R::err(std::move(paths).error());
    auto commands = string_list(j, "allow_commands", source);
    if (commands.is_err()) return R::err(std::move(commands).error());
    auto confirm = string_list(j, "require_confirmation_for", source);
    if (confirm.is_err()) return R::err(std::move(confirm).error());
    auto deny = string_list(j, "deny_tools", source);
    if (deny.is_err()) return R::err(std::move(deny).error());

    for (const auto& entry : paths.value()) {
        if (entry.empty()) continue;
        fs::path p = expand_path(entry);
        if (p.is_relative()) {
            p = base_dir / p;
        }
        std::error_code ec;
        fs::path canonical = fs::weakly_canonical(p, ec);
        if (ec) {
            spdlog::warn("Skipping unresolvable allow_paths entry '{}': {}", entry, ec.message());
            continue;
        }
        config.allow_paths.push_back(AllowedRoot{
            .path = canonical,
            .is_dir = fs::is_directory(canonical, ec)
        });
    }

    config.allow_commands.insert(commands.value().begin(), commands.value().end());
    config.require_confirmation_for.insert(confirm.value().begin(), confirm.value().end());
    config.deny_tools.insert(deny.value().begin(), deny.value().end());

    return R::ok(std::move(config));
}

PermissionsConfig PermissionsConfig::deny_all(const fs::path& base_dir, const fs::path& source) {
    PermissionsConfig config;
    config.base_dir = base_dir;
    config.source = source;
    config.from_file = false;
    return config;
}

Json PermissionsConfig::to_json() const {
    Json paths = Json::array();
    for (const auto& root : allow_paths) {
        paths.push_back(root.path.string());
    }
    return Json{
        {"version", version},
        {"allow_paths", paths},
        {"allow_commands", allow_commands},
        {"require_confirmation_for", require_confirmation_for},
        {"deny_tools", deny_tools}
    };
}

std::vector<fs::path> permissions_candidates(const PermissionsLookup& lookup) {
    std::vector<fs::path> candidates;
    if (const char* env = std::getenv("TOOLROUTE_PERMISSIONS_PATH"); env && *env) {
        candidates.emplace_back(expand_path(std::string(env)));
    }
    if (!lookup.configured.empty()) {
        candidates.push_back(expand_path(lookup.configured));
    }
    candidates.push_back(lookup.base_dir / "permissions.json");
    candidates.emplace_back(expand_path(std::string("~/.toolroute/permissions.json")));
    return candidates;
}

Result<PermissionsConfig, Error> load_permissions_file(const fs::path& file,
                                                       const fs::path& base_dir) {
    std::ifstream in(file);
    if (!in) {
        return Result<PermissionsConfig, Error>::err(
            ErrorCode::ConfigNotFound, "Cannot open permissions file", file.string());
    }

    Json j = Json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        return Result<PermissionsConfig, Error>::err(
            ErrorCode::ConfigParseFailed, "Permissions file is not valid JSON", file.string());
    }

    return PermissionsConfig::from_json(j, base_dir, file);
}

PermissionsPtr load_permissions(const PermissionsLookup& lookup) {
    auto candidates = permissions_candidates(lookup);

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) {
            continue;
        }

        auto loaded = load_permissions_file(candidate, lookup.base_dir);
        if (loaded.is_ok()) {
            spdlog::debug("Loaded permissions from {}", candidate.string());
            return std::make_shared<const PermissionsConfig>(std::move(loaded).value());
        }

        spdlog::warn("Invalid permissions file ({}); denying all paths and commands",
                     loaded.error().to_string());
        return std::make_shared<const PermissionsConfig>(
            PermissionsConfig::deny_all(lookup.base_dir, candidate));
    }

    // Point the caller at the file they would most likely create
    fs::path suggested = lookup.base_dir / "permissions.json";
    spdlog::warn("No permissions file found; denying all paths and commands (create {})",
                 suggested.string());
    return std::make_shared<const PermissionsConfig>(
        PermissionsConfig::deny_all(lookup.base_dir, suggested));
}

}  // namespace toolroute::security
