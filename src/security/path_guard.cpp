#include "toolroute/security/path_guard.hpp"
#include "toolroute/core/hash.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace toolroute::security {

PathGuard::PathGuard(PermissionsPtr permissions)
    : permissions_(std::move(permissions))
{
}

bool PathGuard::is_within_root(const fs::path& root, const fs::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        // a root with a trailing separator ends in an empty element
        if (root_it->empty()) {
            break;
        }
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end() || root_it->empty();
}

fs::path PathGuard::resolve_components(const fs::path& candidate, std::error_code& ec) {
    fs::path current = candidate.root_path();
    for (const auto& part : candidate.relative_path()) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            // current never contains a symlink, so its parent is the real one
            current = current.parent_path();
            continue;
        }

        fs::path next = current / part;
        auto status = fs::symlink_status(next, ec);
        if (status.type() == fs::file_type::not_found) {
            ec.clear();
            current = std::move(next);
            continue;
        }
        if (ec) {
            return {};
        }

        current = fs::canonical(next, ec);
        if (ec) {
            return {};
        }
    }
    return current;
}

bool PathGuard::is_protected_segment(const fs::path& segment) {
    auto lower = to_lower(segment.string());
    return lower == ".git" || lower == ".env" || lower == "node_modules";
}

Error PathGuard::deny(const std::string& input, const std::string& reason, PathOperation op,
                      const fs::path& resolved) const {
    Json details{
        {"path", input},
        {"operation", std::string(path_operation_to_string(op))},
        {"permissions_file", permissions_->source.string()}
    };
    if (!resolved.empty()) {
        details["resolved"] = resolved.string();
    }
    return Error::with_details(
        ErrorCode::DeniedPathAllowlist,
        "Path '" + input + "' is not allowed for " + std::string(path_operation_to_string(op)) +
            " (" + reason + "). Edit allow_paths in: " + permissions_->source.string(),
        std::move(details)
    );
}

Result<fs::path, Error> PathGuard::resolve(const std::string& input, PathOperation op) const {
    using R = Result<fs::path, Error>;

    if (input.empty()) {
        return R::err(deny(input, "empty path", op));
    }
    if (input.find('\0') != std::string::npos) {
        return R::err(deny(input, "invalid characters", op));
    }
    if (permissions_->allow_paths.empty()) {
        return R::err(deny(input, "no allowed paths configured", op));
    }

    fs::path candidate(input);
    if (candidate.is_relative()) {
        candidate = permissions_->base_dir / candidate;
    }

    std::error_code ec;
    fs::path resolved = resolve_components(candidate, ec);
    if (ec) {
        return R::err(deny(input, "cannot be resolved", op));
    }

    for (const auto& root : permissions_->allow_paths) {
        bool admitted = root.is_dir ? is_within_root(root.path, resolved)
                                    : resolved == root.path;
        if (!admitted) {
            continue;
        }

        for (const auto& segment : resolved.lexically_relative(root.path)) {
            if (is_protected_segment(segment)) {
                return R::err(deny(input, "protected location", op, resolved));
            }
        }

        spdlog::debug("Resolved path '{}' -> {}", input, resolved.string());
        return R::ok(std::move(resolved));
    }

    return R::err(deny(input, "outside allowed paths", op, resolved));
}

}  // namespace toolroute::security
