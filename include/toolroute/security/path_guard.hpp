#pragma once

#include "permissions.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace toolroute::security {

enum class PathOperation {
    Read,
    Write
};

inline std::string_view path_operation_to_string(PathOperation op) {
    return op == PathOperation::Read ? "read" : "write";
}

// Resolves tool path arguments to canonical paths under allow_paths.
//
// The path is resolved one component at a time and every component that
// exists is canonicalized, so the returned path contains no symlinks and a
// link inside an allowed root that points outside it is denied.
class PathGuard {
public:
    explicit PathGuard(PermissionsPtr permissions);

    Result<fs::path, Error> resolve(const std::string& input, PathOperation op) const;

    // Component-wise prefix test on already canonical paths
    static bool is_within_root(const fs::path& root, const fs::path& child);

    // Absolute path with every existing component canonicalized; ".." after a
    // missing component pops that component
    static fs::path resolve_components(const fs::path& candidate, std::error_code& ec);

    // Segments that are denied anywhere below an allowed root
    static bool is_protected_segment(const fs::path& segment);

private:
    PermissionsPtr permissions_;

    Error deny(const std::string& input, const std::string& reason, PathOperation op,
               const fs::path& resolved = {}) const;
};

}  // namespace toolroute::security
