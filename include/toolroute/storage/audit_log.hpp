#pragma once

#include "jsonl.hpp"

#include <optional>
#include <string>

namespace toolroute::storage {

struct AuditRecord {
    TimePoint ts = Clock::now();
    std::string tool;
    std::string agent;
    Json args_redacted = Json::object();
    bool ok = false;
    std::optional<std::string> error_code;
    int64_t duration_ms = 0;

    Json to_json() const;
};

// Strings longer than 100 characters are truncated; values under keys that
// contain password, secret, token or api_key are masked.
Json redact_args(const Json& args);

// Append-only invocation log. Failures are logged and never surface to callers.
class AuditLog {
public:
    AuditLog(fs::path path, bool enabled);

    void record(const AuditRecord& record) const;

    bool enabled() const { return enabled_; }
    const fs::path& path() const { return file_.path(); }

private:
    JsonlFile file_;
    bool enabled_;
};

}  // namespace toolroute::storage
