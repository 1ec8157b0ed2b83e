#include "toolroute/storage/audit_log.hpp"
#include "toolroute/core/hash.hpp"

#include <spdlog/spdlog.h>

namespace toolroute::storage {

namespace {

constexpr size_t kMaxAuditString = 100;

bool is_sensitive_key(const std::string& key) {
    auto lower = to_lower(key);
    for (const char* marker : {"password", "secret", "token", "api_key"}) {
        if (lower.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Largest cut <= limit that does not split a UTF-8 sequence
size_t utf8_boundary(const std::string& s, size_t limit) {
    size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return cut;
}

}  // namespace

Json redact_args(const Json& args) {
    if (args.is_string()) {
        const auto& s = args.get_ref<const std::string&>();
        if (s.size() > kMaxAuditString) {
            return s.substr(0, utf8_boundary(s, kMaxAuditString)) + "...";
        }
        return args;
    }

    if (args.is_array()) {
        Json out = Json::array();
        for (const auto& v : args) {
            out.push_back(redact_args(v));
        }
        return out;
    }

    if (args.is_object()) {
        Json out = Json::object();
        for (const auto& [key, value] : args.items()) {
            out[key] = is_sensitive_key(key) ? Json("***") : redact_args(value);
        }
        return out;
    }

    return args;
}

Json AuditRecord::to_json() const {
    Json j{
        {"ts", format_timestamp(ts)},
        {"tool", tool},
        {"agent", agent},
        {"args_redacted", args_redacted},
        {"ok", ok},
        {"duration_ms", duration_ms}
    };
    if (error_code) {
        j["error_code"] = *error_code;
    }
    return j;
}

AuditLog::AuditLog(fs::path path, bool enabled)
    : file_(std::move(path))
    , enabled_(enabled)
{
}

void AuditLog::record(const AuditRecord& record) const {
    if (!enabled_) {
        return;
    }

    try {
        auto written = file_.append(record.to_json());
        if (written.is_err()) {
            spdlog::warn("Audit write failed: {}", written.error().to_string());
        }
    } catch (const std::exception& e) {
        spdlog::warn("Audit write failed for '{}': {}", record.tool, e.what());
    }
}

}  // namespace toolroute::storage
