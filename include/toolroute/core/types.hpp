#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace toolroute::core {

// JSON alias
using Json = nlohmann::json;

// Time types
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

using ToolId = std::string;

// ISO-8601 UTC timestamp with millisecond precision
std::string format_timestamp(TimePoint tp);
inline std::string now_timestamp() { return format_timestamp(Clock::now()); }

// Which router stage produced a tool call
enum class ResolutionStage {
    FastPath,
    Heuristic,
    ModelFallback,
    Direct
};

inline std::string_view stage_to_string(ResolutionStage stage) {
    switch (stage) {
        case ResolutionStage::FastPath: return "fast_path";
        case ResolutionStage::Heuristic: return "heuristic";
        case ResolutionStage::ModelFallback: return "model_fallback";
        case ResolutionStage::Direct: return "direct";
    }
    return "direct";
}

// Tool call structure
struct ToolCall {
    ToolId tool_name;
    Json args = Json::object();
    ResolutionStage stage = ResolutionStage::Direct;
    double confidence = 1.0;

    Json to_json() const {
        return Json{
            {"tool_name", tool_name},
            {"args", args},
            {"stage", std::string(stage_to_string(stage))},
            {"confidence", confidence}
        };
    }

    static ToolCall from_json(const Json& j) {
        ToolCall call;
        call.tool_name = j.value("tool_name", j.value("tool", std::string{}));
        call.args = j.contains("args") ? j["args"] : Json::object();
        return call;
    }
};

// Debug metadata attached to every result
struct DebugInfo {
    ResolutionStage stage = ResolutionStage::Direct;
    TimePoint start = Clock::now();
    Duration elapsed{0};
    bool cache_hit = false;
    std::optional<std::string> model;

    Json to_json() const {
        return Json{
            {"stage", std::string(stage_to_string(stage))},
            {"start", format_timestamp(start)},
            {"duration_ms", elapsed.count()},
            {"cache_hit", cache_hit},
            {"model", model ? Json(*model) : Json(nullptr)}
        };
    }
};

// Tool result structure
struct ToolResult {
    bool ok = false;
    Json result;                   // present iff ok
    std::optional<Error> error;    // present iff !ok
    DebugInfo debug;

    static ToolResult success(Json value) {
        ToolResult r;
        r.ok = true;
        r.result = std::move(value);
        return r;
    }

    static ToolResult failure(Error err) {
        ToolResult r;
        r.ok = false;
        r.error = std::move(err);
        return r;
    }

    static ToolResult failure(ErrorCode code, std::string message) {
        return failure(Error{code, std::move(message)});
    }

    ErrorCode code() const { return ok ? ErrorCode::Ok : (error ? error->code : ErrorCode::ExecError); }

    Json to_json() const {
        Json j{{"ok", ok}};
        if (ok) {
            j["result"] = result;
        } else if (error) {
            j["error"] = error->to_json();
        }
        j["debug"] = debug.to_json();
        return j;
    }
};

}  // namespace toolroute::core
