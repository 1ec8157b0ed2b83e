#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace toolroute::core {

// Error codes organized by category
enum class ErrorCode {
    // Success
    Ok = 0,

    // Validation errors (1-99)
    ValidationError = 1,
    MissingArgument = 2,
    UnknownTool = 3,

    // Permission errors (100-199)
    DeniedTool = 100,
    ConfirmationRequired = 101,
    DeniedAgentToolset = 102,
    DeniedPathAllowlist = 103,
    DeniedCommandAllowlist = 104,

    // Routing errors (200-299)
    RoutingNoMatch = 200,
    RoutingTimeout = 201,

    // Execution errors (300-399)
    ExecError = 300,

    // LLM errors (400-499)
    LLMUnavailable = 400,
    LLMRequestFailed = 401,
    LLMInvalidResponse = 402,

    // Configuration errors (500-599)
    ConfigNotFound = 500,
    ConfigParseFailed = 501,
    ConfigInvalid = 502,

    // Storage errors (600-699)
    StorageReadFailed = 600,
    StorageWriteFailed = 601,

    // Plugin errors (700-799)
    PluginInvalid = 700,
};

// Stable wire name, as written to ToolResult JSON and the audit log
inline std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "OK";
        case ErrorCode::ValidationError: return "VALIDATION_ERROR";
        case ErrorCode::MissingArgument: return "MISSING_ARGUMENT";
        case ErrorCode::UnknownTool: return "UNKNOWN_TOOL";
        case ErrorCode::DeniedTool: return "DENIED_TOOL";
        case ErrorCode::ConfirmationRequired: return "CONFIRMATION_REQUIRED";
        case ErrorCode::DeniedAgentToolset: return "DENIED_AGENT_TOOLSET";
        case ErrorCode::DeniedPathAllowlist: return "DENIED_PATH_ALLOWLIST";
        case ErrorCode::DeniedCommandAllowlist: return "DENIED_COMMAND_ALLOWLIST";
        case ErrorCode::RoutingNoMatch: return "ROUTING_NO_MATCH";
        case ErrorCode::RoutingTimeout: return "ROUTING_TIMEOUT";
        case ErrorCode::ExecError: return "EXEC_ERROR";
        case ErrorCode::LLMUnavailable: return "LLM_UNAVAILABLE";
        case ErrorCode::LLMRequestFailed: return "LLM_REQUEST_FAILED";
        case ErrorCode::LLMInvalidResponse: return "LLM_INVALID_RESPONSE";
        case ErrorCode::ConfigNotFound: return "CONFIG_NOT_FOUND";
        case ErrorCode::ConfigParseFailed: return "CONFIG_PARSE_FAILED";
        case ErrorCode::ConfigInvalid: return "CONFIG_INVALID";
        case ErrorCode::StorageReadFailed: return "STORAGE_READ_FAILED";
        case ErrorCode::StorageWriteFailed: return "STORAGE_WRITE_FAILED";
        case ErrorCode::PluginInvalid: return "PLUGIN_INVALID";
    }
    return "UNKNOWN";
}

// Get human-readable message for error code
inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Success";
        case ErrorCode::ValidationError: return "Invalid arguments";
        case ErrorCode::MissingArgument: return "Missing required argument";
        case ErrorCode::UnknownTool: return "Unknown tool";
        case ErrorCode::DeniedTool: return "Tool is denied by permissions";
        case ErrorCode::ConfirmationRequired: return "Tool requires confirmation";
        case ErrorCode::DeniedAgentToolset: return "Tool is not in the agent's tool set";
        case ErrorCode::DeniedPathAllowlist: return "Path is not allowed";
        case ErrorCode::DeniedCommandAllowlist: return "Command is not allowed";
        case ErrorCode::RoutingNoMatch: return "No tool matched the input";
        case ErrorCode::RoutingTimeout: return "Routing timed out";
        case ErrorCode::ExecError: return "Tool execution failed";
        case ErrorCode::LLMUnavailable: return "Model provider unavailable";
        case ErrorCode::LLMRequestFailed: return "Model request failed";
        case ErrorCode::LLMInvalidResponse: return "Invalid response from model";
        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigInvalid: return "Configuration validation failed";
        case ErrorCode::StorageReadFailed: return "Failed to read store";
        case ErrorCode::StorageWriteFailed: return "Failed to write store";
        case ErrorCode::PluginInvalid: return "Invalid plugin descriptor";
    }
    return "Unknown error code";
}

// Scripting-facing classification used for exit codes
enum class ErrorClass {
    Ok,
    User,      // validation, denial, confirmation, routing miss
    Internal   // execution, timeout, storage, config, model
};

inline ErrorClass error_class(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:
            return ErrorClass::Ok;
        case ErrorCode::ValidationError:
        case ErrorCode::MissingArgument:
        case ErrorCode::UnknownTool:
        case ErrorCode::DeniedTool:
        case ErrorCode::ConfirmationRequired:
        case ErrorCode::DeniedAgentToolset:
        case ErrorCode::DeniedPathAllowlist:
        case ErrorCode::DeniedCommandAllowlist:
        case ErrorCode::RoutingNoMatch:
            return ErrorClass::User;
        default:
            return ErrorClass::Internal;
    }
}

// Check if error is retriable
inline bool is_retriable(ErrorCode code) {
    switch (code) {
        case ErrorCode::LLMRequestFailed:
        case ErrorCode::LLMInvalidResponse:
            return true;
        default:
            return false;
    }
}

// Error structure with context
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<nlohmann::json> details;  // Field-level detail (field, expected, path, ...)
    std::optional<std::string> context;     // Tool name, file path, etc.

    Error() : code(ErrorCode::ExecError) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    static Error with_details(ErrorCode c, std::string msg, nlohmann::json details) {
        Error e{c, std::move(msg)};
        e.details = std::move(details);
        return e;
    }

    static Error from_exception(const std::exception& e) {
        return Error{ErrorCode::ExecError, e.what()};
    }

    std::string_view name() const { return error_code_name(code); }
    ErrorClass error_class() const { return core::error_class(code); }
    bool is_retriable() const { return core::is_retriable(code); }

    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        return result;
    }

    // For logging
    std::string to_string() const {
        return std::string(name()) + ": " + full_message();
    }

    nlohmann::json to_json() const {
        nlohmann::json j{
            {"code", std::string(name())},
            {"message", message}
        };
        if (details) {
            j["details"] = *details;
        }
        return j;
    }
};

}  // namespace toolroute::core
