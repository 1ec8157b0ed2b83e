#include "toolroute/security/permission_gate.hpp"

#include <spdlog/spdlog.h>

namespace toolroute::security {

namespace {

// Command arguments that name files are confined like path parameters
bool looks_like_path(const std::string& token) {
    if (token.empty() || token[0] == '-') {
        return false;
    }
    if (token.find("://") != std::string::npos) {
        return false;
    }
    return token.find('/') != std::string::npos || token == ".." || token[0] == '~';
}

}  // namespace

PermissionGate::PermissionGate(PermissionsPtr permissions)
    : permissions_(permissions)
    , paths_(permissions)
    , commands_(permissions)
{
}

Result<void, Error> PermissionGate::check(const ToolSpec& spec, const Json& args,
                                          const Agent& agent) const {
    TOOLROUTE_TRY_VOID(check_deny_list(spec.name));
    TOOLROUTE_TRY_VOID(check_confirmation(spec.name, args));
    TOOLROUTE_TRY_VOID(check_agent(spec.name, agent));
    TOOLROUTE_TRY_VOID(check_resources(spec, args));
    return Result<void, Error>::ok();
}

Result<void, Error> PermissionGate::check_deny_list(const std::string& tool) const {
    if (permissions_->deny_tools.count(tool)) {
        return Result<void, Error>::err(Error::with_details(
            ErrorCode::DeniedTool,
            "Tool '" + tool + "' is explicitly denied in permissions configuration: " +
                permissions_->source.string(),
            Json{{"tool", tool}, {"permissions_file", permissions_->source.string()}}
        ));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> PermissionGate::check_confirmation(const std::string& tool,
                                                       const Json& args) const {
    if (!permissions_->require_confirmation_for.count(tool)) {
        return Result<void, Error>::ok();
    }

    auto it = args.find(std::string(tools::kConfirmKey));
    if (it != args.end() && it->is_boolean() && it->get<bool>()) {
        return Result<void, Error>::ok();
    }

    return Result<void, Error>::err(Error::with_details(
        ErrorCode::ConfirmationRequired,
        "Tool '" + tool + "' requires confirmation. Please retry with 'confirm: true' or remove '" +
            tool + "' from 'require_confirmation_for' in: " + permissions_->source.string(),
        Json{{"tool", tool}, {"permissions_file", permissions_->source.string()}}
    ));
}

Result<void, Error> PermissionGate::check_agent(const std::string& tool, const Agent& agent) const {
    if (agent.may_use(tool)) {
        return Result<void, Error>::ok();
    }

    return Result<void, Error>::err(Error::with_details(
        ErrorCode::DeniedAgentToolset,
        "Permission denied: agent '" + agent.name + "' cannot use tool '" + tool + "'",
        Json{{"tool", tool}, {"agent", agent.name}}
    ));
}

Result<void, Error> PermissionGate::check_resources(const ToolSpec& spec, const Json& args) const {
    if (!spec.has_resource_params()) {
        return Result<void, Error>::ok();
    }

    PathOperation op = spec.mutating ? PathOperation::Write : PathOperation::Read;

    for (const auto& param : spec.parameters) {
        if (param.resource == tools::ResourceRole::None) {
            continue;
        }
        auto it = args.find(param.name);
        if (it == args.end() || !it->is_string()) {
            continue;
        }
        const auto& value = it->get_ref<const std::string&>();

        if (param.resource == tools::ResourceRole::Path) {
            auto resolved = paths_.resolve(value, op);
            if (resolved.is_err()) {
                spdlog::debug("Gate denied path '{}' for {}", value, spec.name);
                return Result<void, Error>::err(std::move(resolved).error());
            }
            continue;
        }

        auto argv = commands_.parse(value);
        if (argv.is_err()) {
            spdlog::debug("Gate denied command '{}' for {}", value, spec.name);
            return Result<void, Error>::err(std::move(argv).error());
        }
        for (size_t i = 1; i < argv.value().size(); ++i) {
            const auto& arg = argv.value()[i];
            if (!looks_like_path(arg)) {
                continue;
            }
            auto resolved = paths_.resolve(arg, PathOperation::Read);
            if (resolved.is_err()) {
                return Result<void, Error>::err(std::move(resolved).error());
            }
        }
    }

    return Result<void, Error>::ok();
}

}  // namespace toolroute::security
