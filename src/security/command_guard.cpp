#include "toolroute/security/command_guard.hpp"

#include <filesystem>
#include <set>

namespace toolroute::security {

namespace {

bool is_shell_operator(const std::string& token) {
    static const std::set<std::string> ops = {"|", "||", "&", "&&", ";", "<", ">", ">>", "2>", "2>&1"};
    return ops.count(token) > 0;
}

Error tokenize_error(std::string_view line, const std::string& reason) {
    return Error::with_details(
        ErrorCode::DeniedCommandAllowlist,
        "Command cannot be parsed: " + reason,
        Json{{"command", std::string(line)}}
    );
}

}  // namespace

Result<std::vector<std::string>, Error> tokenize_command(std::string_view line) {
    using R = Result<std::vector<std::string>, Error>;

    std::vector<std::string> tokens;
    std::string current;
    bool in_token = false;
    bool quoted = false;
    char quote = 0;

    auto flush = [&]() -> bool {
        if (!in_token) return true;
        if (!quoted && is_shell_operator(current)) {
            return false;
        }
        tokens.push_back(std::move(current));
        current.clear();
        in_token = false;
        quoted = false;
        return true;
    };

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (quote == '\'') {
            if (c == '\'') {
                quote = 0;
            } else {
                current.push_back(c);
            }
            continue;
        }

        if (quote == '"') {
            if (c == '"') {
                quote = 0;
            } else if (c == '\\' && i + 1 < line.size() &&
                       (line[i + 1] == '"' || line[i + 1] == '\\' || line[i + 1] == '$')) {
                current.push_back(line[++i]);
            } else {
                current.push_back(c);
            }
            continue;
        }

        if (c == ' ' || c == '\t' || c == '\n') {
            if (!flush()) {
                return R::err(tokenize_error(line, "shell operators are not supported"));
            }
            continue;
        }

        in_token = true;
        if (c == '\'' || c == '"') {
            quote = c;
            quoted = true;
        } else if (c == '\\') {
            if (i + 1 >= line.size()) {
                return R::err(tokenize_error(line, "trailing backslash"));
            }
            current.push_back(line[++i]);
            quoted = true;
        } else {
            current.push_back(c);
        }
    }

    if (quote != 0) {
        return R::err(tokenize_error(line, "unbalanced quote"));
    }
    if (!flush()) {
        return R::err(tokenize_error(line, "shell operators are not supported"));
    }

    return R::ok(std::move(tokens));
}

CommandGuard::CommandGuard(PermissionsPtr permissions)
    : permissions_(std::move(permissions))
{
}

Error CommandGuard::deny(const std::string& command, const std::string& reason) const {
    return Error::with_details(
        ErrorCode::DeniedCommandAllowlist,
        "Command '" + command + "' is not allowed (" + reason +
            "). Edit allow_commands in: " + permissions_->source.string(),
        Json{{"command", command}, {"permissions_file", permissions_->source.string()}}
    );
}

Result<void, Error> CommandGuard::validate(const std::string& executable) const {
    if (executable.empty()) {
        return Result<void, Error>::err(deny(executable, "empty command"));
    }

    std::string base = std::filesystem::path(executable).filename().string();
    if (base.empty() || permissions_->allow_commands.count(base) == 0) {
        return Result<void, Error>::err(deny(executable, "not in allow_commands"));
    }

    return Result<void, Error>::ok();
}

Result<std::vector<std::string>, Error> CommandGuard::parse(const std::string& command_line) const {
    using R = Result<std::vector<std::string>, Error>;

    auto tokens = tokenize_command(command_line);
    if (tokens.is_err()) {
        return tokens;
    }
    if (tokens.value().empty()) {
        return R::err(deny(command_line, "empty command"));
    }

    auto status = validate(tokens.value().front());
    if (status.is_err()) {
        return R::err(std::move(status).error());
    }

    return tokens;
}

}  // namespace toolroute::security
