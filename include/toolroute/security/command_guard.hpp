#pragma once

#include "permissions.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace toolroute::security {

// Split a command line with shell-like quoting ('..', "..", backslash escapes).
// Unbalanced quotes, a trailing backslash and unquoted shell operators
// (| || & && ; < > >>) are rejected, since commands never run through a shell.
Result<std::vector<std::string>, Error> tokenize_command(std::string_view line);

// Checks executables against allow_commands by basename
class CommandGuard {
public:
    explicit CommandGuard(PermissionsPtr permissions);

    Result<void, Error> validate(const std::string& executable) const;

    // Tokenize and validate argv[0]
    Result<std::vector<std::string>, Error> parse(const std::string& command_line) const;

private:
    PermissionsPtr permissions_;

    Error deny(const std::string& command, const std::string& reason) const;
};

}  // namespace toolroute::security
