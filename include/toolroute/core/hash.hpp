#pragma once

#include <string>
#include <string_view>

namespace toolroute::core {

// Lowercase hex SHA-256 digest
std::string sha256_hex(std::string_view text);

// Trim, collapse internal whitespace runs, lowercase
std::string normalize_text(std::string_view text);

// Trim only
std::string trim(std::string_view text);

std::string to_lower(std::string_view text);

}  // namespace toolroute::core
