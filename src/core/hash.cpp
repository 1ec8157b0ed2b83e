#include "toolroute/core/hash.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace toolroute::core {

std::string sha256_hex(std::string_view text) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(text.data()), text.size(), digest);

    std::ostringstream stream;
    stream << std::hex << std::setfill('0');
    for (unsigned char c : digest) {
        stream << std::setw(2) << static_cast<int>(c);
    }
    return stream.str();
}

std::string trim(std::string_view text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return std::string(text.substr(start, end - start));
}

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string normalize_text(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char ch : trim(text)) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

}  // namespace toolroute::core
