#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace toolroute::core {

// Random RFC 4122 version 4 identifier
class UUID {
public:
    UUID() : bytes_{} {}

    static UUID generate() {
        static thread_local std::mt19937_64 engine{std::random_device{}()};

        UUID uuid;
        for (size_t half = 0; half < 2; ++half) {
            uint64_t bits = engine();
            for (size_t i = 0; i < 8; ++i) {
                uuid.bytes_[half * 8 + i] = static_cast<uint8_t>(bits >> (56 - i * 8));
            }
        }
        uuid.bytes_[6] = static_cast<uint8_t>((uuid.bytes_[6] & 0x0F) | 0x40);
        uuid.bytes_[8] = static_cast<uint8_t>((uuid.bytes_[8] & 0x3F) | 0x80);
        return uuid;
    }

    std::string to_string() const {
        static constexpr char kHex[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes_.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out += '-';
            }
            out += kHex[bytes_[i] >> 4];
            out += kHex[bytes_[i] & 0x0F];
        }
        return out;
    }

    // All-zero means never generated
    bool is_valid() const {
        return bytes_ != std::array<uint8_t, 16>{};
    }

    bool operator==(const UUID& other) const = default;

private:
    std::array<uint8_t, 16> bytes_;
};

// prefix + first 8 hex digits, e.g. "inv_1f0c2a9b"
inline std::string short_id(const std::string& prefix) {
    return prefix + UUID::generate().to_string().substr(0, 8);
}

inline std::string generate_invocation_id() {
    return short_id("inv_");
}

inline std::string generate_temp_suffix() {
    return UUID::generate().to_string();
}

}  // namespace toolroute::core
