/**
 * @file session_id.cpp
 * @brief Implementation of session_id generation and serialization
 */

#include "chunked_upload/core/types.h"

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace chunked_upload {

auto session_id::generate() -> session_id {
    session_id id;

    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t part1 = dis(gen);
    uint64_t part2 = dis(gen);

    for (int i = 0; i < 8; ++i) {
        id.bytes[i] = static_cast<uint8_t>((part1 >> (i * 8)) & 0xFF);
        id.bytes[i + 8] = static_cast<uint8_t>((part2 >> (i * 8)) & 0xFF);
    }

    // Version 4, RFC 4122 variant
    id.bytes[6] = (id.bytes[6] & 0x0F) | 0x40;
    id.bytes[8] = (id.bytes[8] & 0x3F) | 0x80;

    return id;
}

auto session_id::to_string() const -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }

    return oss.str();
}

auto session_id::from_string(std::string_view str) -> std::optional<session_id> {
    std::string hex_str;
    hex_str.reserve(32);

    for (char c : str) {
        if (c == '-') continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        hex_str += c;
    }

    if (hex_str.length() != 32) {
        return std::nullopt;
    }

    session_id id;
    for (std::size_t i = 0; i < 16; ++i) {
        id.bytes[i] = static_cast<uint8_t>(std::stoul(hex_str.substr(i * 2, 2), nullptr, 16));
    }

    return id;
}

}  // namespace chunked_upload
