/**
 * @file transfer_id.cpp
 * @brief transfer_id generation and text conversion
 */

#include "kcenon/transfer_orchestrator/core/transfer_id.h"

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::transfer_orchestrator {

auto transfer_id::generate() -> transfer_id {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;

    transfer_id id;
    uint64_t high = dis(gen);
    uint64_t low = dis(gen);
    for (int i = 0; i < 8; ++i) {
        id.bytes[i] = static_cast<uint8_t>(high >> (56 - i * 8));
        id.bytes[i + 8] = static_cast<uint8_t>(low >> (56 - i * 8));
    }

    // RFC 4122 version 4, variant 1
    id.bytes[6] = static_cast<uint8_t>((id.bytes[6] & 0x0F) | 0x40);
    id.bytes[8] = static_cast<uint8_t>((id.bytes[8] & 0x3F) | 0x80);

    return id;
}

auto transfer_id::to_string() const -> std::string {
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

auto transfer_id::from_string(std::string_view str)
    -> std::optional<transfer_id> {
    std::string hex;
    hex.reserve(32);

    for (char c : str) {
        if (c == '-') continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        hex += c;
    }

    if (hex.size() != 32) {
        return std::nullopt;
    }

    transfer_id id;
    for (std::size_t i = 0; i < 16; ++i) {
        id.bytes[i] = static_cast<uint8_t>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));
    }

    return id;
}

}  // namespace kcenon::transfer_orchestrator
