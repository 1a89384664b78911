/**
 * @file transfer_id.h
 * @brief Opaque identifier of a transfer record
 *
 * The same identifier correlates progress events, cancel and pause signals,
 * persisted checkpoints and log records for one transfer.
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_CORE_TRANSFER_ID_H
#define KCENON_TRANSFER_ORCHESTRATOR_CORE_TRANSFER_ID_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::transfer_orchestrator {

/**
 * @brief Unique identifier for a transfer (16-byte UUID)
 */
struct transfer_id {
    std::array<uint8_t, 16> bytes{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};

    constexpr transfer_id() noexcept = default;

    explicit constexpr transfer_id(const std::array<uint8_t, 16>& b) noexcept
        : bytes(b) {}

    /**
     * @brief Generate a new random (version 4) identifier
     */
    [[nodiscard]] static auto generate() -> transfer_id;

    /**
     * @brief Convert to canonical UUID text (8-4-4-4-12 lowercase hex)
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Parse UUID text; dashes are optional
     */
    [[nodiscard]] static auto from_string(std::string_view str)
        -> std::optional<transfer_id>;

    [[nodiscard]] constexpr auto is_null() const noexcept -> bool {
        for (const auto& b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr auto operator==(const transfer_id& other) const
        noexcept -> bool = default;

    [[nodiscard]] constexpr auto operator<(const transfer_id& other) const
        noexcept -> bool {
        return bytes < other.bytes;
    }
};

}  // namespace kcenon::transfer_orchestrator

template <>
struct std::hash<kcenon::transfer_orchestrator::transfer_id> {
    auto operator()(const kcenon::transfer_orchestrator::transfer_id& id) const noexcept
        -> std::size_t {
        std::size_t h = 1469598103934665603ULL;
        for (auto b : id.bytes) {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return h;
    }
};

#endif  // KCENON_TRANSFER_ORCHESTRATOR_CORE_TRANSFER_ID_H
