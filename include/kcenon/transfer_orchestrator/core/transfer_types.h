/**
 * @file transfer_types.h
 * @brief Transfer kinds, lifecycle states and progress snapshots
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_CORE_TRANSFER_TYPES_H
#define KCENON_TRANSFER_ORCHESTRATOR_CORE_TRANSFER_TYPES_H

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::transfer_orchestrator {

/**
 * @brief Kind of work a transfer record performs
 */
enum class transfer_kind : uint8_t {
    copy = 0,
    move = 1,
    extract = 2,
};

inline constexpr std::size_t transfer_kind_count = 3;

[[nodiscard]] constexpr auto to_string(transfer_kind kind) noexcept -> const char* {
    switch (kind) {
        case transfer_kind::copy: return "copy";
        case transfer_kind::move: return "move";
        case transfer_kind::extract: return "extract";
        default: return "unknown";
    }
}

[[nodiscard]] inline auto transfer_kind_from_string(std::string_view text)
    -> std::optional<transfer_kind> {
    if (text == "copy") return transfer_kind::copy;
    if (text == "move") return transfer_kind::move;
    if (text == "extract") return transfer_kind::extract;
    return std::nullopt;
}

/**
 * @brief Lifecycle state of a transfer record
 *
 * queued -> running -> {completed | failed | cancelled | paused}
 * paused -> queued (resume)
 * queued -> cancelled (cancel before start)
 */
enum class transfer_status : uint8_t {
    queued,     ///< Waiting for a free slot
    running,    ///< Dispatched to a backend
    paused,     ///< Stopped with a checkpoint
    completed,  ///< Finished successfully
    failed,     ///< Finished with an I/O failure
    cancelled,  ///< Cancelled by the user
};

[[nodiscard]] constexpr auto to_string(transfer_status status) noexcept -> const char* {
    switch (status) {
        case transfer_status::queued: return "queued";
        case transfer_status::running: return "running";
        case transfer_status::paused: return "paused";
        case transfer_status::completed: return "completed";
        case transfer_status::failed: return "failed";
        case transfer_status::cancelled: return "cancelled";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal_status(transfer_status status) noexcept -> bool {
    return status == transfer_status::completed ||
           status == transfer_status::failed ||
           status == transfer_status::cancelled;
}

/**
 * @brief Check a lifecycle transition against the state machine
 */
[[nodiscard]] constexpr auto is_valid_transition(
    transfer_status from, transfer_status to) noexcept -> bool {
    switch (from) {
        case transfer_status::queued:
            return to == transfer_status::running ||
                   to == transfer_status::cancelled;
        case transfer_status::running:
            return to == transfer_status::completed ||
                   to == transfer_status::failed ||
                   to == transfer_status::cancelled ||
                   to == transfer_status::paused;
        case transfer_status::paused:
            return to == transfer_status::queued;
        default:
            return false;
    }
}

/**
 * @brief Progress snapshot reported by a backend call
 */
struct progress_event {
    uint64_t bytes_done = 0;
    uint64_t bytes_total = 0;
    uint32_t files_done = 0;
    uint32_t files_total = 0;
    std::string current_item;

    [[nodiscard]] auto completion_percentage() const -> double {
        if (bytes_total == 0) return 0.0;
        return static_cast<double>(bytes_done) / static_cast<double>(bytes_total) * 100.0;
    }
};

/**
 * @brief Combined progress of every running record
 */
struct aggregate_progress {
    std::size_t running_count = 0;
    uint64_t bytes_done = 0;
    uint64_t bytes_total = 0;

    /**
     * @brief round(100 * bytes_done / bytes_total), 0 when nothing runs
     */
    [[nodiscard]] auto percent() const -> uint32_t {
        if (running_count == 0 || bytes_total == 0) return 0;
        return static_cast<uint32_t>(std::lround(
            static_cast<double>(bytes_done) / static_cast<double>(bytes_total) * 100.0));
    }
};

/**
 * @brief Client-side encryption settings forwarded to object storage
 *
 * Presence of a non-empty password selects the encrypted upload primitive.
 */
struct encryption_options {
    std::string password;
    std::string algorithm = "aes-256-gcm";
    uint32_t kdf_memory_cost = 19456;
    uint32_t kdf_time_cost = 2;
    uint32_t kdf_parallelism = 1;
};

/**
 * @brief Compact size text: 512, 1.5K, 20.0M, 3.2G
 */
[[nodiscard]] inline auto format_size(uint64_t bytes) -> std::string {
    constexpr double kib = 1024.0;
    char buf[32];
    auto value = static_cast<double>(bytes);
    if (bytes < 1024) {
        std::snprintf(buf, sizeof(buf), "%llu", static_cast<unsigned long long>(bytes));
    } else if (value < kib * kib) {
        std::snprintf(buf, sizeof(buf), "%.1fK", value / kib);
    } else if (value < kib * kib * kib) {
        std::snprintf(buf, sizeof(buf), "%.1fM", value / (kib * kib));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1fG", value / (kib * kib * kib));
    }
    return buf;
}

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_CORE_TRANSFER_TYPES_H
