/**
 * @file transfer_settings.h
 * @brief Shared, thread-safe limits injected into the scheduler
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_CORE_TRANSFER_SETTINGS_H
#define KCENON_TRANSFER_ORCHESTRATOR_CORE_TRANSFER_SETTINGS_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "bandwidth_limiter.h"
#include "types.h"

namespace kcenon::transfer_orchestrator {

/**
 * @brief Bandwidth and concurrency limits shared by every component
 *
 * Reads and writes are synchronized. Listeners run after the value changed,
 * outside the internal lock, on the thread that made the change.
 */
class transfer_settings {
public:
    static constexpr std::size_t default_max_concurrent = 2;

    using listener = std::function<void()>;
    using listener_id = std::size_t;

    explicit transfer_settings(uint64_t bandwidth_limit = 0,
                               std::size_t max_concurrent = default_max_concurrent);

    transfer_settings(const transfer_settings&) = delete;
    auto operator=(const transfer_settings&) -> transfer_settings& = delete;

    /**
     * @brief Bytes per second for new dispatches, 0 = unlimited
     */
    [[nodiscard]] auto bandwidth_limit() const -> uint64_t;
    void set_bandwidth_limit(uint64_t bytes_per_second);

    [[nodiscard]] auto max_concurrent() const -> std::size_t;

    /**
     * @brief Change the concurrency bound
     * @return invalid_configuration when value is 0
     */
    [[nodiscard]] auto set_max_concurrent(std::size_t value) -> result<void>;

    /**
     * @brief Live token bucket kept in sync with bandwidth_limit()
     */
    [[nodiscard]] auto limiter() -> bandwidth_limiter& { return limiter_; }

    /**
     * @brief Observe max_concurrent changes
     */
    auto on_max_concurrent_changed(listener callback) -> listener_id;
    void remove_listener(listener_id id);

private:
    mutable std::mutex mutex_;
    uint64_t bandwidth_limit_;
    std::size_t max_concurrent_;
    bandwidth_limiter limiter_;

    std::mutex listener_mutex_;
    std::vector<std::pair<listener_id, listener>> listeners_;
    listener_id next_listener_id_ = 1;
};

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_CORE_TRANSFER_SETTINGS_H
