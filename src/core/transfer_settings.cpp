/**
 * @file transfer_settings.cpp
 * @brief Shared transfer limits
 */

#include <kcenon/transfer_orchestrator/core/transfer_settings.h>

#include <algorithm>
#include <kcenon/transfer_orchestrator/core/logging.h>
#include <kcenon/transfer_orchestrator/core/transfer_types.h>

namespace kcenon::transfer_orchestrator {

transfer_settings::transfer_settings(uint64_t bandwidth_limit, std::size_t max_concurrent)
    : bandwidth_limit_(bandwidth_limit)
    , max_concurrent_(std::max<std::size_t>(max_concurrent, 1))
    , limiter_(bandwidth_limit) {}

auto transfer_settings::bandwidth_limit() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return bandwidth_limit_;
}

void transfer_settings::set_bandwidth_limit(uint64_t bytes_per_second) {
    {
        std::lock_guard lock(mutex_);
        bandwidth_limit_ = bytes_per_second;
    }
    limiter_.set_limit(bytes_per_second);
    TO_LOG_INFO(log_category::scheduler,
        "Bandwidth limit set to " +
        (bytes_per_second == 0 ? std::string("unlimited")
                               : format_size(bytes_per_second) + "/s"));
}

auto transfer_settings::max_concurrent() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return max_concurrent_;
}

auto transfer_settings::set_max_concurrent(std::size_t value) -> result<void> {
    if (value == 0) {
        return unexpected(error(error_code::invalid_configuration,
            "max_concurrent must be at least 1"));
    }

    {
        std::lock_guard lock(mutex_);
        if (max_concurrent_ == value) {
            return {};
        }
        max_concurrent_ = value;
    }

    TO_LOG_INFO(log_category::scheduler,
        "Max concurrent transfers set to " + std::to_string(value));

    std::vector<listener> snapshot;
    {
        std::lock_guard lock(listener_mutex_);
        snapshot.reserve(listeners_.size());
        for (const auto& [id, cb] : listeners_) {
            snapshot.push_back(cb);
        }
    }
    for (const auto& cb : snapshot) {
        cb();
    }
    return {};
}

auto transfer_settings::on_max_concurrent_changed(listener callback) -> listener_id {
    std::lock_guard lock(listener_mutex_);
    auto id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(callback));
    return id;
}

void transfer_settings::remove_listener(listener_id id) {
    std::lock_guard lock(listener_mutex_);
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(),
                       [id](const auto& entry) { return entry.first == id; }),
        listeners_.end());
}

}  // namespace kcenon::transfer_orchestrator
