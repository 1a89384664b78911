/**
 * @file bandwidth_limiter.cpp
 * @brief Token bucket implementation
 */

#include <kcenon/transfer_orchestrator/core/bandwidth_limiter.h>

#include <algorithm>

namespace kcenon::transfer_orchestrator {

bandwidth_limiter::bandwidth_limiter(uint64_t bytes_per_second)
    : bytes_per_second_(bytes_per_second)
    , capacity_(static_cast<double>(bytes_per_second))
    , last_refill_(std::chrono::steady_clock::now()) {
    tokens_ = capacity_;
}

bandwidth_limiter::~bandwidth_limiter() {
    {
        std::lock_guard lock(mutex_);
        shutting_down_ = true;
    }
    cv_.notify_all();
}

void bandwidth_limiter::acquire(std::size_t bytes) {
    if (bytes == 0) {
        return;
    }

    std::unique_lock lock(mutex_);
    while (!shutting_down_ && bytes_per_second_.load(std::memory_order_relaxed) > 0) {
        refill_locked(std::chrono::steady_clock::now());

        // A request larger than the bucket drains it and goes negative
        // so that the average rate still holds.
        auto needed = std::min(static_cast<double>(bytes), capacity_);
        if (tokens_ >= needed) {
            tokens_ -= static_cast<double>(bytes);
            return;
        }

        cv_.wait_for(lock, wait_time_locked(static_cast<std::size_t>(needed)));
    }
}

auto bandwidth_limiter::try_acquire(std::size_t bytes) -> bool {
    if (bytes == 0 || bytes_per_second_.load(std::memory_order_relaxed) == 0) {
        return true;
    }

    std::lock_guard lock(mutex_);
    refill_locked(std::chrono::steady_clock::now());
    if (tokens_ >= static_cast<double>(bytes)) {
        tokens_ -= static_cast<double>(bytes);
        return true;
    }
    return false;
}

void bandwidth_limiter::set_limit(uint64_t bytes_per_second) {
    {
        std::lock_guard lock(mutex_);
        auto old_capacity = capacity_;
        bytes_per_second_.store(bytes_per_second, std::memory_order_relaxed);
        capacity_ = static_cast<double>(bytes_per_second);

        if (bytes_per_second == 0) {
            tokens_ = 0.0;
        } else if (old_capacity > 0.0) {
            tokens_ = std::min(tokens_ * (capacity_ / old_capacity), capacity_);
        } else {
            tokens_ = capacity_;
        }
        last_refill_ = std::chrono::steady_clock::now();
    }
    cv_.notify_all();
}

auto bandwidth_limiter::limit() const noexcept -> uint64_t {
    return bytes_per_second_.load(std::memory_order_relaxed);
}

auto bandwidth_limiter::is_enabled() const noexcept -> bool {
    return limit() > 0;
}

void bandwidth_limiter::reset() {
    {
        std::lock_guard lock(mutex_);
        tokens_ = capacity_;
        last_refill_ = std::chrono::steady_clock::now();
    }
    cv_.notify_all();
}

auto bandwidth_limiter::available_tokens() const -> std::size_t {
    std::lock_guard lock(mutex_);
    refill_locked(std::chrono::steady_clock::now());
    return static_cast<std::size_t>(std::max(0.0, tokens_));
}

void bandwidth_limiter::refill_locked(std::chrono::steady_clock::time_point now) const {
    auto elapsed = std::chrono::duration<double>(now - last_refill_).count();
    if (elapsed <= 0.0) {
        return;
    }
    auto rate = static_cast<double>(bytes_per_second_.load(std::memory_order_relaxed));
    tokens_ = std::min(tokens_ + elapsed * rate, capacity_);
    last_refill_ = now;
}

auto bandwidth_limiter::wait_time_locked(std::size_t bytes) const
    -> std::chrono::microseconds {
    auto rate = static_cast<double>(bytes_per_second_.load(std::memory_order_relaxed));
    auto missing = static_cast<double>(bytes) - tokens_;
    if (rate <= 0.0 || missing <= 0.0) {
        return std::chrono::microseconds(1);
    }
    auto micros = static_cast<int64_t>(missing / rate * 1'000'000.0);
    return std::chrono::microseconds(std::max<int64_t>(micros, 1));
}

}  // namespace kcenon::transfer_orchestrator
