/**
 * @file bandwidth_limiter.h
 * @brief Token bucket shared by primitives that pace their own I/O
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_CORE_BANDWIDTH_LIMITER_H
#define KCENON_TRANSFER_ORCHESTRATOR_CORE_BANDWIDTH_LIMITER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace kcenon::transfer_orchestrator {

/**
 * @brief Token bucket bandwidth limiter
 *
 * Capacity equals one second of the configured rate. A limit of 0 disables
 * pacing and releases every waiting caller.
 *
 * @code
 * bandwidth_limiter limiter(10 * 1024 * 1024);  // 10 MiB/s
 * limiter.acquire(chunk.size());
 * limiter.set_limit(0);  // unlimited from now on
 * @endcode
 */
class bandwidth_limiter {
public:
    explicit bandwidth_limiter(uint64_t bytes_per_second = 0);
    ~bandwidth_limiter();

    bandwidth_limiter(const bandwidth_limiter&) = delete;
    auto operator=(const bandwidth_limiter&) -> bandwidth_limiter& = delete;

    /**
     * @brief Block until bytes can be sent at the configured rate
     */
    void acquire(std::size_t bytes);

    /**
     * @brief Take tokens if available right now
     */
    [[nodiscard]] auto try_acquire(std::size_t bytes) -> bool;

    /**
     * @brief Change the rate; 0 disables limiting
     */
    void set_limit(uint64_t bytes_per_second);

    [[nodiscard]] auto limit() const noexcept -> uint64_t;
    [[nodiscard]] auto is_enabled() const noexcept -> bool;

    /**
     * @brief Refill the bucket to capacity
     */
    void reset();

    [[nodiscard]] auto available_tokens() const -> std::size_t;

private:
    void refill_locked(std::chrono::steady_clock::time_point now) const;
    [[nodiscard]] auto wait_time_locked(std::size_t bytes) const
        -> std::chrono::microseconds;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::atomic<uint64_t> bytes_per_second_;
    bool shutting_down_ = false;

    mutable double tokens_ = 0.0;
    double capacity_ = 0.0;
    mutable std::chrono::steady_clock::time_point last_refill_;
};

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_CORE_BANDWIDTH_LIMITER_H
