/**
 * @file speed_estimator.h
 * @brief Smoothed throughput estimate of one running transfer
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_CORE_SPEED_ESTIMATOR_H
#define KCENON_TRANSFER_ORCHESTRATOR_CORE_SPEED_ESTIMATOR_H

#include <chrono>
#include <cstdint>
#include <optional>

namespace kcenon::transfer_orchestrator {

/**
 * @brief Exponential moving average of bytes per second
 *
 * The first sample of an episode only sets the baseline. Later samples update
 * the estimate as 0.3 * instant + 0.7 * estimate. A sample with no elapsed
 * time is ignored and a shrinking byte count counts as zero.
 *
 * @code
 * speed_estimator speed;
 * speed.add_sample(now, 0);
 * speed.add_sample(now + 1s, 1024);
 * double bps = speed.estimate();  // 1024.0
 * @endcode
 */
class speed_estimator {
public:
    using clock = std::chrono::steady_clock;

    static constexpr double smoothing_factor = 0.3;

    speed_estimator() = default;

    /**
     * @brief Record a cumulative byte count observed at a point in time
     */
    void add_sample(clock::time_point when, uint64_t bytes_done);

    /**
     * @brief Forget the baseline and the estimate (start of a new episode)
     */
    void reset() noexcept;

    /**
     * @brief Current estimate in bytes/s, 0 when none exists yet
     */
    [[nodiscard]] auto estimate() const noexcept -> double { return estimate_; }

    [[nodiscard]] auto has_estimate() const noexcept -> bool { return has_estimate_; }

    [[nodiscard]] auto last_sample_time() const noexcept
        -> std::optional<clock::time_point> {
        return last_time_;
    }

    [[nodiscard]] auto last_sample_bytes() const noexcept -> uint64_t {
        return last_bytes_;
    }

    /**
     * @brief Seconds until bytes_total is reached at the current estimate
     */
    [[nodiscard]] auto eta_seconds(uint64_t bytes_done, uint64_t bytes_total) const
        -> std::optional<double>;

private:
    std::optional<clock::time_point> last_time_;
    uint64_t last_bytes_ = 0;
    double estimate_ = 0.0;
    bool has_estimate_ = false;
};

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_CORE_SPEED_ESTIMATOR_H
