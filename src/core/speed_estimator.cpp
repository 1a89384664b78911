/**
 * @file speed_estimator.cpp
 * @brief Smoothed throughput estimate
 */

#include <kcenon/transfer_orchestrator/core/speed_estimator.h>

#include <cmath>

namespace kcenon::transfer_orchestrator {

void speed_estimator::add_sample(clock::time_point when, uint64_t bytes_done) {
    if (!last_time_) {
        last_time_ = when;
        last_bytes_ = bytes_done;
        return;
    }

    auto elapsed = std::chrono::duration<double>(when - *last_time_).count();
    if (!(elapsed > 0.0)) {
        return;
    }

    uint64_t delta = bytes_done > last_bytes_ ? bytes_done - last_bytes_ : 0;
    double instant = static_cast<double>(delta) / elapsed;
    if (!std::isfinite(instant)) {
        return;
    }

    if (has_estimate_) {
        estimate_ = smoothing_factor * instant + (1.0 - smoothing_factor) * estimate_;
    } else {
        estimate_ = instant;
        has_estimate_ = true;
    }

    last_time_ = when;
    last_bytes_ = bytes_done;
}

void speed_estimator::reset() noexcept {
    last_time_.reset();
    last_bytes_ = 0;
    estimate_ = 0.0;
    has_estimate_ = false;
}

auto speed_estimator::eta_seconds(uint64_t bytes_done, uint64_t bytes_total) const
    -> std::optional<double> {
    if (!has_estimate_ || estimate_ <= 0.0 || bytes_done >= bytes_total) {
        return std::nullopt;
    }
    return static_cast<double>(bytes_total - bytes_done) / estimate_;
}

}  // namespace kcenon::transfer_orchestrator
