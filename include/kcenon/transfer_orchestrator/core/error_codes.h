/**
 * @file error_codes.h
 * @brief Failure classification returned by backend primitives
 *
 * Backend primitives report failures through a closed set of kinds so that
 * the scheduler can tell a user cancellation apart from a genuine I/O failure
 * without inspecting message text.
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_CORE_ERROR_CODES_H
#define KCENON_TRANSFER_ORCHESTRATOR_CORE_ERROR_CODES_H

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace kcenon::transfer_orchestrator {

/**
 * @brief Failure kinds reported by a backend call
 */
enum class failure_kind : uint8_t {
    cancelled,    ///< Stopped because cancel(id) was signalled
    io_failure,   ///< Backend or filesystem error; detail carries the cause
    unsupported,  ///< Operation not available for this backend pair
};

/**
 * @brief Convert failure_kind to string
 */
[[nodiscard]] constexpr auto to_string(failure_kind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case failure_kind::cancelled:
            return "cancelled";
        case failure_kind::io_failure:
            return "io_failure";
        case failure_kind::unsupported:
            return "unsupported";
        default:
            return "unknown";
    }
}

/**
 * @brief Failure returned by a backend primitive
 */
struct backend_error {
    failure_kind kind = failure_kind::io_failure;
    std::string detail;

    backend_error() = default;
    backend_error(failure_kind k, std::string d)
        : kind(k), detail(std::move(d)) {}

    [[nodiscard]] static auto cancelled() -> backend_error {
        return backend_error{failure_kind::cancelled, "operation cancelled"};
    }

    [[nodiscard]] static auto io(std::string detail) -> backend_error {
        return backend_error{failure_kind::io_failure, std::move(detail)};
    }

    [[nodiscard]] static auto unsupported(std::string detail) -> backend_error {
        return backend_error{failure_kind::unsupported, std::move(detail)};
    }

    [[nodiscard]] auto is_cancellation() const noexcept -> bool {
        return kind == failure_kind::cancelled;
    }
};

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_CORE_ERROR_CODES_H
