/**
 * @file types.h
 * @brief Core result and error types for transfer_orchestrator
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_CORE_TYPES_H
#define KCENON_TRANSFER_ORCHESTRATOR_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::transfer_orchestrator {

/**
 * @brief Error codes for orchestration operations
 */
enum class error_code {
    success = 0,

    // Request errors (-100 to -119)
    invalid_request = -100,
    unsupported_route = -101,
    transfer_already_exists = -102,

    // State errors (-120 to -139)
    transfer_not_found = -120,
    invalid_state_transition = -121,
    wait_timeout = -122,

    // File errors (-140 to -159)
    file_not_found = -140,
    file_read_error = -141,
    file_write_error = -142,
    invalid_file_path = -143,

    // Configuration errors (-160 to -179)
    invalid_configuration = -160,

    // Internal errors (-200 to -219)
    internal_error = -200,
    operation_cancelled = -201,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_request:
            return "invalid request";
        case error_code::unsupported_route:
            return "unsupported route";
        case error_code::transfer_already_exists:
            return "transfer already exists";
        case error_code::transfer_not_found:
            return "transfer not found";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::wait_timeout:
            return "wait timeout";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        case error_code::operation_cancelled:
            return "operation cancelled";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_CORE_TYPES_H
