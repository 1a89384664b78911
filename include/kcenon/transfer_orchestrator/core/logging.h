// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file logging.h
 * @brief Structured logging for transfer_orchestrator
 *
 * Routes log records to kcenon logger_system when the library is built with
 * logger_system and common_system, and to stderr otherwise. Records can be
 * emitted as plain text or as one JSON object per line.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

#if TRANSFER_ORCH_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::transfer_orchestrator {

/**
 * @brief Log categories for the orchestrator
 */
struct log_category {
    static constexpr std::string_view scheduler = "transfer_orchestrator.scheduler";
    static constexpr std::string_view dispatcher = "transfer_orchestrator.dispatcher";
    static constexpr std::string_view progress = "transfer_orchestrator.progress";
    static constexpr std::string_view checkpoint = "transfer_orchestrator.checkpoint";
    static constexpr std::string_view sync = "transfer_orchestrator.sync";
    static constexpr std::string_view backend = "transfer_orchestrator.backend";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Masking options for paths and addresses that appear in log text
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_ips = false;
    char mask_char = '*';
    std::size_t visible_chars = 4;

    static masking_config all_masked() { return {true, true, '*', 4}; }
    static masking_config none() { return {false, false, '*', 4}; }
};

/**
 * @brief Replaces sensitive substrings in log messages
 *
 * Paths keep their last component with the first visible_chars characters
 * readable; IPv4 addresses keep their first octet.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string out = input;
        if (config_.mask_ips) {
            static const std::regex ip_pattern(
                R"((\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3}))");
            out = std::regex_replace(out, ip_pattern, "$1.***.***.***");
        }
        if (config_.mask_paths) {
            static const std::regex path_pattern(R"((?:\/[A-Za-z0-9._-]+)+)");
            std::string masked;
            std::sregex_iterator it(out.begin(), out.end(), path_pattern);
            std::sregex_iterator end;
            std::size_t last = 0;
            for (; it != end; ++it) {
                masked += out.substr(last, static_cast<std::size_t>(it->position()) - last);
                masked += mask_path(it->str());
                last = static_cast<std::size_t>(it->position() + it->length());
            }
            masked += out.substr(last);
            out = std::move(masked);
        }
        return out;
    }

    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        auto slash = path.find_last_of('/');
        std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
        if (name.size() > config_.visible_chars) {
            name = name.substr(0, config_.visible_chars) +
                   std::string(name.size() - config_.visible_chars, config_.mask_char);
        }
        return ".../" + name;
    }

    [[nodiscard]] auto config() const -> const masking_config& { return config_; }
    void set_config(masking_config config) { config_ = config; }

private:
    masking_config config_;
};

/**
 * @brief Structured context attached to a log record
 */
struct transfer_log_context {
    std::string transfer_id;
    std::optional<std::string> kind;
    std::optional<std::string> route;
    std::optional<std::string> status;
    std::optional<uint64_t> bytes_done;
    std::optional<uint64_t> bytes_total;
    std::optional<uint32_t> files_done;
    std::optional<uint32_t> files_total;
    std::optional<double> progress_percent;
    std::optional<double> speed_bps;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";
        bool first = true;
        auto sep = [&]() {
            if (!first) oss << ",";
            first = false;
        };
        auto add_string = [&](const char* name, const std::string& value) {
            sep();
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            sep();
            oss << "\"" << name << "\":" << value;
        };
        auto add_double = [&](const char* name, double value) {
            sep();
            oss << "\"" << name << "\":" << std::fixed << std::setprecision(2) << value;
        };

        if (!transfer_id.empty()) add_string("transfer_id", transfer_id);
        if (kind) add_string("kind", *kind);
        if (route) add_string("route", *route);
        if (status) add_string("status", *status);
        if (bytes_done) add_uint("bytes_done", *bytes_done);
        if (bytes_total) add_uint("bytes_total", *bytes_total);
        if (files_done) add_uint("files_done", *files_done);
        if (files_total) add_uint("files_total", *files_total);
        if (progress_percent) add_double("progress_percent", *progress_percent);
        if (speed_bps) add_double("speed_bps", *speed_bps);
        if (error_message) {
            add_string("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for the orchestrator
 */
class orchestrator_logger {
public:
    using log_callback = std::function<void(
        log_level, std::string_view, std::string_view, const transfer_log_context*)>;

    orchestrator_logger() = default;
    ~orchestrator_logger() = default;

    orchestrator_logger(const orchestrator_logger&) = delete;
    orchestrator_logger& operator=(const orchestrator_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; only the first call has an effect.
     * Called by the scheduler builder.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if TRANSFER_ORCH_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if TRANSFER_ORCH_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if TRANSFER_ORCH_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(config);
    }

    /**
     * @brief Install a callback that receives every enabled record
     *
     * Pass an empty function to remove it.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string text = format == log_output_format::json
            ? format_json(level, category, message, context, masker)
            : format_text(category, message, context, masker);

#if TRANSFER_ORCH_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), text);
            }
            return;
        }
#endif
        if (format == log_output_format::text) {
            text = get_timestamp() + " [" + std::string(log_level_to_string(level)) +
                   "] " + text;
        }
        output_to_stderr(text);
    }

    void flush() {
#if TRANSFER_ORCH_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json(&masker);
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_timestamp() << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\"" << detail::escape_json(masker.mask(std::string(message)))
            << "\"";
        if (context) {
            auto ctx = context->to_json(&masker);
            if (ctx.size() > 2) {
                oss << "," << ctx.substr(1, ctx.size() - 2);
            }
        }
        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

#if TRANSFER_ORCH_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline orchestrator_logger& get_logger() {
    static orchestrator_logger instance;
    return instance;
}

#define TO_LOG(level, category, message) \
    kcenon::transfer_orchestrator::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define TO_LOG_CTX(level, category, message, context) \
    kcenon::transfer_orchestrator::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define TO_LOG_TRACE(category, message) \
    TO_LOG(kcenon::transfer_orchestrator::log_level::trace, category, message)

#define TO_LOG_DEBUG(category, message) \
    TO_LOG(kcenon::transfer_orchestrator::log_level::debug, category, message)

#define TO_LOG_INFO(category, message) \
    TO_LOG(kcenon::transfer_orchestrator::log_level::info, category, message)

#define TO_LOG_WARN(category, message) \
    TO_LOG(kcenon::transfer_orchestrator::log_level::warn, category, message)

#define TO_LOG_ERROR(category, message) \
    TO_LOG(kcenon::transfer_orchestrator::log_level::error, category, message)

#define TO_LOG_FATAL(category, message) \
    TO_LOG(kcenon::transfer_orchestrator::log_level::fatal, category, message)

#define TO_LOG_DEBUG_CTX(category, message, ctx) \
    TO_LOG_CTX(kcenon::transfer_orchestrator::log_level::debug, category, message, ctx)

#define TO_LOG_INFO_CTX(category, message, ctx) \
    TO_LOG_CTX(kcenon::transfer_orchestrator::log_level::info, category, message, ctx)

#define TO_LOG_WARN_CTX(category, message, ctx) \
    TO_LOG_CTX(kcenon::transfer_orchestrator::log_level::warn, category, message, ctx)

#define TO_LOG_ERROR_CTX(category, message, ctx) \
    TO_LOG_CTX(kcenon::transfer_orchestrator::log_level::error, category, message, ctx)

#define TO_LOG_FATAL_CTX(category, message, ctx) \
    TO_LOG_CTX(kcenon::transfer_orchestrator::log_level::fatal, category, message, ctx)

}  // namespace kcenon::transfer_orchestrator
