// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Workers for dispatch episodes
 *
 * transfer_scheduler hands every admitted episode (one backend dispatch from
 * running to completed, paused, cancelled or failed) to one of these pools
 * under dispatch_stage. Which pool is used depends on the libraries found at
 * configure time; transfer_pool_factory makes the choice.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/integration/thread_integration.h>
#endif

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::transfer_orchestrator::adapters {

inline constexpr const char* default_pool_name = "transfer_orchestrator_pool";

/// Stage the scheduler submits dispatch episodes under
inline constexpr const char* dispatch_stage = "dispatch";

/**
 * @brief Where the scheduler runs its dispatch episodes
 *
 * An episode may run on any thread, the submitting one included, so the
 * scheduler releases its record lock before submitting. An exception that
 * escapes an episode, of any type, is stored in the returned future.
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Run an episode and count it under stage_name until it finishes
     *
     * The count drops when the task returns or throws.
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    /// Upper bound on episodes running at once; the scheduler's own
    /// concurrency limit is applied before submission.
    [[nodiscard]] virtual size_t worker_count() const = 0;
    [[nodiscard]] virtual bool is_running() const = 0;

    /// Submitted and not yet finished, across all stages
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
    /// Submitted under stage_name and not yet finished
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Episodes run as jobs on a kcenon::thread::thread_pool
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    explicit thread_system_transfer_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = default_pool_name,
        size_t worker_count = 0);

    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    /// Starts worker_count workers, hardware concurrency when 0
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = default_pool_name);

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

#if KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Episodes run on network_system's shared worker pool
 */
class network_pool_transfer_adapter : public transfer_thread_pool_interface {
public:
    explicit network_pool_transfer_adapter(
        std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool,
        const std::string& pool_name = default_pool_name);

    ~network_pool_transfer_adapter() override;

    network_pool_transfer_adapter(const network_pool_transfer_adapter&) = delete;
    network_pool_transfer_adapter& operator=(const network_pool_transfer_adapter&) = delete;

    [[nodiscard]] static std::shared_ptr<network_pool_transfer_adapter> create_basic(
        size_t worker_count = 0,
        const std::string& pool_name = default_pool_name);

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief One std::async launch per episode
 *
 * Used when neither thread_system nor network_system is available. The
 * future's destructor blocks until the episode ends; the scheduler holds
 * the futures and prunes finished ones.
 */
class async_transfer_pool : public transfer_thread_pool_interface {
public:
    async_transfer_pool();
    ~async_transfer_pool() override;

    async_transfer_pool(const async_transfer_pool&) = delete;
    async_transfer_pool& operator=(const async_transfer_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Builds the scheduler's pool from what was found at configure time
 *
 * thread_system is preferred over network_system; async_transfer_pool is
 * the last resort. worker_count 0 means hardware concurrency.
 */
class transfer_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = default_pool_name);

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }

    [[nodiscard]] static constexpr bool has_network_pool() noexcept {
#if KCENON_WITH_NETWORK_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::transfer_orchestrator::adapters
