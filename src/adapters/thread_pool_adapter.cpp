// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapters for transfer execution
 */

#include "kcenon/transfer_orchestrator/adapters/thread_pool_adapter.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::transfer_orchestrator::adapters {

namespace {

// Per-stage in-flight counters
class stage_counter {
public:
    void enter(const std::string& stage) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage];
    }

    void leave(const std::string& stage) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage);
        return it == counts_.end() ? 0 : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

size_t resolve_worker_count(size_t requested) {
    if (requested > 0) {
        return requested;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

// Run task and forward its outcome into promise
void run_into(const std::function<void()>& task, std::promise<void>& promise) {
    try {
        task();
        promise.set_value();
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
}

}  // namespace

// ============================================================================
// thread_system_transfer_adapter
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

class transfer_job : public kcenon::thread::job {
public:
    transfer_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t workers{0};
    stage_counter stages;
};

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->workers = worker_count;
}

thread_system_transfer_adapter::~thread_system_transfer_adapter() = default;

std::shared_ptr<thread_system_transfer_adapter>
thread_system_transfer_adapter::create_default(size_t worker_count,
                                                const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_transfer_adapter>(
        std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->pool->enqueue(std::make_unique<transfer_job>(
        [task = std::move(task), promise]() { run_into(task, *promise); },
        pimpl_->pool_name + ".transfer"));
    return future;
}

std::future<void> thread_system_transfer_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->stages.enter(stage_name);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    auto* stages = &pimpl_->stages;

    pimpl_->pool->enqueue(std::make_unique<transfer_job>(
        [task = std::move(task), promise, stages, stage = stage_name]() {
            run_into(task, *promise);
            stages->leave(stage);
        },
        pimpl_->pool_name + "." + stage_name));
    return future;
}

size_t thread_system_transfer_adapter::worker_count() const {
    return pimpl_->workers;
}

bool thread_system_transfer_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_transfer_adapter::pending_tasks() const {
    if (!pimpl_->pool) {
        return 0;
    }
    auto queue = pimpl_->pool->get_job_queue();
    return queue ? queue->size() : 0;
}

size_t thread_system_transfer_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->stages.count(stage_name);
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_transfer_adapter::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// network_pool_transfer_adapter
// ============================================================================

#if KCENON_WITH_NETWORK_SYSTEM

struct network_pool_transfer_adapter::impl {
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool;
    std::string pool_name;
    stage_counter stages;
};

network_pool_transfer_adapter::network_pool_transfer_adapter(
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool,
    const std::string& pool_name)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
}

network_pool_transfer_adapter::~network_pool_transfer_adapter() = default;

std::shared_ptr<network_pool_transfer_adapter>
network_pool_transfer_adapter::create_basic(size_t worker_count,
                                             const std::string& pool_name) {
    auto pool = std::make_shared<kcenon::network::integration::basic_thread_pool>(
        resolve_worker_count(worker_count));
    return std::make_shared<network_pool_transfer_adapter>(std::move(pool), pool_name);
}

std::future<void> network_pool_transfer_adapter::submit(std::function<void()> task) {
    return pimpl_->pool->submit(std::move(task));
}

std::future<void> network_pool_transfer_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->stages.enter(stage_name);

    auto* stages = &pimpl_->stages;
    return pimpl_->pool->submit([task = std::move(task), stages, stage = stage_name]() {
        try {
            task();
        } catch (...) {
            stages->leave(stage);
            throw;
        }
        stages->leave(stage);
    });
}

size_t network_pool_transfer_adapter::worker_count() const {
    return pimpl_->pool ? pimpl_->pool->worker_count() : 0;
}

bool network_pool_transfer_adapter::is_running() const {
    return pimpl_->pool ? pimpl_->pool->is_running() : false;
}

size_t network_pool_transfer_adapter::pending_tasks() const {
    return pimpl_->pool ? pimpl_->pool->pending_tasks() : 0;
}

size_t network_pool_transfer_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->stages.count(stage_name);
}

#endif  // KCENON_WITH_NETWORK_SYSTEM

// ============================================================================
// async_transfer_pool
// ============================================================================

struct async_transfer_pool::impl {
    std::atomic<size_t> active{0};
    stage_counter stages;
};

async_transfer_pool::async_transfer_pool()
    : pimpl_(std::make_shared<impl>()) {}

async_transfer_pool::~async_transfer_pool() = default;

std::future<void> async_transfer_pool::submit(std::function<void()> task) {
    pimpl_->active.fetch_add(1, std::memory_order_relaxed);

    // The task keeps the counters alive even if the pool goes first
    return std::async(std::launch::async, [state = pimpl_, task = std::move(task)]() {
        struct active_guard {
            std::atomic<size_t>& counter;
            ~active_guard() { counter.fetch_sub(1, std::memory_order_relaxed); }
        } guard{state->active};
        task();
    });
}

std::future<void> async_transfer_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->stages.enter(stage_name);
    auto state = pimpl_;
    return submit([state, task = std::move(task), stage = stage_name]() {
        struct stage_guard {
            stage_counter& stages;
            const std::string& name;
            ~stage_guard() { stages.leave(name); }
        } guard{state->stages, stage};
        task();
    });
}

size_t async_transfer_pool::worker_count() const {
    return resolve_worker_count(0);
}

bool async_transfer_pool::is_running() const { return true; }

size_t async_transfer_pool::pending_tasks() const {
    return pimpl_->active.load(std::memory_order_relaxed);
}

size_t async_transfer_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->stages.count(stage_name);
}

// ============================================================================
// transfer_pool_factory
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_transfer_adapter::create_default(worker_count, pool_name);
#elif KCENON_WITH_NETWORK_SYSTEM
    return network_pool_transfer_adapter::create_basic(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_transfer_pool>();
#endif
}

}  // namespace kcenon::transfer_orchestrator::adapters
