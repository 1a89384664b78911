/**
 * @file transfer_scheduler.h
 * @brief Transfer queue with bounded concurrency, pause/resume and reordering
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_SCHEDULER_TRANSFER_SCHEDULER_H
#define KCENON_TRANSFER_ORCHESTRATOR_SCHEDULER_TRANSFER_SCHEDULER_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/transfer_orchestrator/adapters/thread_pool_adapter.h"
#include "kcenon/transfer_orchestrator/core/checkpoint_store.h"
#include "kcenon/transfer_orchestrator/core/transfer_record.h"
#include "kcenon/transfer_orchestrator/core/transfer_settings.h"
#include "kcenon/transfer_orchestrator/core/types.h"
#include "kcenon/transfer_orchestrator/dispatch/backend_dispatcher.h"

namespace kcenon::transfer_orchestrator {

/**
 * @brief Owns every transfer record and decides when each one runs
 *
 * At most settings.max_concurrent() records run at a time; queued records are
 * admitted in ascending priority order whenever a slot frees up. Each admitted
 * record runs as one task on the worker pool. All record state is guarded by a
 * single mutex that is never held while calling the pool or the dispatcher.
 *
 * Destruction asks running transfers to pause and waits for the tasks that
 * already started. A scheduler must not be destroyed from its own status
 * callback.
 *
 * @code
 * auto scheduler = transfer_scheduler::builder()
 *     .with_dispatcher(dispatcher)
 *     .with_settings(settings)
 *     .build();
 * if (!scheduler) { ... }
 *
 * transfer_request req;
 * req.sources = {"/tmp/a.bin"};
 * req.destination = "/backup";
 * auto id = scheduler.value().enqueue(req);
 * @endcode
 */
class transfer_scheduler {
public:
    using status_callback = std::function<void(const transfer_record&)>;

    class builder;

    ~transfer_scheduler();

    transfer_scheduler(const transfer_scheduler&) = delete;
    auto operator=(const transfer_scheduler&) -> transfer_scheduler& = delete;
    transfer_scheduler(transfer_scheduler&&) noexcept;
    auto operator=(transfer_scheduler&&) noexcept -> transfer_scheduler&;

    // Caller operations

    /**
     * @brief Create a queued record and run admission
     * @return invalid_request, unsupported_route or transfer_already_exists on rejection
     */
    [[nodiscard]] auto enqueue(const transfer_request& request) -> result<transfer_id>;

    /**
     * @brief Cancel a queued record at once, or signal a running one
     */
    [[nodiscard]] auto cancel(const transfer_id& id) -> result<void>;

    /**
     * @brief Ask a running record to stop with a checkpoint
     *
     * The record becomes paused when the backend returns its checkpoint, or
     * completes normally if it finishes first.
     */
    [[nodiscard]] auto pause(const transfer_id& id) -> result<void>;

    /**
     * @brief Requeue a paused record at the back of the queue
     */
    [[nodiscard]] auto resume(const transfer_id& id) -> result<void>;

    [[nodiscard]] auto move_up(const transfer_id& id) -> result<void>;
    [[nodiscard]] auto move_down(const transfer_id& id) -> result<void>;

    /**
     * @brief Remove a record that is not running
     */
    [[nodiscard]] auto dismiss(const transfer_id& id) -> result<void>;

    /**
     * @brief Remove every completed, failed and cancelled record
     * @return Number of records removed
     */
    auto dismiss_completed() -> std::size_t;

    // Views

    [[nodiscard]] auto get(const transfer_id& id) const -> result<transfer_record>;

    /**
     * @brief All records ordered by priority
     */
    [[nodiscard]] auto records() const -> std::vector<transfer_record>;
    [[nodiscard]] auto queued() const -> std::vector<transfer_record>;
    [[nodiscard]] auto running() const -> std::vector<transfer_record>;
    [[nodiscard]] auto paused() const -> std::vector<transfer_record>;

    [[nodiscard]] auto aggregate() const -> aggregate_progress;

    /**
     * @brief e.g. "2 transfers, 42% 1.2M/3.4M"; empty when nothing runs
     */
    [[nodiscard]] auto aggregate_summary() const -> std::string;

    /**
     * @brief Block until the record is neither queued nor running
     * @return Status reached, wait_timeout, or transfer_not_found
     */
    [[nodiscard]] auto wait_for(const transfer_id& id,
                                std::chrono::milliseconds timeout) -> result<transfer_status>;

    /**
     * @brief Observe record creation and every status transition
     *
     * Callbacks run without the scheduler lock held, on the thread that
     * caused the transition.
     */
    void on_status_change(status_callback callback);

    /**
     * @brief Recreate paused records saved in the checkpoint store
     * @return Number of records restored
     */
    [[nodiscard]] auto restore_paused() -> result<std::size_t>;

    [[nodiscard]] auto settings() const -> std::shared_ptr<transfer_settings>;

private:
    class impl;
    explicit transfer_scheduler(std::unique_ptr<impl> impl);

    std::unique_ptr<impl> impl_;
};

/**
 * @brief Builder for transfer_scheduler
 */
class transfer_scheduler::builder {
public:
    builder();

    /**
     * @brief Required
     */
    auto with_dispatcher(std::shared_ptr<backend_dispatcher> dispatcher) -> builder&;

    auto with_settings(std::shared_ptr<transfer_settings> settings) -> builder&;

    auto with_thread_pool(
        std::shared_ptr<adapters::transfer_thread_pool_interface> pool) -> builder&;

    auto with_checkpoint_store(std::shared_ptr<checkpoint_store> store) -> builder&;

    [[nodiscard]] auto build() -> result<transfer_scheduler>;

private:
    std::shared_ptr<backend_dispatcher> dispatcher_;
    std::shared_ptr<transfer_settings> settings_;
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;
    std::shared_ptr<checkpoint_store> store_;
};

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_SCHEDULER_TRANSFER_SCHEDULER_H
