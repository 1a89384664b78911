/**
 * @file sync_reconciler.h
 * @brief Turns selected diff entries into a batch of transfers
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_SYNC_SYNC_RECONCILER_H
#define KCENON_TRANSFER_ORCHESTRATOR_SYNC_SYNC_RECONCILER_H

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "sync_types.h"
#include "tree_differ.h"
#include "kcenon/transfer_orchestrator/dispatch/backend_dispatcher.h"
#include "kcenon/transfer_orchestrator/scheduler/transfer_scheduler.h"

namespace kcenon::transfer_orchestrator {

/**
 * @brief What execute() did with a plan
 */
struct sync_execution {
    std::vector<transfer_id> enqueued;
    std::size_t deleted = 0;
};

/**
 * @brief Collects a diff, tracks the user's selection and builds the batch
 *
 * After collect() every new, modified and deleted entry is selected; same
 * entries never are unless selected explicitly. Deletions are issued only for
 * selected entries.
 *
 * @code
 * sync_reconciler reconciler(std::make_shared<local_tree_differ>());
 * auto summary = reconciler.collect(transfer_id::generate(), src, dst, {});
 * reconciler.deselect(sync_classification::deleted);
 * auto plan = reconciler.build_plan(sync_direction::source_to_destination);
 * auto done = reconciler.execute(plan, scheduler, *dispatcher);
 * @endcode
 */
class sync_reconciler {
public:
    explicit sync_reconciler(std::shared_ptr<tree_differ> differ);

    /**
     * @brief Run the diff and keep its entries
     *
     * Events are forwarded to on_event as they arrive.
     */
    [[nodiscard]] auto collect(const transfer_id& id,
                               const sync_location& source,
                               const sync_location& destination,
                               const sync_options& options,
                               const sync_event_callback& on_event = {})
        -> result<sync_summary>;

    void cancel(const transfer_id& id);

    [[nodiscard]] auto entries() const -> const std::vector<sync_entry>& { return entries_; }
    [[nodiscard]] auto summary() const -> const std::optional<sync_summary>& {
        return summary_;
    }

    // Selection

    void select_defaults();
    void select_all();
    void clear_selection();

    /**
     * @brief Select or deselect one path
     * @return invalid_request if the path is not among the entries
     */
    [[nodiscard]] auto select(const std::string& relative_path, bool selected = true)
        -> result<void>;

    void select(sync_classification classification);
    void deselect(sync_classification classification);

    [[nodiscard]] auto is_selected(const std::string& relative_path) const -> bool;
    [[nodiscard]] auto selected_entries() const -> std::vector<sync_entry>;

    /**
     * @brief Translate the selection into copies and deletions
     *
     * source_to_destination: new and modified copy to the destination,
     * deleted are removed from the destination. destination_to_source:
     * deleted and modified copy back to the source, new are removed from the
     * source. Each copy lands in the parent directory of its path under the
     * target root.
     */
    [[nodiscard]] auto build_plan(sync_direction direction) const -> sync_plan;

    /**
     * @brief Enqueue the copies and issue the deletions
     *
     * Stops at the first rejected copy; copies already enqueued keep running.
     */
    [[nodiscard]] auto execute(const sync_plan& plan,
                               transfer_scheduler& scheduler,
                               backend_dispatcher& dispatcher) -> result<sync_execution>;

private:
    std::shared_ptr<tree_differ> differ_;
    std::optional<sync_location> source_;
    std::optional<sync_location> destination_;
    std::vector<sync_entry> entries_;
    std::optional<sync_summary> summary_;
    std::set<std::string> selected_;
};

/**
 * @brief Join a root locator and a '/'-separated relative path
 */
[[nodiscard]] auto join_locator(const std::string& root, const std::string& relative)
    -> std::string;

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_SYNC_SYNC_RECONCILER_H
