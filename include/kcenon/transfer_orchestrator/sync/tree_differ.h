/**
 * @file tree_differ.h
 * @brief Tree comparison collaborator and its compare rules
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_SYNC_TREE_DIFFER_H
#define KCENON_TRANSFER_ORCHESTRATOR_SYNC_TREE_DIFFER_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "sync_types.h"
#include "kcenon/transfer_orchestrator/core/transfer_id.h"
#include "kcenon/transfer_orchestrator/core/types.h"

namespace kcenon::transfer_orchestrator {

/**
 * @brief Walks two trees and streams one sync_entry per path
 *
 * diff() emits entries and periodic sync_progress events through on_event,
 * then a final sync_summary, which it also returns. A diff cancelled through
 * cancel(id) returns operation_cancelled and emits no summary.
 */
class tree_differ {
public:
    virtual ~tree_differ() = default;

    [[nodiscard]] virtual auto diff(const transfer_id& id,
                                    const sync_location& source,
                                    const sync_location& destination,
                                    const sync_options& options,
                                    const sync_event_callback& on_event)
        -> result<sync_summary> = 0;

    virtual void cancel(const transfer_id& id) = 0;
};

/**
 * @brief True when any pattern matches the path or its file name
 *
 * Blank patterns are ignored.
 */
[[nodiscard]] auto is_excluded(std::string_view relative_path,
                               const std::vector<std::string>& patterns) -> bool;

/**
 * @brief Compare two fingerprints, falling back to sizes
 *
 * Sizes decide when either etag is empty or is a multipart etag (contains
 * '-'). Surrounding quotes are ignored.
 */
[[nodiscard]] auto files_differ_checksum(uint64_t source_size, std::string_view source_etag,
                                         uint64_t dest_size, std::string_view dest_etag)
    -> bool;

/**
 * @brief Classify a path present on both sides
 */
[[nodiscard]] auto classify(const sync_entry& both_sides, compare_mode mode)
    -> sync_classification;

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_SYNC_TREE_DIFFER_H
