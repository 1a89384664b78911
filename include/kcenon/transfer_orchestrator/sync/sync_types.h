/**
 * @file sync_types.h
 * @brief Types shared by tree differs and the sync reconciler
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_SYNC_SYNC_TYPES_H
#define KCENON_TRANSFER_ORCHESTRATOR_SYNC_SYNC_TYPES_H

#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "kcenon/transfer_orchestrator/core/backend_id.h"
#include "kcenon/transfer_orchestrator/core/transfer_record.h"

namespace kcenon::transfer_orchestrator {

/**
 * @brief How one path compares between the two trees
 */
enum class sync_classification : uint8_t {
    new_entry,  ///< Only in the source tree
    modified,   ///< In both trees, contents differ
    deleted,    ///< Only in the destination tree
    same,       ///< In both trees, contents match
};

[[nodiscard]] constexpr auto to_string(sync_classification c) noexcept -> const char* {
    switch (c) {
        case sync_classification::new_entry: return "new";
        case sync_classification::modified: return "modified";
        case sync_classification::deleted: return "deleted";
        case sync_classification::same: return "same";
        default: return "unknown";
    }
}

/**
 * @brief One path's comparison result
 *
 * Size and mtime of a missing side are 0; etags are empty when unavailable.
 */
struct sync_entry {
    std::string relative_path;  ///< '/'-separated, relative to each root
    sync_classification classification = sync_classification::same;
    uint64_t source_size = 0;
    uint64_t dest_size = 0;
    int64_t source_modified_ms = 0;
    int64_t dest_modified_ms = 0;
    std::string source_etag;
    std::string dest_etag;
};

struct sync_progress {
    uint32_t scanned = 0;
};

/**
 * @brief Final event of a completed diff
 */
struct sync_summary {
    uint32_t total = 0;
    uint32_t new_count = 0;
    uint32_t modified = 0;
    uint32_t deleted = 0;
    uint32_t same = 0;
};

using sync_event = std::variant<sync_entry, sync_progress, sync_summary>;
using sync_event_callback = std::function<void(const sync_event&)>;

enum class compare_mode : uint8_t {
    size_mtime,  ///< Sizes differ or source is newer
    checksum,    ///< Content fingerprints differ
};

struct sync_options {
    /// Glob patterns matched against the relative path and the file name
    std::vector<std::string> excludes;
    compare_mode mode = compare_mode::size_mtime;
};

/**
 * @brief A tree root on some backend
 */
struct sync_location {
    backend_id backend;
    std::string root;  ///< Directory path or key prefix
};

enum class sync_direction : uint8_t {
    source_to_destination,
    destination_to_source,
};

/**
 * @brief Locators to delete on one backend
 */
struct sync_deletion {
    backend_id backend;
    std::vector<std::string> locators;
};

/**
 * @brief Batch produced from the selected entries
 */
struct sync_plan {
    std::vector<transfer_request> copies;
    sync_deletion deletions;

    [[nodiscard]] auto empty() const -> bool {
        return copies.empty() && deletions.locators.empty();
    }
};

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_SYNC_SYNC_TYPES_H
