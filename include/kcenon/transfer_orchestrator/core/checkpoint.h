/**
 * @file checkpoint.h
 * @brief Resume state captured when a running transfer is paused
 *
 * A checkpoint is produced by the backend call that was asked to pause and is
 * handed back to the same kind of call on resume. The orchestrator stores and
 * forwards it but never interprets the backend-specific parts.
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_CORE_CHECKPOINT_H
#define KCENON_TRANSFER_ORCHESTRATOR_CORE_CHECKPOINT_H

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.h"

namespace kcenon::transfer_orchestrator {

/**
 * @brief One uploaded part of an in-progress multipart upload
 */
struct completed_part {
    int32_t part_number = 0;
    std::string etag;

    [[nodiscard]] auto operator==(const completed_part& other) const -> bool = default;
};

/**
 * @brief Partial multipart upload of the file that was in flight at pause time
 */
struct multipart_upload_state {
    std::string upload_id;
    std::string key;
    std::vector<completed_part> completed_parts;

    [[nodiscard]] auto operator==(const multipart_upload_state& other) const
        -> bool = default;
};

/**
 * @brief Phase of a route that stages data through a local directory
 */
enum class staging_phase : uint8_t {
    download,  ///< Pulling sources into the staging directory
    upload,    ///< Pushing the staging directory to the destination
};

[[nodiscard]] constexpr auto to_string(staging_phase phase) noexcept -> const char* {
    switch (phase) {
        case staging_phase::download: return "download";
        case staging_phase::upload: return "upload";
        default: return "unknown";
    }
}

/**
 * @brief Dispatcher-owned state of a staged route
 */
struct staging_state {
    staging_phase phase = staging_phase::download;
    std::string directory;

    // Counters of the interrupted phase, in that phase's own units
    std::vector<std::string> phase_files_completed;
    uint64_t phase_bytes_done = 0;
    uint64_t phase_bytes_total = 0;
    uint32_t phase_files_done = 0;
    uint32_t phase_files_total = 0;

    [[nodiscard]] auto operator==(const staging_state& other) const -> bool = default;
};

/**
 * @brief Serializable resume state of a paused transfer
 */
struct checkpoint {
    std::vector<std::string> files_completed;
    uint64_t bytes_done = 0;
    uint64_t bytes_total = 0;
    uint32_t files_done = 0;
    uint32_t files_total = 0;

    std::optional<multipart_upload_state> multipart;
    std::optional<staging_state> staging;

    [[nodiscard]] auto has_completed(std::string_view item) const -> bool {
        return std::find(files_completed.begin(), files_completed.end(), item) !=
               files_completed.end();
    }

    [[nodiscard]] auto operator==(const checkpoint& other) const -> bool = default;
};

/**
 * @brief Serialize a checkpoint to a JSON object
 */
[[nodiscard]] auto to_json(const checkpoint& cp) -> std::string;

/**
 * @brief Parse a checkpoint produced by to_json()
 */
[[nodiscard]] auto checkpoint_from_json(std::string_view json) -> result<checkpoint>;

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_CORE_CHECKPOINT_H
