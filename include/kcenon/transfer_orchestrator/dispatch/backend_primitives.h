/**
 * @file backend_primitives.h
 * @brief Interfaces of the storage primitives driven by the dispatcher
 *
 * The orchestrator does not speak any storage protocol itself. Each backend
 * kind is reached through one of these interfaces; implementations run the
 * data movement synchronously on the calling worker thread and report the
 * outcome as completed, paused (with a checkpoint) or failed.
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_DISPATCH_BACKEND_PRIMITIVES_H
#define KCENON_TRANSFER_ORCHESTRATOR_DISPATCH_BACKEND_PRIMITIVES_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "kcenon/transfer_orchestrator/core/checkpoint.h"
#include "kcenon/transfer_orchestrator/core/error_codes.h"
#include "kcenon/transfer_orchestrator/core/transfer_id.h"
#include "kcenon/transfer_orchestrator/core/transfer_types.h"

namespace kcenon::transfer_orchestrator {

/**
 * @brief Marker for a call that moved every source
 */
struct transfer_completed {};

/**
 * @brief Result of one primitive call
 *
 * Holds transfer_completed, a checkpoint when pause was requested, or a
 * backend_error.
 */
using execution_outcome = std::variant<transfer_completed, checkpoint, backend_error>;

[[nodiscard]] inline auto is_completed(const execution_outcome& outcome) -> bool {
    return std::holds_alternative<transfer_completed>(outcome);
}

using progress_callback = std::function<void(const progress_event&)>;

/**
 * @brief Arguments shared by every data-moving primitive call
 */
struct execution_context {
    transfer_id id;
    std::vector<std::string> sources;
    std::string destination;

    /// Checkpoint from the paused episode, passed back verbatim
    std::optional<checkpoint> resume_from;

    /// Bytes per second snapshotted at admission, 0 = unlimited
    uint64_t bandwidth_limit = 0;

    progress_callback on_progress;

    void report(const progress_event& event) const {
        if (on_progress) {
            on_progress(event);
        }
    }
};

/**
 * @brief Cancel and pause signals accepted by every primitive
 *
 * Both are requests; the running call observes them cooperatively and
 * returns backend_error::cancelled() or a checkpoint respectively.
 */
class controllable_primitive {
public:
    virtual ~controllable_primitive() = default;

    virtual void cancel(const transfer_id& id) = 0;
    virtual void request_pause(const transfer_id& id) = 0;
};

/**
 * @brief Local filesystem primitives
 */
class local_filesystem_operations : public controllable_primitive {
public:
    virtual auto copy(const execution_context& ctx) -> execution_outcome = 0;

    /**
     * @brief Move sources into destination as one operation
     */
    virtual auto move(const execution_context& ctx) -> execution_outcome = 0;

    /**
     * @brief Delete local paths (files or directory trees)
     */
    virtual auto remove(const transfer_id& id, const std::vector<std::string>& paths)
        -> execution_outcome = 0;
};

/**
 * @brief Object storage primitives; conn identifies the connection
 */
class object_storage_operations : public controllable_primitive {
public:
    /**
     * @brief Download keys into a local directory
     * @param password Decrypts client-side encrypted objects when present
     */
    virtual auto download(const std::string& conn,
                          const execution_context& ctx,
                          const std::optional<std::string>& password)
        -> execution_outcome = 0;

    virtual auto upload(const std::string& conn, const execution_context& ctx)
        -> execution_outcome = 0;

    virtual auto upload_encrypted(const std::string& conn,
                                  const execution_context& ctx,
                                  const encryption_options& encryption)
        -> execution_outcome = 0;

    /**
     * @brief Server-side copy; src_conn and dst_conn may differ
     */
    virtual auto copy_objects(const std::string& src_conn,
                              const std::string& dst_conn,
                              const execution_context& ctx) -> execution_outcome = 0;

    virtual auto delete_objects(const std::string& conn,
                                const transfer_id& id,
                                const std::vector<std::string>& keys)
        -> execution_outcome = 0;
};

/**
 * @brief Secure remote filesystem primitives; session identifies the login
 */
class secure_remote_operations : public controllable_primitive {
public:
    virtual auto download(const std::string& session, const execution_context& ctx)
        -> execution_outcome = 0;

    virtual auto upload(const std::string& session, const execution_context& ctx)
        -> execution_outcome = 0;

    virtual auto remove(const std::string& session,
                        const transfer_id& id,
                        const std::vector<std::string>& paths) -> execution_outcome = 0;
};

/**
 * @brief Read-only archive extraction
 *
 * ctx.sources holds paths inside the archive.
 */
class archive_operations : public controllable_primitive {
public:
    virtual auto extract(const std::string& archive_path, const execution_context& ctx)
        -> execution_outcome = 0;
};

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_DISPATCH_BACKEND_PRIMITIVES_H
