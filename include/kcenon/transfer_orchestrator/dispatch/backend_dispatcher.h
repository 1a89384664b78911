/**
 * @file backend_dispatcher.h
 * @brief Maps a transfer onto backend primitive calls
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_DISPATCH_BACKEND_DISPATCHER_H
#define KCENON_TRANSFER_ORCHESTRATOR_DISPATCH_BACKEND_DISPATCHER_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backend_primitives.h"
#include "dispatch_route.h"
#include "kcenon/transfer_orchestrator/core/backend_id.h"
#include "kcenon/transfer_orchestrator/core/transfer_record.h"

namespace kcenon::transfer_orchestrator {

/**
 * @brief Primitive implementations available to the dispatcher
 *
 * Any member may be null; routes that need a missing primitive are reported
 * as unavailable.
 */
struct backend_set {
    std::shared_ptr<local_filesystem_operations> local;
    std::shared_ptr<object_storage_operations> object_storage;
    std::shared_ptr<secure_remote_operations> secure_remote;
    std::shared_ptr<archive_operations> archive;
};

/**
 * @brief Cancel and pause flags of one transfer episode
 *
 * The scheduler owns one instance per episode and may raise a flag before
 * the worker reaches the dispatcher; dispatch() checks the flags before each
 * phase.
 */
struct transfer_signals {
    std::atomic<bool> cancel{false};
    std::atomic<bool> pause{false};
};

/**
 * @brief One episode of a transfer as handed to the dispatcher
 */
struct dispatch_request {
    transfer_id id;
    transfer_kind kind = transfer_kind::copy;
    std::vector<std::string> sources;
    std::string destination;
    backend_id source_backend;
    backend_id destination_backend;
    std::optional<encryption_options> encryption;
    std::optional<checkpoint> resume_from;
    uint64_t bandwidth_limit = 0;
    progress_callback on_progress;

    /// Optional; the dispatcher creates its own when null
    std::shared_ptr<transfer_signals> signals;

    [[nodiscard]] static auto from_record(const transfer_record& record) -> dispatch_request;
};

/**
 * @brief Routes transfers to primitives and relays cancel and pause signals
 *
 * dispatch() runs on a worker thread and returns when the transfer completed,
 * paused or failed. For a move the source is deleted only after the copy
 * phase reported success. Staged routes pass through a per-transfer directory
 * under the staging root, which is removed on completion, failure and
 * cancellation but kept while paused.
 *
 * @code
 * backend_set backends;
 * backends.local = std::make_shared<local_filesystem_backend>();
 * auto dispatcher = std::make_shared<backend_dispatcher>(backends);
 * @endcode
 */
class backend_dispatcher {
public:
    explicit backend_dispatcher(backend_set backends,
                                std::filesystem::path staging_root = {});
    ~backend_dispatcher();

    backend_dispatcher(const backend_dispatcher&) = delete;
    auto operator=(const backend_dispatcher&) -> backend_dispatcher& = delete;

    /**
     * @brief True when the route exists and its primitives are configured
     */
    [[nodiscard]] auto can_dispatch(transfer_kind kind,
                                    const backend_id& source,
                                    const backend_id& destination) const -> bool;

    /**
     * @brief Run one episode of a transfer to completion, pause or failure
     */
    [[nodiscard]] auto dispatch(const dispatch_request& request) -> execution_outcome;

    /**
     * @brief Signal cancel to whatever is running for id
     *
     * Also honoured if it arrives between two phases of a route.
     */
    void cancel(const transfer_id& id);

    void request_pause(const transfer_id& id);

    /**
     * @brief Delete locators on any backend (sync deletions)
     */
    [[nodiscard]] auto remove(const transfer_id& id,
                              const backend_id& backend,
                              const std::vector<std::string>& locators)
        -> execution_outcome;

    /**
     * @brief Number of transfers currently inside dispatch()
     */
    [[nodiscard]] auto in_flight() const -> std::size_t;

    [[nodiscard]] auto staging_root() const -> const std::filesystem::path&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_DISPATCH_BACKEND_DISPATCHER_H
