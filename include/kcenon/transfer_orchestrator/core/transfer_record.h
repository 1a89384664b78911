/**
 * @file transfer_record.h
 * @brief Transfer request and the record the scheduler keeps for it
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_CORE_TRANSFER_RECORD_H
#define KCENON_TRANSFER_ORCHESTRATOR_CORE_TRANSFER_RECORD_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "backend_id.h"
#include "checkpoint.h"
#include "transfer_id.h"
#include "transfer_types.h"

namespace kcenon::transfer_orchestrator {

/**
 * @brief Caller request for one copy, move or extract
 *
 * @code
 * transfer_request req;
 * req.kind = transfer_kind::copy;
 * req.sources = {"/data/a.bin", "/data/b.bin"};
 * req.destination = "photos/2024/";
 * req.source_backend = backend_id::local();
 * req.destination_backend = backend_id::object_storage("conn-1");
 * auto id = scheduler.enqueue(req);
 * @endcode
 */
struct transfer_request {
    /// Caller-chosen id; generated when absent
    std::optional<transfer_id> id;
    transfer_kind kind = transfer_kind::copy;
    std::vector<std::string> sources;
    std::string destination;
    backend_id source_backend;
    backend_id destination_backend;

    /// Password and cipher settings for object storage; never persisted
    std::optional<encryption_options> encryption;

    std::string label;
};

/**
 * @brief Snapshot of a scheduled transfer
 */
struct transfer_record {
    using time_point = std::chrono::system_clock::time_point;

    transfer_id id;
    transfer_kind kind = transfer_kind::copy;
    transfer_status status = transfer_status::queued;

    std::vector<std::string> sources;
    std::string destination;
    backend_id source_backend;
    backend_id destination_backend;
    std::optional<encryption_options> encryption;
    std::string label;

    std::optional<progress_event> progress;
    std::optional<checkpoint> resume_state;

    /// Admission order; lower is admitted first
    uint64_t priority = 0;

    /// Smoothed bytes/s of the current episode
    double speed_bps = 0.0;

    /// Set only when status == failed
    std::optional<std::string> error_message;

    time_point created_at{};
    std::optional<time_point> started_at;
    std::optional<time_point> finished_at;

    [[nodiscard]] auto is_terminal() const noexcept -> bool {
        return is_terminal_status(status);
    }

    [[nodiscard]] auto display_name() const -> std::string {
        if (!label.empty()) return label;
        if (sources.size() == 1) return sources.front();
        return std::to_string(sources.size()) + " items";
    }

    /**
     * @brief Rebuild the request that produced this record
     */
    [[nodiscard]] auto to_request() const -> transfer_request {
        transfer_request req;
        req.id = id;
        req.kind = kind;
        req.sources = sources;
        req.destination = destination;
        req.source_backend = source_backend;
        req.destination_backend = destination_backend;
        req.encryption = encryption;
        req.label = label;
        return req;
    }
};

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_CORE_TRANSFER_RECORD_H
