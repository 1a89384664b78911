/**
 * @file local_filesystem_backend.h
 * @brief Local filesystem copy, move and delete primitives
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_DISPATCH_LOCAL_FILESYSTEM_BACKEND_H
#define KCENON_TRANSFER_ORCHESTRATOR_DISPATCH_LOCAL_FILESYSTEM_BACKEND_H

#include <cstddef>
#include <memory>

#include "backend_primitives.h"
#include "kcenon/transfer_orchestrator/core/transfer_settings.h"

namespace kcenon::transfer_orchestrator {

/**
 * @brief Configuration for local_filesystem_backend
 */
struct local_backend_config {
    std::size_t chunk_size = 1024 * 1024;  ///< Copy buffer size in bytes
    bool overwrite_existing = true;

    /// When set, copies are paced by settings->limiter() instead of the
    /// per-dispatch bandwidth snapshot, so limit changes apply immediately.
    std::shared_ptr<transfer_settings> live_settings;
};

/**
 * @brief Local filesystem primitive
 *
 * Each source (file or directory) lands in the destination directory under
 * its own name. Cancel is observed between chunks and removes the partial
 * file. Pause is observed before every file, including files inside a
 * directory source, and yields a checkpoint listing the finished sources
 * and files; those are skipped on resume. Move tries a rename first and
 * falls back to copy plus delete across devices. With overwrite_existing
 * off, an existing target fails the copy or move.
 *
 * cancel() and request_pause() only reach a call that is running for the
 * id; a signal sent while none is running is dropped.
 */
class local_filesystem_backend : public local_filesystem_operations {
public:
    explicit local_filesystem_backend(local_backend_config config = {});
    ~local_filesystem_backend() override;

    local_filesystem_backend(const local_filesystem_backend&) = delete;
    auto operator=(const local_filesystem_backend&) -> local_filesystem_backend& = delete;

    auto copy(const execution_context& ctx) -> execution_outcome override;
    auto move(const execution_context& ctx) -> execution_outcome override;
    auto remove(const transfer_id& id, const std::vector<std::string>& paths)
        -> execution_outcome override;

    void cancel(const transfer_id& id) override;
    void request_pause(const transfer_id& id) override;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_DISPATCH_LOCAL_FILESYSTEM_BACKEND_H
