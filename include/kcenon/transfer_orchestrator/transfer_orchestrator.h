/**
 * @file transfer_orchestrator.h
 * @brief Main header for the transfer_orchestrator library
 * @version 0.1.0
 *
 * Include this header to access the scheduler, the dispatcher, the bundled
 * local backend and the sync reconciler.
 *
 * @code
 * #include <kcenon/transfer_orchestrator/transfer_orchestrator.h>
 *
 * using namespace kcenon::transfer_orchestrator;
 *
 * backend_set backends;
 * backends.local = std::make_shared<local_filesystem_backend>();
 *
 * auto scheduler = transfer_scheduler::builder()
 *     .with_dispatcher(std::make_shared<backend_dispatcher>(backends))
 *     .build();
 * @endcode
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_TRANSFER_ORCHESTRATOR_H
#define KCENON_TRANSFER_ORCHESTRATOR_TRANSFER_ORCHESTRATOR_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/transfer_orchestrator/core/types.h"
#include "kcenon/transfer_orchestrator/core/transfer_record.h"
#include "kcenon/transfer_orchestrator/core/checkpoint_store.h"
#include "kcenon/transfer_orchestrator/core/transfer_settings.h"

// Dispatch
#include "kcenon/transfer_orchestrator/dispatch/backend_dispatcher.h"
#include "kcenon/transfer_orchestrator/dispatch/local_filesystem_backend.h"

// Scheduler
#include "kcenon/transfer_orchestrator/scheduler/transfer_scheduler.h"

// Sync
#include "kcenon/transfer_orchestrator/sync/local_tree_differ.h"
#include "kcenon/transfer_orchestrator/sync/sync_reconciler.h"

// Adapters
#include "kcenon/transfer_orchestrator/adapters/thread_pool_adapter.h"

namespace kcenon::transfer_orchestrator {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_TRANSFER_ORCHESTRATOR_H
