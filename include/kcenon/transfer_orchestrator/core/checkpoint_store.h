/**
 * @file checkpoint_store.h
 * @brief Persistence of paused transfers across restarts
 *
 * Each paused transfer is written as `<id>.json` under the state directory,
 * holding the request fields and the checkpoint returned by the backend.
 * Requests that carry an encryption password are never written.
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_CORE_CHECKPOINT_STORE_H
#define KCENON_TRANSFER_ORCHESTRATOR_CORE_CHECKPOINT_STORE_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "checkpoint.h"
#include "transfer_record.h"
#include "types.h"

namespace kcenon::transfer_orchestrator {

/**
 * @brief A paused transfer as stored on disk
 */
struct persisted_transfer {
    transfer_request request;
    checkpoint state;
    uint64_t priority = 0;
    std::chrono::system_clock::time_point saved_at{};
};

/**
 * @brief Configuration for checkpoint_store
 */
struct checkpoint_store_config {
    std::filesystem::path state_directory;
    std::chrono::seconds state_ttl{86400};  ///< Expiry measured from saved_at
    bool auto_cleanup = true;               ///< Drop expired files on construction

    checkpoint_store_config();
    explicit checkpoint_store_config(std::filesystem::path dir);
};

/**
 * @brief Store of paused transfers
 *
 * @code
 * checkpoint_store store({"/var/lib/app/transfers"});
 * auto saved = store.save(persisted);
 * for (auto& entry : store.list()) { ... }
 * @endcode
 */
class checkpoint_store {
public:
    explicit checkpoint_store(const checkpoint_store_config& config);
    ~checkpoint_store();

    checkpoint_store(const checkpoint_store&) = delete;
    auto operator=(const checkpoint_store&) -> checkpoint_store& = delete;
    checkpoint_store(checkpoint_store&&) noexcept;
    auto operator=(checkpoint_store&&) noexcept -> checkpoint_store&;

    /**
     * @brief Write or replace the entry for entry.request.id
     * @return invalid_request when the id is missing or the request is encrypted
     */
    [[nodiscard]] auto save(const persisted_transfer& entry) -> result<void>;

    [[nodiscard]] auto load(const transfer_id& id) -> result<persisted_transfer>;

    /**
     * @brief Delete an entry; missing entries are not an error
     */
    [[nodiscard]] auto remove(const transfer_id& id) -> result<void>;

    [[nodiscard]] auto contains(const transfer_id& id) const -> bool;

    /**
     * @brief Every readable entry in the state directory
     */
    [[nodiscard]] auto list() -> std::vector<persisted_transfer>;

    /**
     * @brief Remove entries older than the configured TTL
     * @return Number of entries removed
     */
    auto cleanup_expired() -> std::size_t;

    [[nodiscard]] auto config() const -> const checkpoint_store_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_CORE_CHECKPOINT_STORE_H
