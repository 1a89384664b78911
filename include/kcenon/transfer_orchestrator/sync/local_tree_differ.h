/**
 * @file local_tree_differ.h
 * @brief tree_differ over two local directories
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_SYNC_LOCAL_TREE_DIFFER_H
#define KCENON_TRANSFER_ORCHESTRATOR_SYNC_LOCAL_TREE_DIFFER_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "tree_differ.h"

namespace kcenon::transfer_orchestrator {

/**
 * @brief Compares two local directory trees
 *
 * Regular files are collected recursively; symlinked directories are not
 * followed and unreadable directories are skipped. In checksum mode each file
 * gets an MD5 etag when the library is built with OpenSSL; otherwise etags
 * stay empty and the comparison falls back to sizes. Entries are emitted in
 * path order, source-side paths first, with a progress event every
 * progress_interval entries.
 */
class local_tree_differ : public tree_differ {
public:
    static constexpr uint32_t progress_interval = 100;

    local_tree_differ();
    ~local_tree_differ() override;

    local_tree_differ(const local_tree_differ&) = delete;
    auto operator=(const local_tree_differ&) -> local_tree_differ& = delete;

    [[nodiscard]] auto diff(const transfer_id& id,
                            const sync_location& source,
                            const sync_location& destination,
                            const sync_options& options,
                            const sync_event_callback& on_event)
        -> result<sync_summary> override;

    void cancel(const transfer_id& id) override;

    /**
     * @brief Lowercase hex MD5 of a file, or nullopt when unavailable
     */
    [[nodiscard]] static auto file_md5(const std::filesystem::path& path)
        -> std::optional<std::string>;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_SYNC_LOCAL_TREE_DIFFER_H
