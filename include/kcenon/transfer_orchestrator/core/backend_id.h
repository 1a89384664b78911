/**
 * @file backend_id.h
 * @brief Tagged identifier of a storage backend
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_CORE_BACKEND_ID_H
#define KCENON_TRANSFER_ORCHESTRATOR_CORE_BACKEND_ID_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace kcenon::transfer_orchestrator {

/**
 * @brief Closed set of backend kinds
 */
enum class backend_tag : uint8_t {
    local = 0,           ///< Local filesystem
    object_storage = 1,  ///< Object storage connection (bucket)
    secure_remote = 2,   ///< Secure remote filesystem session
    archive = 3,         ///< Read-only archive view
};

inline constexpr std::size_t backend_tag_count = 4;

[[nodiscard]] constexpr auto to_string(backend_tag tag) noexcept -> std::string_view {
    switch (tag) {
        case backend_tag::local: return "local";
        case backend_tag::object_storage: return "object_storage";
        case backend_tag::secure_remote: return "secure_remote";
        case backend_tag::archive: return "archive";
        default: return "unknown";
    }
}

[[nodiscard]] inline auto backend_tag_from_string(std::string_view text)
    -> std::optional<backend_tag> {
    if (text == "local") return backend_tag::local;
    if (text == "object_storage") return backend_tag::object_storage;
    if (text == "secure_remote") return backend_tag::secure_remote;
    if (text == "archive") return backend_tag::archive;
    return std::nullopt;
}

/**
 * @brief Backend identifier with the handle needed to address it
 *
 * The handle is the connection id for object storage, the session id for a
 * secure remote filesystem, and the archive file path for an archive. It is
 * empty for the local filesystem.
 */
struct backend_id {
    backend_tag tag = backend_tag::local;
    std::string handle;

    [[nodiscard]] static auto local() -> backend_id {
        return backend_id{backend_tag::local, {}};
    }

    [[nodiscard]] static auto object_storage(std::string connection_id) -> backend_id {
        return backend_id{backend_tag::object_storage, std::move(connection_id)};
    }

    [[nodiscard]] static auto secure_remote(std::string session_id) -> backend_id {
        return backend_id{backend_tag::secure_remote, std::move(session_id)};
    }

    [[nodiscard]] static auto archive(std::string archive_path) -> backend_id {
        return backend_id{backend_tag::archive, std::move(archive_path)};
    }

    [[nodiscard]] auto is_local() const noexcept -> bool {
        return tag == backend_tag::local;
    }

    /**
     * @brief Display form, e.g. "object_storage:conn-1" or "local"
     */
    [[nodiscard]] auto to_string() const -> std::string {
        std::string text(transfer_orchestrator::to_string(tag));
        if (!handle.empty()) {
            text += ':';
            text += handle;
        }
        return text;
    }

    [[nodiscard]] auto operator==(const backend_id& other) const -> bool = default;
};

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_CORE_BACKEND_ID_H
