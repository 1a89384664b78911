/**
 * @file dispatch_route.h
 * @brief Compile-time routing table from (kind, source, destination) to a route
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_DISPATCH_DISPATCH_ROUTE_H
#define KCENON_TRANSFER_ORCHESTRATOR_DISPATCH_DISPATCH_ROUTE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string_view>

#include "kcenon/transfer_orchestrator/core/backend_id.h"
#include "kcenon/transfer_orchestrator/core/transfer_types.h"

namespace kcenon::transfer_orchestrator {

/**
 * @brief Primitive sequence used for one transfer
 */
enum class dispatch_route : uint8_t {
    unsupported,
    local_copy,            ///< local -> local
    object_download,       ///< object -> local
    object_upload,         ///< local -> object (encrypted when a password is set)
    object_copy,           ///< object -> object, server side
    remote_download,       ///< remote -> local
    remote_upload,         ///< local -> remote
    staged_remote_remote,  ///< remote -> remote through a local temp dir
    staged_object_remote,  ///< object -> remote through a local temp dir
    staged_remote_object,  ///< remote -> object through a local temp dir
    archive_extract,       ///< archive -> local
};

[[nodiscard]] constexpr auto to_string(dispatch_route route) noexcept -> std::string_view {
    switch (route) {
        case dispatch_route::unsupported: return "unsupported";
        case dispatch_route::local_copy: return "local_copy";
        case dispatch_route::object_download: return "object_download";
        case dispatch_route::object_upload: return "object_upload";
        case dispatch_route::object_copy: return "object_copy";
        case dispatch_route::remote_download: return "remote_download";
        case dispatch_route::remote_upload: return "remote_upload";
        case dispatch_route::staged_remote_remote: return "staged_remote_remote";
        case dispatch_route::staged_object_remote: return "staged_object_remote";
        case dispatch_route::staged_remote_object: return "staged_remote_object";
        case dispatch_route::archive_extract: return "archive_extract";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_staged(dispatch_route route) noexcept -> bool {
    return route == dispatch_route::staged_remote_remote ||
           route == dispatch_route::staged_object_remote ||
           route == dispatch_route::staged_remote_object;
}

namespace detail {

using route_row = std::array<dispatch_route, backend_tag_count>;
using route_plane = std::array<route_row, backend_tag_count>;
using route_table = std::array<route_plane, transfer_kind_count>;

constexpr auto make_route_table() -> route_table {
    constexpr auto L = static_cast<std::size_t>(backend_tag::local);
    constexpr auto O = static_cast<std::size_t>(backend_tag::object_storage);
    constexpr auto R = static_cast<std::size_t>(backend_tag::secure_remote);
    constexpr auto A = static_cast<std::size_t>(backend_tag::archive);

    route_table table{};
    for (auto& plane : table) {
        for (auto& row : plane) {
            row.fill(dispatch_route::unsupported);
        }
    }

    // copy and move share routes; move adds the post-success delete
    for (auto kind : {transfer_kind::copy, transfer_kind::move}) {
        auto& p = table[static_cast<std::size_t>(kind)];
        p[L][L] = dispatch_route::local_copy;
        p[O][L] = dispatch_route::object_download;
        p[L][O] = dispatch_route::object_upload;
        p[O][O] = dispatch_route::object_copy;
        p[R][L] = dispatch_route::remote_download;
        p[L][R] = dispatch_route::remote_upload;
        p[R][R] = dispatch_route::staged_remote_remote;
        p[O][R] = dispatch_route::staged_object_remote;
        p[R][O] = dispatch_route::staged_remote_object;
    }

    table[static_cast<std::size_t>(transfer_kind::extract)][A][L] =
        dispatch_route::archive_extract;
    return table;
}

inline constexpr route_table routes = make_route_table();

}  // namespace detail

/**
 * @brief Look up the route for a request shape
 */
[[nodiscard]] constexpr auto resolve_route(transfer_kind kind,
                                           backend_tag source,
                                           backend_tag destination) noexcept
    -> dispatch_route {
    auto k = static_cast<std::size_t>(kind);
    auto s = static_cast<std::size_t>(source);
    auto d = static_cast<std::size_t>(destination);
    if (k >= transfer_kind_count || s >= backend_tag_count || d >= backend_tag_count) {
        return dispatch_route::unsupported;
    }
    return detail::routes[k][s][d];
}

static_assert(resolve_route(transfer_kind::copy, backend_tag::local, backend_tag::local) ==
              dispatch_route::local_copy);
static_assert(resolve_route(transfer_kind::extract, backend_tag::archive,
                            backend_tag::object_storage) == dispatch_route::unsupported);

}  // namespace kcenon::transfer_orchestrator

#endif  // KCENON_TRANSFER_ORCHESTRATOR_DISPATCH_DISPATCH_ROUTE_H
