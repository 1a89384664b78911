/**
 * @file test_dispatch_route.cpp
 * @brief Unit tests for the routing table
 */

#include <gtest/gtest.h>

#include <kcenon/transfer_orchestrator/dispatch/dispatch_route.h>

#include <string>

namespace kcenon::transfer_orchestrator::test {

class DispatchRouteTest : public ::testing::Test {
protected:
    static constexpr backend_tag all_tags[] = {
        backend_tag::local, backend_tag::object_storage,
        backend_tag::secure_remote, backend_tag::archive,
    };
    static constexpr transfer_kind all_kinds[] = {
        transfer_kind::copy, transfer_kind::move, transfer_kind::extract,
    };
};

TEST_F(DispatchRouteTest, DirectRoutes) {
    constexpr auto L = backend_tag::local;
    constexpr auto O = backend_tag::object_storage;
    constexpr auto R = backend_tag::secure_remote;

    EXPECT_EQ(resolve_route(transfer_kind::copy, L, L), dispatch_route::local_copy);
    EXPECT_EQ(resolve_route(transfer_kind::copy, O, L), dispatch_route::object_download);
    EXPECT_EQ(resolve_route(transfer_kind::copy, L, O), dispatch_route::object_upload);
    EXPECT_EQ(resolve_route(transfer_kind::copy, O, O), dispatch_route::object_copy);
    EXPECT_EQ(resolve_route(transfer_kind::copy, R, L), dispatch_route::remote_download);
    EXPECT_EQ(resolve_route(transfer_kind::copy, L, R), dispatch_route::remote_upload);
}

TEST_F(DispatchRouteTest, StagedRoutes) {
    constexpr auto O = backend_tag::object_storage;
    constexpr auto R = backend_tag::secure_remote;

    EXPECT_EQ(resolve_route(transfer_kind::copy, R, R), dispatch_route::staged_remote_remote);
    EXPECT_EQ(resolve_route(transfer_kind::copy, O, R), dispatch_route::staged_object_remote);
    EXPECT_EQ(resolve_route(transfer_kind::move, R, O), dispatch_route::staged_remote_object);
}

TEST_F(DispatchRouteTest, MoveSharesCopyRoutes) {
    for (auto src : all_tags) {
        for (auto dst : all_tags) {
            EXPECT_EQ(resolve_route(transfer_kind::copy, src, dst),
                      resolve_route(transfer_kind::move, src, dst))
                << to_string(src) << " -> " << to_string(dst);
        }
    }
}

TEST_F(DispatchRouteTest, ExtractOnlyFromArchiveToLocal) {
    for (auto src : all_tags) {
        for (auto dst : all_tags) {
            auto expected = (src == backend_tag::archive && dst == backend_tag::local)
                                ? dispatch_route::archive_extract
                                : dispatch_route::unsupported;
            EXPECT_EQ(resolve_route(transfer_kind::extract, src, dst), expected);
        }
    }
}

TEST_F(DispatchRouteTest, ArchiveIsNeverADestinationOrCopySource) {
    for (auto kind : all_kinds) {
        for (auto tag : all_tags) {
            EXPECT_EQ(resolve_route(kind, tag, backend_tag::archive),
                      dispatch_route::unsupported);
        }
    }
    EXPECT_EQ(resolve_route(transfer_kind::copy, backend_tag::archive, backend_tag::local),
              dispatch_route::unsupported);
    EXPECT_EQ(resolve_route(transfer_kind::move, backend_tag::archive, backend_tag::local),
              dispatch_route::unsupported);
}

TEST_F(DispatchRouteTest, SupportedCellCount) {
    int supported = 0;
    for (auto kind : all_kinds) {
        for (auto src : all_tags) {
            for (auto dst : all_tags) {
                if (resolve_route(kind, src, dst) != dispatch_route::unsupported) {
                    ++supported;
                }
            }
        }
    }
    EXPECT_EQ(supported, 19);
}

TEST_F(DispatchRouteTest, OutOfRangeIsUnsupported) {
    EXPECT_EQ(resolve_route(static_cast<transfer_kind>(7), backend_tag::local,
                            backend_tag::local),
              dispatch_route::unsupported);
    EXPECT_EQ(resolve_route(transfer_kind::copy, static_cast<backend_tag>(9),
                            backend_tag::local),
              dispatch_route::unsupported);
}

TEST_F(DispatchRouteTest, IsStaged) {
    EXPECT_TRUE(is_staged(dispatch_route::staged_remote_remote));
    EXPECT_TRUE(is_staged(dispatch_route::staged_object_remote));
    EXPECT_TRUE(is_staged(dispatch_route::staged_remote_object));
    EXPECT_FALSE(is_staged(dispatch_route::object_copy));
    EXPECT_FALSE(is_staged(dispatch_route::local_copy));
    EXPECT_FALSE(is_staged(dispatch_route::unsupported));
}

TEST_F(DispatchRouteTest, Names) {
    EXPECT_EQ(to_string(dispatch_route::unsupported), "unsupported");
    EXPECT_EQ(to_string(dispatch_route::object_upload), "object_upload");
    EXPECT_EQ(to_string(dispatch_route::staged_object_remote), "staged_object_remote");
    EXPECT_EQ(to_string(dispatch_route::archive_extract), "archive_extract");
}

}  // namespace kcenon::transfer_orchestrator::test
