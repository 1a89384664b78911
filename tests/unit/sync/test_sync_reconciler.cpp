/**
 * @file test_sync_reconciler.cpp
 * @brief Unit tests for sync selection, plan building and execution
 */

#include "unit/test_fixtures.h"

#include <algorithm>

namespace kcenon::transfer_orchestrator::test {

/**
 * @brief tree_differ that replays a fixed list of entries
 */
class scripted_differ : public tree_differ {
public:
    auto diff(const transfer_id& id, const sync_location&, const sync_location&,
              const sync_options&, const sync_event_callback& on_event)
        -> result<sync_summary> override {
        ++diff_calls;
        if (failure) {
            return unexpected{*failure};
        }
        sync_summary summary;
        for (const auto& entry : entries) {
            if (cancelled.count(id.to_string()) != 0) {
                return unexpected{error{error_code::operation_cancelled, "diff cancelled"}};
            }
            switch (entry.classification) {
                case sync_classification::new_entry: ++summary.new_count; break;
                case sync_classification::modified: ++summary.modified; break;
                case sync_classification::deleted: ++summary.deleted; break;
                case sync_classification::same: ++summary.same; break;
            }
            ++summary.total;
            if (on_event) {
                on_event(sync_event{entry});
            }
        }
        if (on_event) {
            on_event(sync_event{summary});
        }
        return summary;
    }

    void cancel(const transfer_id& id) override { cancelled.insert(id.to_string()); }

    std::vector<sync_entry> entries;
    std::optional<error> failure;
    std::unordered_set<std::string> cancelled;
    int diff_calls = 0;
};

class SyncReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        differ_ = std::make_shared<scripted_differ>();
        add("a/new1.txt", sync_classification::new_entry);
        add("new2.txt", sync_classification::new_entry);
        add("docs/mod.txt", sync_classification::modified);
        add("old/gone.txt", sync_classification::deleted);
        for (int i = 0; i < 10; ++i) {
            add("same" + std::to_string(i), sync_classification::same);
        }

        pool_ = std::make_shared<manual_pool>();
        dispatcher_ = std::make_shared<backend_dispatcher>(fakes_.set());
        auto built = transfer_scheduler::builder()
                         .with_dispatcher(dispatcher_)
                         .with_settings(std::make_shared<transfer_settings>(0, 2))
                         .with_thread_pool(pool_)
                         .build();
        ASSERT_TRUE(built.has_value()) << built.error().message;
        scheduler_.emplace(std::move(built).value());
    }

    void add(const std::string& path, sync_classification classification) {
        sync_entry entry;
        entry.relative_path = path;
        entry.classification = classification;
        differ_->entries.push_back(entry);
    }

    auto collect(sync_reconciler& reconciler) -> sync_summary {
        auto summary = reconciler.collect(transfer_id::generate(), source_, destination_, {});
        if (!summary) {
            ADD_FAILURE() << "collect failed: " << summary.error().message;
            return {};
        }
        return summary.value();
    }

    static auto labels(const sync_plan& plan) -> std::vector<std::string> {
        std::vector<std::string> out;
        for (const auto& copy : plan.copies) {
            out.push_back(copy.label);
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    std::shared_ptr<scripted_differ> differ_;
    sync_location source_{backend_id::local(), "/src"};
    sync_location destination_{backend_id::object_storage("conn-1"), "bucket/backup/"};

    fake_backends fakes_;
    std::shared_ptr<manual_pool> pool_;
    std::shared_ptr<backend_dispatcher> dispatcher_;
    std::optional<transfer_scheduler> scheduler_;
};

// ============================================================================
// Collection and selection
// ============================================================================

TEST_F(SyncReconcilerTest, CollectKeepsEntriesAndSummary) {
    sync_reconciler reconciler(differ_);
    std::size_t forwarded = 0;
    auto summary = reconciler.collect(transfer_id::generate(), source_, destination_, {},
                                      [&](const sync_event&) { ++forwarded; });

    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().total, 14u);
    EXPECT_EQ(reconciler.entries().size(), 14u);
    ASSERT_TRUE(reconciler.summary().has_value());
    EXPECT_EQ(reconciler.summary()->new_count, 2u);
    EXPECT_EQ(forwarded, 15u);
}

TEST_F(SyncReconcilerTest, DefaultSelectionSkipsSame) {
    sync_reconciler reconciler(differ_);
    collect(reconciler);

    EXPECT_EQ(reconciler.selected_entries().size(), 4u);
    EXPECT_TRUE(reconciler.is_selected("a/new1.txt"));
    EXPECT_TRUE(reconciler.is_selected("old/gone.txt"));
    EXPECT_FALSE(reconciler.is_selected("same3"));
}

TEST_F(SyncReconcilerTest, SelectionByPathAndClassification) {
    sync_reconciler reconciler(differ_);
    collect(reconciler);

    reconciler.clear_selection();
    EXPECT_TRUE(reconciler.selected_entries().empty());

    reconciler.select(sync_classification::same);
    EXPECT_EQ(reconciler.selected_entries().size(), 10u);
    reconciler.deselect(sync_classification::same);

    ASSERT_TRUE(reconciler.select("docs/mod.txt").has_value());
    EXPECT_TRUE(reconciler.is_selected("docs/mod.txt"));
    ASSERT_TRUE(reconciler.select("docs/mod.txt", false).has_value());
    EXPECT_FALSE(reconciler.is_selected("docs/mod.txt"));

    auto missing = reconciler.select("not/there.txt");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::invalid_request);

    reconciler.select_all();
    EXPECT_EQ(reconciler.selected_entries().size(), 14u);
    reconciler.select_defaults();
    EXPECT_EQ(reconciler.selected_entries().size(), 4u);
}

TEST_F(SyncReconcilerTest, RecollectResetsSelection) {
    sync_reconciler reconciler(differ_);
    collect(reconciler);
    reconciler.select_all();

    collect(reconciler);
    EXPECT_EQ(reconciler.entries().size(), 14u);
    EXPECT_EQ(reconciler.selected_entries().size(), 4u);
}

TEST_F(SyncReconcilerTest, FailedDiffLeavesNothingSelected) {
    differ_->failure = error{error_code::invalid_file_path, "not a directory: /src"};
    sync_reconciler reconciler(differ_);

    auto summary = reconciler.collect(transfer_id::generate(), source_, destination_, {});
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::invalid_file_path);
    EXPECT_FALSE(reconciler.summary().has_value());
    EXPECT_TRUE(reconciler.selected_entries().empty());
    EXPECT_TRUE(reconciler.build_plan(sync_direction::source_to_destination).copies.empty());
}

TEST_F(SyncReconcilerTest, CancelIsForwardedToDiffer) {
    sync_reconciler reconciler(differ_);
    auto id = transfer_id::generate();
    reconciler.cancel(id);

    auto summary = reconciler.collect(id, source_, destination_, {});
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::operation_cancelled);
}

TEST_F(SyncReconcilerTest, MissingDifferIsConfigurationError) {
    sync_reconciler reconciler(nullptr);
    auto summary = reconciler.collect(transfer_id::generate(), source_, destination_, {});
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::invalid_configuration);
}

// ============================================================================
// Plan building
// ============================================================================

TEST_F(SyncReconcilerTest, ForwardPlanCopiesAndDeletes) {
    sync_reconciler reconciler(differ_);
    collect(reconciler);

    auto plan = reconciler.build_plan(sync_direction::source_to_destination);
    EXPECT_EQ(labels(plan),
              (std::vector<std::string>{"a/new1.txt", "docs/mod.txt", "new2.txt"}));
    EXPECT_EQ(plan.deletions.backend, destination_.backend);
    EXPECT_EQ(plan.deletions.locators, std::vector<std::string>{"bucket/backup/old/gone.txt"});

    for (const auto& copy : plan.copies) {
        EXPECT_EQ(copy.kind, transfer_kind::copy);
        EXPECT_EQ(copy.source_backend, source_.backend);
        EXPECT_EQ(copy.destination_backend, destination_.backend);
        ASSERT_EQ(copy.sources.size(), 1u);
        if (copy.label == "docs/mod.txt") {
            EXPECT_EQ(copy.sources.front(), "/src/docs/mod.txt");
            EXPECT_EQ(copy.destination, "bucket/backup/docs");
        }
        if (copy.label == "new2.txt") {
            EXPECT_EQ(copy.sources.front(), "/src/new2.txt");
            EXPECT_EQ(copy.destination, "bucket/backup/");
        }
    }
}

TEST_F(SyncReconcilerTest, ReversePlanMirrorsRoles) {
    sync_reconciler reconciler(differ_);
    collect(reconciler);

    auto plan = reconciler.build_plan(sync_direction::destination_to_source);
    EXPECT_EQ(labels(plan), (std::vector<std::string>{"docs/mod.txt", "old/gone.txt"}));
    EXPECT_EQ(plan.deletions.backend, source_.backend);
    auto deletions = plan.deletions.locators;
    std::sort(deletions.begin(), deletions.end());
    EXPECT_EQ(deletions, (std::vector<std::string>{"/src/a/new1.txt", "/src/new2.txt"}));

    for (const auto& copy : plan.copies) {
        EXPECT_EQ(copy.source_backend, destination_.backend);
        EXPECT_EQ(copy.destination_backend, source_.backend);
        if (copy.label == "old/gone.txt") {
            EXPECT_EQ(copy.sources.front(), "bucket/backup/old/gone.txt");
            EXPECT_EQ(copy.destination, "/src/old");
        }
    }
}

TEST_F(SyncReconcilerTest, DeletionsOnlyForSelectedEntries) {
    sync_reconciler reconciler(differ_);
    collect(reconciler);
    reconciler.deselect(sync_classification::deleted);

    auto plan = reconciler.build_plan(sync_direction::source_to_destination);
    EXPECT_EQ(plan.copies.size(), 3u);
    EXPECT_TRUE(plan.deletions.locators.empty());
}

TEST_F(SyncReconcilerTest, SelectedSameEntriesAreNotCopied) {
    sync_reconciler reconciler(differ_);
    collect(reconciler);
    reconciler.clear_selection();
    reconciler.select(sync_classification::same);

    EXPECT_TRUE(reconciler.build_plan(sync_direction::source_to_destination).empty());
    EXPECT_TRUE(reconciler.build_plan(sync_direction::destination_to_source).empty());
}

TEST_F(SyncReconcilerTest, PlanBeforeCollectIsEmpty) {
    sync_reconciler reconciler(differ_);
    EXPECT_TRUE(reconciler.build_plan(sync_direction::source_to_destination).empty());
}

TEST_F(SyncReconcilerTest, JoinLocator) {
    EXPECT_EQ(join_locator("/root", "a/b"), "/root/a/b");
    EXPECT_EQ(join_locator("/root/", "a/b"), "/root/a/b");
    EXPECT_EQ(join_locator("/root", ""), "/root");
    EXPECT_EQ(join_locator("", "a"), "a");
}

// ============================================================================
// Execution
// ============================================================================

TEST_F(SyncReconcilerTest, NewAndModifiedBecomeQueuedTransfers) {
    sync_reconciler reconciler(differ_);
    collect(reconciler);
    reconciler.clear_selection();
    reconciler.select(sync_classification::new_entry);
    reconciler.select(sync_classification::modified);

    auto plan = reconciler.build_plan(sync_direction::source_to_destination);
    auto done = reconciler.execute(plan, *scheduler_, *dispatcher_);
    ASSERT_TRUE(done.has_value()) << done.error().message;
    EXPECT_EQ(done.value().enqueued.size(), 3u);
    EXPECT_EQ(done.value().deleted, 0u);

    auto records = scheduler_->records();
    ASSERT_EQ(records.size(), 3u);
    for (const auto& id : done.value().enqueued) {
        auto record = scheduler_->get(id);
        ASSERT_TRUE(record.has_value());
        EXPECT_EQ(record.value().destination_backend, destination_.backend);
    }
    EXPECT_EQ(fakes_.object_storage->call_count(), 0u);
}

TEST_F(SyncReconcilerTest, ExecuteIssuesDeletions) {
    sync_reconciler reconciler(differ_);
    collect(reconciler);

    auto plan = reconciler.build_plan(sync_direction::source_to_destination);
    auto done = reconciler.execute(plan, *scheduler_, *dispatcher_);
    ASSERT_TRUE(done.has_value()) << done.error().message;
    EXPECT_EQ(done.value().enqueued.size(), 3u);
    EXPECT_EQ(done.value().deleted, 1u);

    auto calls = fakes_.object_storage->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].method, "delete_objects");
    EXPECT_EQ(calls[0].handle, "conn-1");
    EXPECT_EQ(calls[0].paths, std::vector<std::string>{"bucket/backup/old/gone.txt"});
}

TEST_F(SyncReconcilerTest, ReverseExecutionRemovesLocalFiles) {
    sync_reconciler reconciler(differ_);
    collect(reconciler);

    auto plan = reconciler.build_plan(sync_direction::destination_to_source);
    auto done = reconciler.execute(plan, *scheduler_, *dispatcher_);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().enqueued.size(), 2u);
    EXPECT_EQ(done.value().deleted, 2u);

    auto calls = fakes_.local->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].method, "remove");
    EXPECT_EQ(calls[0].paths.size(), 2u);
}

TEST_F(SyncReconcilerTest, DeletionFailureIsReported) {
    fakes_.object_storage->script = [](const fake_primitive_base::call&) -> execution_outcome {
        return backend_error::io("access denied");
    };
    sync_reconciler reconciler(differ_);
    collect(reconciler);
    reconciler.deselect(sync_classification::new_entry);
    reconciler.deselect(sync_classification::modified);

    auto done = reconciler.execute(reconciler.build_plan(sync_direction::source_to_destination),
                                   *scheduler_, *dispatcher_);
    ASSERT_FALSE(done.has_value());
    EXPECT_EQ(done.error().code, error_code::file_write_error);
    EXPECT_EQ(done.error().message, "access denied");
}

TEST_F(SyncReconcilerTest, RejectedCopyStopsExecution) {
    sync_plan plan;
    transfer_request good;
    good.sources = {"/src/a"};
    good.destination = "/dst";
    good.label = "a";
    transfer_request unroutable = good;
    unroutable.destination_backend = backend_id::archive("/x.zip");
    unroutable.label = "b";
    transfer_request never = good;
    never.label = "c";
    plan.copies = {good, unroutable, never};
    plan.deletions.backend = backend_id::local();
    plan.deletions.locators = {"/dst/stale"};

    sync_reconciler reconciler(differ_);
    auto done = reconciler.execute(plan, *scheduler_, *dispatcher_);
    ASSERT_FALSE(done.has_value());
    EXPECT_EQ(done.error().code, error_code::unsupported_route);

    // The first copy stays queued and no deletion was issued
    EXPECT_EQ(scheduler_->records().size(), 1u);
    EXPECT_EQ(fakes_.local->call_count(), 0u);
}

TEST_F(SyncReconcilerTest, EmptyPlanDoesNothing) {
    sync_reconciler reconciler(differ_);
    auto done = reconciler.execute(sync_plan{}, *scheduler_, *dispatcher_);
    ASSERT_TRUE(done.has_value());
    EXPECT_TRUE(done.value().enqueued.empty());
    EXPECT_EQ(done.value().deleted, 0u);
}

}  // namespace kcenon::transfer_orchestrator::test
