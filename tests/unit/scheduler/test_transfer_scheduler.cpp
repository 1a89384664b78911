/**
 * @file test_transfer_scheduler.cpp
 * @brief Unit tests for queueing, admission, lifecycle and persistence
 */

#include "unit/test_fixtures.h"

#include <stdexcept>
#include <thread>

namespace kcenon::transfer_orchestrator::test {

class TransferSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = std::make_shared<manual_pool>();
        settings_ = std::make_shared<transfer_settings>(0, 2);
        dispatcher_ = std::make_shared<backend_dispatcher>(fakes_.set());
        build();
    }

    void build(std::shared_ptr<checkpoint_store> store = nullptr) {
        scheduler_.reset();
        auto b = transfer_scheduler::builder();
        b.with_dispatcher(dispatcher_).with_settings(settings_).with_thread_pool(pool_);
        if (store) {
            b.with_checkpoint_store(std::move(store));
        }
        auto built = b.build();
        ASSERT_TRUE(built.has_value()) << built.error().message;
        scheduler_.emplace(std::move(built).value());
    }

    auto sched() -> transfer_scheduler& { return *scheduler_; }

    auto enqueue(const transfer_request& req) -> transfer_id {
        auto id = sched().enqueue(req);
        if (!id) {
            ADD_FAILURE() << "enqueue failed: " << id.error().message;
            return {};
        }
        return id.value();
    }

    auto enqueue_copy(const std::string& source) -> transfer_id {
        return enqueue(local_copy_request({source}));
    }

    auto status_of(const transfer_id& id) -> transfer_status {
        auto record = sched().get(id);
        if (!record) {
            ADD_FAILURE() << "missing record " << id.to_string();
            return transfer_status::failed;
        }
        return record.value().status;
    }

    auto limit_to(std::size_t value) -> void {
        ASSERT_TRUE(settings_->set_max_concurrent(value).has_value());
    }

    fake_backends fakes_;
    std::shared_ptr<manual_pool> pool_;
    std::shared_ptr<transfer_settings> settings_;
    std::shared_ptr<backend_dispatcher> dispatcher_;
    std::optional<transfer_scheduler> scheduler_;
};

// ============================================================================
// Builder
// ============================================================================

TEST_F(TransferSchedulerTest, BuilderRequiresDispatcher) {
    auto built = transfer_scheduler::builder().build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(TransferSchedulerTest, BuilderDefaultsRunTransfers) {
    auto built = transfer_scheduler::builder().with_dispatcher(dispatcher_).build();
    ASSERT_TRUE(built.has_value());
    auto& scheduler = built.value();

    ASSERT_NE(scheduler.settings(), nullptr);
    EXPECT_EQ(scheduler.settings()->max_concurrent(),
              transfer_settings::default_max_concurrent);

    auto id = scheduler.enqueue(local_copy_request({"/src/a"}));
    ASSERT_TRUE(id.has_value());
    auto status = scheduler.wait_for(id.value(), 5s);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status.value(), transfer_status::completed);
}

// ============================================================================
// Enqueue
// ============================================================================

TEST_F(TransferSchedulerTest, EnqueueRejectsMalformedRequests) {
    auto no_sources = local_copy_request({});
    auto empty_source = local_copy_request({"/a", ""});
    auto no_destination = local_copy_request({"/a"}, "");
    auto null_id = local_copy_request({"/a"});
    null_id.id = transfer_id{};

    for (const auto& req : {no_sources, empty_source, no_destination, null_id}) {
        auto result = sched().enqueue(req);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, error_code::invalid_request);
    }
    EXPECT_TRUE(sched().records().empty());
}

TEST_F(TransferSchedulerTest, EnqueueRejectsUnroutableRequests) {
    auto req = local_copy_request({"/a"});
    req.source_backend = backend_id::archive("/a.zip");

    auto result = sched().enqueue(req);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::unsupported_route);
    EXPECT_EQ(result.error().message, "no route for copy archive:/a.zip -> local");
}

TEST_F(TransferSchedulerTest, EnqueueRejectsDuplicateId) {
    auto req = local_copy_request({"/a"});
    req.id = transfer_id::generate();

    auto first = sched().enqueue(req);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), *req.id);

    auto second = sched().enqueue(req);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::transfer_already_exists);
    EXPECT_EQ(sched().records().size(), 1u);
}

TEST_F(TransferSchedulerTest, EnqueueCopiesRequestIntoRecord) {
    auto req = upload_request({"/photos/a.jpg", "/photos/b.jpg"}, "conn-9");
    req.label = "holiday";

    auto id = enqueue(req);
    auto record = sched().get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record.value().id, id);
    EXPECT_EQ(record.value().sources, req.sources);
    EXPECT_EQ(record.value().destination, req.destination);
    EXPECT_EQ(record.value().destination_backend, backend_id::object_storage("conn-9"));
    EXPECT_EQ(record.value().label, "holiday");
    EXPECT_NE(record.value().created_at, transfer_record::time_point{});
}

// ============================================================================
// Admission
// ============================================================================

TEST_F(TransferSchedulerTest, AdmitsUpToLimit) {
    auto a = enqueue_copy("/a");
    auto b = enqueue_copy("/b");
    auto c = enqueue_copy("/c");

    EXPECT_EQ(status_of(a), transfer_status::running);
    EXPECT_EQ(status_of(b), transfer_status::running);
    EXPECT_EQ(status_of(c), transfer_status::queued);
    EXPECT_EQ(sched().running().size(), 2u);
    EXPECT_EQ(sched().queued().size(), 1u);
    EXPECT_EQ(pool_->pending_tasks("dispatch"), 2u);
    EXPECT_EQ(sched().aggregate().running_count, 2u);
}

TEST_F(TransferSchedulerTest, CompletionAdmitsNext) {
    auto a = enqueue_copy("/a");
    enqueue_copy("/b");
    auto c = enqueue_copy("/c");

    ASSERT_TRUE(pool_->run_next());

    EXPECT_EQ(status_of(a), transfer_status::completed);
    EXPECT_EQ(status_of(c), transfer_status::running);
    EXPECT_EQ(pool_->pending_tasks(), 2u);

    pool_->run_all();
    for (const auto& record : sched().records()) {
        EXPECT_EQ(record.status, transfer_status::completed);
        EXPECT_TRUE(record.finished_at.has_value());
    }
    EXPECT_EQ(fakes_.local->call_count(), 3u);
    EXPECT_EQ(sched().aggregate().running_count, 0u);
}

TEST_F(TransferSchedulerTest, PrioritiesStrictlyIncrease) {
    std::vector<transfer_id> ids;
    for (int i = 0; i < 20; ++i) {
        ids.push_back(enqueue_copy("/f" + std::to_string(i)));
    }

    auto records = sched().records();
    ASSERT_EQ(records.size(), ids.size());
    for (size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].id, ids[i]);
        if (i > 0) {
            EXPECT_GT(records[i].priority, records[i - 1].priority);
        }
    }
}

TEST_F(TransferSchedulerTest, RaisingLimitAdmitsMore) {
    limit_to(1);
    enqueue_copy("/a");
    enqueue_copy("/b");
    enqueue_copy("/c");
    EXPECT_EQ(sched().running().size(), 1u);

    limit_to(3);
    EXPECT_EQ(sched().running().size(), 3u);
    EXPECT_EQ(pool_->pending_tasks(), 3u);
}

TEST_F(TransferSchedulerTest, LoweringLimitLetsRunningFinish) {
    enqueue_copy("/a");
    enqueue_copy("/b");
    auto c = enqueue_copy("/c");

    limit_to(1);
    EXPECT_EQ(sched().running().size(), 2u);

    // One slot frees, but two are still over the new limit of one
    ASSERT_TRUE(pool_->run_next());
    EXPECT_EQ(status_of(c), transfer_status::queued);

    ASSERT_TRUE(pool_->run_next());
    EXPECT_EQ(status_of(c), transfer_status::running);
}

TEST_F(TransferSchedulerTest, BandwidthIsSnapshotAtAdmission) {
    settings_->set_bandwidth_limit(4096);
    enqueue_copy("/a");
    settings_->set_bandwidth_limit(1);

    pool_->run_all();

    auto calls = fakes_.local->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].ctx.bandwidth_limit, 4096u);
}

// ============================================================================
// Cancel, pause, resume
// ============================================================================

TEST_F(TransferSchedulerTest, CancelQueuedIsImmediate) {
    limit_to(1);
    auto a = enqueue_copy("/a");
    auto b = enqueue_copy("/b");

    ASSERT_TRUE(sched().cancel(b).has_value());

    auto record = sched().get(b);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record.value().status, transfer_status::cancelled);
    EXPECT_TRUE(record.value().finished_at.has_value());

    pool_->run_all();
    EXPECT_EQ(status_of(a), transfer_status::completed);
    auto calls = fakes_.local->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].ctx.id, a);
}

TEST_F(TransferSchedulerTest, CancelRunningBeforeStartSkipsBackend) {
    auto a = enqueue_copy("/a");
    ASSERT_TRUE(sched().cancel(a).has_value());

    // Cancel is a request; the record settles when its task runs
    EXPECT_EQ(status_of(a), transfer_status::running);

    pool_->run_all();
    EXPECT_EQ(status_of(a), transfer_status::cancelled);
    EXPECT_EQ(fakes_.local->call_count(), 0u);
}

TEST_F(TransferSchedulerTest, BackendCancellationEndsCancelled) {
    fakes_.local->script = [](const fake_primitive_base::call&) -> execution_outcome {
        return backend_error::cancelled();
    };
    auto a = enqueue_copy("/a");

    pool_->run_all();
    auto record = sched().get(a);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record.value().status, transfer_status::cancelled);
    EXPECT_FALSE(record.value().error_message.has_value());
}

TEST_F(TransferSchedulerTest, PauseAndResumeCarryCheckpoint) {
    fakes_.local->script = [](const fake_primitive_base::call& c) -> execution_outcome {
        if (c.ctx.resume_from) {
            return transfer_completed{};
        }
        checkpoint cp;
        cp.files_completed = {"/a"};
        cp.bytes_done = 30;
        cp.bytes_total = 90;
        cp.files_done = 1;
        cp.files_total = 3;
        return cp;
    };
    auto id = enqueue(local_copy_request({"/a", "/b", "/c"}));

    pool_->run_all();

    auto paused = sched().get(id);
    ASSERT_TRUE(paused.has_value());
    EXPECT_EQ(paused.value().status, transfer_status::paused);
    ASSERT_TRUE(paused.value().resume_state.has_value());
    EXPECT_EQ(paused.value().resume_state->files_completed, std::vector<std::string>{"/a"});
    ASSERT_TRUE(paused.value().progress.has_value());
    EXPECT_EQ(paused.value().progress->bytes_done, 30u);
    EXPECT_EQ(paused.value().progress->bytes_total, 90u);
    EXPECT_FALSE(paused.value().finished_at.has_value());
    EXPECT_EQ(sched().paused().size(), 1u);

    auto old_priority = paused.value().priority;
    ASSERT_TRUE(sched().resume(id).has_value());

    auto resumed = sched().get(id);
    ASSERT_TRUE(resumed.has_value());
    EXPECT_EQ(resumed.value().status, transfer_status::running);
    EXPECT_GT(resumed.value().priority, old_priority);
    // Progress starts from the checkpoint, not from zero
    ASSERT_TRUE(resumed.value().progress.has_value());
    EXPECT_EQ(resumed.value().progress->bytes_done, 30u);
    EXPECT_EQ(sched().aggregate().bytes_done, 30u);

    pool_->run_all();
    auto done = sched().get(id);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().status, transfer_status::completed);
    EXPECT_FALSE(done.value().resume_state.has_value());

    auto calls = fakes_.local->calls();
    ASSERT_EQ(calls.size(), 2u);
    ASSERT_TRUE(calls[1].ctx.resume_from.has_value());
    EXPECT_EQ(calls[1].ctx.resume_from->bytes_done, 30u);
}

TEST_F(TransferSchedulerTest, PauseRunningBeforeStartGivesEmptyCheckpoint) {
    auto id = enqueue_copy("/a");
    ASSERT_TRUE(sched().pause(id).has_value());

    pool_->run_all();

    auto record = sched().get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record.value().status, transfer_status::paused);
    ASSERT_TRUE(record.value().resume_state.has_value());
    EXPECT_EQ(*record.value().resume_state, checkpoint{});
    EXPECT_EQ(fakes_.local->call_count(), 0u);
}

TEST_F(TransferSchedulerTest, ResumeGoesToBackOfQueue) {
    limit_to(1);
    auto a = enqueue_copy("/a");
    ASSERT_TRUE(sched().pause(a).has_value());
    auto b = enqueue_copy("/b");

    ASSERT_TRUE(pool_->run_next());  // a pauses, b is admitted
    EXPECT_EQ(status_of(a), transfer_status::paused);
    EXPECT_EQ(status_of(b), transfer_status::running);

    auto c = enqueue_copy("/c");
    ASSERT_TRUE(sched().resume(a).has_value());

    auto queue = sched().queued();
    ASSERT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue[0].id, c);
    EXPECT_EQ(queue[1].id, a);
}

TEST_F(TransferSchedulerTest, InvalidTransitionsAreRejected) {
    limit_to(1);
    auto running = enqueue_copy("/a");
    auto queued = enqueue_copy("/b");

    auto pause_queued = sched().pause(queued);
    ASSERT_FALSE(pause_queued.has_value());
    EXPECT_EQ(pause_queued.error().code, error_code::invalid_state_transition);
    EXPECT_EQ(pause_queued.error().message, "cannot pause a queued transfer");

    auto resume_running = sched().resume(running);
    ASSERT_FALSE(resume_running.has_value());
    EXPECT_EQ(resume_running.error().code, error_code::invalid_state_transition);

    ASSERT_TRUE(sched().pause(running).has_value());
    ASSERT_TRUE(pool_->run_next());
    ASSERT_EQ(status_of(running), transfer_status::paused);

    auto cancel_paused = sched().cancel(running);
    ASSERT_FALSE(cancel_paused.has_value());
    EXPECT_EQ(cancel_paused.error().message, "cannot cancel a paused transfer");

    pool_->run_all();
    ASSERT_EQ(status_of(queued), transfer_status::completed);

    auto cancel_done = sched().cancel(queued);
    ASSERT_FALSE(cancel_done.has_value());
    EXPECT_EQ(cancel_done.error().message, "cannot cancel a completed transfer");

    auto pause_done = sched().pause(queued);
    ASSERT_FALSE(pause_done.has_value());
    EXPECT_EQ(pause_done.error().code, error_code::invalid_state_transition);
}

TEST_F(TransferSchedulerTest, UnknownIdIsNotFound) {
    auto id = transfer_id::generate();

    EXPECT_EQ(sched().cancel(id).error().code, error_code::transfer_not_found);
    EXPECT_EQ(sched().pause(id).error().code, error_code::transfer_not_found);
    EXPECT_EQ(sched().resume(id).error().code, error_code::transfer_not_found);
    EXPECT_EQ(sched().move_up(id).error().code, error_code::transfer_not_found);
    EXPECT_EQ(sched().move_down(id).error().code, error_code::transfer_not_found);
    EXPECT_EQ(sched().dismiss(id).error().code, error_code::transfer_not_found);
    EXPECT_EQ(sched().get(id).error().code, error_code::transfer_not_found);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(TransferSchedulerTest, BackendFailureRecordsMessage) {
    fakes_.local->script = [](const fake_primitive_base::call&) -> execution_outcome {
        return backend_error::io("disk full");
    };
    auto id = enqueue_copy("/a");

    pool_->run_all();

    auto record = sched().get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record.value().status, transfer_status::failed);
    EXPECT_EQ(record.value().error_message, std::optional<std::string>("disk full"));
    EXPECT_TRUE(record.value().finished_at.has_value());
}

TEST_F(TransferSchedulerTest, BackendExceptionFailsTransfer) {
    fakes_.local->script = [](const fake_primitive_base::call&) -> execution_outcome {
        throw std::runtime_error("boom");
    };
    auto a = enqueue_copy("/a");
    auto b = enqueue_copy("/b");

    pool_->run_all();

    for (const auto& id : {a, b}) {
        auto record = sched().get(id);
        ASSERT_TRUE(record.has_value());
        EXPECT_EQ(record.value().status, transfer_status::failed);
        EXPECT_EQ(record.value().error_message, std::optional<std::string>("boom"));
    }
    EXPECT_EQ(dispatcher_->in_flight(), 0u);
}

TEST_F(TransferSchedulerTest, NonStandardExceptionFailsTransfer) {
    fakes_.local->script = [](const fake_primitive_base::call&) -> execution_outcome {
        throw 42;
    };
    auto id = enqueue_copy("/a");

    pool_->run_all();

    auto record = sched().get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record.value().status, transfer_status::failed);
    EXPECT_EQ(record.value().error_message, std::optional<std::string>("unknown exception"));
    EXPECT_EQ(sched().running().size(), 0u);
    EXPECT_EQ(dispatcher_->in_flight(), 0u);
}

// ============================================================================
// Reordering and dismissal
// ============================================================================

TEST_F(TransferSchedulerTest, MoveUpAndDownReorderQueue) {
    limit_to(1);
    auto a = enqueue_copy("/a");
    auto b = enqueue_copy("/b");
    auto c = enqueue_copy("/c");
    auto d = enqueue_copy("/d");

    ASSERT_TRUE(sched().move_up(d).has_value());    // b d c
    ASSERT_TRUE(sched().move_down(b).has_value());  // d b c
    ASSERT_TRUE(sched().move_up(d).has_value());    // already first
    ASSERT_TRUE(sched().move_down(c).has_value());  // already last

    auto queue = sched().queued();
    ASSERT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue[0].id, d);
    EXPECT_EQ(queue[1].id, b);
    EXPECT_EQ(queue[2].id, c);

    pool_->run_all();

    std::vector<transfer_id> order;
    for (const auto& call : fakes_.local->calls()) {
        order.push_back(call.ctx.id);
    }
    EXPECT_EQ(order, (std::vector<transfer_id>{a, d, b, c}));
}

TEST_F(TransferSchedulerTest, ReorderRequiresQueuedRecord) {
    auto running = enqueue_copy("/a");

    auto result = sched().move_up(running);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_state_transition);
    EXPECT_EQ(result.error().message, "cannot reorder a running transfer");
}

TEST_F(TransferSchedulerTest, DismissRules) {
    limit_to(1);
    auto running = enqueue_copy("/a");
    auto queued = enqueue_copy("/b");

    auto rejected = sched().dismiss(running);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, error_code::invalid_state_transition);

    ASSERT_TRUE(sched().dismiss(queued).has_value());
    EXPECT_FALSE(sched().get(queued).has_value());

    pool_->run_all();
    ASSERT_TRUE(sched().dismiss(running).has_value());
    EXPECT_TRUE(sched().records().empty());
    EXPECT_EQ(fakes_.local->call_count(), 1u);
}

TEST_F(TransferSchedulerTest, DismissCompletedKeepsLiveRecords) {
    fakes_.local->script = [](const fake_primitive_base::call& c) -> execution_outcome {
        if (c.ctx.sources.front() == "/fail") {
            return backend_error::io("bad");
        }
        if (c.ctx.sources.front() == "/pause") {
            return checkpoint{};
        }
        return transfer_completed{};
    };
    limit_to(4);
    enqueue_copy("/ok");
    enqueue_copy("/fail");
    auto paused = enqueue_copy("/pause");
    auto cancelled = enqueue_copy("/cancel");
    ASSERT_TRUE(sched().cancel(cancelled).has_value());
    pool_->run_all();

    limit_to(1);
    auto running = enqueue_copy("/run");
    auto queued = enqueue_copy("/queued");

    EXPECT_EQ(sched().dismiss_completed(), 3u);

    auto remaining = sched().records();
    ASSERT_EQ(remaining.size(), 3u);
    EXPECT_EQ(remaining[0].id, paused);
    EXPECT_EQ(remaining[1].id, running);
    EXPECT_EQ(remaining[2].id, queued);
    EXPECT_EQ(sched().dismiss_completed(), 0u);
}

// ============================================================================
// Progress
// ============================================================================

TEST_F(TransferSchedulerTest, ProgressNeverGoesBackwards) {
    std::vector<progress_event> seen;
    fakes_.local->script = [&](const fake_primitive_base::call& c) -> execution_outcome {
        auto snapshot = [&] {
            auto record = sched().get(c.ctx.id);
            seen.push_back(record.has_value() && record.value().progress
                               ? *record.value().progress
                               : progress_event{});
        };
        c.ctx.report(progress_event{100, 200, 1, 2, "/a"});
        snapshot();
        c.ctx.report(progress_event{50, 200, 0, 2, "/b"});
        snapshot();
        c.ctx.report(progress_event{250, 200, 2, 2, {}});
        snapshot();
        return transfer_completed{};
    };
    enqueue(local_copy_request({"/a", "/b"}));

    pool_->run_all();

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].bytes_done, 100u);
    EXPECT_EQ(seen[0].current_item, "/a");
    EXPECT_EQ(seen[1].bytes_done, 100u);
    EXPECT_EQ(seen[1].files_done, 1u);
    EXPECT_EQ(seen[1].current_item, "/b");
    EXPECT_EQ(seen[2].bytes_done, 250u);
    EXPECT_EQ(seen[2].bytes_total, 250u);
}

TEST_F(TransferSchedulerTest, AggregateTracksRunningProgress) {
    limit_to(1);
    aggregate_progress during{};
    std::string summary;
    fakes_.local->script = [&](const fake_primitive_base::call& c) -> execution_outcome {
        c.ctx.report(progress_event{512, 2048, 0, 1, {}});
        during = sched().aggregate();
        summary = sched().aggregate_summary();
        return transfer_completed{};
    };
    enqueue_copy("/a");
    EXPECT_EQ(sched().aggregate_summary(), "1 transfer, 0% 0/0");

    pool_->run_all();

    EXPECT_EQ(during.running_count, 1u);
    EXPECT_EQ(during.bytes_done, 512u);
    EXPECT_EQ(during.bytes_total, 2048u);
    EXPECT_EQ(summary, "1 transfer, 25% 512/2.0K");

    auto idle = sched().aggregate();
    EXPECT_EQ(idle.running_count, 0u);
    EXPECT_EQ(idle.bytes_done, 0u);
    EXPECT_EQ(idle.bytes_total, 0u);
    EXPECT_TRUE(sched().aggregate_summary().empty());
}

TEST_F(TransferSchedulerTest, StaleProgressIsDropped) {
    std::optional<execution_context> first_episode;
    fakes_.local->script = [&](const fake_primitive_base::call& c) -> execution_outcome {
        if (!first_episode) {
            first_episode = c.ctx;
            checkpoint cp;
            cp.bytes_done = 10;
            cp.bytes_total = 100;
            return cp;
        }
        // A late report from the paused episode must not touch the new one
        first_episode->report(progress_event{95, 100, 0, 0, {}});
        auto record = sched().get(c.ctx.id);
        EXPECT_TRUE(record.has_value() && record.value().progress &&
                    record.value().progress->bytes_done == 10u);
        return transfer_completed{};
    };
    auto id = enqueue_copy("/a");
    pool_->run_all();
    ASSERT_EQ(status_of(id), transfer_status::paused);

    // Reports while paused are dropped as well
    first_episode->report(progress_event{90, 100, 0, 0, {}});
    auto paused = sched().get(id);
    ASSERT_TRUE(paused.has_value());
    ASSERT_TRUE(paused.value().progress.has_value());
    EXPECT_EQ(paused.value().progress->bytes_done, 10u);

    ASSERT_TRUE(sched().resume(id).has_value());
    pool_->run_all();
    EXPECT_EQ(status_of(id), transfer_status::completed);
}

// ============================================================================
// Waiting and callbacks
// ============================================================================

TEST_F(TransferSchedulerTest, WaitForOutcomes) {
    auto id = enqueue_copy("/a");

    auto timed_out = sched().wait_for(id, 50ms);
    ASSERT_FALSE(timed_out.has_value());
    EXPECT_EQ(timed_out.error().code, error_code::wait_timeout);

    pool_->run_all();
    auto done = sched().wait_for(id, 50ms);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value(), transfer_status::completed);

    ASSERT_TRUE(sched().dismiss(id).has_value());
    auto gone = sched().wait_for(id, 50ms);
    ASSERT_FALSE(gone.has_value());
    EXPECT_EQ(gone.error().code, error_code::transfer_not_found);
}

TEST_F(TransferSchedulerTest, WaitForWakesOnCompletion) {
    auto id = enqueue_copy("/a");

    auto worker = std::async(std::launch::async, [this] {
        std::this_thread::sleep_for(50ms);
        pool_->run_all();
    });

    auto status = sched().wait_for(id, 5s);
    worker.get();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status.value(), transfer_status::completed);
}

TEST_F(TransferSchedulerTest, StatusCallbacksSeeEveryTransition) {
    std::vector<transfer_status> statuses;
    sched().on_status_change([](const transfer_record&) {
        throw std::runtime_error("observer failure");
    });
    sched().on_status_change([&](const transfer_record& record) {
        statuses.push_back(record.status);
    });

    auto id = enqueue_copy("/a");
    ASSERT_TRUE(sched().pause(id).has_value());
    pool_->run_all();
    ASSERT_TRUE(sched().resume(id).has_value());
    pool_->run_all();

    EXPECT_EQ(statuses, (std::vector<transfer_status>{
                            transfer_status::queued,
                            transfer_status::running,
                            transfer_status::paused,
                            transfer_status::queued,
                            transfer_status::running,
                            transfer_status::completed,
                        }));
}

// ============================================================================
// Persistence
// ============================================================================

class SchedulerPersistenceTest : public TransferSchedulerTest {
protected:
    void SetUp() override {
        TransferSchedulerTest::SetUp();
        state_dir_ = std::filesystem::temp_directory_path() /
                     ("transfer_orch_test_sched_" +
                      std::to_string(std::chrono::steady_clock::now()
                                         .time_since_epoch()
                                         .count()));
        store_ = std::make_shared<checkpoint_store>(checkpoint_store_config(state_dir_));
        build(store_);
    }

    void TearDown() override {
        scheduler_.reset();
        std::error_code ec;
        std::filesystem::remove_all(state_dir_, ec);
    }

    static auto pause_first_episode() -> fake_primitive_base::handler {
        return [](const fake_primitive_base::call& c) -> execution_outcome {
            if (c.ctx.resume_from) {
                return transfer_completed{};
            }
            checkpoint cp;
            cp.files_completed = {c.ctx.sources.front()};
            cp.bytes_done = 5;
            cp.bytes_total = 10;
            return cp;
        };
    }

    std::filesystem::path state_dir_;
    std::shared_ptr<checkpoint_store> store_;
};

TEST_F(SchedulerPersistenceTest, PauseSavesAndCompletionRemoves) {
    fakes_.local->script = pause_first_episode();
    auto id = enqueue(local_copy_request({"/a", "/b"}));
    pool_->run_all();

    ASSERT_TRUE(store_->contains(id));
    auto saved = store_->load(id);
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved.value().state.bytes_done, 5u);
    EXPECT_EQ(saved.value().request.sources, (std::vector<std::string>{"/a", "/b"}));
    auto record = sched().get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(saved.value().priority, record.value().priority);

    ASSERT_TRUE(sched().resume(id).has_value());
    pool_->run_all();

    EXPECT_EQ(status_of(id), transfer_status::completed);
    EXPECT_FALSE(store_->contains(id));
}

TEST_F(SchedulerPersistenceTest, EncryptedTransfersAreNotSaved) {
    fakes_.object_storage->script = pause_first_episode();
    auto req = upload_request({"/secret.doc"});
    req.encryption = encryption_options{};
    req.encryption->password = "pw";
    auto id = enqueue(req);

    pool_->run_all();

    EXPECT_EQ(status_of(id), transfer_status::paused);
    EXPECT_FALSE(store_->contains(id));
}

TEST_F(SchedulerPersistenceTest, DismissDropsSavedCheckpoint) {
    fakes_.local->script = pause_first_episode();
    auto id = enqueue_copy("/a");
    pool_->run_all();
    ASSERT_TRUE(store_->contains(id));

    ASSERT_TRUE(sched().dismiss(id).has_value());
    EXPECT_FALSE(store_->contains(id));
}

TEST_F(SchedulerPersistenceTest, RestorePausedRecreatesRecords) {
    auto id = transfer_id::generate();
    persisted_transfer saved;
    saved.request = local_copy_request({"/x", "/y"}, "/backup");
    saved.request.id = id;
    saved.request.label = "nightly";
    saved.state.files_completed = {"/x"};
    saved.state.bytes_done = 3;
    saved.state.bytes_total = 9;
    saved.priority = 42;
    saved.saved_at = std::chrono::system_clock::now();
    ASSERT_TRUE(store_->save(saved).has_value());

    persisted_transfer unroutable;
    unroutable.request = local_copy_request({"/z"});
    unroutable.request.id = transfer_id::generate();
    unroutable.request.source_backend = backend_id::archive("/old.zip");
    unroutable.saved_at = std::chrono::system_clock::now();
    ASSERT_TRUE(store_->save(unroutable).has_value());

    std::vector<transfer_status> notified;
    sched().on_status_change([&](const transfer_record& r) { notified.push_back(r.status); });

    auto restored = sched().restore_paused();
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored.value(), 1u);
    EXPECT_EQ(notified, std::vector<transfer_status>{transfer_status::paused});

    auto record = sched().get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record.value().status, transfer_status::paused);
    EXPECT_EQ(record.value().priority, 42u);
    EXPECT_EQ(record.value().label, "nightly");
    EXPECT_EQ(record.value().destination, "/backup");
    ASSERT_TRUE(record.value().progress.has_value());
    EXPECT_EQ(record.value().progress->bytes_done, 3u);
    EXPECT_EQ(record.value().progress->bytes_total, 9u);

    auto again = sched().restore_paused();
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again.value(), 0u);

    ASSERT_TRUE(sched().resume(id).has_value());
    pool_->run_all();

    EXPECT_EQ(status_of(id), transfer_status::completed);
    auto calls = fakes_.local->calls();
    ASSERT_EQ(calls.size(), 1u);
    ASSERT_TRUE(calls[0].ctx.resume_from.has_value());
    EXPECT_EQ(calls[0].ctx.resume_from->files_completed, std::vector<std::string>{"/x"});
}

TEST_F(TransferSchedulerTest, RestoreWithoutStoreIsConfigurationError) {
    auto restored = sched().restore_paused();
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, error_code::invalid_configuration);
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_F(SchedulerPersistenceTest, DestructionPausesRunningTransfers) {
    auto* local = fakes_.local.get();
    local->script = [local](const fake_primitive_base::call& c) -> execution_outcome {
        if (local->wait_signal(c.ctx.id) == fake_primitive_base::signal::pause) {
            checkpoint cp;
            cp.bytes_done = 7;
            return cp;
        }
        return transfer_completed{};
    };

    auto built = transfer_scheduler::builder()
                     .with_dispatcher(dispatcher_)
                     .with_settings(settings_)
                     .with_checkpoint_store(store_)
                     .build();
    ASSERT_TRUE(built.has_value());
    std::optional<transfer_scheduler> scheduler;
    scheduler.emplace(std::move(built).value());

    auto id = scheduler->enqueue(local_copy_request({"/big.iso"}));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(local->wait_calls(1));

    scheduler.reset();

    EXPECT_EQ(local->pause_requests(), 1u);
    ASSERT_TRUE(store_->contains(id.value()));
    auto saved = store_->load(id.value());
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved.value().state.bytes_done, 7u);
}

}  // namespace kcenon::transfer_orchestrator::test
