/**
 * @file transfer_scheduler.cpp
 * @brief Implementation of the transfer queue and admission control
 */

#include <kcenon/transfer_orchestrator/scheduler/transfer_scheduler.h>
#include <kcenon/transfer_orchestrator/core/logging.h>
#include <kcenon/transfer_orchestrator/core/speed_estimator.h>

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <sstream>
#include <unordered_map>
#include <variant>

namespace kcenon::transfer_orchestrator {

namespace {

auto progress_from(const checkpoint& cp) -> progress_event {
    progress_event progress;
    progress.bytes_done = cp.bytes_done;
    progress.bytes_total = std::max(cp.bytes_total, cp.bytes_done);
    progress.files_done = cp.files_done;
    progress.files_total = std::max(cp.files_total, cp.files_done);
    return progress;
}

auto make_record(const transfer_request& request, const transfer_id& id) -> transfer_record {
    transfer_record record;
    record.id = id;
    record.kind = request.kind;
    record.sources = request.sources;
    record.destination = request.destination;
    record.source_backend = request.source_backend;
    record.destination_backend = request.destination_backend;
    record.encryption = request.encryption;
    record.label = request.label;
    return record;
}

auto log_context(const transfer_record& record) -> transfer_log_context {
    transfer_log_context ctx;
    ctx.transfer_id = record.id.to_string();
    ctx.kind = to_string(record.kind);
    ctx.route = std::string(to_string(resolve_route(record.kind,
                                                    record.source_backend.tag,
                                                    record.destination_backend.tag)));
    ctx.status = to_string(record.status);
    if (record.progress) {
        ctx.bytes_done = record.progress->bytes_done;
        ctx.bytes_total = record.progress->bytes_total;
        ctx.files_done = record.progress->files_done;
        ctx.files_total = record.progress->files_total;
        ctx.progress_percent = record.progress->completion_percentage();
    }
    if (record.speed_bps > 0.0) {
        ctx.speed_bps = record.speed_bps;
    }
    if (record.error_message) {
        ctx.error_message = *record.error_message;
    }
    return ctx;
}

auto not_found(const transfer_id& id) -> unexpected {
    return unexpected{error{error_code::transfer_not_found,
                            "transfer not found: " + id.to_string()}};
}

auto bad_transition(const transfer_record& record, const char* action) -> unexpected {
    return unexpected{error{error_code::invalid_state_transition,
                            std::string("cannot ") + action + " a " +
                                to_string(record.status) + " transfer"}};
}

}  // namespace

// ============================================================================
// transfer_scheduler::impl
// ============================================================================

class transfer_scheduler::impl {
public:
    impl(std::shared_ptr<backend_dispatcher> dispatcher,
         std::shared_ptr<transfer_settings> settings,
         std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
         std::shared_ptr<checkpoint_store> store)
        : dispatcher_(std::move(dispatcher))
        , settings_(std::move(settings))
        , pool_(std::move(pool))
        , store_(std::move(store))
        , gate_(std::make_shared<task_gate>(this)) {
        listener_id_ = settings_->on_max_concurrent_changed([gate = gate_]() {
            gate_pass pass(*gate);
            if (pass) {
                pass->admit();
            }
        });
    }

    impl(const impl&) = delete;
    impl& operator=(const impl&) = delete;

    void shutdown() {
        std::vector<transfer_id> in_flight;
        {
            std::lock_guard lock(mutex_);
            if (stopping_) {
                return;
            }
            stopping_ = true;
            for (auto& [id, e] : entries_) {
                if (e.record.status == transfer_status::running && e.signals) {
                    e.signals->pause = true;
                    in_flight.push_back(id);
                }
            }
        }

        for (const auto& id : in_flight) {
            dispatcher_->request_pause(id);
        }
        if (!in_flight.empty()) {
            TO_LOG_INFO(log_category::scheduler,
                "Shutting down, pausing " + std::to_string(in_flight.size()) +
                " running transfer(s)");
        }

        gate_->close_and_wait();
        settings_->remove_listener(listener_id_);
    }

    auto enqueue(const transfer_request& request) -> result<transfer_id> {
        if (request.sources.empty()) {
            return unexpected{error{error_code::invalid_request,
                                    "a transfer needs at least one source"}};
        }
        for (const auto& source : request.sources) {
            if (source.empty()) {
                return unexpected{error{error_code::invalid_request, "empty source locator"}};
            }
        }
        if (request.destination.empty()) {
            return unexpected{error{error_code::invalid_request,
                                    "a transfer needs a destination"}};
        }
        if (request.id && request.id->is_null()) {
            return unexpected{error{error_code::invalid_request, "null transfer id"}};
        }
        if (!dispatcher_->can_dispatch(request.kind, request.source_backend,
                                       request.destination_backend)) {
            return unexpected{error{error_code::unsupported_route,
                                    std::string("no route for ") + to_string(request.kind) +
                                        " " + request.source_backend.to_string() + " -> " +
                                        request.destination_backend.to_string()}};
        }

        const auto id = request.id.value_or(transfer_id::generate());
        transfer_record created;
        {
            std::lock_guard lock(mutex_);
            if (entries_.count(id) != 0) {
                return unexpected{error{error_code::transfer_already_exists,
                                        "transfer already exists: " + id.to_string()}};
            }

            entry e;
            e.record = make_record(request, id);
            e.record.priority = next_priority_locked();
            e.record.created_at = std::chrono::system_clock::now();
            created = e.record;
            entries_.emplace(id, std::move(e));
        }

        auto ctx = log_context(created);
        TO_LOG_INFO_CTX(log_category::scheduler,
            "Queued " + created.display_name() + " (" +
            std::to_string(created.sources.size()) + " item(s))", ctx);

        notify({created});
        admit();
        return id;
    }

    auto cancel(const transfer_id& id) -> result<void> {
        std::optional<transfer_record> cancelled;
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(id);
            if (it == entries_.end()) {
                return not_found(id);
            }

            auto& e = it->second;
            switch (e.record.status) {
                case transfer_status::queued:
                    e.record.status = transfer_status::cancelled;
                    e.record.finished_at = std::chrono::system_clock::now();
                    cancelled = e.record;
                    break;
                case transfer_status::running:
                    e.signals->cancel = true;
                    break;
                default:
                    return bad_transition(e.record, "cancel");
            }
        }

        if (!cancelled) {
            TO_LOG_INFO(log_category::scheduler, "Cancel requested for " + id.to_string());
            dispatcher_->cancel(id);
            return {};
        }

        auto ctx = log_context(*cancelled);
        TO_LOG_INFO_CTX(log_category::scheduler, "Cancelled before start", ctx);
        status_cv_.notify_all();
        drop_saved(id);
        notify({*cancelled});
        admit();
        return {};
    }

    auto pause(const transfer_id& id) -> result<void> {
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(id);
            if (it == entries_.end()) {
                return not_found(id);
            }
            auto& e = it->second;
            if (e.record.status != transfer_status::running) {
                return bad_transition(e.record, "pause");
            }
            e.signals->pause = true;
        }

        TO_LOG_INFO(log_category::scheduler, "Pause requested for " + id.to_string());
        dispatcher_->request_pause(id);
        return {};
    }

    auto resume(const transfer_id& id) -> result<void> {
        transfer_record resumed;
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(id);
            if (it == entries_.end()) {
                return not_found(id);
            }
            auto& record = it->second.record;
            if (record.status != transfer_status::paused) {
                return bad_transition(record, "resume");
            }
            record.status = transfer_status::queued;
            record.priority = next_priority_locked();
            resumed = record;
        }

        auto ctx = log_context(resumed);
        TO_LOG_INFO_CTX(log_category::scheduler, "Resumed", ctx);
        notify({resumed});
        admit();
        return {};
    }

    auto move(const transfer_id& id, bool up) -> result<void> {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return not_found(id);
        }
        if (it->second.record.status != transfer_status::queued) {
            return bad_transition(it->second.record, "reorder");
        }

        auto queue = sorted_locked(transfer_status::queued);
        auto pos = std::find(queue.begin(), queue.end(), &it->second);
        if (up ? pos == queue.begin() : std::next(pos) == queue.end()) {
            return {};
        }
        auto neighbor = up ? std::prev(pos) : std::next(pos);
        std::swap((*pos)->record.priority, (*neighbor)->record.priority);
        return {};
    }

    auto dismiss(const transfer_id& id) -> result<void> {
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(id);
            if (it == entries_.end()) {
                return not_found(id);
            }
            if (it->second.record.status == transfer_status::running) {
                return bad_transition(it->second.record, "dismiss");
            }
            entries_.erase(it);
        }

        TO_LOG_DEBUG(log_category::scheduler, "Dismissed " + id.to_string());
        status_cv_.notify_all();
        drop_saved(id);
        return {};
    }

    auto dismiss_completed() -> std::size_t {
        std::size_t removed = 0;
        {
            std::lock_guard lock(mutex_);
            for (auto it = entries_.begin(); it != entries_.end();) {
                if (it->second.record.is_terminal()) {
                    it = entries_.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }
        if (removed > 0) {
            TO_LOG_DEBUG(log_category::scheduler,
                "Dismissed " + std::to_string(removed) + " finished transfer(s)");
            status_cv_.notify_all();
        }
        return removed;
    }

    auto get(const transfer_id& id) const -> result<transfer_record> {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return not_found(id);
        }
        return it->second.record;
    }

    auto snapshot(std::optional<transfer_status> status) const -> std::vector<transfer_record> {
        std::lock_guard lock(mutex_);
        std::vector<transfer_record> out;
        for (const auto* e : sorted_locked(status)) {
            out.push_back(e->record);
        }
        return out;
    }

    auto aggregate() const -> aggregate_progress {
        std::lock_guard lock(mutex_);
        aggregate_progress agg;
        agg.running_count = running_count_;
        agg.bytes_done = running_bytes_done_;
        agg.bytes_total = running_bytes_total_;
        return agg;
    }

    auto wait_for(const transfer_id& id, std::chrono::milliseconds timeout)
        -> result<transfer_status> {
        std::unique_lock lock(mutex_);
        auto settled = [&] {
            auto it = entries_.find(id);
            return it == entries_.end() ||
                   (it->second.record.status != transfer_status::queued &&
                    it->second.record.status != transfer_status::running);
        };
        if (!status_cv_.wait_for(lock, timeout, settled)) {
            return unexpected{error{error_code::wait_timeout,
                                    "timed out waiting for " + id.to_string()}};
        }
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return not_found(id);
        }
        return it->second.record.status;
    }

    void on_status_change(status_callback callback) {
        std::lock_guard lock(callbacks_mutex_);
        callbacks_.push_back(std::move(callback));
    }

    auto restore_paused() -> result<std::size_t> {
        if (!store_) {
            return unexpected{error{error_code::invalid_configuration,
                                    "no checkpoint store configured"}};
        }

        std::vector<persisted_transfer> restorable;
        for (auto& saved : store_->list()) {
            const auto& req = saved.request;
            if (!req.id) {
                continue;
            }
            if (!dispatcher_->can_dispatch(req.kind, req.source_backend,
                                           req.destination_backend)) {
                TO_LOG_WARN(log_category::checkpoint,
                    "Skipping saved transfer " + req.id->to_string() +
                    ": route no longer available");
                continue;
            }
            restorable.push_back(std::move(saved));
        }

        std::vector<transfer_record> restored;
        {
            std::lock_guard lock(mutex_);
            for (auto& saved : restorable) {
                const auto id = *saved.request.id;
                if (entries_.count(id) != 0) {
                    continue;
                }
                entry e;
                e.record = make_record(saved.request, id);
                e.record.status = transfer_status::paused;
                e.record.progress = progress_from(saved.state);
                e.record.resume_state = std::move(saved.state);
                e.record.priority = saved.priority != 0 ? saved.priority : next_priority_locked();
                e.record.created_at = saved.saved_at;
                restored.push_back(e.record);
                entries_.emplace(id, std::move(e));
            }
        }

        TO_LOG_INFO(log_category::checkpoint,
            "Restored " + std::to_string(restored.size()) + " paused transfer(s)");
        notify(restored);
        return restored.size();
    }

    auto settings() const -> std::shared_ptr<transfer_settings> { return settings_; }

    /**
     * @brief Start queued records while slots are free
     */
    void admit() {
        std::vector<launch> launches;
        std::vector<transfer_record> started;
        {
            std::lock_guard lock(mutex_);
            if (stopping_) {
                return;
            }
            const auto limit = settings_->max_concurrent();
            const auto bandwidth = settings_->bandwidth_limit();
            while (running_count_ < limit) {
                auto queue = sorted_locked(transfer_status::queued);
                if (queue.empty()) {
                    break;
                }
                launches.push_back(start_episode_locked(*queue.front(), bandwidth));
                started.push_back(queue.front()->record);
            }
        }

        for (const auto& record : started) {
            auto ctx = log_context(record);
            TO_LOG_DEBUG_CTX(log_category::scheduler, "Admitted", ctx);
        }
        notify(started);

        for (auto& l : launches) {
            submit(std::move(l));
        }
    }

private:
    // Lets worker tasks reach the scheduler until it shuts down. Outlives impl.
    class task_gate {
    public:
        explicit task_gate(impl* owner) : owner_(owner) {}

        auto enter() -> impl* {
            std::lock_guard lock(mutex_);
            if (!owner_) {
                return nullptr;
            }
            ++active_;
            return owner_;
        }

        void leave() {
            std::lock_guard lock(mutex_);
            if (--active_ == 0) {
                idle_.notify_all();
            }
        }

        void close_and_wait() {
            std::unique_lock lock(mutex_);
            owner_ = nullptr;
            idle_.wait(lock, [this] { return active_ == 0; });
        }

    private:
        std::mutex mutex_;
        std::condition_variable idle_;
        impl* owner_;
        std::size_t active_ = 0;
    };

    // Holds the gate open for the lifetime of one callback or task
    class gate_pass {
    public:
        explicit gate_pass(task_gate& gate) : gate_(gate), owner_(gate.enter()) {}
        ~gate_pass() {
            if (owner_) {
                gate_.leave();
            }
        }

        gate_pass(const gate_pass&) = delete;
        gate_pass& operator=(const gate_pass&) = delete;

        explicit operator bool() const { return owner_ != nullptr; }
        auto operator->() const -> impl* { return owner_; }

    private:
        task_gate& gate_;
        impl* owner_;
    };

    struct entry {
        transfer_record record;
        speed_estimator speed;
        uint64_t episode = 0;
        std::shared_ptr<transfer_signals> signals;
    };

    struct launch {
        dispatch_request request;
        uint64_t episode = 0;
    };

    auto next_priority_locked() -> uint64_t {
        const auto now = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());
        last_priority_ = std::max(now, last_priority_ + 1);
        return last_priority_;
    }

    auto sorted_locked(std::optional<transfer_status> status) const
        -> std::vector<const entry*> {
        std::vector<const entry*> out;
        for (const auto& [id, e] : entries_) {
            if (!status || e.record.status == *status) {
                out.push_back(&e);
            }
        }
        std::sort(out.begin(), out.end(), [](const entry* a, const entry* b) {
            return a->record.priority < b->record.priority;
        });
        return out;
    }

    auto sorted_locked(std::optional<transfer_status> status) -> std::vector<entry*> {
        std::vector<entry*> out;
        for (auto& [id, e] : entries_) {
            if (!status || e.record.status == *status) {
                out.push_back(&e);
            }
        }
        std::sort(out.begin(), out.end(), [](const entry* a, const entry* b) {
            return a->record.priority < b->record.priority;
        });
        return out;
    }

    auto start_episode_locked(entry& e, uint64_t bandwidth) -> launch {
        auto& record = e.record;
        record.status = transfer_status::running;
        record.started_at = std::chrono::system_clock::now();
        record.finished_at.reset();
        record.error_message.reset();
        record.speed_bps = 0.0;
        record.progress.reset();
        if (record.resume_state) {
            record.progress = progress_from(*record.resume_state);
        }

        ++e.episode;
        e.signals = std::make_shared<transfer_signals>();
        e.speed.reset();

        ++running_count_;
        if (record.progress) {
            running_bytes_done_ += record.progress->bytes_done;
            running_bytes_total_ += record.progress->bytes_total;
        }

        launch l;
        l.episode = e.episode;
        l.request = dispatch_request::from_record(record);
        l.request.bandwidth_limit = bandwidth;
        l.request.signals = e.signals;
        l.request.on_progress = [gate = gate_, id = record.id, episode = e.episode](
                                    const progress_event& event) {
            gate_pass pass(*gate);
            if (pass) {
                pass->on_progress(id, episode, event);
            }
        };
        return l;
    }

    void release_slot_locked(const transfer_record& record) {
        --running_count_;
        if (record.progress) {
            running_bytes_done_ -= record.progress->bytes_done;
            running_bytes_total_ -= record.progress->bytes_total;
        }
    }

    void submit(launch l) {
        const auto id = l.request.id;
        const auto episode = l.episode;
        try {
            auto future = pool_->submit_to_stage(
                [gate = gate_, episode, request = std::move(l.request)]() {
                    gate_pass pass(*gate);
                    if (pass) {
                        pass->run_episode(request, episode);
                    }
                },
                adapters::dispatch_stage);
            keep(std::move(future));
        } catch (const std::exception& e) {
            TO_LOG_ERROR(log_category::scheduler,
                "Worker pool rejected " + id.to_string() + ": " + e.what());
            finish_episode(id, episode,
                backend_error::io(std::string("worker pool rejected the transfer: ") + e.what()));
        }
    }

    // Finished futures are pruned; the rest are held until impl is destroyed
    void keep(std::future<void> future) {
        std::lock_guard lock(futures_mutex_);
        futures_.erase(
            std::remove_if(futures_.begin(), futures_.end(), [](const std::future<void>& f) {
                return !f.valid() ||
                       f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
            }),
            futures_.end());
        futures_.push_back(std::move(future));
    }

    void run_episode(const dispatch_request& request, uint64_t episode) {
        execution_outcome outcome;
        try {
            outcome = dispatcher_->dispatch(request);
        } catch (const std::exception& e) {
            TO_LOG_ERROR(log_category::scheduler,
                "Transfer " + request.id.to_string() + " threw: " + e.what());
            outcome = backend_error::io(e.what());
        } catch (...) {
            TO_LOG_ERROR(log_category::scheduler,
                "Transfer " + request.id.to_string() + " threw a non-standard exception");
            outcome = backend_error::io("unknown exception");
        }
        finish_episode(request.id, episode, std::move(outcome));
    }

    void on_progress(const transfer_id& id, uint64_t episode, const progress_event& event) {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() || it->second.episode != episode ||
            it->second.record.status != transfer_status::running) {
            TO_LOG_TRACE(log_category::progress, "Dropped stale progress for " + id.to_string());
            return;
        }

        auto& e = it->second;
        auto& record = e.record;
        const auto prev = record.progress.value_or(progress_event{});

        progress_event next = event;
        next.bytes_done = std::max(next.bytes_done, prev.bytes_done);
        next.bytes_total = std::max(next.bytes_total, next.bytes_done);
        next.files_done = std::max(next.files_done, prev.files_done);
        next.files_total = std::max(next.files_total, next.files_done);

        running_bytes_done_ = running_bytes_done_ - prev.bytes_done + next.bytes_done;
        running_bytes_total_ = running_bytes_total_ - prev.bytes_total + next.bytes_total;

        e.speed.add_sample(speed_estimator::clock::now(), next.bytes_done);
        record.speed_bps = e.speed.estimate();
        record.progress = std::move(next);
    }

    void finish_episode(const transfer_id& id, uint64_t episode, execution_outcome outcome) {
        transfer_record finished;
        std::optional<persisted_transfer> to_save;
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(id);
            if (it == entries_.end() || it->second.episode != episode ||
                it->second.record.status != transfer_status::running) {
                TO_LOG_WARN(log_category::scheduler,
                    "Ignoring result for " + id.to_string() + " from a finished episode");
                return;
            }

            auto& e = it->second;
            auto& record = e.record;
            release_slot_locked(record);
            e.signals.reset();

            const auto now = std::chrono::system_clock::now();
            if (std::holds_alternative<transfer_completed>(outcome)) {
                record.status = transfer_status::completed;
                record.resume_state.reset();
                if (record.progress) {
                    record.progress->current_item.clear();
                }
            } else if (auto* cp = std::get_if<checkpoint>(&outcome)) {
                record.status = transfer_status::paused;
                record.progress = progress_from(*cp);
                record.resume_state = std::move(*cp);
                if (store_ && !record.encryption) {
                    to_save = persisted_transfer{record.to_request(), *record.resume_state,
                                                 record.priority, now};
                }
            } else {
                const auto& failure = std::get<backend_error>(outcome);
                if (failure.is_cancellation()) {
                    record.status = transfer_status::cancelled;
                } else {
                    record.status = transfer_status::failed;
                    record.error_message = failure.detail;
                }
            }
            if (record.is_terminal()) {
                record.finished_at = now;
            }
            finished = record;
        }
        status_cv_.notify_all();

        auto ctx = log_context(finished);
        switch (finished.status) {
            case transfer_status::completed:
                TO_LOG_INFO_CTX(log_category::scheduler, "Transfer completed", ctx);
                break;
            case transfer_status::paused:
                TO_LOG_INFO_CTX(log_category::scheduler, "Transfer paused", ctx);
                break;
            case transfer_status::cancelled:
                TO_LOG_INFO_CTX(log_category::scheduler, "Transfer cancelled", ctx);
                break;
            default:
                if (std::get<backend_error>(outcome).kind == failure_kind::unsupported) {
                    TO_LOG_FATAL_CTX(log_category::scheduler,
                        "Dispatched a transfer with no route", ctx);
                } else {
                    TO_LOG_ERROR_CTX(log_category::scheduler, "Transfer failed", ctx);
                }
                break;
        }

        if (to_save) {
            auto saved = store_->save(*to_save);
            if (!saved) {
                TO_LOG_WARN(log_category::checkpoint,
                    "Could not persist checkpoint for " + id.to_string() + ": " +
                    saved.error().message);
            }
        } else if (finished.is_terminal()) {
            drop_saved(id);
        }

        notify({finished});
        admit();
    }

    void drop_saved(const transfer_id& id) {
        if (!store_ || !store_->contains(id)) {
            return;
        }
        auto removed = store_->remove(id);
        if (!removed) {
            TO_LOG_WARN(log_category::checkpoint,
                "Could not delete saved checkpoint for " + id.to_string() + ": " +
                removed.error().message);
        }
    }

    void notify(const std::vector<transfer_record>& changed) {
        if (changed.empty()) {
            return;
        }
        std::vector<status_callback> callbacks;
        {
            std::lock_guard lock(callbacks_mutex_);
            callbacks = callbacks_;
        }
        for (const auto& record : changed) {
            for (const auto& callback : callbacks) {
                try {
                    callback(record);
                } catch (const std::exception& e) {
                    TO_LOG_ERROR(log_category::scheduler,
                        std::string("Status callback threw: ") + e.what());
                }
            }
        }
    }

    std::shared_ptr<backend_dispatcher> dispatcher_;
    std::shared_ptr<transfer_settings> settings_;
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;
    std::shared_ptr<checkpoint_store> store_;
    std::shared_ptr<task_gate> gate_;
    transfer_settings::listener_id listener_id_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable status_cv_;
    std::unordered_map<transfer_id, entry> entries_;
    uint64_t last_priority_ = 0;
    bool stopping_ = false;

    std::size_t running_count_ = 0;
    uint64_t running_bytes_done_ = 0;
    uint64_t running_bytes_total_ = 0;

    std::mutex callbacks_mutex_;
    std::vector<status_callback> callbacks_;

    std::mutex futures_mutex_;
    std::vector<std::future<void>> futures_;
};

// ============================================================================
// transfer_scheduler
// ============================================================================

transfer_scheduler::transfer_scheduler(std::unique_ptr<impl> impl)
    : impl_(std::move(impl)) {
}

transfer_scheduler::~transfer_scheduler() {
    if (impl_) {
        impl_->shutdown();
    }
}

transfer_scheduler::transfer_scheduler(transfer_scheduler&&) noexcept = default;

auto transfer_scheduler::operator=(transfer_scheduler&& other) noexcept -> transfer_scheduler& {
    if (this != &other) {
        if (impl_) {
            impl_->shutdown();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

auto transfer_scheduler::enqueue(const transfer_request& request) -> result<transfer_id> {
    return impl_->enqueue(request);
}

auto transfer_scheduler::cancel(const transfer_id& id) -> result<void> {
    return impl_->cancel(id);
}

auto transfer_scheduler::pause(const transfer_id& id) -> result<void> {
    return impl_->pause(id);
}

auto transfer_scheduler::resume(const transfer_id& id) -> result<void> {
    return impl_->resume(id);
}

auto transfer_scheduler::move_up(const transfer_id& id) -> result<void> {
    return impl_->move(id, true);
}

auto transfer_scheduler::move_down(const transfer_id& id) -> result<void> {
    return impl_->move(id, false);
}

auto transfer_scheduler::dismiss(const transfer_id& id) -> result<void> {
    return impl_->dismiss(id);
}

auto transfer_scheduler::dismiss_completed() -> std::size_t {
    return impl_->dismiss_completed();
}

auto transfer_scheduler::get(const transfer_id& id) const -> result<transfer_record> {
    return impl_->get(id);
}

auto transfer_scheduler::records() const -> std::vector<transfer_record> {
    return impl_->snapshot(std::nullopt);
}

auto transfer_scheduler::queued() const -> std::vector<transfer_record> {
    return impl_->snapshot(transfer_status::queued);
}

auto transfer_scheduler::running() const -> std::vector<transfer_record> {
    return impl_->snapshot(transfer_status::running);
}

auto transfer_scheduler::paused() const -> std::vector<transfer_record> {
    return impl_->snapshot(transfer_status::paused);
}

auto transfer_scheduler::aggregate() const -> aggregate_progress {
    return impl_->aggregate();
}

auto transfer_scheduler::aggregate_summary() const -> std::string {
    const auto agg = impl_->aggregate();
    if (agg.running_count == 0) {
        return {};
    }
    std::ostringstream oss;
    oss << agg.running_count << (agg.running_count == 1 ? " transfer, " : " transfers, ")
        << agg.percent() << "% " << format_size(agg.bytes_done) << "/"
        << format_size(agg.bytes_total);
    return oss.str();
}

auto transfer_scheduler::wait_for(const transfer_id& id, std::chrono::milliseconds timeout)
    -> result<transfer_status> {
    return impl_->wait_for(id, timeout);
}

void transfer_scheduler::on_status_change(status_callback callback) {
    impl_->on_status_change(std::move(callback));
}

auto transfer_scheduler::restore_paused() -> result<std::size_t> {
    return impl_->restore_paused();
}

auto transfer_scheduler::settings() const -> std::shared_ptr<transfer_settings> {
    return impl_->settings();
}

// ============================================================================
// transfer_scheduler::builder
// ============================================================================

transfer_scheduler::builder::builder() = default;

auto transfer_scheduler::builder::with_dispatcher(
    std::shared_ptr<backend_dispatcher> dispatcher) -> builder& {
    dispatcher_ = std::move(dispatcher);
    return *this;
}

auto transfer_scheduler::builder::with_settings(
    std::shared_ptr<transfer_settings> settings) -> builder& {
    settings_ = std::move(settings);
    return *this;
}

auto transfer_scheduler::builder::with_thread_pool(
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto transfer_scheduler::builder::with_checkpoint_store(
    std::shared_ptr<checkpoint_store> store) -> builder& {
    store_ = std::move(store);
    return *this;
}

auto transfer_scheduler::builder::build() -> result<transfer_scheduler> {
    if (!dispatcher_) {
        return unexpected{error{error_code::invalid_configuration,
                                "a backend dispatcher is required"}};
    }

    get_logger().initialize();

    auto settings = settings_ ? settings_ : std::make_shared<transfer_settings>();
    auto pool = pool_ ? pool_ : adapters::transfer_pool_factory::create();
    if (!pool) {
        return unexpected{error{error_code::invalid_configuration,
                                "no worker pool available"}};
    }

    TO_LOG_INFO(log_category::scheduler,
        "Scheduler ready (max_concurrent=" + std::to_string(settings->max_concurrent()) +
        ", workers=" + std::to_string(pool->worker_count()) + ")");

    return transfer_scheduler(std::make_unique<impl>(
        dispatcher_, std::move(settings), std::move(pool), store_));
}

}  // namespace kcenon::transfer_orchestrator
