/**
 * @file backend_dispatcher.cpp
 * @brief Route execution, staging and signal relay
 */

#include <kcenon/transfer_orchestrator/dispatch/backend_dispatcher.h>
#include <kcenon/transfer_orchestrator/core/logging.h>

#include <algorithm>
#include <mutex>
#include <system_error>
#include <unordered_map>

namespace kcenon::transfer_orchestrator {

namespace {

auto password_of(const std::optional<encryption_options>& encryption)
    -> std::optional<std::string> {
    if (encryption && !encryption->password.empty()) {
        return encryption->password;
    }
    return std::nullopt;
}

auto make_context(const dispatch_request& req) -> execution_context {
    execution_context ctx;
    ctx.id = req.id;
    ctx.sources = req.sources;
    ctx.destination = req.destination;
    ctx.resume_from = req.resume_from;
    ctx.bandwidth_limit = req.bandwidth_limit;
    ctx.on_progress = req.on_progress;
    return ctx;
}

auto describe(const dispatch_request& req) -> std::string {
    return std::string(to_string(req.kind)) + " " + req.source_backend.to_string() +
           " -> " + req.destination_backend.to_string();
}

auto log_context(const dispatch_request& req, dispatch_route route) -> transfer_log_context {
    transfer_log_context ctx;
    ctx.transfer_id = req.id.to_string();
    ctx.kind = to_string(req.kind);
    ctx.route = std::string(to_string(route));
    return ctx;
}

// Totals of what a finished download phase left in the staging directory
struct staged_totals {
    uint64_t bytes = 0;
    uint32_t files = 0;
};

auto measure_directory(const std::filesystem::path& dir) -> staged_totals {
    staged_totals totals;
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(dir, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            totals.bytes += it->file_size(ec);
            ++totals.files;
        }
    }
    return totals;
}

auto list_staged_entries(const std::filesystem::path& dir)
    -> result<std::vector<std::string>> {
    std::error_code ec;
    std::vector<std::string> entries;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        entries.push_back(it->path().string());
    }
    if (ec) {
        return unexpected(error(error_code::file_read_error,
            "cannot read staging directory " + dir.string() + ": " + ec.message()));
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

// Combine a phase checkpoint with the counters of the phases before it
auto wrap_staged(staging_phase phase,
                 const std::filesystem::path& dir,
                 const checkpoint& inner,
                 staged_totals base) -> checkpoint {
    checkpoint out;
    out.files_completed = inner.files_completed;
    out.multipart = inner.multipart;
    if (phase == staging_phase::download) {
        out.bytes_done = inner.bytes_done;
        out.bytes_total = inner.bytes_total * 2;
        out.files_done = inner.files_done;
        out.files_total = inner.files_total * 2;
    } else {
        out.bytes_done = base.bytes + inner.bytes_done;
        out.bytes_total = base.bytes + inner.bytes_total;
        out.files_done = base.files + inner.files_done;
        out.files_total = base.files + inner.files_total;
    }
    out.staging = staging_state{phase, dir.string(), inner.files_completed,
                                inner.bytes_done, inner.bytes_total,
                                inner.files_done, inner.files_total};
    return out;
}

}  // namespace

auto dispatch_request::from_record(const transfer_record& record) -> dispatch_request {
    dispatch_request req;
    req.id = record.id;
    req.kind = record.kind;
    req.sources = record.sources;
    req.destination = record.destination;
    req.source_backend = record.source_backend;
    req.destination_backend = record.destination_backend;
    req.encryption = record.encryption;
    req.resume_from = record.resume_state;
    return req;
}

// ============================================================================
// backend_dispatcher::impl
// ============================================================================

class backend_dispatcher::impl {
public:
    impl(backend_set backends, std::filesystem::path staging_root)
        : backends_(std::move(backends))
        , staging_root_(staging_root.empty()
              ? std::filesystem::temp_directory_path() / "transfer_orchestrator_staging"
              : std::move(staging_root)) {}

    auto can_dispatch(transfer_kind kind, const backend_id& source,
                      const backend_id& destination) const -> bool {
        bool move = kind == transfer_kind::move;
        switch (resolve_route(kind, source.tag, destination.tag)) {
            case dispatch_route::local_copy:
                return backends_.local != nullptr;
            case dispatch_route::object_download:
            case dispatch_route::object_copy:
                return backends_.object_storage != nullptr;
            case dispatch_route::object_upload:
                return backends_.object_storage && (!move || backends_.local);
            case dispatch_route::remote_download:
            case dispatch_route::staged_remote_remote:
                return backends_.secure_remote != nullptr;
            case dispatch_route::remote_upload:
                return backends_.secure_remote && (!move || backends_.local);
            case dispatch_route::staged_object_remote:
            case dispatch_route::staged_remote_object:
                return backends_.object_storage && backends_.secure_remote;
            case dispatch_route::archive_extract:
                return backends_.archive != nullptr;
            case dispatch_route::unsupported:
            default:
                return false;
        }
    }

    auto dispatch(const dispatch_request& req) -> execution_outcome {
        auto route = resolve_route(req.kind, req.source_backend.tag,
                                   req.destination_backend.tag);
        auto log_ctx = log_context(req, route);

        if (!can_dispatch(req.kind, req.source_backend, req.destination_backend)) {
            TO_LOG_FATAL_CTX(log_category::dispatcher,
                "No executable route for " + describe(req), log_ctx);
            return backend_error::unsupported("no route for " + describe(req));
        }

        auto signals = req.signals ? req.signals : std::make_shared<transfer_signals>();
        flight_scope scope(*this, req.id, signals);

        TO_LOG_DEBUG_CTX(log_category::dispatcher,
            std::string(req.resume_from ? "Resuming " : "Dispatching ") + describe(req),
            log_ctx);

        auto outcome = is_staged(route) ? run_staged(req, route, *signals)
                                        : run_direct(req, route, *signals);

        if (auto* err = std::get_if<backend_error>(&outcome)) {
            log_ctx.error_message = err->detail;
            if (err->is_cancellation()) {
                TO_LOG_INFO_CTX(log_category::dispatcher, "Transfer cancelled", log_ctx);
            } else {
                TO_LOG_ERROR_CTX(log_category::dispatcher, "Transfer failed", log_ctx);
            }
        } else if (std::holds_alternative<checkpoint>(outcome)) {
            TO_LOG_INFO_CTX(log_category::dispatcher, "Transfer paused", log_ctx);
        } else {
            TO_LOG_DEBUG_CTX(log_category::dispatcher, "Transfer completed", log_ctx);
        }
        return outcome;
    }

    void cancel(const transfer_id& id) {
        std::lock_guard lock(mutex_);
        auto it = flights_.find(id);
        if (it == flights_.end()) {
            return;
        }
        it->second.signals->cancel.store(true);
        if (it->second.current) {
            it->second.current->cancel(id);
        }
    }

    void request_pause(const transfer_id& id) {
        std::lock_guard lock(mutex_);
        auto it = flights_.find(id);
        if (it == flights_.end()) {
            return;
        }
        it->second.signals->pause.store(true);
        if (it->second.current) {
            it->second.current->request_pause(id);
        }
    }

    auto remove(const transfer_id& id, const backend_id& backend,
                const std::vector<std::string>& locators) -> execution_outcome {
        if (locators.empty()) {
            return transfer_completed{};
        }

        TO_LOG_DEBUG(log_category::dispatcher,
            "Deleting " + std::to_string(locators.size()) + " item(s) on " +
            backend.to_string());

        switch (backend.tag) {
            case backend_tag::local:
                if (backends_.local) {
                    return backends_.local->remove(id, locators);
                }
                break;
            case backend_tag::object_storage:
                if (backends_.object_storage) {
                    return backends_.object_storage->delete_objects(
                        backend.handle, id, locators);
                }
                break;
            case backend_tag::secure_remote:
                if (backends_.secure_remote) {
                    return backends_.secure_remote->remove(backend.handle, id, locators);
                }
                break;
            case backend_tag::archive:
            default:
                break;
        }

        TO_LOG_ERROR(log_category::dispatcher,
            "Delete is not available on " + backend.to_string());
        return backend_error::unsupported("delete is not available on " +
                                          backend.to_string());
    }

    auto in_flight() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return flights_.size();
    }

    auto staging_root() const -> const std::filesystem::path& { return staging_root_; }

private:
    struct flight {
        std::shared_ptr<transfer_signals> signals;
        controllable_primitive* current = nullptr;
    };

    class flight_scope {
    public:
        flight_scope(impl& owner, const transfer_id& id,
                     std::shared_ptr<transfer_signals> signals)
            : owner_(owner), id_(id) {
            std::lock_guard lock(owner_.mutex_);
            owner_.flights_[id_] = flight{std::move(signals), nullptr};
        }

        ~flight_scope() {
            std::lock_guard lock(owner_.mutex_);
            owner_.flights_.erase(id_);
        }

        flight_scope(const flight_scope&) = delete;
        flight_scope& operator=(const flight_scope&) = delete;

    private:
        impl& owner_;
        transfer_id id_;
    };

    /**
     * Run one primitive call with signal relay. A signal raised before the
     * call starts ends the phase without calling the primitive.
     */
    template <typename Call>
    auto run_phase(const transfer_id& id,
                   const transfer_signals& signals,
                   controllable_primitive* primitive,
                   const checkpoint& paused_state,
                   Call&& call) -> execution_outcome {
        {
            std::lock_guard lock(mutex_);
            if (signals.cancel.load()) {
                return backend_error::cancelled();
            }
            if (signals.pause.load()) {
                return paused_state;
            }
            flights_[id].current = primitive;
        }

        auto outcome = call();

        std::lock_guard lock(mutex_);
        if (auto it = flights_.find(id); it != flights_.end()) {
            it->second.current = nullptr;
        }
        return outcome;
    }

    auto run_direct(const dispatch_request& req, dispatch_route route,
                    const transfer_signals& signals) -> execution_outcome {
        auto ctx = make_context(req);
        auto paused_state = req.resume_from.value_or(checkpoint{});
        const auto& src = req.source_backend.handle;
        const auto& dst = req.destination_backend.handle;
        bool move = req.kind == transfer_kind::move;

        execution_outcome outcome = backend_error::unsupported(describe(req));
        switch (route) {
            case dispatch_route::local_copy:
                // Local moves are a single rename-or-copy operation
                return run_phase(req.id, signals, backends_.local.get(), paused_state,
                    [&] { return move ? backends_.local->move(ctx) : backends_.local->copy(ctx); });
            case dispatch_route::object_download:
                outcome = run_phase(req.id, signals, backends_.object_storage.get(), paused_state,
                    [&] { return backends_.object_storage->download(src, ctx, password_of(req.encryption)); });
                break;
            case dispatch_route::object_upload:
                outcome = run_phase(req.id, signals, backends_.object_storage.get(), paused_state,
                    [&] { return upload_to_object(dst, ctx, req.encryption); });
                break;
            case dispatch_route::object_copy:
                outcome = run_phase(req.id, signals, backends_.object_storage.get(), paused_state,
                    [&] { return backends_.object_storage->copy_objects(src, dst, ctx); });
                break;
            case dispatch_route::remote_download:
                outcome = run_phase(req.id, signals, backends_.secure_remote.get(), paused_state,
                    [&] { return backends_.secure_remote->download(src, ctx); });
                break;
            case dispatch_route::remote_upload:
                outcome = run_phase(req.id, signals, backends_.secure_remote.get(), paused_state,
                    [&] { return backends_.secure_remote->upload(dst, ctx); });
                break;
            case dispatch_route::archive_extract:
                return run_phase(req.id, signals, backends_.archive.get(), paused_state,
                    [&] { return backends_.archive->extract(src, ctx); });
            default:
                return outcome;
        }

        if (!is_completed(outcome) || !move) {
            return outcome;
        }
        return delete_sources(req, signals);
    }

    auto run_staged(const dispatch_request& req, dispatch_route route,
                    const transfer_signals& signals) -> execution_outcome {
        auto dir = staging_root_ / req.id.to_string();
        auto phase = staging_phase::download;
        std::optional<checkpoint> inner;
        staged_totals base;

        if (req.resume_from && req.resume_from->staging) {
            const auto& cp = *req.resume_from;
            const auto& st = *cp.staging;
            dir = st.directory;
            phase = st.phase;

            checkpoint phase_cp;
            phase_cp.files_completed = st.phase_files_completed;
            phase_cp.bytes_done = st.phase_bytes_done;
            phase_cp.bytes_total = st.phase_bytes_total;
            phase_cp.files_done = st.phase_files_done;
            phase_cp.files_total = st.phase_files_total;
            phase_cp.multipart = cp.multipart;
            inner = std::move(phase_cp);

            if (phase == staging_phase::upload) {
                base.bytes = cp.bytes_done >= st.phase_bytes_done
                    ? cp.bytes_done - st.phase_bytes_done : 0;
                base.files = cp.files_done >= st.phase_files_done
                    ? cp.files_done - st.phase_files_done : 0;
            }
        }

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return backend_error::io("cannot create staging directory " + dir.string() +
                                     ": " + ec.message());
        }

        const auto& src = req.source_backend.handle;
        const auto& dst = req.destination_backend.handle;

        if (phase == staging_phase::download) {
            auto ctx = make_context(req);
            ctx.destination = dir.string();
            ctx.resume_from = inner;

            std::optional<progress_event> last;
            ctx.on_progress = [&](const progress_event& e) {
                last = e;
                progress_event combined = e;
                combined.bytes_total = e.bytes_total * 2;
                combined.files_total = e.files_total * 2;
                req_progress(req, combined);
            };

            auto paused_state = wrap_staged(staging_phase::download, dir,
                                            inner.value_or(checkpoint{}), base);
            auto outcome = run_phase(req.id, signals, source_primitive(route), paused_state,
                [&]() -> execution_outcome {
                    if (route == dispatch_route::staged_object_remote) {
                        return backends_.object_storage->download(
                            src, ctx, password_of(req.encryption));
                    }
                    return backends_.secure_remote->download(src, ctx);
                });

            if (auto* cp = std::get_if<checkpoint>(&outcome)) {
                return wrap_staged(staging_phase::download, dir, *cp, base);
            }
            if (!is_completed(outcome)) {
                discard_staging(dir);
                return outcome;
            }

            base = measure_directory(dir);
            if (last && last->bytes_total > base.bytes) {
                base.bytes = last->bytes_total;
            }
            if (last && last->files_total > base.files) {
                base.files = last->files_total;
            }

            // Nothing of the upload phase has happened yet
            checkpoint fresh;
            fresh.bytes_total = base.bytes;
            fresh.files_total = base.files;
            inner = fresh;
        }

        auto staged = list_staged_entries(dir);
        if (!staged) {
            return backend_error::io(staged.error().message);
        }

        auto ctx = make_context(req);
        ctx.sources = std::move(staged.value());
        ctx.resume_from = inner;
        ctx.on_progress = [&](const progress_event& e) {
            progress_event combined = e;
            combined.bytes_done = base.bytes + e.bytes_done;
            combined.bytes_total = base.bytes + e.bytes_total;
            combined.files_done = base.files + e.files_done;
            combined.files_total = base.files + e.files_total;
            req_progress(req, combined);
        };

        auto paused_state = wrap_staged(staging_phase::upload, dir,
                                        inner.value_or(checkpoint{}), base);
        auto outcome = run_phase(req.id, signals, destination_primitive(route), paused_state,
            [&]() -> execution_outcome {
                if (route == dispatch_route::staged_remote_object) {
                    return upload_to_object(dst, ctx, req.encryption);
                }
                return backends_.secure_remote->upload(dst, ctx);
            });

        if (auto* cp = std::get_if<checkpoint>(&outcome)) {
            return wrap_staged(staging_phase::upload, dir, *cp, base);
        }

        discard_staging(dir);
        if (!is_completed(outcome) || req.kind != transfer_kind::move) {
            return outcome;
        }
        return delete_sources(req, signals);
    }

    static void req_progress(const dispatch_request& req, const progress_event& event) {
        if (req.on_progress) {
            req.on_progress(event);
        }
    }

    auto upload_to_object(const std::string& conn, const execution_context& ctx,
                          const std::optional<encryption_options>& encryption)
        -> execution_outcome {
        if (encryption && !encryption->password.empty()) {
            return backends_.object_storage->upload_encrypted(conn, ctx, *encryption);
        }
        return backends_.object_storage->upload(conn, ctx);
    }

    auto source_primitive(dispatch_route route) const -> controllable_primitive* {
        if (route == dispatch_route::staged_object_remote) {
            return backends_.object_storage.get();
        }
        return backends_.secure_remote.get();
    }

    auto destination_primitive(dispatch_route route) const -> controllable_primitive* {
        if (route == dispatch_route::staged_remote_object) {
            return backends_.object_storage.get();
        }
        return backends_.secure_remote.get();
    }

    // Runs only after the destination reported success
    auto delete_sources(const dispatch_request& req, const transfer_signals& signals)
        -> execution_outcome {
        if (signals.cancel.load()) {
            TO_LOG_WARN(log_category::dispatcher,
                "Move of " + req.id.to_string() +
                " cancelled after the copy finished; sources kept");
            return backend_error::cancelled();
        }

        auto deleted = remove(req.id, req.source_backend, req.sources);
        if (is_completed(deleted)) {
            return deleted;
        }
        if (auto* err = std::get_if<backend_error>(&deleted)) {
            return backend_error::io("copied, but deleting sources failed: " + err->detail);
        }
        return backend_error::io("copied, but deleting sources did not complete");
    }

    static void discard_staging(const std::filesystem::path& dir) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            TO_LOG_WARN(log_category::dispatcher,
                "Failed to remove staging directory " + dir.string() + ": " + ec.message());
        }
    }

    backend_set backends_;
    std::filesystem::path staging_root_;

    mutable std::mutex mutex_;
    std::unordered_map<transfer_id, flight> flights_;
};

// ============================================================================
// backend_dispatcher public interface
// ============================================================================

backend_dispatcher::backend_dispatcher(backend_set backends,
                                       std::filesystem::path staging_root)
    : impl_(std::make_unique<impl>(std::move(backends), std::move(staging_root))) {
}

backend_dispatcher::~backend_dispatcher() = default;

auto backend_dispatcher::can_dispatch(transfer_kind kind,
                                      const backend_id& source,
                                      const backend_id& destination) const -> bool {
    return impl_->can_dispatch(kind, source, destination);
}

auto backend_dispatcher::dispatch(const dispatch_request& request) -> execution_outcome {
    return impl_->dispatch(request);
}

void backend_dispatcher::cancel(const transfer_id& id) {
    impl_->cancel(id);
}

void backend_dispatcher::request_pause(const transfer_id& id) {
    impl_->request_pause(id);
}

auto backend_dispatcher::remove(const transfer_id& id,
                                const backend_id& backend,
                                const std::vector<std::string>& locators)
    -> execution_outcome {
    return impl_->remove(id, backend, locators);
}

auto backend_dispatcher::in_flight() const -> std::size_t {
    return impl_->in_flight();
}

auto backend_dispatcher::staging_root() const -> const std::filesystem::path& {
    return impl_->staging_root();
}

}  // namespace kcenon::transfer_orchestrator
