/**
 * @file sync_reconciler.cpp
 * @brief Sync selection and plan building
 */

#include <kcenon/transfer_orchestrator/sync/sync_reconciler.h>
#include <kcenon/transfer_orchestrator/core/logging.h>

#include <variant>

namespace kcenon::transfer_orchestrator {

namespace {

auto parent_of(const std::string& relative) -> std::string {
    const auto slash = relative.rfind('/');
    return slash == std::string::npos ? std::string{} : relative.substr(0, slash);
}

auto is_default_selected(sync_classification c) -> bool {
    return c != sync_classification::same;
}

auto make_copy(const sync_location& from, const sync_location& to, const sync_entry& entry)
    -> transfer_request {
    transfer_request req;
    req.kind = transfer_kind::copy;
    req.sources = {join_locator(from.root, entry.relative_path)};
    req.destination = join_locator(to.root, parent_of(entry.relative_path));
    req.source_backend = from.backend;
    req.destination_backend = to.backend;
    req.label = entry.relative_path;
    return req;
}

}  // namespace

auto join_locator(const std::string& root, const std::string& relative) -> std::string {
    if (relative.empty()) {
        return root;
    }
    if (root.empty()) {
        return relative;
    }
    if (root.back() == '/') {
        return root + relative;
    }
    return root + "/" + relative;
}

sync_reconciler::sync_reconciler(std::shared_ptr<tree_differ> differ)
    : differ_(std::move(differ)) {
}

auto sync_reconciler::collect(const transfer_id& id, const sync_location& source,
                              const sync_location& destination, const sync_options& options,
                              const sync_event_callback& on_event) -> result<sync_summary> {
    if (!differ_) {
        return unexpected{error{error_code::invalid_configuration, "no tree differ configured"}};
    }

    entries_.clear();
    selected_.clear();
    summary_.reset();
    source_ = source;
    destination_ = destination;

    auto outcome = differ_->diff(id, source, destination, options,
        [this, &on_event](const sync_event& event) {
            if (const auto* entry = std::get_if<sync_entry>(&event)) {
                entries_.push_back(*entry);
            }
            if (on_event) {
                on_event(event);
            }
        });
    if (!outcome) {
        TO_LOG_WARN(log_category::sync, "Diff failed: " + outcome.error().message);
        return outcome;
    }

    summary_ = outcome.value();
    select_defaults();
    return outcome;
}

void sync_reconciler::cancel(const transfer_id& id) {
    if (differ_) {
        differ_->cancel(id);
    }
}

void sync_reconciler::select_defaults() {
    selected_.clear();
    for (const auto& entry : entries_) {
        if (is_default_selected(entry.classification)) {
            selected_.insert(entry.relative_path);
        }
    }
}

void sync_reconciler::select_all() {
    for (const auto& entry : entries_) {
        selected_.insert(entry.relative_path);
    }
}

void sync_reconciler::clear_selection() {
    selected_.clear();
}

auto sync_reconciler::select(const std::string& relative_path, bool selected) -> result<void> {
    for (const auto& entry : entries_) {
        if (entry.relative_path == relative_path) {
            if (selected) {
                selected_.insert(relative_path);
            } else {
                selected_.erase(relative_path);
            }
            return {};
        }
    }
    return unexpected{error{error_code::invalid_request, "no such entry: " + relative_path}};
}

void sync_reconciler::select(sync_classification classification) {
    for (const auto& entry : entries_) {
        if (entry.classification == classification) {
            selected_.insert(entry.relative_path);
        }
    }
}

void sync_reconciler::deselect(sync_classification classification) {
    for (const auto& entry : entries_) {
        if (entry.classification == classification) {
            selected_.erase(entry.relative_path);
        }
    }
}

auto sync_reconciler::is_selected(const std::string& relative_path) const -> bool {
    return selected_.count(relative_path) != 0;
}

auto sync_reconciler::selected_entries() const -> std::vector<sync_entry> {
    std::vector<sync_entry> out;
    for (const auto& entry : entries_) {
        if (is_selected(entry.relative_path)) {
            out.push_back(entry);
        }
    }
    return out;
}

auto sync_reconciler::build_plan(sync_direction direction) const -> sync_plan {
    sync_plan plan;
    if (!source_ || !destination_) {
        return plan;
    }

    const bool forward = direction == sync_direction::source_to_destination;
    const auto& from = forward ? *source_ : *destination_;
    const auto& to = forward ? *destination_ : *source_;
    // Entries present only on the side being overwritten
    const auto orphan = forward ? sync_classification::deleted : sync_classification::new_entry;
    const auto missing = forward ? sync_classification::new_entry : sync_classification::deleted;

    plan.deletions.backend = to.backend;
    for (const auto& entry : entries_) {
        if (!is_selected(entry.relative_path)) {
            continue;
        }
        if (entry.classification == missing ||
            entry.classification == sync_classification::modified) {
            plan.copies.push_back(make_copy(from, to, entry));
        } else if (entry.classification == orphan) {
            plan.deletions.locators.push_back(join_locator(to.root, entry.relative_path));
        }
    }
    return plan;
}

auto sync_reconciler::execute(const sync_plan& plan, transfer_scheduler& scheduler,
                              backend_dispatcher& dispatcher) -> result<sync_execution> {
    sync_execution done;

    for (const auto& request : plan.copies) {
        auto id = scheduler.enqueue(request);
        if (!id) {
            TO_LOG_ERROR(log_category::sync,
                "Sync copy of " + request.label + " rejected: " + id.error().message);
            return unexpected{id.error()};
        }
        done.enqueued.push_back(id.value());
    }

    if (!plan.deletions.locators.empty()) {
        const auto delete_id = transfer_id::generate();
        auto outcome = dispatcher.remove(delete_id, plan.deletions.backend,
                                         plan.deletions.locators);
        if (const auto* failure = std::get_if<backend_error>(&outcome)) {
            if (failure->is_cancellation()) {
                return unexpected{error{error_code::operation_cancelled, failure->detail}};
            }
            TO_LOG_ERROR(log_category::sync, "Sync deletions failed: " + failure->detail);
            return unexpected{error{error_code::file_write_error, failure->detail}};
        }
        done.deleted = plan.deletions.locators.size();
    }

    TO_LOG_INFO(log_category::sync,
        "Sync started: " + std::to_string(done.enqueued.size()) + " copies, " +
        std::to_string(done.deleted) + " deletions");
    return done;
}

}  // namespace kcenon::transfer_orchestrator
