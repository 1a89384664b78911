/**
 * @file local_filesystem_backend.cpp
 * @brief Local filesystem primitive implementation
 */

#include <kcenon/transfer_orchestrator/dispatch/local_filesystem_backend.h>
#include <kcenon/transfer_orchestrator/core/logging.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace kcenon::transfer_orchestrator {

namespace fs = std::filesystem;

namespace {

struct tree_size {
    uint64_t bytes = 0;
    uint32_t files = 0;
};

// Files listed in `done` are left out of the total
auto measure(const fs::path& path, const std::unordered_set<std::string>& done,
             std::error_code& ec) -> tree_size {
    tree_size size;
    if (fs::is_directory(path, ec)) {
        for (auto it = fs::recursive_directory_iterator(path, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && done.count(it->path().string()) == 0) {
                size.bytes += it->file_size(ec);
                ++size.files;
            }
        }
    } else if (!ec) {
        size.bytes = fs::file_size(path, ec);
        size.files = 1;
    }
    return size;
}

// "a/b/" and "a/b" both name "b"
auto leaf_name(const fs::path& path) -> fs::path {
    auto name = path.filename();
    if (name.empty()) {
        name = path.parent_path().filename();
    }
    return name;
}

}  // namespace

class local_filesystem_backend::impl {
public:
    explicit impl(local_backend_config config) : config_(std::move(config)) {
        if (config_.chunk_size == 0) {
            config_.chunk_size = 64 * 1024;
        }
    }

    auto run(const execution_context& ctx, bool move) -> execution_outcome {
        signal_scope scope(*this, ctx.id);

        std::error_code ec;
        fs::path destination(ctx.destination);
        fs::create_directories(destination, ec);
        if (ec) {
            return backend_error::io("cannot create destination " + ctx.destination +
                                     ": " + ec.message());
        }

        episode ep{ctx};
        if (ctx.resume_from) {
            ep.completed = ctx.resume_from->files_completed;
            ep.done.insert(ep.completed.begin(), ep.completed.end());
            ep.progress.bytes_done = ctx.resume_from->bytes_done;
            ep.progress.files_done = ctx.resume_from->files_done;
        }
        ep.progress.bytes_total = ep.progress.bytes_done;
        ep.progress.files_total = ep.progress.files_done;

        for (const auto& source : ctx.sources) {
            if (ep.done.count(source) != 0) {
                continue;
            }
            if (!fs::exists(source, ec)) {
                return backend_error::io("source not found: " + source);
            }
            auto size = measure(source, ep.done, ec);
            if (ec) {
                return backend_error::io("cannot stat " + source + ": " + ec.message());
            }
            ep.progress.bytes_total += size.bytes;
            ep.progress.files_total += size.files;
        }
        ctx.report(ep.progress);

        std::unique_ptr<bandwidth_limiter> own_limiter;
        if (config_.live_settings) {
            ep.limiter = &config_.live_settings->limiter();
        } else if (ctx.bandwidth_limit > 0) {
            own_limiter = std::make_unique<bandwidth_limiter>(ctx.bandwidth_limit);
            ep.limiter = own_limiter.get();
        }

        for (const auto& source : ctx.sources) {
            if (ep.done.count(source) != 0) {
                continue;
            }
            if (auto stop = check_signals(ep)) {
                return *stop;
            }

            ep.progress.current_item = source;
            auto stop = move ? move_one(ep, source, destination)
                             : copy_one(ep, source, destination);
            if (stop) {
                return *stop;
            }
            ep.finish(source);
        }

        ep.progress.current_item.clear();
        ctx.report(ep.progress);
        return transfer_completed{};
    }

    auto remove(const transfer_id& id, const std::vector<std::string>& paths)
        -> execution_outcome {
        signal_scope scope(*this, id);

        for (const auto& path : paths) {
            if (cancel_requested(id)) {
                return backend_error::cancelled();
            }
            std::error_code ec;
            fs::remove_all(path, ec);
            if (ec) {
                return backend_error::io("cannot delete " + path + ": " + ec.message());
            }
        }
        return transfer_completed{};
    }

    // Ignored unless a call for the id is running
    void cancel(const transfer_id& id) {
        std::lock_guard lock(mutex_);
        if (auto it = signals_.find(id); it != signals_.end()) {
            it->second.cancel = true;
        }
    }

    void request_pause(const transfer_id& id) {
        std::lock_guard lock(mutex_);
        if (auto it = signals_.find(id); it != signals_.end()) {
            it->second.pause = true;
        }
    }

private:
    struct signal_flags {
        bool cancel = false;
        bool pause = false;
    };

    // Flags for an id live exactly as long as the call that owns them
    class signal_scope {
    public:
        signal_scope(impl& owner, const transfer_id& id) : owner_(owner), id_(id) {
            std::lock_guard lock(owner_.mutex_);
            owner_.signals_[id_] = signal_flags{};
        }
        ~signal_scope() {
            std::lock_guard lock(owner_.mutex_);
            owner_.signals_.erase(id_);
        }

        signal_scope(const signal_scope&) = delete;
        signal_scope& operator=(const signal_scope&) = delete;

    private:
        impl& owner_;
        transfer_id id_;
    };

    /**
     * State of one copy or move call. `completed` holds finished top-level
     * sources and finished files inside directory sources, in order.
     */
    struct episode {
        const execution_context& ctx;
        progress_event progress;
        bandwidth_limiter* limiter = nullptr;
        std::vector<std::string> completed;
        std::unordered_set<std::string> done;

        void finish(const std::string& path) {
            if (done.insert(path).second) {
                completed.push_back(path);
            }
        }

        // True when a file below `root` was finished by an earlier call
        auto has_partial(const fs::path& root) const -> bool {
            const auto prefix = (root / "").string();
            return std::any_of(completed.begin(), completed.end(),
                               [&](const std::string& path) {
                                   return path.compare(0, prefix.size(), prefix) == 0;
                               });
        }
    };

    auto cancel_requested(const transfer_id& id) const -> bool {
        std::lock_guard lock(mutex_);
        auto it = signals_.find(id);
        return it != signals_.end() && it->second.cancel;
    }

    auto pause_requested(const transfer_id& id) const -> bool {
        std::lock_guard lock(mutex_);
        auto it = signals_.find(id);
        return it != signals_.end() && it->second.pause;
    }

    auto check_signals(const episode& ep) const -> std::optional<execution_outcome> {
        if (cancel_requested(ep.ctx.id)) {
            return execution_outcome{backend_error::cancelled()};
        }
        if (pause_requested(ep.ctx.id)) {
            return execution_outcome{make_checkpoint(ep)};
        }
        return std::nullopt;
    }

    static auto make_checkpoint(const episode& ep) -> checkpoint {
        checkpoint cp;
        cp.files_completed = ep.completed;
        cp.bytes_done = ep.progress.bytes_done;
        cp.bytes_total = ep.progress.bytes_total;
        cp.files_done = ep.progress.files_done;
        cp.files_total = ep.progress.files_total;
        return cp;
    }

    // nullopt when the source was copied in full
    auto copy_one(episode& ep, const fs::path& source, const fs::path& destination)
        -> std::optional<execution_outcome> {
        std::error_code ec;
        auto target = destination / leaf_name(source);

        if (!fs::is_directory(source, ec)) {
            if (auto failure = copy_file(ep, source, target)) {
                return execution_outcome{*failure};
            }
            return std::nullopt;
        }

        fs::create_directories(target, ec);
        if (ec) {
            return execution_outcome{
                backend_error::io("cannot create " + target.string() + ": " + ec.message())};
        }

        for (auto it = fs::recursive_directory_iterator(source, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            auto relative = fs::relative(it->path(), source, ec);
            if (ec) {
                break;
            }
            if (it->is_directory(ec)) {
                fs::create_directories(target / relative, ec);
            } else if (it->is_regular_file(ec)) {
                const auto path = it->path().string();
                if (ep.done.count(path) != 0) {
                    continue;
                }
                if (auto stop = check_signals(ep)) {
                    return stop;
                }
                ep.progress.current_item = path;
                if (auto failure = copy_file(ep, it->path(), target / relative)) {
                    return execution_outcome{*failure};
                }
                ep.finish(path);
            }
            if (ec) {
                break;
            }
        }
        if (ec) {
            return execution_outcome{
                backend_error::io("cannot copy " + source.string() + ": " + ec.message())};
        }
        return std::nullopt;
    }

    auto copy_file(episode& ep, const fs::path& from, const fs::path& to)
        -> std::optional<backend_error> {
        std::error_code ec;
        if (!config_.overwrite_existing && fs::exists(to, ec)) {
            return backend_error::io("destination exists: " + to.string());
        }

        std::ifstream in(from, std::ios::binary);
        if (!in) {
            return backend_error::io("cannot open " + from.string());
        }
        std::ofstream out(to, std::ios::binary | std::ios::trunc);
        if (!out) {
            return backend_error::io("cannot create " + to.string());
        }

        auto& progress = ep.progress;
        std::vector<char> buffer(config_.chunk_size);
        while (in) {
            if (cancel_requested(ep.ctx.id)) {
                out.close();
                fs::remove(to, ec);
                return backend_error::cancelled();
            }

            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto count = in.gcount();
            if (count <= 0) {
                break;
            }
            if (ep.limiter) {
                ep.limiter->acquire(static_cast<std::size_t>(count));
            }
            out.write(buffer.data(), count);
            if (!out) {
                return backend_error::io("write failed: " + to.string());
            }

            progress.bytes_done = std::min(progress.bytes_done + static_cast<uint64_t>(count),
                                           progress.bytes_total);
            ep.ctx.report(progress);
        }
        if (in.bad()) {
            return backend_error::io("read failed: " + from.string());
        }

        if (progress.files_done < progress.files_total) {
            ++progress.files_done;
        }
        ep.ctx.report(progress);
        return std::nullopt;
    }

    auto move_one(episode& ep, const fs::path& source, const fs::path& destination)
        -> std::optional<execution_outcome> {
        std::error_code ec;
        auto target = destination / leaf_name(source);

        // A directory paused half way is finished by copying the rest
        if (!ep.has_partial(source)) {
            if (fs::exists(target, ec)) {
                if (!config_.overwrite_existing) {
                    return execution_outcome{
                        backend_error::io("destination exists: " + target.string())};
                }
                if (fs::is_directory(target, ec)) {
                    fs::remove_all(target, ec);
                }
            }

            auto size = measure(source, ep.done, ec);
            ec.clear();
            fs::rename(source, target, ec);
            if (!ec) {
                auto& progress = ep.progress;
                progress.bytes_done =
                    std::min(progress.bytes_done + size.bytes, progress.bytes_total);
                progress.files_done =
                    std::min(progress.files_done + size.files, progress.files_total);
                ep.ctx.report(progress);
                return std::nullopt;
            }

            TO_LOG_DEBUG(log_category::backend,
                "Rename failed (" + ec.message() + "), copying " + source.string());
        }

        if (auto stop = copy_one(ep, source, destination)) {
            return stop;
        }

        ec.clear();
        fs::remove_all(source, ec);
        if (ec) {
            return execution_outcome{backend_error::io(
                "copied, but cannot delete " + source.string() + ": " + ec.message())};
        }
        return std::nullopt;
    }

    local_backend_config config_;
    mutable std::mutex mutex_;
    std::unordered_map<transfer_id, signal_flags> signals_;
};

local_filesystem_backend::local_filesystem_backend(local_backend_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
}

local_filesystem_backend::~local_filesystem_backend() = default;

auto local_filesystem_backend::copy(const execution_context& ctx) -> execution_outcome {
    return impl_->run(ctx, false);
}

auto local_filesystem_backend::move(const execution_context& ctx) -> execution_outcome {
    return impl_->run(ctx, true);
}

auto local_filesystem_backend::remove(const transfer_id& id,
                                      const std::vector<std::string>& paths)
    -> execution_outcome {
    return impl_->remove(id, paths);
}

void local_filesystem_backend::cancel(const transfer_id& id) {
    impl_->cancel(id);
}

void local_filesystem_backend::request_pause(const transfer_id& id) {
    impl_->request_pause(id);
}

}  // namespace kcenon::transfer_orchestrator
