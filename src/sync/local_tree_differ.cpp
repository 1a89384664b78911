/**
 * @file local_tree_differ.cpp
 * @brief Local directory tree comparison
 */

#include <kcenon/transfer_orchestrator/sync/local_tree_differ.h>
#include <kcenon/transfer_orchestrator/config/feature_flags.h>
#include <kcenon/transfer_orchestrator/core/logging.h>

#include <array>
#include <atomic>
#include <chrono>
#include <fstream>
#include <map>
#include <mutex>
#include <unordered_map>

#if TRANSFER_ORCH_HAS_CHECKSUM
#include <openssl/evp.h>
#endif

namespace kcenon::transfer_orchestrator {

namespace fs = std::filesystem;

namespace {

struct file_info {
    uint64_t size = 0;
    int64_t modified_ms = 0;
    std::string etag;
};

using file_map = std::map<std::string, file_info>;

auto modified_ms(const fs::directory_entry& entry) -> int64_t {
    std::error_code ec;
    auto ftime = entry.last_write_time(ec);
    if (ec) {
        return 0;
    }
    auto sys = std::chrono::file_clock::to_sys(ftime);
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        sys.time_since_epoch()).count();
}

#if TRANSFER_ORCH_HAS_CHECKSUM
/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
class evp_md_ctx_wrapper {
public:
    evp_md_ctx_wrapper() : ctx_(EVP_MD_CTX_new()) {}
    ~evp_md_ctx_wrapper() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    evp_md_ctx_wrapper(const evp_md_ctx_wrapper&) = delete;
    evp_md_ctx_wrapper& operator=(const evp_md_ctx_wrapper&) = delete;

    [[nodiscard]] auto get() const -> EVP_MD_CTX* { return ctx_; }

private:
    EVP_MD_CTX* ctx_;
};
#endif

}  // namespace

class local_tree_differ::impl {
public:
    auto diff(const transfer_id& id, const sync_location& source,
              const sync_location& destination, const sync_options& options,
              const sync_event_callback& on_event) -> result<sync_summary> {
        if (source.backend.tag != backend_tag::local ||
            destination.backend.tag != backend_tag::local) {
            return unexpected{error{error_code::invalid_request,
                                    "local_tree_differ compares local directories only"}};
        }

        auto flag = register_diff(id);
        cancel_scope scope(*this, id);
        const bool use_checksum = options.mode == compare_mode::checksum;

        TO_LOG_INFO(log_category::sync,
            "Comparing " + source.root + " with " + destination.root +
            (use_checksum ? " (checksum)" : " (size/mtime)"));

        auto source_files = collect(source.root, use_checksum, *flag);
        if (!source_files) {
            return unexpected{source_files.error()};
        }
        auto dest_files = collect(destination.root, use_checksum, *flag);
        if (!dest_files) {
            return unexpected{dest_files.error()};
        }
        if (flag->load()) {
            return cancelled(id);
        }

        if (!options.excludes.empty()) {
            apply_excludes(source_files.value(), options.excludes);
            apply_excludes(dest_files.value(), options.excludes);
        }

        const auto& src = source_files.value();
        const auto& dst = dest_files.value();
        sync_summary summary;
        uint32_t scanned = 0;

        auto emit = [&](sync_entry entry) {
            switch (entry.classification) {
                case sync_classification::new_entry: ++summary.new_count; break;
                case sync_classification::modified: ++summary.modified; break;
                case sync_classification::deleted: ++summary.deleted; break;
                case sync_classification::same: ++summary.same; break;
            }
            if (on_event) {
                on_event(sync_event{std::move(entry)});
            }
            if (++scanned % progress_interval == 0 && on_event) {
                on_event(sync_event{sync_progress{scanned}});
            }
        };

        for (const auto& [path, info] : src) {
            if (flag->load()) {
                return cancelled(id);
            }
            sync_entry entry;
            entry.relative_path = path;
            entry.source_size = info.size;
            entry.source_modified_ms = info.modified_ms;
            entry.source_etag = info.etag;

            auto other = dst.find(path);
            if (other == dst.end()) {
                entry.classification = sync_classification::new_entry;
            } else {
                entry.dest_size = other->second.size;
                entry.dest_modified_ms = other->second.modified_ms;
                entry.dest_etag = other->second.etag;
                entry.classification = classify(entry, options.mode);
            }
            emit(std::move(entry));
        }

        for (const auto& [path, info] : dst) {
            if (flag->load()) {
                return cancelled(id);
            }
            if (src.count(path) != 0) {
                continue;
            }
            sync_entry entry;
            entry.relative_path = path;
            entry.classification = sync_classification::deleted;
            entry.dest_size = info.size;
            entry.dest_modified_ms = info.modified_ms;
            entry.dest_etag = info.etag;
            emit(std::move(entry));
        }

        summary.total = summary.new_count + summary.modified + summary.deleted + summary.same;
        if (on_event) {
            on_event(sync_event{summary});
        }

        TO_LOG_INFO(log_category::sync,
            "Diff done: " + std::to_string(summary.new_count) + " new, " +
            std::to_string(summary.modified) + " modified, " +
            std::to_string(summary.deleted) + " deleted, " +
            std::to_string(summary.same) + " same");
        return summary;
    }

    void cancel(const transfer_id& id) {
        std::lock_guard lock(mutex_);
        auto it = flags_.find(id);
        if (it != flags_.end()) {
            it->second->store(true);
        }
    }

private:
    class cancel_scope {
    public:
        cancel_scope(impl& owner, const transfer_id& id) : owner_(owner), id_(id) {}
        ~cancel_scope() {
            std::lock_guard lock(owner_.mutex_);
            owner_.flags_.erase(id_);
        }

        cancel_scope(const cancel_scope&) = delete;
        cancel_scope& operator=(const cancel_scope&) = delete;

    private:
        impl& owner_;
        transfer_id id_;
    };

    auto register_diff(const transfer_id& id) -> std::shared_ptr<std::atomic<bool>> {
        std::lock_guard lock(mutex_);
        auto flag = std::make_shared<std::atomic<bool>>(false);
        flags_[id] = flag;
        return flag;
    }

    static auto cancelled(const transfer_id& id) -> unexpected {
        TO_LOG_INFO(log_category::sync, "Diff cancelled: " + id.to_string());
        return unexpected{error{error_code::operation_cancelled, "diff cancelled"}};
    }

    static auto collect(const std::string& root, bool use_checksum,
                        const std::atomic<bool>& cancel_flag) -> result<file_map> {
        std::error_code ec;
        const fs::path base(root);
        if (!fs::exists(base, ec)) {
            // A missing tree compares as empty
            return file_map{};
        }
        if (!fs::is_directory(base, ec)) {
            return unexpected{error{error_code::invalid_file_path, "not a directory: " + root}};
        }

        file_map files;
        auto it = fs::recursive_directory_iterator(
            base, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return unexpected{error{error_code::file_read_error,
                                    "cannot read " + root + ": " + ec.message()}};
        }

        // A failed increment leaves the iterator at end, so the map would be partial
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (cancel_flag.load()) {
                return files;
            }

            const auto& entry = *it;
            std::error_code entry_ec;
            if (entry.is_symlink(entry_ec) && entry.is_directory(entry_ec)) {
                continue;
            }
            if (!entry.is_regular_file(entry_ec)) {
                continue;
            }

            file_info info;
            info.size = entry.file_size(entry_ec);
            if (entry_ec) {
                continue;
            }
            info.modified_ms = modified_ms(entry);
            if (use_checksum) {
                info.etag = file_md5(entry.path()).value_or(std::string{});
            }

            auto relative = entry.path().lexically_relative(base).generic_string();
            files.emplace(std::move(relative), std::move(info));
        }
        if (ec) {
            TO_LOG_ERROR(log_category::sync, "Walk of " + root + " failed: " + ec.message());
            return unexpected{error{error_code::file_read_error,
                                    "cannot read " + root + ": " + ec.message()}};
        }
        return files;
    }

    static void apply_excludes(file_map& files, const std::vector<std::string>& patterns) {
        for (auto it = files.begin(); it != files.end();) {
            if (is_excluded(it->first, patterns)) {
                it = files.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::mutex mutex_;
    std::unordered_map<transfer_id, std::shared_ptr<std::atomic<bool>>> flags_;
};

local_tree_differ::local_tree_differ() : impl_(std::make_unique<impl>()) {
}

local_tree_differ::~local_tree_differ() = default;

auto local_tree_differ::diff(const transfer_id& id, const sync_location& source,
                             const sync_location& destination, const sync_options& options,
                             const sync_event_callback& on_event) -> result<sync_summary> {
    return impl_->diff(id, source, destination, options, on_event);
}

void local_tree_differ::cancel(const transfer_id& id) {
    impl_->cancel(id);
}

auto local_tree_differ::file_md5(const fs::path& path) -> std::optional<std::string> {
#if TRANSFER_ORCH_HAS_CHECKSUM
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    evp_md_ctx_wrapper ctx;
    if (!ctx.get() || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return std::nullopt;
    }

    std::array<char, 8192> buffer{};
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = file.gcount();
        if (count > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(count)) != 1) {
            return std::nullopt;
        }
    }
    if (file.bad()) {
        return std::nullopt;
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        return std::nullopt;
    }

    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0f]);
    }
    return out;
#else
    (void)path;
    return std::nullopt;
#endif
}

}  // namespace kcenon::transfer_orchestrator
