/**
 * @file checkpoint_store.cpp
 * @brief Implementation of checkpoint_store
 */

#include <kcenon/transfer_orchestrator/core/checkpoint_store.h>
#include <kcenon/transfer_orchestrator/core/logging.h>

#include "checkpoint_codec.h"
#include "json_reader.h"

#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <unordered_map>

namespace kcenon::transfer_orchestrator {

// ============================================================================
// checkpoint_store_config implementation
// ============================================================================

checkpoint_store_config::checkpoint_store_config()
    : state_directory(std::filesystem::temp_directory_path() / "transfer_orchestrator_states") {
}

checkpoint_store_config::checkpoint_store_config(std::filesystem::path dir)
    : state_directory(std::move(dir)) {
}

// ============================================================================
// JSON helpers
// ============================================================================

namespace {

auto to_millis(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

auto from_millis(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

void write_backend(std::ostringstream& oss, const char* name, const backend_id& backend) {
    oss << "  \"" << name << "\": {\"tag\": \"" << to_string(backend.tag)
        << "\", \"handle\": " << detail::quote_json(backend.handle) << "},\n";
}

auto read_backend(const detail::json_value& root, std::string_view name)
    -> std::optional<backend_id> {
    const auto* node = root.find(name);
    if (!node) return std::nullopt;
    auto tag_text = node->get_string("tag");
    auto handle = node->get_string("handle");
    if (!tag_text || !handle) return std::nullopt;
    auto tag = backend_tag_from_string(*tag_text);
    if (!tag) return std::nullopt;
    return backend_id{*tag, std::move(*handle)};
}

auto serialize_entry(const persisted_transfer& entry) -> std::string {
    const auto& req = entry.request;
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"id\": \"" << req.id->to_string() << "\",\n";
    oss << "  \"kind\": \"" << to_string(req.kind) << "\",\n";
    oss << "  \"sources\": [";
    for (std::size_t i = 0; i < req.sources.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << detail::quote_json(req.sources[i]);
    }
    oss << "],\n";
    oss << "  \"destination\": " << detail::quote_json(req.destination) << ",\n";
    write_backend(oss, "source_backend", req.source_backend);
    write_backend(oss, "destination_backend", req.destination_backend);
    oss << "  \"label\": " << detail::quote_json(req.label) << ",\n";
    oss << "  \"priority\": " << entry.priority << ",\n";
    oss << "  \"saved_at\": " << to_millis(entry.saved_at) << ",\n";
    oss << "  \"checkpoint\": " << to_json(entry.state) << "\n";
    oss << "}\n";
    return oss.str();
}

auto deserialize_entry(std::string_view json) -> result<persisted_transfer> {
    auto parsed = detail::parse_json(json);
    if (!parsed) {
        return unexpected(parsed.error());
    }
    const auto& root = parsed.value();

    auto id_text = root.get_string("id");
    auto kind_text = root.get_string("kind");
    auto sources = root.get_string_array("sources");
    auto destination = root.get_string("destination");
    auto src_backend = read_backend(root, "source_backend");
    auto dst_backend = read_backend(root, "destination_backend");
    const auto* cp_node = root.find("checkpoint");
    if (!id_text || !kind_text || !sources || !destination ||
        !src_backend || !dst_backend || !cp_node) {
        return unexpected(error(error_code::invalid_request,
            "state file is missing required fields"));
    }

    auto id = transfer_id::from_string(*id_text);
    auto kind = transfer_kind_from_string(*kind_text);
    if (!id || !kind) {
        return unexpected(error(error_code::invalid_request,
            "state file has an invalid id or kind"));
    }

    auto cp = detail::read_checkpoint(*cp_node);
    if (!cp) {
        return unexpected(cp.error());
    }

    persisted_transfer entry;
    entry.request.id = *id;
    entry.request.kind = *kind;
    entry.request.sources = std::move(*sources);
    entry.request.destination = std::move(*destination);
    entry.request.source_backend = std::move(*src_backend);
    entry.request.destination_backend = std::move(*dst_backend);
    entry.request.label = root.get_string("label").value_or("");
    entry.priority = root.get_uint64("priority").value_or(0);
    entry.saved_at = from_millis(root.get_int64("saved_at").value_or(0));
    entry.state = std::move(cp.value());
    return entry;
}

auto state_file_path(const std::filesystem::path& dir, const transfer_id& id)
    -> std::filesystem::path {
    return dir / (id.to_string() + ".json");
}

}  // namespace

// ============================================================================
// checkpoint_store::impl
// ============================================================================

class checkpoint_store::impl {
public:
    explicit impl(const checkpoint_store_config& cfg)
        : config_(cfg) {
        std::error_code ec;
        std::filesystem::create_directories(config_.state_directory, ec);
        if (ec) {
            TO_LOG_WARN(log_category::checkpoint,
                "Failed to create state directory: " +
                config_.state_directory.string() + " (" + ec.message() + ")");
        }
        if (config_.auto_cleanup) {
            cleanup_expired();
        }
    }

    auto save(const persisted_transfer& entry) -> result<void> {
        if (!entry.request.id) {
            return unexpected(error(error_code::invalid_request,
                "persisted transfer requires an id"));
        }
        if (entry.request.encryption) {
            return unexpected(error(error_code::invalid_request,
                "encrypted transfers are not persisted"));
        }

        const auto& id = *entry.request.id;
        std::unique_lock lock(mutex_);

        TO_LOG_DEBUG(log_category::checkpoint,
            "Saving checkpoint: " + id.to_string() + " (" +
            std::to_string(entry.state.files_completed.size()) + " files completed)");

        auto path = state_file_path(config_.state_directory, id);
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            TO_LOG_ERROR(log_category::checkpoint,
                "Failed to open state file for writing: " + path.string());
            return unexpected(error(error_code::file_write_error,
                "failed to open state file for writing"));
        }

        file << serialize_entry(entry);
        if (!file) {
            TO_LOG_ERROR(log_category::checkpoint,
                "Failed to write state file: " + path.string());
            return unexpected(error(error_code::file_write_error,
                "failed to write state file"));
        }

        cache_[id] = entry;
        return {};
    }

    auto load(const transfer_id& id) -> result<persisted_transfer> {
        {
            std::shared_lock lock(mutex_);
            auto it = cache_.find(id);
            if (it != cache_.end()) {
                return it->second;
            }
        }

        auto path = state_file_path(config_.state_directory, id);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return unexpected(error(error_code::file_not_found,
                "state file not found"));
        }

        std::ifstream file(path);
        if (!file) {
            TO_LOG_ERROR(log_category::checkpoint,
                "Failed to open state file: " + path.string());
            return unexpected(error(error_code::file_read_error,
                "failed to open state file"));
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        auto loaded = deserialize_entry(oss.str());
        if (!loaded) {
            TO_LOG_ERROR(log_category::checkpoint,
                "Failed to parse state file " + path.string() + ": " +
                loaded.error().message);
            return loaded;
        }

        TO_LOG_DEBUG(log_category::checkpoint, "Checkpoint recovered: " + id.to_string());

        std::unique_lock lock(mutex_);
        cache_[id] = loaded.value();
        return loaded;
    }

    auto remove(const transfer_id& id) -> result<void> {
        std::unique_lock lock(mutex_);
        cache_.erase(id);

        auto path = state_file_path(config_.state_directory, id);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            TO_LOG_ERROR(log_category::checkpoint,
                "Failed to delete state file: " + path.string() +
                " (" + ec.message() + ")");
            return unexpected(error(error_code::file_write_error,
                "failed to delete state file: " + ec.message()));
        }
        return {};
    }

    auto contains(const transfer_id& id) const -> bool {
        {
            std::shared_lock lock(mutex_);
            if (cache_.find(id) != cache_.end()) {
                return true;
            }
        }
        std::error_code ec;
        return std::filesystem::exists(state_file_path(config_.state_directory, id), ec);
    }

    auto list() -> std::vector<persisted_transfer> {
        std::vector<persisted_transfer> entries;
        for (const auto& id : stored_ids()) {
            auto loaded = load(id);
            if (loaded) {
                entries.push_back(std::move(loaded.value()));
            }
        }
        TO_LOG_DEBUG(log_category::checkpoint,
            "Found " + std::to_string(entries.size()) + " persisted transfers");
        return entries;
    }

    auto cleanup_expired() -> std::size_t {
        std::size_t removed = 0;
        auto now = std::chrono::system_clock::now();

        for (const auto& id : stored_ids()) {
            auto loaded = load(id);
            if (!loaded) {
                continue;
            }
            if (now - loaded.value().saved_at > config_.state_ttl) {
                if (remove(id)) {
                    ++removed;
                }
            }
        }

        if (removed > 0) {
            TO_LOG_INFO(log_category::checkpoint,
                "Removed " + std::to_string(removed) + " expired checkpoints");
        }
        return removed;
    }

    auto config() const -> const checkpoint_store_config& { return config_; }

private:
    auto stored_ids() const -> std::vector<transfer_id> {
        std::vector<transfer_id> ids;
        std::error_code ec;
        if (!std::filesystem::exists(config_.state_directory, ec)) {
            return ids;
        }
        for (const auto& entry :
             std::filesystem::directory_iterator(config_.state_directory, ec)) {
            if (entry.path().extension() != ".json") {
                continue;
            }
            auto id = transfer_id::from_string(entry.path().stem().string());
            if (id) {
                ids.push_back(*id);
            }
        }
        return ids;
    }

    checkpoint_store_config config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<transfer_id, persisted_transfer> cache_;
};

// ============================================================================
// checkpoint_store public interface
// ============================================================================

checkpoint_store::checkpoint_store(const checkpoint_store_config& config)
    : impl_(std::make_unique<impl>(config)) {
}

checkpoint_store::~checkpoint_store() = default;

checkpoint_store::checkpoint_store(checkpoint_store&&) noexcept = default;

auto checkpoint_store::operator=(checkpoint_store&&) noexcept
    -> checkpoint_store& = default;

auto checkpoint_store::save(const persisted_transfer& entry) -> result<void> {
    return impl_->save(entry);
}

auto checkpoint_store::load(const transfer_id& id) -> result<persisted_transfer> {
    return impl_->load(id);
}

auto checkpoint_store::remove(const transfer_id& id) -> result<void> {
    return impl_->remove(id);
}

auto checkpoint_store::contains(const transfer_id& id) const -> bool {
    return impl_->contains(id);
}

auto checkpoint_store::list() -> std::vector<persisted_transfer> {
    return impl_->list();
}

auto checkpoint_store::cleanup_expired() -> std::size_t {
    return impl_->cleanup_expired();
}

auto checkpoint_store::config() const -> const checkpoint_store_config& {
    return impl_->config();
}

}  // namespace kcenon::transfer_orchestrator
