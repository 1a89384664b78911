/**
 * @file tree_differ.cpp
 * @brief Compare rules shared by tree differs
 */

#include <kcenon/transfer_orchestrator/sync/tree_differ.h>

#include <fnmatch.h>

namespace kcenon::transfer_orchestrator {

namespace {

auto trim(std::string_view text) -> std::string_view {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

auto strip_quotes(std::string_view tag) -> std::string_view {
    while (!tag.empty() && tag.front() == '"') tag.remove_prefix(1);
    while (!tag.empty() && tag.back() == '"') tag.remove_suffix(1);
    return tag;
}

auto glob_match(const std::string& pattern, const std::string& text) -> bool {
    return ::fnmatch(pattern.c_str(), text.c_str(), 0) == 0;
}

}  // namespace

auto is_excluded(std::string_view relative_path, const std::vector<std::string>& patterns)
    -> bool {
    const std::string path(relative_path);
    const auto slash = relative_path.rfind('/');
    const std::string name(slash == std::string_view::npos ? relative_path
                                                           : relative_path.substr(slash + 1));

    for (const auto& raw : patterns) {
        const std::string pattern(trim(raw));
        if (pattern.empty()) {
            continue;
        }
        if (glob_match(pattern, path) || glob_match(pattern, name)) {
            return true;
        }
    }
    return false;
}

auto files_differ_checksum(uint64_t source_size, std::string_view source_etag,
                           uint64_t dest_size, std::string_view dest_etag) -> bool {
    if (source_etag.empty() || dest_etag.empty()) {
        return source_size != dest_size;
    }
    // Multipart etags are not content hashes
    if (source_etag.find('-') != std::string_view::npos ||
        dest_etag.find('-') != std::string_view::npos) {
        return source_size != dest_size;
    }
    return strip_quotes(source_etag) != strip_quotes(dest_etag);
}

auto classify(const sync_entry& both_sides, compare_mode mode) -> sync_classification {
    bool differs = false;
    if (mode == compare_mode::checksum) {
        differs = files_differ_checksum(both_sides.source_size, both_sides.source_etag,
                                        both_sides.dest_size, both_sides.dest_etag);
    } else {
        differs = both_sides.source_size != both_sides.dest_size ||
                  both_sides.source_modified_ms > both_sides.dest_modified_ms;
    }
    return differs ? sync_classification::modified : sync_classification::same;
}

}  // namespace kcenon::transfer_orchestrator
