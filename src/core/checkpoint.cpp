/**
 * @file checkpoint.cpp
 * @brief Checkpoint JSON serialization
 */

#include <kcenon/transfer_orchestrator/core/checkpoint.h>

#include "checkpoint_codec.h"
#include "json_reader.h"

#include <sstream>

namespace kcenon::transfer_orchestrator {

namespace {

void write_string_array(std::ostringstream& oss, const std::vector<std::string>& items) {
    oss << "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << ",";
        oss << detail::quote_json(items[i]);
    }
    oss << "]";
}

auto parse_multipart(const detail::json_value& node) -> result<multipart_upload_state> {
    multipart_upload_state state;
    auto upload_id = node.get_string("upload_id");
    auto key = node.get_string("key");
    const auto* parts = node.find("completed_parts");
    if (!upload_id || !key || !parts || !parts->is_array()) {
        return unexpected(error(error_code::invalid_request,
            "incomplete multipart state in checkpoint"));
    }
    state.upload_id = std::move(*upload_id);
    state.key = std::move(*key);

    for (const auto& part : parts->items()) {
        auto number = part.get_int64("part_number");
        auto etag = part.get_string("etag");
        if (!number || !etag) {
            return unexpected(error(error_code::invalid_request,
                "invalid completed part in checkpoint"));
        }
        state.completed_parts.push_back(
            completed_part{static_cast<int32_t>(*number), std::move(*etag)});
    }
    return state;
}

auto parse_staging(const detail::json_value& node) -> result<staging_state> {
    staging_state state;
    auto phase = node.get_string("phase");
    auto directory = node.get_string("directory");
    auto files = node.get_string_array("phase_files_completed");
    if (!phase || !directory || !files) {
        return unexpected(error(error_code::invalid_request,
            "incomplete staging state in checkpoint"));
    }

    if (*phase == "download") {
        state.phase = staging_phase::download;
    } else if (*phase == "upload") {
        state.phase = staging_phase::upload;
    } else {
        return unexpected(error(error_code::invalid_request,
            "unknown staging phase: " + *phase));
    }

    state.directory = std::move(*directory);
    state.phase_files_completed = std::move(*files);
    state.phase_bytes_done = node.get_uint64("phase_bytes_done").value_or(0);
    state.phase_bytes_total = node.get_uint64("phase_bytes_total").value_or(0);
    state.phase_files_done =
        static_cast<uint32_t>(node.get_uint64("phase_files_done").value_or(0));
    state.phase_files_total =
        static_cast<uint32_t>(node.get_uint64("phase_files_total").value_or(0));
    return state;
}

}  // namespace

auto to_json(const checkpoint& cp) -> std::string {
    std::ostringstream oss;
    oss << "{\"files_completed\":";
    write_string_array(oss, cp.files_completed);
    oss << ",\"bytes_done\":" << cp.bytes_done
        << ",\"bytes_total\":" << cp.bytes_total
        << ",\"files_done\":" << cp.files_done
        << ",\"files_total\":" << cp.files_total;

    if (cp.multipart) {
        const auto& mp = *cp.multipart;
        oss << ",\"multipart\":{\"upload_id\":" << detail::quote_json(mp.upload_id)
            << ",\"key\":" << detail::quote_json(mp.key)
            << ",\"completed_parts\":[";
        for (std::size_t i = 0; i < mp.completed_parts.size(); ++i) {
            if (i > 0) oss << ",";
            oss << "{\"part_number\":" << mp.completed_parts[i].part_number
                << ",\"etag\":" << detail::quote_json(mp.completed_parts[i].etag) << "}";
        }
        oss << "]}";
    }

    if (cp.staging) {
        const auto& st = *cp.staging;
        oss << ",\"staging\":{\"phase\":\"" << to_string(st.phase) << "\""
            << ",\"directory\":" << detail::quote_json(st.directory)
            << ",\"phase_files_completed\":";
        write_string_array(oss, st.phase_files_completed);
        oss << ",\"phase_bytes_done\":" << st.phase_bytes_done
            << ",\"phase_bytes_total\":" << st.phase_bytes_total
            << ",\"phase_files_done\":" << st.phase_files_done
            << ",\"phase_files_total\":" << st.phase_files_total << "}";
    }

    oss << "}";
    return oss.str();
}

auto checkpoint_from_json(std::string_view json) -> result<checkpoint> {
    auto parsed = detail::parse_json(json);
    if (!parsed) {
        return unexpected(parsed.error());
    }
    return detail::read_checkpoint(parsed.value());
}

namespace detail {

auto read_checkpoint(const json_value& root) -> result<checkpoint> {
    if (!root.is_object()) {
        return unexpected(error(error_code::invalid_request,
            "checkpoint must be a JSON object"));
    }

    checkpoint cp;
    auto files = root.get_string_array("files_completed");
    auto bytes_done = root.get_uint64("bytes_done");
    auto bytes_total = root.get_uint64("bytes_total");
    auto files_done = root.get_uint64("files_done");
    auto files_total = root.get_uint64("files_total");
    if (!files || !bytes_done || !bytes_total || !files_done || !files_total) {
        return unexpected(error(error_code::invalid_request,
            "checkpoint is missing required fields"));
    }

    cp.files_completed = std::move(*files);
    cp.bytes_done = *bytes_done;
    cp.bytes_total = *bytes_total;
    cp.files_done = static_cast<uint32_t>(*files_done);
    cp.files_total = static_cast<uint32_t>(*files_total);

    if (const auto* mp = root.find("multipart"); mp && !mp->is_null()) {
        auto state = parse_multipart(*mp);
        if (!state) {
            return unexpected(state.error());
        }
        cp.multipart = std::move(state.value());
    }

    if (const auto* st = root.find("staging"); st && !st->is_null()) {
        auto state = parse_staging(*st);
        if (!state) {
            return unexpected(state.error());
        }
        cp.staging = std::move(state.value());
    }

    return cp;
}

}  // namespace detail

}  // namespace kcenon::transfer_orchestrator
