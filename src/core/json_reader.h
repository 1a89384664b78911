/**
 * @file json_reader.h
 * @brief Minimal JSON reader for checkpoint and state files
 *
 * Internal to the library. Supports the subset written by the orchestrator:
 * objects, arrays, strings, unsigned/signed integers, booleans and null.
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_SRC_CORE_JSON_READER_H
#define KCENON_TRANSFER_ORCHESTRATOR_SRC_CORE_JSON_READER_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/transfer_orchestrator/core/types.h"

namespace kcenon::transfer_orchestrator::detail {

class json_value {
public:
    enum class kind { null, boolean, number, string, array, object };

    json_value() = default;

    [[nodiscard]] auto type() const noexcept -> kind { return kind_; }
    [[nodiscard]] auto is_null() const noexcept -> bool { return kind_ == kind::null; }
    [[nodiscard]] auto is_object() const noexcept -> bool { return kind_ == kind::object; }
    [[nodiscard]] auto is_array() const noexcept -> bool { return kind_ == kind::array; }

    /**
     * @brief Member lookup; nullptr when absent or not an object
     */
    [[nodiscard]] auto find(std::string_view key) const -> const json_value*;

    [[nodiscard]] auto items() const -> const std::vector<json_value>& { return items_; }

    [[nodiscard]] auto as_string() const -> std::optional<std::string>;
    [[nodiscard]] auto as_uint64() const -> std::optional<uint64_t>;
    [[nodiscard]] auto as_int64() const -> std::optional<int64_t>;
    [[nodiscard]] auto as_bool() const -> std::optional<bool>;

    // Typed member accessors used by the deserializers
    [[nodiscard]] auto get_string(std::string_view key) const -> std::optional<std::string>;
    [[nodiscard]] auto get_uint64(std::string_view key) const -> std::optional<uint64_t>;
    [[nodiscard]] auto get_int64(std::string_view key) const -> std::optional<int64_t>;
    [[nodiscard]] auto get_string_array(std::string_view key) const
        -> std::optional<std::vector<std::string>>;

private:
    friend class json_parser;

    kind kind_ = kind::null;
    bool bool_ = false;
    std::string text_;  // string contents or raw number text
    std::vector<json_value> items_;
    std::vector<std::string> keys_;  // parallel to items_ for objects
};

/**
 * @brief Parse a complete JSON document
 */
[[nodiscard]] auto parse_json(std::string_view text) -> result<json_value>;

/**
 * @brief Quote and escape a string for JSON output
 */
[[nodiscard]] auto quote_json(std::string_view text) -> std::string;

}  // namespace kcenon::transfer_orchestrator::detail

#endif  // KCENON_TRANSFER_ORCHESTRATOR_SRC_CORE_JSON_READER_H
