/**
 * @file json_reader.cpp
 * @brief Minimal JSON reader implementation
 */

#include "json_reader.h"

#include <kcenon/transfer_orchestrator/core/logging.h>

#include <cctype>
#include <charconv>

namespace kcenon::transfer_orchestrator::detail {

// ============================================================================
// json_value
// ============================================================================

auto json_value::find(std::string_view key) const -> const json_value* {
    if (kind_ != kind::object) {
        return nullptr;
    }
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            return &items_[i];
        }
    }
    return nullptr;
}

auto json_value::as_string() const -> std::optional<std::string> {
    if (kind_ != kind::string) return std::nullopt;
    return text_;
}

auto json_value::as_uint64() const -> std::optional<uint64_t> {
    if (kind_ != kind::number) return std::nullopt;
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text_.data(), text_.data() + text_.size(), value);
    if (ec != std::errc{} || ptr != text_.data() + text_.size()) return std::nullopt;
    return value;
}

auto json_value::as_int64() const -> std::optional<int64_t> {
    if (kind_ != kind::number) return std::nullopt;
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text_.data(), text_.data() + text_.size(), value);
    if (ec != std::errc{} || ptr != text_.data() + text_.size()) return std::nullopt;
    return value;
}

auto json_value::as_bool() const -> std::optional<bool> {
    if (kind_ != kind::boolean) return std::nullopt;
    return bool_;
}

auto json_value::get_string(std::string_view key) const -> std::optional<std::string> {
    const auto* v = find(key);
    return v ? v->as_string() : std::nullopt;
}

auto json_value::get_uint64(std::string_view key) const -> std::optional<uint64_t> {
    const auto* v = find(key);
    return v ? v->as_uint64() : std::nullopt;
}

auto json_value::get_int64(std::string_view key) const -> std::optional<int64_t> {
    const auto* v = find(key);
    return v ? v->as_int64() : std::nullopt;
}

auto json_value::get_string_array(std::string_view key) const
    -> std::optional<std::vector<std::string>> {
    const auto* v = find(key);
    if (!v || !v->is_array()) return std::nullopt;
    std::vector<std::string> out;
    out.reserve(v->items_.size());
    for (const auto& item : v->items_) {
        auto s = item.as_string();
        if (!s) return std::nullopt;
        out.push_back(std::move(*s));
    }
    return out;
}

// ============================================================================
// json_parser
// ============================================================================

class json_parser {
public:
    explicit json_parser(std::string_view text) : text_(text) {}

    auto parse() -> result<json_value> {
        json_value root;
        if (!parse_value(root, 0)) {
            return unexpected(error(error_code::invalid_request,
                "malformed JSON at offset " + std::to_string(pos_)));
        }
        skip_ws();
        if (pos_ != text_.size()) {
            return unexpected(error(error_code::invalid_request,
                "trailing data after JSON document"));
        }
        return root;
    }

private:
    static constexpr int max_depth = 32;

    void skip_ws() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    auto consume(char c) -> bool {
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    auto consume_literal(std::string_view literal) -> bool {
        if (text_.substr(pos_, literal.size()) == literal) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    auto parse_value(json_value& out, int depth) -> bool {
        if (depth > max_depth) return false;
        skip_ws();
        if (pos_ >= text_.size()) return false;

        char c = text_[pos_];
        if (c == '{') return parse_object(out, depth);
        if (c == '[') return parse_array(out, depth);
        if (c == '"') {
            out.kind_ = json_value::kind::string;
            return parse_string(out.text_);
        }
        if (c == 't' && consume_literal("true")) {
            out.kind_ = json_value::kind::boolean;
            out.bool_ = true;
            return true;
        }
        if (c == 'f' && consume_literal("false")) {
            out.kind_ = json_value::kind::boolean;
            out.bool_ = false;
            return true;
        }
        if (c == 'n' && consume_literal("null")) {
            out.kind_ = json_value::kind::null;
            return true;
        }
        return parse_number(out);
    }

    auto parse_object(json_value& out, int depth) -> bool {
        out.kind_ = json_value::kind::object;
        ++pos_;  // '{'
        if (consume('}')) return true;

        do {
            skip_ws();
            std::string key;
            if (pos_ >= text_.size() || text_[pos_] != '"' || !parse_string(key)) {
                return false;
            }
            if (!consume(':')) return false;
            json_value member;
            if (!parse_value(member, depth + 1)) return false;
            out.keys_.push_back(std::move(key));
            out.items_.push_back(std::move(member));
        } while (consume(','));

        return consume('}');
    }

    auto parse_array(json_value& out, int depth) -> bool {
        out.kind_ = json_value::kind::array;
        ++pos_;  // '['
        if (consume(']')) return true;

        do {
            json_value item;
            if (!parse_value(item, depth + 1)) return false;
            out.items_.push_back(std::move(item));
        } while (consume(','));

        return consume(']');
    }

    auto parse_string(std::string& out) -> bool {
        ++pos_;  // opening quote
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') return true;
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) return false;
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    if (pos_ + 4 > text_.size()) return false;
                    unsigned int code = 0;
                    auto hex = text_.substr(pos_, 4);
                    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + 4, code, 16);
                    if (ec != std::errc{} || ptr != hex.data() + 4) return false;
                    pos_ += 4;
                    append_utf8(out, code);
                    break;
                }
                default:
                    return false;
            }
        }
        return false;
    }

    static void append_utf8(std::string& out, unsigned int code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    auto parse_number(json_value& out) -> bool {
        auto start = pos_;
        if (pos_ < text_.size() && text_[pos_] == '-') ++pos_;
        while (pos_ < text_.size() &&
               (std::isdigit(static_cast<unsigned char>(text_[pos_])) ||
                text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E' ||
                text_[pos_] == '+' || text_[pos_] == '-')) {
            ++pos_;
        }
        if (pos_ == start) return false;
        out.kind_ = json_value::kind::number;
        out.text_ = std::string(text_.substr(start, pos_ - start));
        return true;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

auto parse_json(std::string_view text) -> result<json_value> {
    return json_parser(text).parse();
}

auto quote_json(std::string_view text) -> std::string {
    return "\"" + escape_json(text) + "\"";
}

}  // namespace kcenon::transfer_orchestrator::detail
