#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "simdjson.h"

/*
================================================================================
Configuration JSON Helpers
================================================================================

Low-level extraction of optional primitive fields from a simdjson DOM object.

Every helper follows the same contract:
  • returns false only when the key is present with the wrong type
  • leaves `out` untouched when the key is absent
  • never logs, never throws, never validates values semantically

================================================================================
*/


namespace gattlink::config::parser::helper {

[[nodiscard]]
inline bool require_object(const simdjson::dom::element& root) noexcept {
    return root.type() == simdjson::dom::element_type::OBJECT;
}

[[nodiscard]]
inline bool parse_int64_optional(const simdjson::dom::element& obj, const char* key, std::optional<std::int64_t>& out) noexcept {
    if (!require_object(obj)) {
        return false;
    }
    auto field = obj[key];
    if (field.error()) {
        return true;  // optional, not present
    }
    std::int64_t tmp{};
    if (field.get(tmp)) {
        return false; // wrong type
    }
    out = tmp;
    return true;
}

[[nodiscard]]
inline bool parse_bool_optional(const simdjson::dom::element& obj, const char* key, std::optional<bool>& out) noexcept {
    if (!require_object(obj)) {
        return false;
    }
    auto field = obj[key];
    if (field.error()) {
        return true;
    }
    bool tmp{};
    if (field.get(tmp)) {
        return false;
    }
    out = tmp;
    return true;
}

[[nodiscard]]
inline bool parse_string_optional(const simdjson::dom::element& obj, const char* key, std::optional<std::string>& out) noexcept {
    if (!require_object(obj)) {
        return false;
    }
    auto field = obj[key];
    if (field.error()) {
        return true;
    }
    std::string_view sv;
    if (field.get(sv)) {
        return false;
    }
    out = std::string(sv);
    return true;
}

} // namespace gattlink::config::parser::helper
