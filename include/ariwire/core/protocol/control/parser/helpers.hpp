#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "ariwire/core/protocol/control/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
Control JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the control Router to extract primitive values from
simdjson DOM elements.

  • Enforce basic JSON structural rules (object presence, type correctness)
  • Provide strict optional-field handling semantics
  • Never interpret values semantically
  • Never log; only allocating helpers may throw (std::bad_alloc)

================================================================================
*/


namespace ariwire::core::protocol::control::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Ok : Result::InvalidSchema;
}

[[nodiscard]]
inline bool has_field(const simdjson::dom::element& obj, const char* key) noexcept {
    if (require_object(obj) != Result::Ok) {
        return false;
    }
    return !obj[key].error();
}

// ------------------------------------------------------------
// OPTIONAL OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out, bool& present) noexcept {
    present = false;
    if (require_object(parent) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return Result::Ok; // optional, not present
    }
    out = field.value();
    if (require_object(out) != Result::Ok) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Ok;
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    if (obj[key].get(out)) {
        return Result::InvalidSchema; // missing or wrong type
    }
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_uint64_required(const simdjson::dom::element& obj, const char* key, std::uint64_t& out) noexcept {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================

// Copies the string value of `key` into out when present (out untouched otherwise)
[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::string& out) {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::Ok;
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Result::InvalidSchema;
    }
    out.assign(sv.data(), sv.size());
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_uint64_optional(const simdjson::dom::element& obj, const char* key, std::uint64_t& out, bool& present) noexcept {
    present = false;
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::Ok;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Ok;
}

// Serialized JSON of `key` (strings are kept as their decoded text when
// `unwrap_string` is set). Absent fields leave out empty.
[[nodiscard]]
inline Result parse_raw_optional(const simdjson::dom::element& obj, const char* key, std::string& out, bool unwrap_string) {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::Ok;
    }
    simdjson::dom::element value = field.value();
    if (value.is_null()) {
        return Result::Ok;
    }
    std::string_view sv;
    if (unwrap_string && !value.get(sv)) {
        out.assign(sv.data(), sv.size());
        return Result::Ok;
    }
    out = simdjson::minify(value);
    return Result::Ok;
}

// Decimal string → uint64 ("17" -> 17). Rejects empty input, signs and overflow.
[[nodiscard]]
inline bool parse_decimal(std::string_view s, std::uint64_t& out) noexcept {
    if (s.empty() || s.size() > 20) {
        return false;
    }
    std::uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (v > (UINT64_MAX - digit) / 10) {
            return false;
        }
        v = v * 10 + digit;
    }
    out = v;
    return true;
}

} // namespace ariwire::core::protocol::control::parser::helper
