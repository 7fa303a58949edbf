#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

#include "statesync/core/protocol/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the payload adapters to safely extract primitive
JSON values from simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structural rules (object presence, type correctness)
  • Parse primitive field types (bool, number, string, string arrays)
  • Provide strict optional-field handling semantics

IMPORTANT:
  - Helpers MUST NOT interpret values semantically
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions

Optional helpers return Ok with `present == false` when the key is absent or
explicitly null; a present value of the wrong type is InvalidSchema.
================================================================================
*/


namespace statesync::core::protocol::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Ok : Result::InvalidSchema;
}

// Looks up `key`; `found` is false when the key is absent or null.
[[nodiscard]]
inline Result lookup_(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out, bool& found) noexcept {
    found = false;
    if (require_object(parent) != Result::Ok) {
        return Result::InvalidSchema;
    }
    if (parent[key].get(out)) {
        return Result::Ok; // absent
    }
    if (out.is_null()) {
        return Result::Ok;
    }
    found = true;
    return Result::Ok;
}

// ------------------------------------------------------------
// OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out, bool& present) noexcept {
    auto r = lookup_(parent, key, out, present);
    if (r != Result::Ok || !present) {
        return r;
    }
    return require_object(out);
}

// ============================================================================
// STRING FIELDS
// ============================================================================

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    simdjson::dom::element field;
    bool found = false;
    auto r = lookup_(obj, key, field, found);
    if (r != Result::Ok || !found) {
        return Result::InvalidSchema;
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Result::InvalidSchema;
    }
    out.assign(sv.data(), sv.size());
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::string& out, bool& present) noexcept {
    simdjson::dom::element field;
    auto r = lookup_(obj, key, field, present);
    if (r != Result::Ok || !present) {
        return r;
    }
    std::string_view sv;
    if (field.get(sv)) {
        present = false;
        return Result::InvalidSchema;
    }
    out.assign(sv.data(), sv.size());
    return Result::Ok;
}

// ============================================================================
// NUMERIC FIELDS
// ============================================================================

// Integers are accepted and widened.
[[nodiscard]]
inline Result parse_double_required(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    simdjson::dom::element field;
    bool found = false;
    auto r = lookup_(obj, key, field, found);
    if (r != Result::Ok || !found) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

// Doubles are truncated (timestamps are sometimes sent as 1.7e12).
[[nodiscard]]
inline Result parse_int64_optional(const simdjson::dom::element& obj, const char* key, std::int64_t& out, bool& present) noexcept {
    simdjson::dom::element field;
    auto r = lookup_(obj, key, field, present);
    if (r != Result::Ok || !present) {
        return r;
    }
    if (!field.get(out)) {
        return Result::Ok;
    }
    double d = 0.0;
    if (field.get(d)) {
        present = false;
        return Result::InvalidSchema;
    }
    out = static_cast<std::int64_t>(d);
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_uint32_optional(const simdjson::dom::element& obj, const char* key, std::uint32_t& out, bool& present) noexcept {
    std::int64_t v = 0;
    auto r = parse_int64_optional(obj, key, v, present);
    if (r != Result::Ok || !present) {
        return r;
    }
    if (v < 0 || v > static_cast<std::int64_t>(UINT32_MAX)) {
        present = false;
        return Result::InvalidValue;
    }
    out = static_cast<std::uint32_t>(v);
    return Result::Ok;
}

// ============================================================================
// BOOLEAN FIELDS
// ============================================================================

[[nodiscard]]
inline Result parse_bool_optional(const simdjson::dom::element& obj, const char* key, bool& out, bool& present) noexcept {
    simdjson::dom::element field;
    auto r = lookup_(obj, key, field, present);
    if (r != Result::Ok || !present) {
        return r;
    }
    if (field.get(out)) {
        present = false;
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

// ============================================================================
// ARRAY FIELDS
// ============================================================================

// Every element must be a string.
[[nodiscard]]
inline Result parse_string_array_optional(const simdjson::dom::element& obj, const char* key, std::vector<std::string>& out, bool& present) {
    simdjson::dom::element field;
    auto r = lookup_(obj, key, field, present);
    if (r != Result::Ok || !present) {
        return r;
    }
    simdjson::dom::array arr;
    if (field.get(arr)) {
        present = false;
        return Result::InvalidSchema;
    }
    out.clear();
    for (simdjson::dom::element item : arr) {
        std::string_view sv;
        if (item.get(sv)) {
            present = false;
            return Result::InvalidSchema;
        }
        out.emplace_back(sv);
    }
    return Result::Ok;
}

} // namespace statesync::core::protocol::parser::helper
