#pragma once

#include <charconv>
#include <initializer_list>
#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "arbwire/core/protocol/parser/result.hpp"
#include "lcr/optional.hpp"

#include <simdjson.h>

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helper functions used by the message parsers to safely extract
primitive JSON values from simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structural rules (object presence, type correctness)
  • Parse primitive field types (bool, integer, number, string)
  • Provide strict optional-field handling semantics

Numbers:
  Feeds serialize decimals either as JSON numbers or as numeric strings
  ("171.12"). parse_number_* accepts both; any other type is a schema error,
  and a non-numeric string is an invalid value.

IMPORTANT:
  - Helpers MUST NOT interpret values semantically
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions

================================================================================
*/


namespace arbwire::core::protocol::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// ------------------------------------------------------------
// REQUIRED OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    out = field.value_unsafe();
    return require_object(out);
}

// ------------------------------------------------------------
// OPTIONAL OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out, bool& present) noexcept {
    present = false;
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return Result::Parsed; // optional, not present
    }
    out = field.value_unsafe();
    if (require_object(out) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

// ------------------------------------------------------------
// REQUIRED ARRAY FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_array_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out) noexcept {
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ------------------------------------------------------------
// OPTIONAL ARRAY FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_array_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out, bool& present) noexcept {
    present = false;
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return Result::Parsed; // optional, not present
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

// ============================================================================
// NUMBERS
// ============================================================================

// Element -> double, accepting JSON numbers and numeric strings
[[nodiscard]]
inline Result element_to_number(const simdjson::dom::element& el, double& out) noexcept {
    if (!el.get(out)) {
        return std::isfinite(out) ? Result::Parsed : Result::InvalidValue;
    }
    std::string_view sv;
    if (el.get(sv)) {
        return Result::InvalidSchema;
    }
    double tmp{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), tmp);
    if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(tmp)) {
        return Result::InvalidValue;
    }
    out = tmp;
    return Result::Parsed;
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_bool_required(const simdjson::dom::element& obj, const char* key, bool& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_number_required(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    return element_to_number(field.value_unsafe(), out);
}

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::string_view& out, bool& presence) noexcept {
    presence = false;
    out = std::string_view{};
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::Parsed; // optional, not present
    }
    presence = true;
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_bool_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<bool>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::Parsed; // optional, not present
    }
    bool tmp{};
    if (field.get(tmp)) {
        return Result::InvalidSchema;
    }
    out = tmp;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_number_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<double>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.value_unsafe().is_null()) {
        return Result::Parsed; // optional, not present
    }
    double tmp{};
    const Result r = element_to_number(field.value_unsafe(), tmp);
    if (r != Result::Parsed) {
        return r;
    }
    out = tmp;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_int64_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::int64_t>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.value_unsafe().is_null()) {
        return Result::Parsed; // optional, not present
    }
    std::int64_t tmp{};
    if (!field.get(tmp)) {
        out = tmp;
        return Result::Parsed;
    }
    // Some producers emit timestamps as floating point
    double d{};
    if (!field.get(d) && std::isfinite(d)) {
        out = static_cast<std::int64_t>(d);
        return Result::Parsed;
    }
    return Result::InvalidSchema;
}

[[nodiscard]]
inline Result parse_string_list_optional(const simdjson::dom::element& obj, const char* key, std::vector<std::string>& out, bool& present) noexcept {
    out.clear();
    present = false;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::Parsed; // optional, not present
    }
    simdjson::dom::array arr;
    if (field.get(arr)) {
        return Result::InvalidSchema;
    }
    for (auto v : arr) {
        std::string_view sv;
        if (v.get(sv)) {
            return Result::InvalidSchema;
        }
        out.emplace_back(sv);
    }
    present = true;
    return Result::Parsed;
}

// Fields that different producers spell differently ("opportunity_id" vs
// "opportunityId"): the first key present wins.
[[nodiscard]]
inline Result parse_string_optional_any(const simdjson::dom::element& obj, std::initializer_list<const char*> keys, std::string_view& out, bool& presence) noexcept {
    presence = false;
    out = std::string_view{};
    for (const char* key : keys) {
        const Result r = parse_string_optional(obj, key, out, presence);
        if (r != Result::Parsed || presence) {
            return r;
        }
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_number_optional_any(const simdjson::dom::element& obj, std::initializer_list<const char*> keys, lcr::optional<double>& out) noexcept {
    out.reset();
    for (const char* key : keys) {
        const Result r = parse_number_optional(obj, key, out);
        if (r != Result::Parsed || out.has()) {
            return r;
        }
    }
    return Result::Parsed;
}

} // namespace arbwire::core::protocol::parser::helper
