#pragma once

#include <cstdint>
#include <string_view>

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level, allocation-free helpers used by the chunkwire parsers to extract
structural pieces from simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structural rules (object presence, type correctness)
  • Parse primitive field types
  • Never allocate memory
  • Never log or report errors

Design principles:
  • Helpers are schema-agnostic
  • All functions return boolean success/failure and are [[nodiscard]]
  • All helpers are noexcept and side-effect free on failure

Higher-level parsers (parser::value, parser::envelope, parser::chunk_message)
add logging and schema knowledge on top of these primitives.
================================================================================
*/


namespace chunkwire::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline bool require_object(const simdjson::dom::element& root) noexcept {
    return root.type() == simdjson::dom::element_type::OBJECT;
}

// ------------------------------------------------------------
// REQUIRED OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline bool parse_object_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::object& out) noexcept {
    if (!require_object(parent)) {
        return false;
    }
    auto field = parent[key];
    if (field.error()) {
        return false;
    }
    return !field.get(out);
}

// ------------------------------------------------------------
// REQUIRED ARRAY FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline bool parse_array_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out) noexcept {
    if (!require_object(parent)) {
        return false;
    }
    auto field = parent[key];
    if (field.error()) {
        return false;
    }
    return !field.get(out);
}

// ------------------------------------------------------------
// REQUIRED ELEMENT (any type)
// ------------------------------------------------------------
[[nodiscard]]
inline bool parse_element_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (!require_object(parent)) {
        return false;
    }
    auto field = parent[key];
    if (field.error()) {
        return false;
    }
    out = field.value_unsafe();
    return true;
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline bool parse_uint64_required(const simdjson::dom::element& obj, const char* key, std::uint64_t& out) noexcept {
    if (!require_object(obj)) {
        return false;
    }
    return !obj[key].get(out);
}

// ------------------------------------------------------------
// Scalar: anything but an array or an object
// ------------------------------------------------------------
[[nodiscard]]
inline bool is_scalar(const simdjson::dom::element& el) noexcept {
    auto t = el.type();
    return t != simdjson::dom::element_type::ARRAY && t != simdjson::dom::element_type::OBJECT;
}

} // namespace chunkwire::parser::helper
