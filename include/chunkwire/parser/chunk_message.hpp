#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "chunkwire/core/value.hpp"
#include "chunkwire/parser/helpers.hpp"
#include "chunkwire/parser/value.hpp"
#include "chunkwire/schema/chunk_message.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace chunkwire::parser::chunk_message {

// ===============================================
// CHUNK MESSAGE PARSER
// ===============================================
//
// Strict: every member produced by the emitter
// must be present.
//
//   header.chunk_index / chunk_count : unsigned
//   type / drafty_id / command       : scalars
//   results                          : array of
//     { plot_type: scalar, args: {}, data: {} }
//
// Header consistency (index <= count, ...) is the
// reassembler's job.
//
// ===============================================

namespace detail {

[[nodiscard]]
inline bool parse_scalar_required(const simdjson::dom::element& parent, const char* key, core::Value& out) noexcept {
    simdjson::dom::element el;
    if (!helper::parse_element_required(parent, key, el)) {
        CW_DEBUG("[PARSER] Field '" << key << "' missing in chunk -> ignore message.");
        return false;
    }
    if (!helper::is_scalar(el)) {
        CW_DEBUG("[PARSER] Field '" << key << "' is not a scalar -> ignore message.");
        return false;
    }
    return value::parse(el, out);
}

[[nodiscard]]
inline bool parse_fields(const simdjson::dom::element& view, const char* key, schema::Fields& out) noexcept {
    simdjson::dom::object obj;
    if (!helper::parse_object_required(view, key, obj)) {
        CW_DEBUG("[PARSER] Group '" << key << "' missing or not an object -> ignore message.");
        return false;
    }
    out.clear();
    out.reserve(obj.size());
    for (auto field : obj) {
        core::Value v;
        if (!value::parse(field.value, v)) {
            return false;
        }
        out.emplace_back(std::string(field.key), std::move(v));
    }
    return true;
}

} // namespace detail

[[nodiscard]]
inline bool parse(const simdjson::dom::element& root, schema::ChunkMessage& out) noexcept {
    if (!helper::require_object(root)) {
        CW_DEBUG("[PARSER] Chunk root is not an object -> ignore message.");
        return false;
    }

    // header
    simdjson::dom::element header;
    if (!helper::parse_element_required(root, "header", header)) {
        CW_DEBUG("[PARSER] Field 'header' missing in chunk -> ignore message.");
        return false;
    }
    std::uint64_t index = 0;
    std::uint64_t count = 0;
    if (!helper::parse_uint64_required(header, "chunk_index", index) ||
        !helper::parse_uint64_required(header, "chunk_count", count)) {
        CW_DEBUG("[PARSER] Invalid chunk header -> ignore message.");
        return false;
    }
    out.header.chunk_index = static_cast<std::size_t>(index);
    out.header.chunk_count = static_cast<std::size_t>(count);

    // metadata
    if (!detail::parse_scalar_required(root, "type", out.type) ||
        !detail::parse_scalar_required(root, "drafty_id", out.drafty_id) ||
        !detail::parse_scalar_required(root, "command", out.command)) {
        return false;
    }

    // results
    simdjson::dom::array results;
    if (!helper::parse_array_required(root, "results", results)) {
        CW_DEBUG("[PARSER] Field 'results' missing or not an array -> ignore message.");
        return false;
    }

    out.results.clear();
    out.results.reserve(results.size());

    for (auto item : results) {
        if (!helper::require_object(item)) {
            CW_DEBUG("[PARSER] Chunk view is not an object -> ignore message.");
            return false;
        }
        schema::ChunkView view;
        if (!detail::parse_scalar_required(item, "plot_type", view.plot_type) ||
            !detail::parse_fields(item, "args", view.args) ||
            !detail::parse_fields(item, "data", view.data)) {
            return false;
        }
        out.results.push_back(std::move(view));
    }

    return true;
}

} // namespace chunkwire::parser::chunk_message
