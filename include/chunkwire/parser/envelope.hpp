#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "chunkwire/codec/document.hpp"
#include "chunkwire/codec/error.hpp"
#include "chunkwire/core/value.hpp"
#include "chunkwire/parser/value.hpp"
#include "chunkwire/schema/envelope.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace chunkwire::parser::envelope {

// ===============================================
// ENVELOPE PARSER
// ===============================================
//
// JSON text / DOM element → schema::Envelope.
//
// Structural rules are those of codec::to_envelope;
// any failure (syntax error, excessive nesting,
// wrong shape) is reported as MalformedEnvelope.
//
// ===============================================

[[nodiscard]]
inline codec::Status parse(const simdjson::dom::element& root, schema::Envelope& out) {
    core::Value document;
    if (!value::parse(root, document)) {
        CW_DEBUG("[PARSER] Envelope document could not be converted -> reject.");
        return codec::Status::failure(codec::Error::MalformedEnvelope, "document could not be converted");
    }
    return codec::to_envelope(std::move(document), out);
}

[[nodiscard]]
inline codec::Status parse(simdjson::dom::parser& parser, std::string_view json, schema::Envelope& out) {
    simdjson::dom::element root;
    auto err = parser.parse(json.data(), json.size()).get(root);
    if (err) {
        CW_DEBUG("[PARSER] Envelope JSON rejected: " << simdjson::error_message(err));
        return codec::Status::failure(codec::Error::MalformedEnvelope,
            std::string("invalid JSON: ") + simdjson::error_message(err));
    }
    return parse(root, out);
}

} // namespace chunkwire::parser::envelope
