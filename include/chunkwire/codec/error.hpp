#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "chunkwire/schema/envelope.hpp"


namespace chunkwire::codec {

/*
===============================================================================
 codec::Error
===============================================================================

Codec-level failure classification, shared by planning, emission and
reassembly.

Fatal errors abort the operation before any chunk is produced (emission) or
leave the partial stream untouched (reassembly). Nothing is retried inside the
codec: the caller decides whether to fix its input, enlarge the budget, or
give up.

BudgetTooSmallForElement is the only informational code: it never appears in
a Status, only in Diagnostics collected alongside a successful emission.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Input contract violations (caller responsibility) ------------------
    MalformedEnvelope,        // Document is not shaped as an envelope (results not a sequence, ...)
    UnsupportedFieldType,     // Field value is not a canonical array (mapping, non-finite number)
    InvalidBudget,            // Byte budget below the minimum of one byte

    // --- Stream control ------------------------------------------------------
    Cancelled,                // Sink stopped the stream between two chunks

    // --- Reassembly ----------------------------------------------------------
    UnexpectedChunk,          // chunk_index / chunk_count out of sequence
    InconsistentChunk,        // Chunk contents cannot continue the partial envelope

    // --- Diagnostics (non-fatal) ---------------------------------------------
    BudgetTooSmallForElement, // A single element alone exceeds the byte budget
};


/// Optional helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:                     return "None";
    case Error::MalformedEnvelope:        return "MalformedEnvelope";
    case Error::UnsupportedFieldType:     return "UnsupportedFieldType";
    case Error::InvalidBudget:            return "InvalidBudget";
    case Error::Cancelled:                return "Cancelled";
    case Error::UnexpectedChunk:          return "UnexpectedChunk";
    case Error::InconsistentChunk:        return "InconsistentChunk";
    case Error::BudgetTooSmallForElement: return "BudgetTooSmallForElement";
    default:                              return "Unknown";
    }
}

// -----------------------------------------------------------------------------
// Field location
// -----------------------------------------------------------------------------
//
// Identifies one array field of one update: (update index, group, key).
//
struct FieldRef {
    std::size_t   update_index{0};
    schema::Group group{schema::Group::Args};
    std::string   key;

    bool operator==(const FieldRef&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const FieldRef& ref) {
    return os << "results[" << ref.update_index << "]." << to_string(ref.group) << "." << ref.key;
}

// -----------------------------------------------------------------------------
// Status
// -----------------------------------------------------------------------------
//
// Outcome of a codec operation. 'field' is meaningful only for errors that
// concern one field (UnsupportedFieldType, InconsistentChunk).
//
struct Status {
    Error       code{Error::None};
    FieldRef    field{};
    std::string message;

    [[nodiscard]]
    bool ok() const noexcept { return code == Error::None; }

    explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]]
    static Status failure(Error code, std::string message) {
        return Status{code, {}, std::move(message)};
    }

    [[nodiscard]]
    static Status failure(Error code, FieldRef field, std::string message) {
        return Status{code, std::move(field), std::move(message)};
    }
};

inline std::ostream& operator<<(std::ostream& os, const Status& st) {
    os << "[" << to_string(st.code) << "]";
    if (!st.message.empty()) {
        os << " " << st.message;
    }
    return os;
}

// -----------------------------------------------------------------------------
// Diagnostic
// -----------------------------------------------------------------------------
//
// Non-fatal condition observed during a successful emission.
//
// For BudgetTooSmallForElement: 'segment' is the 1-based segment (and chunk)
// index holding the oversized element, 'encoded_bytes' the element's own
// encoded size and 'budget' the byte budget it exceeds.
//
struct Diagnostic {
    Error       code{Error::BudgetTooSmallForElement};
    FieldRef    field{};
    std::size_t segment{0};
    std::size_t encoded_bytes{0};
    std::size_t budget{0};
};

inline std::ostream& operator<<(std::ostream& os, const Diagnostic& d) {
    return os << "[" << to_string(d.code) << "] " << d.field
              << " segment " << d.segment << ": element of " << d.encoded_bytes
              << " bytes > budget " << d.budget;
}

} // namespace chunkwire::codec
