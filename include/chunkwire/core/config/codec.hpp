/*
================================================================================
Codec Configuration
================================================================================

Compile-time constants shared by the canonical encoder, the segmenter and the
example programs.

Canonical encoding overheads
----------------------------
Every byte budget in chunkwire is measured against the canonical JSON text of
a value. Two structural overheads drive segment packing:

  ARRAY_OVERHEAD      "[" + "]" around a segment (paid once per segment)
  SEPARATOR_OVERHEAD  ", " between two elements (paid per element after the
                      first)

Both MUST match what core::canonical writes, otherwise segment sizes computed
during planning drift from the bytes actually emitted.

Default budget
--------------
DEFAULT_CHUNK_BUDGET is used by the example programs when no --budget is
given. The library itself never assumes a default: the budget is always a
parameter of plan() / emit().

================================================================================
*/
#pragma once

#include <cstddef>
#include <cstdint>


namespace chunkwire::core::config::codec {

// -----------------------------------------------------------------------------
// Canonical encoding overheads (bytes)
// -----------------------------------------------------------------------------
inline constexpr static std::size_t ARRAY_OVERHEAD     = 2; // "[]"
inline constexpr static std::size_t OBJECT_OVERHEAD    = 2; // "{}"
inline constexpr static std::size_t SEPARATOR_OVERHEAD = 2; // ", "
inline constexpr static std::size_t KEY_SEPARATOR      = 2; // ": "

// -----------------------------------------------------------------------------
// Budgets
// -----------------------------------------------------------------------------
inline constexpr static std::size_t MIN_CHUNK_BUDGET     = 1;
inline constexpr static std::size_t DEFAULT_CHUNK_BUDGET = 1000;

// -----------------------------------------------------------------------------
// Parsing limits
// -----------------------------------------------------------------------------

// Deepest nesting accepted when converting parsed JSON into core::Value.
inline constexpr static std::uint32_t MAX_VALUE_DEPTH = 256;

} // namespace chunkwire::core::config::codec
