#pragma once

#include <cstddef>
#include <string>

#include "chunkwire/core/value.hpp"


namespace chunkwire::core::canonical {

/*
===============================================================================
 Canonical encoding
===============================================================================

The single textual form every byte budget is measured against, and the form
chunk messages are written in.

  null | true | false
  integers in decimal
  doubles in shortest round-trip form, always with '.' or an exponent
  "strings" with JSON escapes (lcr::json)
  [a, b, c]              separator ", "
  {"k": v, "k2": v2}     separators ": " and ", "

encoded_size(v) == encode(v).size() for every value; it walks the value
without allocating and is what the segmenter uses for budgeting.

Non-finite doubles have no canonical form. They are rejected upstream by
is_array_value(); encode() writes them as null.
===============================================================================
*/

[[nodiscard]] std::size_t encoded_size(const Value& v) noexcept;

void encode(const Value& v, std::string& out);

[[nodiscard]] std::string encode(const Value& v);

// True when 'v' is a codec-acceptable field value: a scalar, or an Array whose
// elements are (recursively) acceptable. Objects and non-finite doubles are
// rejected at any depth.
[[nodiscard]] bool is_array_value(const Value& v) noexcept;

} // namespace chunkwire::core::canonical
