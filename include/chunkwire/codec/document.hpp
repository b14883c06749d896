#pragma once

#include "chunkwire/codec/error.hpp"
#include "chunkwire/schema/envelope.hpp"
#include "chunkwire/core/value.hpp"


namespace chunkwire::codec {

/*
===============================================================================
 Envelope documents
===============================================================================

Converts a dynamic document (typically parsed JSON) into a typed Envelope.

Accepted shape:

  {
    "type": <scalar>, "drafty_id": <scalar>, "command": <scalar>,
    "results": [
      { "plot_type": <scalar>, "args": { key: value, ... }, "data": { ... } },
      ...
    ]
  }

Rules:
  - the document must be an object
  - missing metadata / plot_type          -> null
  - missing "results"                     -> no updates
  - "results" present but not an array    -> MalformedEnvelope
  - update entry not an object            -> MalformedEnvelope
  - missing "args" / "data"               -> empty group
  - "args" / "data" not an object         -> MalformedEnvelope
  - duplicate key inside one group        -> MalformedEnvelope
  - metadata / plot_type not a scalar     -> MalformedEnvelope
  - unknown keys                          -> ignored

Field values are copied as-is: checking them against the array contract is
the emitter's job (UnsupportedFieldType).

On failure 'out' is left unchanged.
===============================================================================
*/

[[nodiscard]]
Status to_envelope(const core::Value& document, schema::Envelope& out);

[[nodiscard]]
Status to_envelope(core::Value&& document, schema::Envelope& out);

} // namespace chunkwire::codec
