#pragma once

#include <cstddef>

#include "chunkwire/codec/error.hpp"
#include "chunkwire/schema/chunk_message.hpp"
#include "chunkwire/schema/envelope.hpp"


namespace chunkwire::codec {

/*
===============================================================================
 codec::Reassembler
===============================================================================

Consumer side of a chunk stream: rebuilds the original Envelope from the
ChunkMessages of one emission, delivered in order.

-------------------------------------------------------------------------------
 Rules
-------------------------------------------------------------------------------
- chunk 1 opens a stream and fixes chunk_count, the metadata and the number
  of updates; every field it carries is taken as-is
- chunk k > 1 must follow chunk k-1 of the same stream (same chunk_count,
  same number of updates), otherwise UnexpectedChunk
- a field in chunk k > 1 continues the field of the same key: its elements
  are appended to the array accumulated so far. A key never seen before, or a
  continuation of a non-array value, is InconsistentChunk
- after chunk chunk_count the stream is complete; take() hands out the
  envelope and the reassembler is ready for a new stream

A rejected chunk leaves the partial stream untouched: the caller may drop the
chunk, or reset() and wait for a new chunk 1.
===============================================================================
*/

class Reassembler {
public:
    [[nodiscard]] Status push(const schema::ChunkMessage& chunk);

    // No chunk received since construction / reset() / take()
    [[nodiscard]]
    bool idle() const noexcept { return received_ == 0; }

    [[nodiscard]]
    bool complete() const noexcept { return received_ > 0 && received_ == chunk_count_; }

    [[nodiscard]]
    std::size_t chunks_received() const noexcept { return received_; }

    [[nodiscard]]
    std::size_t chunk_count() const noexcept { return chunk_count_; }

    // Partial (or complete) envelope
    [[nodiscard]]
    const schema::Envelope& envelope() const noexcept { return envelope_; }

    // Hands out the complete envelope and resets.
    // Precondition: complete()
    [[nodiscard]] schema::Envelope take();

    void reset() noexcept;

private:
    Status start(const schema::ChunkMessage& chunk);
    Status append(const schema::ChunkMessage& chunk);

    schema::Envelope envelope_;
    std::size_t chunk_count_{0};
    std::size_t received_{0};
};

} // namespace chunkwire::codec
