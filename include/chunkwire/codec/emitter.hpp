#pragma once

#include <array>
#include <cstddef>
#include <utility>
#include <vector>

#include "chunkwire/codec/document.hpp"
#include "chunkwire/codec/error.hpp"
#include "chunkwire/codec/segmenter.hpp"
#include "chunkwire/codec/sink.hpp"
#include "chunkwire/codec/telemetry.hpp"
#include "chunkwire/schema/chunk_message.hpp"
#include "chunkwire/schema/envelope.hpp"
#include "lcr/log/logger.hpp"


namespace chunkwire::codec {

/*
===============================================================================
 codec::Emitter
===============================================================================

Turns one Envelope into an ordered stream of self-describing ChunkMessages.

-------------------------------------------------------------------------------
 Two passes
-------------------------------------------------------------------------------
prepare():
  - validates the budget and every field value
  - plans every field of every update with the segmenter
  - derives chunk_count = max(1, longest plan)
  Fails fast: on any error no chunk can be produced.

next(out):
  - builds chunk 'next_index()' into 'out', one chunk per call
  - a "no split" field travels whole in chunk 1 only
  - segment k of a split field travels in chunk k only
  - fields with nothing for this index are absent from the view

Chunks are built on demand, so memory stays bounded by one chunk plus the
plans, and a caller may stop pulling after any chunk.

-------------------------------------------------------------------------------
 Lifetime
-------------------------------------------------------------------------------
The emitter references the envelope: it must outlive the emitter and must not
be modified between prepare() and the last next().

Single-threaded. Independent emitters share nothing.
===============================================================================
*/

class Emitter {
public:
    Emitter(const schema::Envelope& envelope, std::size_t byte_budget) noexcept
        : envelope_(envelope)
        , budget_(byte_budget)
    {}

    Emitter(const Emitter&) = delete;
    Emitter& operator=(const Emitter&) = delete;

    // Pass 1 (idempotent)
    [[nodiscard]] Status prepare();

    // Pass 2: false once the stream is exhausted or when prepare() did not
    // succeed
    [[nodiscard]] bool next(schema::ChunkMessage& out);

    [[nodiscard]]
    bool prepared() const noexcept { return prepared_; }

    // Valid after a successful prepare()
    [[nodiscard]]
    std::size_t chunk_count() const noexcept { return chunk_count_; }

    // Index of the chunk the next call to next() builds
    [[nodiscard]]
    std::size_t next_index() const noexcept { return next_index_; }

    [[nodiscard]]
    bool done() const noexcept { return prepared_ && next_index_ > chunk_count_; }

    [[nodiscard]]
    std::size_t byte_budget() const noexcept { return budget_; }

    // Plan of the 'field'-th field of 'group' in update 'update'
    [[nodiscard]]
    const SegmentPlan& plan_of(std::size_t update, schema::Group group, std::size_t field) const {
        return plans_[update][static_cast<std::size_t>(group)][field];
    }

    [[nodiscard]]
    const std::vector<Diagnostic>& diagnostics() const noexcept { return diagnostics_; }

    [[nodiscard]]
    const telemetry::Codec& telemetry() const noexcept { return telemetry_; }

private:
    // plans_[update][group][field], parallel to the envelope's fields
    using GroupPlans = std::array<std::vector<SegmentPlan>, schema::GROUPS.size()>;

    const schema::Envelope& envelope_;
    std::size_t budget_;

    std::vector<GroupPlans> plans_;
    std::vector<Diagnostic> diagnostics_;

    std::size_t chunk_count_{0};
    std::size_t next_index_{1};
    bool prepared_{false};

    telemetry::Codec telemetry_;
};

// -----------------------------------------------------------------------------
// Push-style emission
// -----------------------------------------------------------------------------

struct Report {
    Status status;
    std::size_t chunk_count{0};      // planned stream length (0 when planning failed)
    std::size_t chunks_emitted{0};   // chunks handed to the sink
    std::vector<Diagnostic> diagnostics;
};

// Plans 'envelope' and hands every chunk to 'sink' in order.
//
// Planning errors are returned before the sink sees anything. When the sink
// refuses a chunk while more remain, emission stops with Error::Cancelled.
template <ChunkSinkConcept Sink>
[[nodiscard]]
Report emit(const schema::Envelope& envelope, std::size_t byte_budget, Sink& sink) {
    Report report;

    Emitter emitter{envelope, byte_budget};
    report.status = emitter.prepare();
    if (!report.status) {
        return report;
    }
    report.chunk_count = emitter.chunk_count();
    report.diagnostics = emitter.diagnostics();

    schema::ChunkMessage msg;
    while (emitter.next(msg)) {
        ++report.chunks_emitted;
        if (!sink.on_chunk(msg) && !emitter.done()) {
            CW_WARN("[EMITTER] Sink stopped the stream after chunk " << report.chunks_emitted
                    << "/" << report.chunk_count << " -> cancel.");
            report.status = Status::failure(Error::Cancelled,
                "sink stopped after chunk " + std::to_string(report.chunks_emitted) +
                " of " + std::to_string(report.chunk_count));
            break;
        }
    }

    return report;
}

// Same, starting from an untyped document (see codec/document.hpp).
// A malformed document fails with Error::MalformedEnvelope before planning.
template <ChunkSinkConcept Sink>
[[nodiscard]]
Report emit(const core::Value& document, std::size_t byte_budget, Sink& sink) {
    schema::Envelope envelope;
    Status st = to_envelope(document, envelope);
    if (!st) {
        CW_ERROR("[EMITTER] Rejected envelope document: " << st);
        Report report;
        report.status = std::move(st);
        return report;
    }
    return emit(envelope, byte_budget, sink);
}

} // namespace chunkwire::codec
