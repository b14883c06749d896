#pragma once

#include <ostream>

#include "lcr/metrics/counter.hpp"


namespace chunkwire::codec::telemetry {

// ============================================================================
// Codec Telemetry
//
// Mechanical counters of one emitter. Updated through CW_TL1 only, so every
// counter stays at zero when telemetry level 1 is compiled out.
//
// Design principles:
//   • no clocks
//   • no allocation
//   • single owner (the emitter), no atomics
// ============================================================================

struct Codec final {
    // ---------------------------------------------------------------------
    // Planning
    // ---------------------------------------------------------------------

    // Array fields visited by the planner
    lcr::metrics::counter64 fields_planned_total;

    // Fields whose encoding exceeded the budget and were split
    lcr::metrics::counter64 fields_split_total;

    // Segments produced across all split fields
    lcr::metrics::counter64 segments_total;

    // Single-element segments whose element exceeds the budget
    lcr::metrics::counter64 oversized_segments_total;

    // ---------------------------------------------------------------------
    // Emission
    // ---------------------------------------------------------------------

    lcr::metrics::counter64 chunks_emitted_total;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------

    inline void copy_to(Codec& other) const noexcept {
        fields_planned_total.copy_to(other.fields_planned_total);
        fields_split_total.copy_to(other.fields_split_total);
        segments_total.copy_to(other.segments_total);
        oversized_segments_total.copy_to(other.oversized_segments_total);
        chunks_emitted_total.copy_to(other.chunks_emitted_total);
    }

    inline void dump(std::ostream& os) const {
        os << "[Codec Telemetry]\n";
        fields_planned_total.dump("fields planned", os);
        fields_split_total.dump("fields split", os);
        segments_total.dump("segments", os);
        oversized_segments_total.dump("oversized segments", os);
        chunks_emitted_total.dump("chunks emitted", os);
    }
};

} // namespace chunkwire::codec::telemetry
