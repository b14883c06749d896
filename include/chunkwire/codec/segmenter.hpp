#pragma once

#include <cstddef>
#include <vector>

#include "chunkwire/core/value.hpp"
#include "chunkwire/core/config/codec.hpp"


namespace chunkwire::codec {

/*
===============================================================================
 codec::Segmenter
===============================================================================

Splits one array into contiguous, byte-budgeted segments.

-------------------------------------------------------------------------------
 Contract
-------------------------------------------------------------------------------
plan(array, budget):
  - canonical size of 'array' <= budget  -> "no split needed" (empty plan)
  - scalars and empty arrays             -> "no split needed"
  - otherwise top-level elements are packed greedily, in order:

        segment size = 2                      ("[]")
                     + sum(element sizes)
                     + 2 * (elements - 1)     (", ")

    an element joins the current segment while the size stays <= budget,
    otherwise the current segment is sealed and the element starts the next.

  - An element too large to share a segment is placed alone and that segment
    may exceed the budget. When the element's own encoding exceeds the budget
    the segment is oversized (SegmentPlan::is_oversized). No element is
    dropped and no empty segment is produced.

Segments are index ranges into the planned array: a plan is only meaningful
together with the array it was computed from.

Deterministic: same array + same budget -> same plan.
===============================================================================
*/

// -----------------------------------------------------------------------------
// Segment
// -----------------------------------------------------------------------------
//
// Half-open range [begin, end) of top-level elements, plus the canonical
// size of those elements written as one array.
//
struct Segment {
    std::size_t begin{0};
    std::size_t end{0};
    std::size_t encoded_bytes{0};

    [[nodiscard]]
    std::size_t size() const noexcept { return end - begin; }

    bool operator==(const Segment&) const = default;
};

// -----------------------------------------------------------------------------
// SegmentPlan
// -----------------------------------------------------------------------------
struct SegmentPlan {
    std::size_t budget{0};

    // Empty: no split needed (the field travels whole in chunk 1)
    std::vector<Segment> segments;

    [[nodiscard]]
    bool needs_split() const noexcept { return !segments.empty(); }

    [[nodiscard]]
    std::size_t segment_count() const noexcept { return segments.size(); }

    // Encoded size of the lone element of a single-element segment
    [[nodiscard]]
    static std::size_t element_bytes(const Segment& seg) noexcept {
        return seg.encoded_bytes - core::config::codec::ARRAY_OVERHEAD;
    }

    // A lone element whose own encoding exceeds the budget. A segment whose
    // brackets alone push it over the budget is not oversized.
    [[nodiscard]]
    bool is_oversized(const Segment& seg) const noexcept {
        return seg.size() == 1 && element_bytes(seg) > budget;
    }
};

// -----------------------------------------------------------------------------
// SegmentBuilder
// -----------------------------------------------------------------------------
//
// Accumulates consecutive elements of one array with a running byte count,
// then seals them into an immutable Segment. Works on element sizes only.
//
class SegmentBuilder {
public:
    explicit SegmentBuilder(std::size_t budget) noexcept;

    [[nodiscard]]
    bool empty() const noexcept { return end_ == begin_; }

    [[nodiscard]]
    std::size_t bytes() const noexcept { return bytes_; }

    // True when an element of 'element_bytes' can join without exceeding
    // the budget. An empty builder accepts any element.
    [[nodiscard]]
    bool fits(std::size_t element_bytes) const noexcept;

    // Appends the next element of the array
    void add(std::size_t element_bytes) noexcept;

    // Closes the current segment and starts an empty one right after it
    [[nodiscard]]
    Segment seal() noexcept;

private:
    std::size_t budget_;
    std::size_t begin_{0};
    std::size_t end_{0};
    std::size_t bytes_;
};

// -----------------------------------------------------------------------------
// Planning
// -----------------------------------------------------------------------------
[[nodiscard]]
SegmentPlan plan(const core::Value& array, std::size_t byte_budget);

// Materializes 'seg' of 'array' as a standalone array value.
// Precondition: 'seg' comes from a plan of 'array'.
[[nodiscard]]
core::Value slice(const core::Value& array, const Segment& seg);

} // namespace chunkwire::codec
