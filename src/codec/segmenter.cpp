#include "chunkwire/codec/segmenter.hpp"
#include "chunkwire/core/canonical.hpp"
#include "chunkwire/core/config/codec.hpp"


namespace chunkwire::codec {

namespace cfg = core::config::codec;

// -----------------------------------------------------------------------------
// SegmentBuilder
// -----------------------------------------------------------------------------

SegmentBuilder::SegmentBuilder(std::size_t budget) noexcept
    : budget_(budget)
    , bytes_(cfg::ARRAY_OVERHEAD)
{
}

bool SegmentBuilder::fits(std::size_t element_bytes) const noexcept {
    if (empty()) {
        return true;
    }
    return bytes_ + cfg::SEPARATOR_OVERHEAD + element_bytes <= budget_;
}

void SegmentBuilder::add(std::size_t element_bytes) noexcept {
    if (!empty()) {
        bytes_ += cfg::SEPARATOR_OVERHEAD;
    }
    bytes_ += element_bytes;
    ++end_;
}

Segment SegmentBuilder::seal() noexcept {
    Segment seg{begin_, end_, bytes_};
    begin_ = end_;
    bytes_ = cfg::ARRAY_OVERHEAD;
    return seg;
}

// -----------------------------------------------------------------------------
// Planning
// -----------------------------------------------------------------------------

SegmentPlan plan(const core::Value& array, std::size_t byte_budget) {
    SegmentPlan out;
    out.budget = byte_budget;

    if (!array.is_array() || array.as_array().empty()) {
        return out;
    }

    const auto& elements = array.as_array();

    // One pass over the data: the whole-array size follows from the element
    // sizes, which packing needs anyway.
    std::vector<std::size_t> sizes;
    sizes.reserve(elements.size());
    std::size_t total = cfg::ARRAY_OVERHEAD + (elements.size() - 1) * cfg::SEPARATOR_OVERHEAD;
    for (const auto& e : elements) {
        sizes.push_back(core::canonical::encoded_size(e));
        total += sizes.back();
    }

    if (total <= byte_budget) {
        return out;
    }

    SegmentBuilder builder{byte_budget};
    for (std::size_t sz : sizes) {
        if (!builder.fits(sz)) {
            out.segments.push_back(builder.seal());
        }
        builder.add(sz);
    }
    if (!builder.empty()) {
        out.segments.push_back(builder.seal());
    }

    return out;
}

core::Value slice(const core::Value& array, const Segment& seg) {
    const auto& elements = array.as_array();
    using diff_t = core::Value::Array::difference_type;
    return core::Value::array(core::Value::Array(
        elements.begin() + static_cast<diff_t>(seg.begin),
        elements.begin() + static_cast<diff_t>(seg.end)));
}

} // namespace chunkwire::codec
