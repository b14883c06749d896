#include "chunkwire/codec/emitter.hpp"
#include "chunkwire/core/canonical.hpp"
#include "chunkwire/core/config/codec.hpp"
#include "chunkwire/core/telemetry.hpp"

#include <algorithm>
#include <string>


namespace chunkwire::codec {

Status Emitter::prepare() {
    if (prepared_) {
        return {};
    }

    if (budget_ < core::config::codec::MIN_CHUNK_BUDGET) {
        CW_ERROR("[EMITTER] Byte budget " << budget_ << " is below the minimum of "
                 << core::config::codec::MIN_CHUNK_BUDGET << " -> abort.");
        return Status::failure(Error::InvalidBudget,
            "byte budget must be at least " + std::to_string(core::config::codec::MIN_CHUNK_BUDGET));
    }

    const auto& updates = envelope_.results;

    // Planning counters are committed only when the whole envelope is accepted
    std::vector<GroupPlans> plans;
    std::vector<Diagnostic> diagnostics;
    [[maybe_unused]] telemetry::Codec planned;
    plans.resize(updates.size());

    std::size_t longest = 0;

    for (std::size_t u = 0; u < updates.size(); ++u) {
        for (auto group : schema::GROUPS) {
            const auto& fields = updates[u].group(group);
            auto& group_plans = plans[u][static_cast<std::size_t>(group)];
            group_plans.reserve(fields.size());

            for (std::size_t f = 0; f < fields.size(); ++f) {
                const auto& [key, value] = fields[f];

                for (std::size_t prev = 0; prev < f; ++prev) {
                    if (fields[prev].first == key) {
                        FieldRef ref{u, group, key};
                        CW_ERROR("[EMITTER] Duplicate field " << ref << " -> abort emission.");
                        return Status::failure(Error::MalformedEnvelope, std::move(ref), "duplicate field key");
                    }
                }

                if (!core::canonical::is_array_value(value)) {
                    FieldRef ref{u, group, key};
                    CW_ERROR("[EMITTER] Field " << ref << " is not a canonical array (kind="
                             << core::to_string(value.kind()) << ") -> abort emission.");
                    return Status::failure(Error::UnsupportedFieldType, std::move(ref),
                        "field value is not a scalar or a nested sequence of scalars");
                }

                SegmentPlan p = plan(value, budget_);
                CW_TL1(planned.fields_planned_total.inc());

                if (p.needs_split()) {
                    const FieldRef ref{u, group, key};
                    CW_DEBUG("[EMITTER] Field " << ref << " split into "
                             << p.segment_count() << " segments (budget=" << budget_ << ").");
                    CW_TL1(planned.fields_split_total.inc());
                    CW_TL1(planned.segments_total.inc(p.segment_count()));

                    for (std::size_t s = 0; s < p.segments.size(); ++s) {
                        const auto& seg = p.segments[s];
                        if (p.is_oversized(seg)) {
                            Diagnostic d{Error::BudgetTooSmallForElement, ref,
                                         s + 1, SegmentPlan::element_bytes(seg), budget_};
                            CW_WARN("[EMITTER] " << d << " (element " << seg.begin << " sent alone).");
                            CW_TL1(planned.oversized_segments_total.inc());
                            diagnostics.push_back(std::move(d));
                        }
                    }
                    longest = std::max(longest, p.segment_count());
                }

                group_plans.push_back(std::move(p));
            }
        }
    }

    plans_ = std::move(plans);
    diagnostics_ = std::move(diagnostics);
    CW_TL1(planned.copy_to(telemetry_));
    chunk_count_ = std::max<std::size_t>(1, longest);
    next_index_ = 1;
    prepared_ = true;

    CW_DEBUG("[EMITTER] Planned " << updates.size() << " updates -> " << chunk_count_ << " chunks.");
    return {};
}

bool Emitter::next(schema::ChunkMessage& out) {
    if (!prepared_ || next_index_ > chunk_count_) {
        return false;
    }
    const std::size_t index = next_index_++;

    out.header.chunk_index = index;
    out.header.chunk_count = chunk_count_;
    out.type      = envelope_.type;
    out.drafty_id = envelope_.drafty_id;
    out.command   = envelope_.command;

    const auto& updates = envelope_.results;
    out.results.clear();
    out.results.reserve(updates.size());

    for (std::size_t u = 0; u < updates.size(); ++u) {
        schema::ChunkView view;
        view.plot_type = updates[u].plot_type;

        for (auto group : schema::GROUPS) {
            const auto& fields = updates[u].group(group);
            const auto& group_plans = plans_[u][static_cast<std::size_t>(group)];
            auto& dst = view.group(group);

            for (std::size_t f = 0; f < fields.size(); ++f) {
                const auto& [key, value] = fields[f];
                const auto& p = group_plans[f];

                if (!p.needs_split()) {
                    if (index == 1) {
                        dst.emplace_back(key, value);
                    }
                }
                else if (index <= p.segment_count()) {
                    dst.emplace_back(key, slice(value, p.segments[index - 1]));
                }
            }
        }

        out.results.push_back(std::move(view));
    }

    CW_TL1(telemetry_.chunks_emitted_total.inc());
    CW_TRACE("[EMITTER] Built chunk " << index << "/" << chunk_count_ << ".");
    return true;
}

} // namespace chunkwire::codec
