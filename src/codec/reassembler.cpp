#include "chunkwire/codec/reassembler.hpp"

#include <string>
#include <utility>

#include "lcr/log/logger.hpp"


namespace chunkwire::codec {

namespace {

Status unexpected(const schema::ChunkHeader& h, std::string why) {
    CW_DEBUG("[REASSEMBLER] Chunk " << h.chunk_index << "/" << h.chunk_count << " rejected: " << why);
    return Status::failure(Error::UnexpectedChunk, std::move(why));
}

Status inconsistent(FieldRef ref, std::string why) {
    CW_DEBUG("[REASSEMBLER] Field " << ref << " rejected: " << why);
    return Status::failure(Error::InconsistentChunk, std::move(ref), std::move(why));
}

// First duplicated key of 'fields', or nullptr
const std::string* duplicate_key(const schema::Fields& fields) noexcept {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        for (std::size_t j = 0; j < i; ++j) {
            if (fields[j].first == fields[i].first) {
                return &fields[i].first;
            }
        }
    }
    return nullptr;
}

} // namespace

Status Reassembler::push(const schema::ChunkMessage& chunk) {
    const auto& h = chunk.header;

    if (h.chunk_index == 0 || h.chunk_count == 0 || h.chunk_index > h.chunk_count) {
        return unexpected(h, "invalid header");
    }

    const bool in_progress = received_ > 0 && !complete();

    if (h.chunk_index == 1) {
        if (in_progress) {
            return unexpected(h, "new stream started while expecting chunk " + std::to_string(received_ + 1));
        }
        return start(chunk);
    }

    if (!in_progress) {
        return unexpected(h, "no stream in progress");
    }
    if (h.chunk_count != chunk_count_) {
        return unexpected(h, "chunk_count changed from " + std::to_string(chunk_count_));
    }
    if (h.chunk_index != received_ + 1) {
        return unexpected(h, "expected chunk " + std::to_string(received_ + 1));
    }
    return append(chunk);
}

Status Reassembler::start(const schema::ChunkMessage& chunk) {
    for (std::size_t u = 0; u < chunk.results.size(); ++u) {
        for (auto group : schema::GROUPS) {
            if (const auto* key = duplicate_key(chunk.results[u].group(group))) {
                return inconsistent(FieldRef{u, group, *key}, "duplicate key");
            }
        }
    }

    envelope_.type      = chunk.type;
    envelope_.drafty_id = chunk.drafty_id;
    envelope_.command   = chunk.command;
    envelope_.results   = chunk.results;

    chunk_count_ = chunk.header.chunk_count;
    received_ = 1;

    CW_TRACE("[REASSEMBLER] Stream started: " << chunk_count_ << " chunks, "
             << envelope_.results.size() << " updates.");
    return {};
}

Status Reassembler::append(const schema::ChunkMessage& chunk) {
    const auto& h = chunk.header;

    if (chunk.type != envelope_.type || chunk.drafty_id != envelope_.drafty_id || chunk.command != envelope_.command) {
        return unexpected(h, "metadata differs from chunk 1");
    }
    if (chunk.results.size() != envelope_.results.size()) {
        return unexpected(h, "update count differs from chunk 1");
    }

    // Validate everything first: a rejected chunk must not touch the partial envelope
    for (std::size_t u = 0; u < chunk.results.size(); ++u) {
        const auto& view = chunk.results[u];
        const auto& target = envelope_.results[u];

        if (view.plot_type != target.plot_type) {
            return unexpected(h, "plot_type of update " + std::to_string(u) + " differs from chunk 1");
        }

        for (auto group : schema::GROUPS) {
            const auto& fields = view.group(group);
            if (const auto* key = duplicate_key(fields)) {
                return inconsistent(FieldRef{u, group, *key}, "duplicate key");
            }
            for (const auto& [key, value] : fields) {
                const core::Value* acc = core::find(target.group(group), key);
                if (acc == nullptr) {
                    return inconsistent(FieldRef{u, group, key}, "continuation of a field absent from chunk 1");
                }
                if (!acc->is_array() || !value.is_array()) {
                    return inconsistent(FieldRef{u, group, key}, "only arrays can be continued");
                }
            }
        }
    }

    for (std::size_t u = 0; u < chunk.results.size(); ++u) {
        for (auto group : schema::GROUPS) {
            auto& target = envelope_.results[u].group(group);
            for (const auto& [key, value] : chunk.results[u].group(group)) {
                auto& acc = core::find(target, key)->as_array();
                const auto& tail = value.as_array();
                acc.insert(acc.end(), tail.begin(), tail.end());
            }
        }
    }

    ++received_;
    CW_TRACE("[REASSEMBLER] Appended chunk " << h.chunk_index << "/" << chunk_count_ << ".");
    return {};
}

schema::Envelope Reassembler::take() {
    schema::Envelope out = std::move(envelope_);
    reset();
    return out;
}

void Reassembler::reset() noexcept {
    envelope_ = schema::Envelope{};
    chunk_count_ = 0;
    received_ = 0;
}

} // namespace chunkwire::codec
