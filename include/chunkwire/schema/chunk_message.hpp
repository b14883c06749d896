#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "chunkwire/schema/envelope.hpp"
#include "chunkwire/core/value.hpp"


namespace chunkwire {
namespace schema {

// ===============================================
// CHUNK MESSAGE
// ===============================================
//
// One unit of an emitted stream:
//
//   { "header": { "chunk_index": i, "chunk_count": n },
//     "type": .., "drafty_id": .., "command": ..,
//     "results": [ ChunkView, ... ] }
//
// chunk_index is 1-based. A field absent from a
// view is simply not in that group's mapping.
//
// ===============================================

// -----------------------------------------------
// HEADER
// -----------------------------------------------
struct ChunkHeader {
    std::size_t chunk_index{1};
    std::size_t chunk_count{1};

    [[nodiscard]]
    bool is_first() const noexcept { return chunk_index == 1; }

    [[nodiscard]]
    bool is_last() const noexcept { return chunk_index == chunk_count; }

    bool operator==(const ChunkHeader&) const = default;
};

// -----------------------------------------------
// PER-UPDATE VIEW
// -----------------------------------------------
//
// Same shape as an Update: only the fields (or
// field segments) relevant to one chunk index.
//
using ChunkView = Update;

struct ChunkMessage {
    ChunkHeader header;

    core::Value type;
    core::Value drafty_id;
    core::Value command;

    std::vector<ChunkView> results;

    // Canonical JSON text, the wire form handed to transports
    [[nodiscard]] std::string to_json() const;

    // Same text appended to 'out' (no intermediate allocation)
    void append_json(std::string& out) const;

    inline void dump(std::ostream& os) const {
        os << to_json();
    }

    bool operator==(const ChunkMessage&) const = default;
};

} // namespace schema
} // namespace chunkwire
