#include "chunkwire/schema/chunk_message.hpp"
#include "chunkwire/core/canonical.hpp"

#include "lcr/json.hpp"


namespace chunkwire::schema {

void ChunkMessage::append_json(std::string& j) const {
    // -------------------------------------------
    // header (required, always first)
    // -------------------------------------------
    j += "{\"header\": {\"chunk_index\": ";
    lcr::json::append(j, static_cast<std::uint64_t>(header.chunk_index));
    j += ", \"chunk_count\": ";
    lcr::json::append(j, static_cast<std::uint64_t>(header.chunk_count));
    j += '}';

    // -------------------------------------------
    // envelope metadata (verbatim)
    // -------------------------------------------
    j += ", \"type\": ";
    core::canonical::encode(type, j);
    j += ", \"drafty_id\": ";
    core::canonical::encode(drafty_id, j);
    j += ", \"command\": ";
    core::canonical::encode(command, j);

    // -------------------------------------------
    // per-update views
    // -------------------------------------------
    j += ", \"results\": [";
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (i > 0) j += ", ";
        schema::append_json(results[i], j);
    }
    j += "]}";
}

std::string ChunkMessage::to_json() const {
    std::string j;
    j.reserve(256);
    append_json(j);
    return j;
}

} // namespace chunkwire::schema
