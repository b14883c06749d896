#pragma once

#include <concepts>
#include <cstddef>
#include <limits>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "chunkwire/schema/chunk_message.hpp"


namespace chunkwire::codec {

// -----------------------------------------------------------------------------
// ChunkSinkConcept
// -----------------------------------------------------------------------------
//
// Minimal contract of whatever receives an emitted stream (transport, file,
// test collector).
//
//   • on_chunk() is called once per chunk, in chunk_index order
//   • the message is only valid for the duration of the call
//   • returning false stops the stream: no further chunk is built
//
// Framing, serialization and delivery guarantees belong to the sink.
//
// -----------------------------------------------------------------------------

template<class S>
concept ChunkSinkConcept =
    requires(S sink, const schema::ChunkMessage& msg)
{
    { sink.on_chunk(msg) } -> std::same_as<bool>;
};

namespace sink {

// -----------------------------------------------------------------------------
// Collector
// -----------------------------------------------------------------------------
//
// Keeps a copy of every chunk. Accepts at most 'limit' chunks, then asks the
// emitter to stop.
//
class Collector {
public:
    Collector() = default;
    explicit Collector(std::size_t limit) noexcept : limit_(limit) {}

    bool on_chunk(const schema::ChunkMessage& msg) {
        chunks_.push_back(msg);
        return chunks_.size() < limit_;
    }

    [[nodiscard]]
    const std::vector<schema::ChunkMessage>& chunks() const noexcept { return chunks_; }

    [[nodiscard]]
    std::vector<schema::ChunkMessage> take() noexcept { return std::move(chunks_); }

private:
    std::size_t limit_{std::numeric_limits<std::size_t>::max()};
    std::vector<schema::ChunkMessage> chunks_;
};

// -----------------------------------------------------------------------------
// JsonLines
// -----------------------------------------------------------------------------
//
// Writes one canonical JSON document per line and flushes after each chunk,
// so a reader on the other end of a pipe sees every chunk as soon as it is
// produced. Stops the stream when the output stream fails.
//
class JsonLines {
public:
    explicit JsonLines(std::ostream& os) noexcept : os_(&os) {}

    bool on_chunk(const schema::ChunkMessage& msg) {
        line_.clear();
        msg.append_json(line_);
        line_ += '\n';
        os_->write(line_.data(), static_cast<std::streamsize>(line_.size()));
        os_->flush();
        if (os_->good()) {
            bytes_written_ += line_.size();
            return true;
        }
        return false;
    }

    [[nodiscard]]
    std::size_t bytes_written() const noexcept { return bytes_written_; }

private:
    std::ostream* os_;
    std::string line_;
    std::size_t bytes_written_{0};
};

static_assert(ChunkSinkConcept<Collector>);
static_assert(ChunkSinkConcept<JsonLines>);

} // namespace sink

} // namespace chunkwire::codec
