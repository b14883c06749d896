#include <cstdlib>
#include <iostream>
#include <string>

#include "simdjson.h"

#include "chunkwire.hpp"
#include "common/cli/params.hpp"
#include "common/input.hpp"

using namespace chunkwire;

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = examples::cli::configure(argc, argv,
        "chunkwire - Envelope Streaming Example\n"
        "Reads one envelope JSON document and writes its chunk stream to stdout, one JSON line per chunk.\n",
        "Pipe the output into chunkwire_reassemble to rebuild the envelope.");

    std::string json;
    if (!examples::read_all(params.input, json)) {
        CW_FATAL("Cannot read input: " << params.input);
        return EXIT_FAILURE;
    }

    // -------------------------------------------------------------
    // Parse
    // -------------------------------------------------------------
    simdjson::dom::parser dom;
    schema::Envelope envelope;
    if (auto st = parser::envelope::parse(dom, json, envelope); !st) {
        CW_ERROR("Invalid envelope: " << st);
        return EXIT_FAILURE;
    }
    CW_INFO("Envelope with " << envelope.results.size() << " updates, budget " << params.budget << " bytes.");

    // -------------------------------------------------------------
    // Emit
    // -------------------------------------------------------------
    codec::Emitter emitter{envelope, params.budget};
    if (auto st = emitter.prepare(); !st) {
        CW_ERROR("Emission aborted: " << st);
        return EXIT_FAILURE;
    }

    codec::sink::JsonLines out{std::cout};
    schema::ChunkMessage msg;
    while (emitter.next(msg)) {
        if (!out.on_chunk(msg)) {
            CW_ERROR("Output closed after chunk " << msg.header.chunk_index << "/" << emitter.chunk_count());
            return EXIT_FAILURE;
        }
    }

    for (const auto& d : emitter.diagnostics()) {
        CW_WARN(d);
    }

    if (params.stats) {
        emitter.telemetry().dump(std::cerr);
        std::cerr << "[Output]\n  chunks: " << emitter.chunk_count()
                  << "\n  bytes : " << out.bytes_written() << std::endl;
    }
    return EXIT_SUCCESS;
}
