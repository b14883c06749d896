#include <cstdlib>
#include <iostream>
#include <sstream>
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
        "chunkwire - Stream Reassembly Example\n"
        "Reads chunk messages (one JSON document per line) and prints every reassembled envelope.\n",
        "Input is typically the output of chunkwire_stream.");

    std::string text;
    if (!examples::read_all(params.input, text)) {
        CW_FATAL("Cannot read input: " << params.input);
        return EXIT_FAILURE;
    }

    simdjson::dom::parser dom;
    codec::Reassembler reassembler;

    std::istringstream lines(text);
    std::string line;
    std::size_t line_no = 0;
    std::size_t envelopes = 0;

    while (std::getline(lines, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        simdjson::dom::element root;
        if (auto err = dom.parse(line).get(root); err) {
            CW_ERROR("Line " << line_no << ": invalid JSON (" << simdjson::error_message(err) << ")");
            return EXIT_FAILURE;
        }

        schema::ChunkMessage chunk;
        if (!parser::chunk_message::parse(root, chunk)) {
            CW_ERROR("Line " << line_no << ": not a chunk message");
            return EXIT_FAILURE;
        }

        if (auto st = reassembler.push(chunk); !st) {
            CW_ERROR("Line " << line_no << ": " << st);
            return EXIT_FAILURE;
        }

        if (reassembler.complete()) {
            CW_INFO("Envelope complete after " << reassembler.chunk_count() << " chunks.");
            std::cout << reassembler.take().to_json() << std::endl;
            ++envelopes;
        }
    }

    if (!reassembler.idle()) {
        CW_ERROR("Stream truncated: " << reassembler.chunks_received() << "/"
                 << reassembler.chunk_count() << " chunks received.");
        return EXIT_FAILURE;
    }

    if (params.stats) {
        std::cerr << "[Reassembly]\n  lines    : " << line_no
                  << "\n  envelopes: " << envelopes << std::endl;
    }
    return EXIT_SUCCESS;
}
