#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include "chunkwire.hpp"
#include "common/cli/params.hpp"

using namespace chunkwire;
using core::Value;

// -----------------------------------------------------------------------------
// Surface builders
// -----------------------------------------------------------------------------

// [0, 1, ..., n-1]
static Value range(int n, int offset = 0) {
    Value::Array a;
    a.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
        a.emplace_back(offset + i);
    }
    return Value::array(std::move(a));
}

// rows x cols grid, z[r][c] = r * cols + c
static Value grid(int rows, int cols) {
    Value::Array a;
    a.reserve(static_cast<std::size_t>(rows));
    for (int r = 0; r < rows; ++r) {
        a.push_back(range(cols, r * cols));
    }
    return Value::array(std::move(a));
}

// x: nx points, y: ny points (omitted when 0), z: rows x cols grid
static schema::Envelope surface(int nx, int ny, int rows, int cols) {
    schema::Envelope env;
    env.type = "plot";
    env.drafty_id = "surface-demo";
    env.command = "update";

    schema::Update u;
    u.plot_type = "surface";
    u.args.emplace_back("x", range(nx));
    if (ny > 0) {
        u.args.emplace_back("y", range(ny));
    }
    u.data.emplace_back("z", grid(rows, cols));
    env.results.push_back(std::move(u));
    return env;
}

static schema::Envelope small_surface() {
    schema::Envelope env;
    env.type = "plot";
    env.drafty_id = "surface-demo";
    env.command = "update";

    schema::Update u;
    u.plot_type = "surface";
    u.args.emplace_back("x", Value::array({1, 2, 3}));
    u.args.emplace_back("y", Value::array({4, 5, 6}));
    u.data.emplace_back("z", Value::array({Value::array({1, 2, 3}), Value::array({3, 4, 5})}));
    env.results.push_back(std::move(u));
    return env;
}

// -----------------------------------------------------------------------------
// Stream one envelope to stdout and check it reassembles
// -----------------------------------------------------------------------------
static bool run(std::string_view name, const schema::Envelope& env, std::size_t budget) {
    codec::sink::Collector collected;
    auto report = codec::emit(env, budget, collected);
    if (!report.status) {
        CW_ERROR("[" << name << "] " << report.status);
        return false;
    }

    codec::sink::JsonLines out{std::cout};
    codec::Reassembler reassembler;
    for (const auto& chunk : collected.chunks()) {
        if (!out.on_chunk(chunk)) {
            CW_ERROR("[" << name << "] Output closed.");
            return false;
        }
        if (auto st = reassembler.push(chunk); !st) {
            CW_ERROR("[" << name << "] " << st);
            return false;
        }
    }

    const bool round_trip = reassembler.complete() && reassembler.take() == env;
    std::cerr << "[" << name << "] budget=" << budget
              << " chunks=" << report.chunk_count
              << " bytes=" << out.bytes_written()
              << " oversized=" << report.diagnostics.size()
              << " round-trip=" << (round_trip ? "ok" : "FAILED") << std::endl;
    return round_trip;
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = examples::cli::configure(argc, argv,
        "chunkwire - Surface Streaming Demo\n"
        "Streams a small, a large and a very large surface update and verifies each reassembles.\n",
        "Chunks go to stdout, one summary line per surface goes to stderr.\n"
        "--budget applies to the very large surface only.",
        120);

    bool ok = true;
    ok = run("small", small_surface(), 1000) && ok;
    ok = run("large", surface(50, 20, 50, 20), 150) && ok;
    ok = run("very large", surface(1000, 0, 100, 100), params.budget) && ok;

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
