#include <cmath>
#include <cstddef>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "chunkwire/codec/emitter.hpp"
#include "chunkwire/codec/reassembler.hpp"
#include "chunkwire/core/canonical.hpp"
#include "common/surfaces.hpp"
#include "common/test_check.hpp"
#include "lcr/log/logger.hpp"

using namespace chunkwire;
using core::Value;

/*
================================================================================
Chunk Emitter — Unit Tests
================================================================================

Validates the emitted stream as a consumer sees it:
  • chunk_count is constant and equals the number of messages
  • unsplit fields travel whole, in chunk 1 only
  • segment k of a split field travels in chunk k only
  • the stream reassembles into the original envelope
  • fatal errors abort before the first chunk
  • a sink may stop the stream (Cancelled)
================================================================================
*/

static std::vector<schema::ChunkMessage> collect(const schema::Envelope& env, std::size_t budget) {
    codec::sink::Collector sink;
    auto report = codec::emit(env, budget, sink);
    TEST_CHECK(report.status.ok());
    TEST_CHECK(report.chunk_count == sink.chunks().size());
    TEST_CHECK(report.chunks_emitted == sink.chunks().size());
    return sink.take();
}

static schema::Envelope reassemble(const std::vector<schema::ChunkMessage>& chunks) {
    codec::Reassembler r;
    for (const auto& c : chunks) {
        TEST_CHECK(r.push(c).ok());
    }
    TEST_CHECK(r.complete());
    return r.take();
}

static const Value* field(const schema::ChunkMessage& msg, std::size_t u, schema::Group g, const char* key) {
    return core::find(msg.results[u].group(g), key);
}

// ------------------------------------------------------------
// POSITIVE CASES
// ------------------------------------------------------------

void test_small_surface_single_chunk() {
    std::cout << "[TEST] Small surface fits in one chunk..." << std::endl;

    const auto env = surfaces::small();
    auto chunks = collect(env, 1000);

    TEST_CHECK(chunks.size() == 1);
    const auto& c = chunks[0];
    TEST_CHECK(c.header.chunk_index == 1);
    TEST_CHECK(c.header.chunk_count == 1);
    TEST_CHECK(c.header.is_first() && c.header.is_last());
    TEST_CHECK(c.type == env.type);
    TEST_CHECK(c.drafty_id == env.drafty_id);
    TEST_CHECK(c.command == env.command);
    TEST_CHECK(c.results == env.results);

    TEST_CHECK(c.to_json() ==
        R"({"header": {"chunk_index": 1, "chunk_count": 1}, "type": "plot", "drafty_id": "d1", "command": "update", )"
        R"("results": [{"plot_type": "surface", "args": {"x": [1, 2, 3], "y": [4, 5, 6]}, "data": {"z": [[1, 2, 3], [3, 4, 5]]}}]})");

    std::cout << "[TEST] OK\n";
}

void test_large_surface_is_split() {
    std::cout << "[TEST] Large surface is split..." << std::endl;

    const auto env = surfaces::large();
    auto chunks = collect(env, 150);

    // z: one row per chunk
    TEST_CHECK(chunks.size() == 50);

    for (std::size_t k = 0; k < chunks.size(); ++k) {
        const auto& c = chunks[k];
        TEST_CHECK(c.header.chunk_index == k + 1);
        TEST_CHECK(c.header.chunk_count == 50);
        TEST_CHECK(c.results.size() == 1);
        TEST_CHECK(c.results[0].plot_type == Value{"surface"});
        TEST_CHECK(c.type == env.type);

        // y fits: whole, chunk 1 only
        const Value* y = field(c, 0, schema::Group::Args, "y");
        TEST_CHECK(k == 0 ? (y != nullptr && *y == env.results[0].args[1].second) : y == nullptr);

        // x has two segments
        const Value* x = field(c, 0, schema::Group::Args, "x");
        TEST_CHECK(k < 2 ? x != nullptr : x == nullptr);

        // z row k
        const Value* z = field(c, 0, schema::Group::Data, "z");
        TEST_CHECK(z != nullptr);
        TEST_CHECK(z->size() == 1);
        TEST_CHECK(z->as_array()[0] == surfaces::range(20, static_cast<int>(k) * 20));
    }

    TEST_CHECK(reassemble(chunks) == env);

    std::cout << "[TEST] OK\n";
}

void test_very_large_surface() {
    std::cout << "[TEST] Very large surface..." << std::endl;

    const auto env = surfaces::very_large();

    codec::sink::Collector sink;
    auto report = codec::emit(env, 120, sink);
    TEST_CHECK(report.status.ok());

    // Every row of z is wider than the budget: one row per chunk, each diagnosed
    TEST_CHECK(report.chunk_count == 100);
    TEST_CHECK(report.diagnostics.size() == 100);
    for (const auto& d : report.diagnostics) {
        TEST_CHECK(d.field.key == "z");
    }

    const auto& first = sink.chunks()[0].results[0];
    TEST_CHECK(first.args.size() == 1);
    TEST_CHECK(first.args[0].first == "x");
    TEST_CHECK(core::find(first.args, "y") == nullptr);

    TEST_CHECK(reassemble(sink.chunks()) == env);

    std::cout << "[TEST] OK\n";
}

void test_field_order_is_preserved() {
    std::cout << "[TEST] Field order within chunks..." << std::endl;

    schema::Update u;
    u.plot_type = "scatter";
    u.args.emplace_back("b", surfaces::range(40));
    u.args.emplace_back("a", Value::array({1}));
    u.args.emplace_back("c", surfaces::range(40));
    const auto env = surfaces::with_metadata({u});

    auto chunks = collect(env, 60);
    TEST_CHECK(chunks.size() > 1);

    const auto& args = chunks[0].results[0].args;
    TEST_CHECK(args.size() == 3);
    TEST_CHECK(args[0].first == "b");
    TEST_CHECK(args[1].first == "a");
    TEST_CHECK(args[2].first == "c");

    TEST_CHECK(reassemble(chunks) == env);

    std::cout << "[TEST] OK\n";
}

void test_empty_results() {
    std::cout << "[TEST] Empty results..." << std::endl;

    const auto env = surfaces::with_metadata({});
    auto chunks = collect(env, 10);

    TEST_CHECK(chunks.size() == 1);
    TEST_CHECK(chunks[0].header.chunk_count == 1);
    TEST_CHECK(chunks[0].results.empty());
    TEST_CHECK(chunks[0].type == Value{"plot"});

    TEST_CHECK(reassemble(chunks) == env);

    std::cout << "[TEST] OK\n";
}

void test_updates_without_split_fields_stay_in_every_chunk() {
    std::cout << "[TEST] Every chunk carries one view per update..." << std::endl;

    schema::Update empty;
    empty.plot_type = "line";
    schema::Update title;
    title.plot_type = "heatmap";
    title.args.emplace_back("title", "Temperature");
    title.data.emplace_back("z", surfaces::grid(6, 6));
    const auto env = surfaces::with_metadata({empty, title});

    auto chunks = collect(env, 40);
    TEST_CHECK(chunks.size() > 1);

    for (const auto& c : chunks) {
        TEST_CHECK(c.results.size() == 2);
        TEST_CHECK(c.results[0].plot_type == Value{"line"});
        TEST_CHECK(c.results[0].args.empty() && c.results[0].data.empty());
        TEST_CHECK(c.results[1].plot_type == Value{"heatmap"});
        // A scalar field travels whole in chunk 1
        TEST_CHECK((field(c, 1, schema::Group::Args, "title") != nullptr) == c.header.is_first());
    }

    TEST_CHECK(reassemble(chunks) == env);

    std::cout << "[TEST] OK\n";
}

void test_round_trip_for_many_budgets() {
    std::cout << "[TEST] Round-trip and budget bound for many budgets..." << std::endl;

    schema::Update u1;
    u1.plot_type = "surface";
    u1.args.emplace_back("x", surfaces::range(37));
    u1.args.emplace_back("labels", Value::array({"alpha", "be\"ta", "gamma", "\xc3\xa9t\xc3\xa9", "x"}));
    u1.data.emplace_back("z", surfaces::grid(13, 9));

    schema::Update u2;
    u2.plot_type = nullptr;
    u2.data.emplace_back("w", Value::array({0.5, -1.25, 1e-9, 3.0, Value{}, true}));
    const auto env = surfaces::with_metadata({u1, u2});

    for (std::size_t budget : {1u, 2u, 7u, 16u, 33u, 100u, 257u, 1024u, 100000u}) {
        codec::Emitter emitter{env, budget};
        TEST_CHECK(emitter.prepare().ok());

        std::vector<schema::ChunkMessage> chunks;
        schema::ChunkMessage msg;
        while (emitter.next(msg)) {
            TEST_CHECK(msg.header.chunk_count == emitter.chunk_count());
            chunks.push_back(msg);
        }
        TEST_CHECK(emitter.done());
        TEST_CHECK(chunks.size() == emitter.chunk_count());

        // Budget bound on every segment of every split field
        for (std::size_t u = 0; u < env.results.size(); ++u) {
            for (auto g : schema::GROUPS) {
                const auto& fields = env.results[u].group(g);
                for (std::size_t f = 0; f < fields.size(); ++f) {
                    const auto& p = emitter.plan_of(u, g, f);
                    if (!p.needs_split()) {
                        TEST_CHECK(core::canonical::encoded_size(fields[f].second) <= budget ||
                                   fields[f].second.size() == 0);
                    }
                    for (const auto& seg : p.segments) {
                        TEST_CHECK(seg.encoded_bytes <= budget || seg.size() == 1);
                    }
                }
            }
        }

        TEST_CHECK(reassemble(chunks) == env);
    }

    std::cout << "[TEST] OK\n";
}

void test_oversized_element_diagnostics() {
    std::cout << "[TEST] Oversized element diagnostics..." << std::endl;

    schema::Update u;
    u.plot_type = "bar";
    u.args.emplace_back("x", Value::array({"aaaaaaaaaa", "b", 7}));
    const auto env = surfaces::with_metadata({u});

    // Capture the WARN line reporting the oversized element
    std::ostringstream log;
    auto& logger = lcr::log::Logger::instance();
    const auto level = logger.level();
    logger.set_level(lcr::log::Level::Warn);
    logger.set_output(&log);

    codec::sink::Collector sink;
    auto report = codec::emit(env, 8, sink);

    logger.set_output(&std::cerr);
    logger.set_level(level);

    TEST_CHECK(report.status.ok());
    TEST_CHECK(report.chunk_count == 2);
    TEST_CHECK(report.diagnostics.size() == 1);

    const auto& d = report.diagnostics[0];
    TEST_CHECK(d.code == codec::Error::BudgetTooSmallForElement);
    TEST_CHECK((d.field == codec::FieldRef{0, schema::Group::Args, "x"}));
    TEST_CHECK(d.segment == 1);
    TEST_CHECK(d.encoded_bytes == 12);   // "aaaaaaaaaa" quoted
    TEST_CHECK(d.budget == 8);

    const std::string text = log.str();
    TEST_CHECK(text.find("[WARN]") != std::string::npos);
    TEST_CHECK(text.find("[BudgetTooSmallForElement] results[0].args.x segment 1: element of 12 bytes > budget 8")
               != std::string::npos);

    // Nothing dropped
    TEST_CHECK(reassemble(sink.chunks()) == env);

    std::cout << "[TEST] OK\n";
}

void test_bracket_overflow_is_not_diagnosed() {
    std::cout << "[TEST] Element within budget raises no diagnostic..." << std::endl;

    schema::Update u;
    u.plot_type = "bar";
    u.args.emplace_back("x", Value::array({"aaaaaaa", "b"}));   // 9 and 3 bytes
    const auto env = surfaces::with_metadata({u});

    codec::sink::Collector sink;
    auto report = codec::emit(env, 10, sink);

    TEST_CHECK(report.status.ok());
    TEST_CHECK(report.chunk_count == 2);
    TEST_CHECK(report.diagnostics.empty());
    TEST_CHECK(reassemble(sink.chunks()) == env);

    std::cout << "[TEST] OK\n";
}

void test_pull_emitter_state() {
    std::cout << "[TEST] Pull emitter state..." << std::endl;

    const auto env = surfaces::large();
    codec::Emitter emitter{env, 150};

    schema::ChunkMessage msg;
    TEST_CHECK(!emitter.prepared());
    TEST_CHECK(!emitter.next(msg));          // not prepared yet

    TEST_CHECK(emitter.prepare().ok());
    TEST_CHECK(emitter.prepare().ok());      // idempotent
    TEST_CHECK(emitter.chunk_count() == 50);
    TEST_CHECK(emitter.next_index() == 1);
    TEST_CHECK(emitter.byte_budget() == 150);

    std::size_t n = 0;
    while (emitter.next(msg)) {
        ++n;
        TEST_CHECK(msg.header.chunk_index == n);
    }
    TEST_CHECK(n == 50);
    TEST_CHECK(emitter.done());
    TEST_CHECK(!emitter.next(msg));

#if defined(CHUNKWIRE_ENABLE_TELEMETRY_L1)
    const auto& t = emitter.telemetry();
    TEST_CHECK(t.fields_planned_total.load() == 3);
    TEST_CHECK(t.fields_split_total.load() == 2);
    TEST_CHECK(t.segments_total.load() == 52);
    TEST_CHECK(t.oversized_segments_total.load() == 0);
    TEST_CHECK(t.chunks_emitted_total.load() == 50);
#endif

    std::cout << "[TEST] OK\n";
}

void test_failed_prepare_leaves_no_counts() {
    std::cout << "[TEST] Failed planning leaves telemetry untouched..." << std::endl;

    // x and z are planned (and split) before w is rejected
    auto env = surfaces::large();
    env.results[0].data.emplace_back("w", Value::array({std::numeric_limits<double>::infinity()}));

    codec::Emitter emitter{env, 150};
    TEST_CHECK(emitter.prepare().code == codec::Error::UnsupportedFieldType);
    TEST_CHECK(emitter.prepare().code == codec::Error::UnsupportedFieldType);

    const auto& t = emitter.telemetry();
    TEST_CHECK(t.fields_planned_total.load() == 0);
    TEST_CHECK(t.fields_split_total.load() == 0);
    TEST_CHECK(t.segments_total.load() == 0);
    TEST_CHECK(t.oversized_segments_total.load() == 0);
    TEST_CHECK(t.chunks_emitted_total.load() == 0);

#if defined(CHUNKWIRE_ENABLE_TELEMETRY_L1)
    // A successful prepare, repeated, counts each field once
    const auto accepted = surfaces::large();
    codec::Emitter ok{accepted, 150};
    TEST_CHECK(ok.prepare().ok());
    TEST_CHECK(ok.prepare().ok());
    TEST_CHECK(ok.telemetry().fields_planned_total.load() == 3);
    TEST_CHECK(ok.telemetry().segments_total.load() == 52);
#endif

    std::cout << "[TEST] OK\n";
}

void test_json_lines_sink() {
    std::cout << "[TEST] JSON lines sink..." << std::endl;

    const auto env = surfaces::large();
    std::ostringstream os;
    codec::sink::JsonLines sink{os};

    auto report = codec::emit(env, 150, sink);
    TEST_CHECK(report.status.ok());

    const std::string text = os.str();
    std::size_t lines = 0;
    for (char c : text) {
        if (c == '\n') ++lines;
    }
    TEST_CHECK(lines == report.chunk_count);
    TEST_CHECK(sink.bytes_written() == text.size());
    TEST_CHECK(text.rfind(R"({"header": {"chunk_index": 1, "chunk_count": 50}, )", 0) == 0);

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// FAILURE CASES
// ------------------------------------------------------------

void test_invalid_budget() {
    std::cout << "[TEST] Budget 0 is rejected..." << std::endl;

    codec::sink::Collector sink;
    auto report = codec::emit(surfaces::small(), 0, sink);

    TEST_CHECK(report.status.code == codec::Error::InvalidBudget);
    TEST_CHECK(report.chunk_count == 0);
    TEST_CHECK(sink.chunks().empty());

    std::cout << "[TEST] OK\n";
}

void test_mapping_field_is_rejected() {
    std::cout << "[TEST] Mapping field is rejected..." << std::endl;

    auto env = surfaces::small();
    env.results[0].data.emplace_back("meta", Value::object({{"unit", "m"}}));

    codec::sink::Collector sink;
    auto report = codec::emit(env, 1000, sink);

    TEST_CHECK(report.status.code == codec::Error::UnsupportedFieldType);
    TEST_CHECK((report.status.field == codec::FieldRef{0, schema::Group::Data, "meta"}));
    TEST_CHECK(sink.chunks().empty());

    // Nested mapping inside an array
    env = surfaces::small();
    env.results[0].args.emplace_back("pts", Value::array({1, Value::object({{"k", 2}})}));
    report = codec::emit(env, 1000, sink);
    TEST_CHECK(report.status.code == codec::Error::UnsupportedFieldType);
    TEST_CHECK(sink.chunks().empty());

    std::cout << "[TEST] OK\n";
}

void test_non_finite_number_is_rejected() {
    std::cout << "[TEST] Non-finite number is rejected..." << std::endl;

    auto env = surfaces::small();
    env.results[0].args.emplace_back("w", Value::array({1.0, std::numeric_limits<double>::quiet_NaN()}));

    codec::Emitter emitter{env, 1000};
    auto st = emitter.prepare();
    TEST_CHECK(st.code == codec::Error::UnsupportedFieldType);
    TEST_CHECK(st.field.key == "w");
    TEST_CHECK(!emitter.prepared());

    schema::ChunkMessage msg;
    TEST_CHECK(!emitter.next(msg));

    std::cout << "[TEST] OK\n";
}

void test_duplicate_field_key_is_rejected() {
    std::cout << "[TEST] Duplicate field key is rejected..." << std::endl;

    auto env = surfaces::small();
    env.results[0].args.emplace_back("x", Value::array({9}));

    codec::sink::Collector sink;
    auto report = codec::emit(env, 1000, sink);
    TEST_CHECK(report.status.code == codec::Error::MalformedEnvelope);
    TEST_CHECK(report.status.field.key == "x");
    TEST_CHECK(sink.chunks().empty());

    std::cout << "[TEST] OK\n";
}

void test_sink_cancellation() {
    std::cout << "[TEST] Sink stops the stream..." << std::endl;

    codec::sink::Collector sink{2};
    auto report = codec::emit(surfaces::large(), 150, sink);

    TEST_CHECK(report.status.code == codec::Error::Cancelled);
    TEST_CHECK(report.chunk_count == 50);
    TEST_CHECK(report.chunks_emitted == 2);
    TEST_CHECK(sink.chunks().size() == 2);

    // Refusing after the last chunk is not a cancellation
    codec::sink::Collector single{1};
    report = codec::emit(surfaces::small(), 1000, single);
    TEST_CHECK(report.status.ok());
    TEST_CHECK(single.chunks().size() == 1);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_small_surface_single_chunk();
    test_large_surface_is_split();
    test_very_large_surface();
    test_field_order_is_preserved();
    test_empty_results();
    test_updates_without_split_fields_stay_in_every_chunk();
    test_round_trip_for_many_budgets();
    test_oversized_element_diagnostics();
    test_bracket_overflow_is_not_diagnosed();
    test_pull_emitter_state();
    test_failed_prepare_leaves_no_counts();
    test_json_lines_sink();

    test_invalid_budget();
    test_mapping_field_is_rejected();
    test_non_finite_number_is_rejected();
    test_duplicate_field_key_is_rejected();
    test_sink_cancellation();

    std::cout << "\n[TEST] ALL EMITTER TESTS PASSED!" << std::endl;
    return 0;
}
