#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

#include "simdjson.h"

#include "chunkwire/parser/envelope.hpp"
#include "common/surfaces.hpp"
#include "common/test_check.hpp"

using namespace chunkwire;
using core::Value;

/*
================================================================================
Envelope Parser — Unit Tests
================================================================================

JSON text → schema::Envelope through simdjson:
  • member order survives parsing
  • integers keep their exact kind (int / uint) and doubles stay doubles
  • every structural failure is MalformedEnvelope, never an exception
================================================================================
*/

static codec::Status parse(std::string_view json, schema::Envelope& out) {
    simdjson::dom::parser parser;
    return parser::envelope::parse(parser, json, out);
}

// ------------------------------------------------------------
// POSITIVE CASES
// ------------------------------------------------------------

void test_small_surface() {
    std::cout << "[TEST] Envelope (small surface)..." << std::endl;

    constexpr std::string_view json = R"json(
    {
        "type": "plot",
        "drafty_id": "d1",
        "command": "update",
        "results": [
            {
                "plot_type": "surface",
                "args": { "x": [1, 2, 3], "y": [4, 5, 6] },
                "data": { "z": [[1, 2, 3], [3, 4, 5]] }
            }
        ]
    }
    )json";

    schema::Envelope env;
    TEST_CHECK(parse(json, env).ok());
    TEST_CHECK(env == surfaces::small());

    std::cout << "[TEST] OK\n";
}

void test_member_order_and_numbers() {
    std::cout << "[TEST] Envelope (member order, number kinds)..." << std::endl;

    constexpr std::string_view json = R"json(
    {
        "results": [
            {
                "plot_type": null,
                "args": {
                    "zeta":  [18446744073709551615, -9223372036854775808, 0],
                    "alpha": [1.5, 2.0, -0.25, 1e3],
                    "mid":   [true, false, null, "café", "tab\t"]
                }
            }
        ]
    }
    )json";

    schema::Envelope env;
    TEST_CHECK(parse(json, env).ok());
    TEST_CHECK(env.type.is_null());
    TEST_CHECK(env.results.size() == 1);

    const auto& args = env.results[0].args;
    TEST_CHECK(args.size() == 3);
    TEST_CHECK(args[0].first == "zeta");
    TEST_CHECK(args[1].first == "alpha");
    TEST_CHECK(args[2].first == "mid");

    const auto& zeta = args[0].second.as_array();
    TEST_CHECK(zeta[0].kind() == core::Kind::UInt);
    TEST_CHECK(zeta[0].as_uint() == std::numeric_limits<std::uint64_t>::max());
    TEST_CHECK(zeta[1].kind() == core::Kind::Int);
    TEST_CHECK(zeta[1].as_int() == std::numeric_limits<std::int64_t>::min());
    TEST_CHECK(zeta[2] == Value{0});

    const auto& alpha = args[1].second.as_array();
    TEST_CHECK(alpha[1].kind() == core::Kind::Double);
    TEST_CHECK(alpha[1].as_double() == 2.0);
    TEST_CHECK(alpha[3].as_double() == 1000.0);

    const auto& mid = args[2].second.as_array();
    TEST_CHECK(mid[0] == Value{true});
    TEST_CHECK(mid[2].is_null());
    TEST_CHECK(mid[3] == Value{"caf\xc3\xa9"});
    TEST_CHECK(mid[4] == Value{"tab\t"});

    std::cout << "[TEST] OK\n";
}

void test_minimal_documents() {
    std::cout << "[TEST] Envelope (minimal documents)..." << std::endl;

    schema::Envelope env;
    TEST_CHECK(parse("{}", env).ok());
    TEST_CHECK(env.results.empty());

    TEST_CHECK(parse(R"({"type": "plot", "results": []})", env).ok());
    TEST_CHECK(env.type == Value{"plot"});
    TEST_CHECK(env.results.empty());

    std::cout << "[TEST] OK\n";
}

void test_canonical_text_round_trip() {
    std::cout << "[TEST] Envelope (canonical text re-parses identically)..." << std::endl;

    schema::Update u;
    u.plot_type = "mixed";
    u.args.emplace_back("w", Value::array({0.1, 1e-9, 123456.789, -0.0, 3.0}));
    u.args.emplace_back("s", Value::array({"q\"uote", "back\\slash", std::string("\x01\x1f", 2)}));
    u.data.emplace_back("n", Value::array({Value::array(), Value::array({Value{}})}));
    const auto env = surfaces::with_metadata({u});

    schema::Envelope parsed;
    TEST_CHECK(parse(env.to_json(), parsed).ok());
    TEST_CHECK(parsed == env);

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// FAILURE CASES
// ------------------------------------------------------------

static void expect_malformed(std::string_view json) {
    schema::Envelope env;
    auto st = parse(json, env);
    TEST_CHECK(st.code == codec::Error::MalformedEnvelope);
}

void test_malformed_envelopes() {
    std::cout << "[TEST] Envelope (malformed)..." << std::endl;

    expect_malformed("");
    expect_malformed("{\"type\": ");
    expect_malformed("[1, 2, 3]");
    expect_malformed(R"({"results": {"plot_type": "surface"}})");
    expect_malformed(R"({"results": [42]})");
    expect_malformed(R"({"results": [{"args": [1, 2]}]})");
    expect_malformed(R"({"results": [{"data": {"z": [1], "z": [2]}}]})");
    expect_malformed(R"({"command": {"name": "update"}})");

    std::cout << "[TEST] OK\n";
}

void test_nesting_limit() {
    std::cout << "[TEST] Envelope (nesting limit)..." << std::endl;

    std::string deep = R"({"results": [{"data": {"z": )";
    deep += std::string(400, '[');
    deep += std::string(400, ']');
    deep += "}}]}";

    expect_malformed(deep);

    schema::Envelope env;
    auto st = parse(deep, env);
    TEST_CHECK(st.message == "document could not be converted");

    std::cout << "[TEST] OK\n";
}

int main() {
    test_small_surface();
    test_member_order_and_numbers();
    test_minimal_documents();
    test_canonical_text_round_trip();

    test_malformed_envelopes();
    test_nesting_limit();

    std::cout << "\n[TEST] ALL ENVELOPE PARSER TESTS PASSED!" << std::endl;
    return 0;
}
