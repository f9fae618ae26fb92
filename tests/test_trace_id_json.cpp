#include <catch2/catch_test_macros.hpp>
#include "tracing/trace_id_json.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <vector>

using namespace tracectx;
using json = nlohmann::json;

TEST_CASE("TraceIdJson: serializes as hex string", "[trace_id][json]") {
    const auto id = TraceId::from_hex("4bf92f3577b34da6a3ce929d0e0e4736").value();

    const json j = {{"trace_id", id}};
    REQUIRE(j["trace_id"].is_string());
    REQUIRE(j.dump() == R"({"trace_id":"4bf92f3577b34da6a3ce929d0e0e4736"})");
}

TEST_CASE("TraceIdJson: parses uppercase hex", "[trace_id][json]") {
    const auto j = json::parse(R"({"trace_id":"4BF92F3577B34DA6A3CE929D0E0E4736"})");
    const auto id = j.at("trace_id").get<TraceId>();
    REQUIRE(id.to_hex() == "4bf92f3577b34da6a3ce929d0e0e4736");
}

TEST_CASE("TraceIdJson: array of IDs round-trips", "[trace_id][json]") {
    const std::vector<TraceId> ids = {TraceId::random(), TraceId::random(), TraceId{}};

    const json j = ids;
    const auto parsed = j.get<std::vector<TraceId>>();
    REQUIRE(parsed == ids);
}

TEST_CASE("TraceIdJson: reject malformed hex", "[trace_id][json]") {
    const json j = "4bf92f3577b34da6a3ce929d0e0e473";
    REQUIRE_THROWS_AS(j.get<TraceId>(), std::invalid_argument);
}

TEST_CASE("TraceIdJson: reject non-string value", "[trace_id][json]") {
    const json j = 42;
    REQUIRE_THROWS_AS(j.get<TraceId>(), json::type_error);
}
