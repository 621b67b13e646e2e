#include <catch2/catch.hpp>

#include "promptgate/serializer.hpp"
#include "test_support.hpp"

#include <cmath>
#include <limits>

using promptgate::Json;
using promptgate::JsonArray;
using promptgate::serialize_payload;

TEST_CASE("Serializer output is stable across calls", "[serializer]") {
    const Json payload = Json::parse(R"([{"id":3,"tags":["a","b"],"owner":{"name":"Zoë","active":true}},{"id":7,"owner":null}])");
    const std::string first = serialize_payload(payload);
    const std::string second = serialize_payload(payload);
    REQUIRE(first == second);
    REQUIRE(serialize_payload(Json::parse(first)) == first);
}

TEST_CASE("Serializer emits keys in sorted order", "[serializer]") {
    REQUIRE(serialize_payload(promptgate::testing::scenario_a()) == R"({"display_name":"Epic","id":1,"slug":"epics"})");
}

TEST_CASE("Serializer stringifies scalars canonically", "[serializer]") {
    REQUIRE(serialize_payload(Json()) == "null");
    REQUIRE(serialize_payload(Json(true)) == "true");
    REQUIRE(serialize_payload(Json(false)) == "false");
    REQUIRE(serialize_payload(Json(42)) == "42");
    REQUIRE(serialize_payload(Json(0.25)) == "0.25");
    REQUIRE(serialize_payload(Json("plain")) == "\"plain\"");
    REQUIRE(serialize_payload(Json(std::numeric_limits<double>::quiet_NaN())) == "null");
    REQUIRE(serialize_payload(Json(JsonArray{})) == "[]");
}

TEST_CASE("Serializer preserves unicode text", "[serializer]") {
    const Json payload = Json::parse("{\"summary\":\"\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E\"}");
    REQUIRE(serialize_payload(payload) == "{\"summary\":\"\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E\"}");
}
