// Unit tests for the newline-delimited JSON wire format
#include <catch2/catch_test_macros.hpp>
#include "mesh/wire_codec.hpp"
#include <nlohmann/json.hpp>

using namespace agentmesh::mesh;

TEST_CASE("EncodeMessage produces one JSON line", "[mesh][wire]") {
    MeshMessage msg{"Anna", "hello", 1700000000.5};
    std::string encoded = EncodeMessage(msg);

    REQUIRE_FALSE(encoded.empty());
    CHECK(encoded.back() == '\n');
    CHECK(encoded.find('\n') == encoded.size() - 1);

    auto parsed = nlohmann::json::parse(encoded);
    REQUIRE(parsed.is_object());
    CHECK(parsed["agent"] == "Anna");
    CHECK(parsed["message"] == "hello");
    CHECK(parsed["timestamp"].get<double>() == 1700000000.5);
}

TEST_CASE("EncodeMessage escapes embedded newlines", "[mesh][wire]") {
    MeshMessage msg{"Miku", "line one\nline two", 1.0};
    std::string encoded = EncodeMessage(msg);

    CHECK(encoded.find('\n') == encoded.size() - 1);

    auto decoded = DecodeMessage(encoded);
    REQUIRE(decoded.has_value());
    CHECK(decoded->message == "line one\nline two");
}

TEST_CASE("EncodeMessage replaces invalid UTF-8 instead of throwing", "[mesh][wire]") {
    MeshMessage msg{"Anna", "bad \xFF byte", 0.0};
    std::string encoded;
    REQUIRE_NOTHROW(encoded = EncodeMessage(msg));

    auto decoded = DecodeMessage(encoded);
    REQUIRE(decoded.has_value());
    CHECK(decoded->message == "bad \xEF\xBF\xBD byte");
}

TEST_CASE("DecodeMessage accepts line terminators", "[mesh][wire]") {
    const std::string body = R"({"agent":"Anna","message":"hi","timestamp":5})";

    for (const std::string& line : {body, body + "\n", body + "\r\n"}) {
        auto msg = DecodeMessage(line);
        REQUIRE(msg.has_value());
        CHECK(msg->agent == "Anna");
        CHECK(msg->message == "hi");
        CHECK(msg->timestamp == 5.0);
    }
}

TEST_CASE("DecodeMessage fills defaults for missing fields", "[mesh][wire]") {
    SECTION("Empty object") {
        auto msg = DecodeMessage("{}");
        REQUIRE(msg.has_value());
        CHECK(msg->agent == UNKNOWN_AGENT);
        CHECK(msg->message.empty());
        CHECK(msg->timestamp == 0.0);
    }

    SECTION("Non-numeric timestamp") {
        auto msg = DecodeMessage(R"({"agent":"A","message":"m","timestamp":"soon"})");
        REQUIRE(msg.has_value());
        CHECK(msg->timestamp == 0.0);
    }

    SECTION("Unknown keys are ignored") {
        auto msg = DecodeMessage(R"({"agent":"A","message":"m","extra":[1,2]})");
        REQUIRE(msg.has_value());
        CHECK(msg->agent == "A");
    }
}

TEST_CASE("DecodeMessage rejects malformed records", "[mesh][wire]") {
    CHECK_FALSE(DecodeMessage("not json").has_value());
    CHECK_FALSE(DecodeMessage(R"({"agent":"A")").has_value());
    CHECK_FALSE(DecodeMessage("[1,2,3]").has_value());
    CHECK_FALSE(DecodeMessage("\"just a string\"").has_value());
    CHECK_FALSE(DecodeMessage("").has_value());
}

TEST_CASE("DecodeMessage rejects wrongly typed fields", "[mesh][wire]") {
    CHECK_FALSE(DecodeMessage(R"({"agent":42,"message":"m"})").has_value());
    CHECK_FALSE(DecodeMessage(R"({"agent":"A","message":{"nested":true}})").has_value());
    CHECK_FALSE(DecodeMessage(R"({"agent":null})").has_value());
}
