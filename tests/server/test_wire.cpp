#include "server/wire.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <string>

using namespace snapgate;
using namespace snapgate::wire;

TEST_CASE("parse_handshake accepts room and uid", "[wire]") {
    SECTION("Plain object") {
        auto handshake = parse_handshake(R"({"room":"r1","uid":"u1"})");
        REQUIRE(handshake.has_value());
        REQUIRE(handshake->room == "r1");
        REQUIRE(handshake->uid == "u1");
    }

    SECTION("Surrounding whitespace and padded values are trimmed") {
        auto handshake = parse_handshake("  {\"room\": \"  lab \", \"uid\": \"42\\n\"}\r\n");
        REQUIRE(handshake.has_value());
        REQUIRE(handshake->room == "lab");
        REQUIRE(handshake->uid == "42");
    }

    SECTION("Extra fields are ignored") {
        auto handshake = parse_handshake(R"({"room":"r1","uid":"u1","device":"cam-3"})");
        REQUIRE(handshake.has_value());
    }
}

TEST_CASE("parse_handshake rejects malformed input", "[wire]") {
    auto expect_invalid = [](std::string_view raw, std::string_view fragment) {
        auto handshake = parse_handshake(raw);
        REQUIRE(!handshake.has_value());
        REQUIRE(handshake.error().code == ErrorCode::protocol_validation);
        REQUIRE(handshake.error().message.find(fragment) != std::string::npos);
    };

    SECTION("Empty input") {
        expect_invalid("", "No initial data received");
        expect_invalid(" \r\n", "No initial data received");
    }

    SECTION("Not JSON") {
        expect_invalid("hello", "Invalid JSON format");
        expect_invalid(R"({"room":"r1")", "Invalid JSON format");
    }

    SECTION("Numbers that overflow a double") {
        expect_invalid(R"({"room":1e999,"uid":"u1"})", "Invalid JSON format");
        expect_invalid(R"({"room":"r1","uid":"u1","n":-1e400})", "Invalid JSON format");
    }

    SECTION("Not an object") {
        expect_invalid(R"(["r1","u1"])", "must be a JSON object");
        expect_invalid("42", "must be a JSON object");
    }

    SECTION("Missing or blank fields") {
        expect_invalid(R"({"room":"r1"})", "Missing required fields");
        expect_invalid(R"({"uid":"u1"})", "Missing required fields");
        expect_invalid(R"({"room":"   ","uid":"u1"})", "Missing required fields");
        expect_invalid(R"({"room":null,"uid":"u1"})", "Missing required fields");
    }

    SECTION("Non-string fields") {
        expect_invalid(R"({"room":7,"uid":"u1"})", "Field 'room' must be a string");
        expect_invalid(R"({"room":"r1","uid":{"id":1}})", "Field 'uid' must be a string");
    }
}

TEST_CASE("Responses keep status first", "[wire]") {
    SECTION("ERROR") {
        const auto text = encode_error("No image data received");
        REQUIRE(text == R"({"status":"ERROR","reason":"No image data received"})");
    }

    SECTION("DENIED uses the fixed reason") {
        const auto text = encode_denied();
        REQUIRE(text == R"({"status":"DENIED","reason":"Access denied - invalid credentials"})");
    }

    SECTION("OK carries the prompt and user") {
        const auto text = encode_ready("Alice");
        REQUIRE(text == R"({"status":"OK","message":"Send image data","user":"Alice"})");
    }

    SECTION("GRANTED carries timestamp, size and user") {
        const auto text = encode_granted("2024-05-01T08:30:12.004211", 1024, "Alice");
        auto parsed = nlohmann::json::parse(text);
        REQUIRE(text.rfind(R"({"status":"GRANTED")", 0) == 0);
        REQUIRE(parsed["timestamp"] == "2024-05-01T08:30:12.004211");
        REQUIRE(parsed["size"] == 1024);
        REQUIRE(parsed["user"] == "Alice");
    }
}

TEST_CASE("Responses escape and sanitize user text", "[wire]") {
    SECTION("Quotes are escaped") {
        auto parsed = nlohmann::json::parse(encode_ready("Al \"the cam\""));
        REQUIRE(parsed["user"] == "Al \"the cam\"");
    }

    SECTION("Invalid UTF-8 does not throw") {
        const std::string bad{"Al\xff\xfe"};
        REQUIRE_NOTHROW(encode_ready(bad));
        REQUIRE_NOTHROW(nlohmann::json::parse(encode_ready(bad)));
    }
}

TEST_CASE("trim strips ASCII whitespace only at the ends", "[wire]") {
    REQUIRE(trim("  a b \t") == "a b");
    REQUIRE(trim("") == "");
    REQUIRE(trim("\n\n").empty());
}
