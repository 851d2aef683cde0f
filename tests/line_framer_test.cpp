// ─────────────────────────────────────────────────────────────────────────────
// LineFramer Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcphub/transport/line_framer.hpp"

#include <string>

using namespace mcphub;

TEST_CASE("LineFramer splits complete lines", "[framing]") {
    LineFramer framer;

    auto lines = framer.feed("{\"a\":1}\n{\"b\":2}\n");

    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0] == "{\"a\":1}");
    REQUIRE(lines[1] == "{\"b\":2}");
    REQUIRE(framer.buffered() == 0);
}

TEST_CASE("LineFramer keeps a partial line until its newline arrives", "[framing]") {
    LineFramer framer;

    auto first = framer.feed("{\"jsonrpc\":\"2.0\",");
    REQUIRE(first.empty());
    REQUIRE(framer.buffered() > 0);

    auto second = framer.feed("\"id\":1}\n{\"x\"");
    REQUIRE(second.size() == 1);
    REQUIRE(second[0] == "{\"jsonrpc\":\"2.0\",\"id\":1}");

    auto third = framer.feed(":2}\n");
    REQUIRE(third.size() == 1);
    REQUIRE(third[0] == "{\"x\":2}");
}

TEST_CASE("LineFramer strips carriage returns and skips blank lines", "[framing]") {
    LineFramer framer;

    auto lines = framer.feed("\n  \r\n{\"a\":1}\r\n\n");

    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "{\"a\":1}");
}

TEST_CASE("LineFramer drops oversized lines and recovers", "[framing]") {
    LineFramer framer(16);

    auto lines = framer.feed(std::string(10, 'x'));
    REQUIRE(lines.empty());

    lines = framer.feed(std::string(10, 'y') + "\n{\"ok\":true}\n");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "{\"ok\":true}");
    REQUIRE(framer.dropped() == 1);
}

TEST_CASE("LineFramer reset discards buffered bytes", "[framing]") {
    LineFramer framer;
    (void)framer.feed("{\"half\":");

    framer.reset();

    REQUIRE(framer.buffered() == 0);
    auto lines = framer.feed("{\"whole\":1}\n");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "{\"whole\":1}");
}

// ─────────────────────────────────────────────────────────────────────────────
// decode_line
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("decode_line accepts objects and batches", "[framing]") {
    auto object = decode_line("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}");
    REQUIRE(object.has_value());
    REQUIRE(object->is_object());

    auto batch = decode_line("[{\"jsonrpc\":\"2.0\",\"method\":\"x\"}]");
    REQUIRE(batch.has_value());
    REQUIRE(batch->is_array());
}

TEST_CASE("decode_line rejects garbage and scalars as protocol errors", "[framing]") {
    auto garbage = decode_line("{this is not json");
    REQUIRE_FALSE(garbage.has_value());
    REQUIRE(garbage.error().category == TransportError::Category::Protocol);

    auto scalar = decode_line("42");
    REQUIRE_FALSE(scalar.has_value());
    REQUIRE(scalar.error().category == TransportError::Category::Protocol);
}
