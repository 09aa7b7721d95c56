#include <catch2/catch.hpp>
#include <string>
#include "ipc/line_framer.hpp"

using plughost::ipc::LineFramer;

namespace {

std::vector<std::string> feed(LineFramer& framer, const std::string& data) {
    return framer.feed(data.data(), data.size());
}

} // anonymous namespace

TEST_CASE("line framer splits coalesced messages", "[ipc][framer]") {
    LineFramer framer;
    auto messages = feed(framer, "{\"a\":1}\n{\"b\":2}\n");
    REQUIRE(messages == std::vector<std::string>{"{\"a\":1}", "{\"b\":2}"});
    REQUIRE(framer.buffered() == 0);
}

TEST_CASE("line framer reassembles split messages", "[ipc][framer]") {
    LineFramer framer;
    REQUIRE(feed(framer, "{\"req").empty());
    REQUIRE(framer.buffered() == 5);
    REQUIRE(feed(framer, "uestId\":\"1\"}\n{\"x\"").size() == 1);
    REQUIRE(feed(framer, ":true}\n") == std::vector<std::string>{"{\"x\":true}"});
}

TEST_CASE("line framer skips blank lines", "[ipc][framer]") {
    LineFramer framer;
    REQUIRE(feed(framer, "\n\r\n  \none\n") == std::vector<std::string>{"one"});
}

TEST_CASE("line framer reports oversized messages", "[ipc][framer]") {
    LineFramer framer(8);
    feed(framer, "0123456789");
    REQUIRE(framer.overflowed());
    framer.clear();
    REQUIRE_FALSE(framer.overflowed());

    SECTION("complete messages never overflow") {
        LineFramer small(4);
        auto messages = feed(small, "0123456789\n");
        REQUIRE(messages.size() == 1);
        REQUIRE_FALSE(small.overflowed());
    }
}
