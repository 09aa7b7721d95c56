#include <catch2/catch.hpp>
#include "transport/timeout_config.hpp"

using namespace plughost::transport;
using std::chrono::milliseconds;

TEST_CASE("default timeout budgets", "[transport][timeout]") {
    TimeoutTable table = TimeoutTable::defaults();

    REQUIRE(table.lookup("cache", "get") == milliseconds(5000));
    REQUIRE(table.lookup("cache", "clear") == milliseconds(10000));
    REQUIRE(table.lookup("cache", "keys") == milliseconds(10000));
    REQUIRE(table.lookup("db", "find") == milliseconds(15000));
    REQUIRE(table.lookup("db", "insertOne") == milliseconds(30000));
    REQUIRE(table.lookup("db", "aggregate") == milliseconds(30000));
    REQUIRE(table.lookup("logs", "query") == milliseconds(15000));
    REQUIRE(table.lookup("search", "index") == FALLBACK_TIMEOUT);
}

TEST_CASE("timeout lookup precedence", "[transport][timeout]") {
    TimeoutTable table;
    REQUIRE(table.lookup("x", "y") == FALLBACK_TIMEOUT);

    table.set("*", milliseconds(1000));
    table.set("queue.*", milliseconds(2000));
    table.set("queue.push", milliseconds(3000));

    REQUIRE(table.lookup("queue", "push") == milliseconds(3000));
    REQUIRE(table.lookup("queue", "pop") == milliseconds(2000));
    REQUIRE(table.lookup("other", "pop") == milliseconds(1000));
}

TEST_CASE("select_timeout prefers explicit values", "[transport][timeout]") {
    TimeoutTable table = TimeoutTable::defaults();

    REQUIRE(select_timeout(table, "cache", "get", milliseconds(42), milliseconds(7)) == milliseconds(42));
    REQUIRE(select_timeout(table, "cache", "get", std::nullopt, milliseconds(7)) == milliseconds(7));
    REQUIRE(select_timeout(table, "cache", "get", std::nullopt, std::nullopt) == milliseconds(5000));
}
