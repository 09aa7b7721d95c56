#include <catch2/catch.hpp>
#include "core/errors.hpp"
#include "runtime/dependency_graph.hpp"

using namespace plughost;
using namespace plughost::runtime;

namespace {

DependencyGraph make_graph(const std::vector<std::string>& tokens,
                           const std::vector<std::pair<std::string, std::string>>& edges) {
    DependencyGraph graph;
    for (const auto& token : tokens) {
        DependencyGraphNode node;
        node.token = token;
        graph.add_node(node);
    }
    for (const auto& [from, to] : edges) {
        graph.add_edge(from, to);
    }
    return graph;
}

std::vector<std::string> order_of(const DependencyGraph& graph) {
    std::vector<std::string> order;
    for (const auto* node : graph.topological_sort()) {
        order.push_back(node->token);
    }
    return order;
}

} // anonymous namespace

TEST_CASE("topological sort puts dependencies first", "[runtime][graph]") {
    // persistence depends on db and logger; logger depends on db
    auto graph = make_graph({"persistence", "logger", "db"},
                            {{"db", "persistence"}, {"logger", "persistence"}, {"db", "logger"}});
    REQUIRE(order_of(graph) == std::vector<std::string>{"db", "logger", "persistence"});
}

TEST_CASE("independent adapters load in token order", "[runtime][graph]") {
    auto graph = make_graph({"zeta", "alpha", "mid"}, {});
    REQUIRE(order_of(graph) == std::vector<std::string>{"alpha", "mid", "zeta"});
}

TEST_CASE("graph bookkeeping", "[runtime][graph]") {
    auto graph = make_graph({"a", "b"}, {{"a", "b"}, {"a", "b"}, {"a", "missing"}});

    SECTION("duplicate edges count once") {
        REQUIRE(graph.get_node("b")->in_degree == 1);
        REQUIRE(graph.dependents("a") == std::vector<std::string>{"b"});
    }

    SECTION("duplicate nodes are rejected") {
        DependencyGraphNode node;
        node.token = "a";
        REQUIRE_FALSE(graph.add_node(node));
        REQUIRE(graph.size() == 2);
    }

    SECTION("lookups") {
        REQUIRE(graph.has_node("a"));
        REQUIRE(graph.get_node("missing") == nullptr);
        REQUIRE(graph.tokens() == std::vector<std::string>{"a", "b"});
    }
}

TEST_CASE("cycles are reported with the tokens on them", "[runtime][graph]") {
    // a <-> b form a cycle; c only waits on it
    auto graph = make_graph({"a", "b", "c", "d"}, {{"a", "b"}, {"b", "a"}, {"a", "c"}});

    try {
        graph.topological_sort();
        FAIL("expected ConfigurationError");
    } catch (const ConfigurationError& e) {
        std::string message = e.what();
        REQUIRE_THAT(message, Catch::StartsWith("Circular dependency detected in adapters: a, b"));
        REQUIRE_THAT(message, Catch::Contains("also blocked: c"));
        REQUIRE(e.tokens() == std::vector<std::string>{"a", "b"});
    }
}

TEST_CASE("self dependency is a cycle", "[runtime][graph]") {
    auto graph = make_graph({"solo"}, {{"solo", "solo"}});
    REQUIRE_THROWS_WITH(graph.topological_sort(),
                        Catch::Contains("Circular dependency detected in adapters: solo"));
}
