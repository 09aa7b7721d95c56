#include <catch2/catch.hpp>
#include "adapters/manifest.hpp"
#include "core/errors.hpp"

using namespace plughost;
using namespace plughost::adapters;
using json = nlohmann::json;

namespace {

json minimal_manifest() {
    return {
        {"id", "redis-cache"},
        {"name", "Redis cache"},
        {"version", "2.1.0"},
        {"implements", "ICache"}
    };
}

std::string parse_error(const json& j) {
    try {
        parse_manifest(j);
    } catch (const ConfigurationError& e) {
        return e.what();
    }
    return {};
}

} // anonymous namespace

TEST_CASE("parse_manifest fills defaults", "[adapters][manifest]") {
    AdapterManifest m = parse_manifest(minimal_manifest());
    REQUIRE(m.id == "redis-cache");
    REQUIRE(m.manifest_version == "1.0.0");
    REQUIRE(m.type == AdapterType::Core);
    REQUIRE(m.required_adapters.empty());
    REQUIRE_FALSE(m.extends.has_value());
}

TEST_CASE("parse_manifest reads dependencies and extensions", "[adapters][manifest]") {
    json j = minimal_manifest();
    j["type"] = "extension";
    j["requires"] = {
        {"adapters", json::array({"logger", json{{"id", "db"}, {"alias", "database"}}})},
        {"platform", ">=1.0.0"}
    };
    j["optional"] = {{"adapters", json::array({"metrics"})}};
    j["extends"] = {{"adapter", "logger"}, {"hook", "onLog"}, {"method", "write"}, {"priority", 7}};
    j["capabilities"] = {{"search", true}, {"custom", {{"ttl", true}}}};

    AdapterManifest m = parse_manifest(j);
    REQUIRE(m.type == AdapterType::Extension);
    REQUIRE(m.required_adapters.size() == 2);
    REQUIRE(m.required_adapters[0].effective_alias() == "logger");
    REQUIRE(m.required_adapters[1].id == "db");
    REQUIRE(m.required_adapters[1].effective_alias() == "database");
    REQUIRE(m.platform_requirement == ">=1.0.0");
    REQUIRE(m.optional_adapters == std::vector<std::string>{"metrics"});
    REQUIRE(m.extends->priority == 7);
    REQUIRE(m.capabilities.search);
    REQUIRE_FALSE(m.capabilities.streaming);
    REQUIRE(m.capabilities.custom["ttl"] == true);

    SECTION("serialized form parses back to the same manifest") {
        AdapterManifest again = parse_manifest(manifest_to_json(m));
        REQUIRE(again.required_adapters[1].alias == "database");
        REQUIRE(again.extends->method == "write");
        REQUIRE(manifest_to_json(again) == manifest_to_json(m));
    }
}

TEST_CASE("parse_manifest names the offending field", "[adapters][manifest]") {
    SECTION("missing implements") {
        json j = minimal_manifest();
        j.erase("implements");
        REQUIRE_THAT(parse_error(j), Catch::Contains("'implements'"));
    }

    SECTION("bad version") {
        json j = minimal_manifest();
        j["version"] = "2.1";
        REQUIRE_THAT(parse_error(j), Catch::Contains("'version'"));
    }

    SECTION("unknown type") {
        json j = minimal_manifest();
        j["type"] = "plugin";
        REQUIRE_THAT(parse_error(j), Catch::Contains("'type'"));
    }

    SECTION("extension without a method") {
        json j = minimal_manifest();
        j["extends"] = {{"adapter", "logger"}, {"hook", "onLog"}};
        REQUIRE_THAT(parse_error(j), Catch::Contains("'method'"));
    }

    SECTION("not an object") {
        REQUIRE_THROWS_AS(parse_manifest(json::array()), ConfigurationError);
    }
}

TEST_CASE("semantic versions", "[adapters][manifest]") {
    REQUIRE(is_semver("1.0.0"));
    REQUIRE(is_semver("10.20.30-beta.1"));
    REQUIRE_FALSE(is_semver("1.0"));
    REQUIRE_FALSE(is_semver("1.0.0-"));
    REQUIRE_FALSE(is_semver("v1.0.0"));
    REQUIRE_FALSE(is_semver("1.0.0+build"));
}
