#include <catch2/catch.hpp>
#include "adapters/builtin/builtin_modules.hpp"
#include "adapters/module_registry.hpp"
#include "core/errors.hpp"
#include "runtime/adapter_loader.hpp"

using namespace plughost;
using namespace plughost::adapters;
using json = nlohmann::json;

TEST_CASE("registered modules resolve by reference", "[adapters][modules]") {
    ModuleRegistry registry;
    builtin::register_builtin_modules(registry);

    REQUIRE(registry.contains(builtin::MEMORY_CACHE_MODULE));
    REQUIRE(registry.module_refs().size() == 5);

    AdapterModule module = registry.resolve(builtin::LOG_PERSISTENCE_MODULE);
    REQUIRE(module.manifest.id == "log-persistence");
    REQUIRE(module.manifest.type == AdapterType::Extension);
    REQUIRE(module.manifest.required_adapters.at(0).effective_alias() == "database");

    SECTION("duplicate registration is refused") {
        REQUIRE_FALSE(registry.register_module(builtin::MEMORY_CACHE_MODULE, builtin::logger_module()));
        REQUIRE(registry.resolve(builtin::MEMORY_CACHE_MODULE).manifest.id == "memory-cache");
    }
}

TEST_CASE("unresolvable references are configuration errors", "[adapters][modules]") {
    ModuleRegistry registry;
    REQUIRE_THROWS_AS(registry.resolve("builtin:nothing"), ConfigurationError);
    REQUIRE_THROWS_WITH(registry.resolve("/nonexistent/libmissing.so"),
                        Catch::Contains("Failed to load adapter module"));
}

TEST_CASE("shared library references", "[adapters][modules]") {
    REQUIRE(is_shared_library_ref("/opt/plugins/libredis.so"));
    REQUIRE(is_shared_library_ref("libredis.so.2"));
    REQUIRE_FALSE(is_shared_library_ref("builtin:memory-cache"));
    REQUIRE_FALSE(is_shared_library_ref(".so"));
}

TEST_CASE("modules load from shared libraries", "[adapters][modules][dlopen]") {
    ModuleRegistry registry;

    AdapterModule module = registry.resolve(PLUGHOST_TEST_MODULE_PATH);
    REQUIRE(module.manifest.id == "greeter");
    REQUIRE(module.manifest.version == "0.3.1");
    REQUIRE(module.manifest.capabilities.custom["languages"][0] == "en");
    REQUIRE(registry.contains(PLUGHOST_TEST_MODULE_PATH));

    auto instance = module.create(json{{"greeting", "hi"}}, DependencyBundle());
    REQUIRE(instance != nullptr);
    REQUIRE(instance->extension_method("remember") != nullptr);
    REQUIRE(instance->extension_method("forget") == nullptr);

    SECTION("through the adapter loader") {
        runtime::AdapterConfigSet configs;
        configs["greeter"] = runtime::AdapterConfigEntry{PLUGHOST_TEST_MODULE_PATH, json::object()};
        auto loaded = runtime::AdapterLoader(registry.resolver()).load_adapters(configs);
        REQUIRE(loaded.load_order == std::vector<std::string>{"greeter"});
    }
}
