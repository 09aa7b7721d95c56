#include <catch2/catch.hpp>
#include "adapters/builtin/builtin_modules.hpp"
#include "adapters/builtin/memory_cache.hpp"
#include "adapters/logger.hpp"
#include "adapters/module_registry.hpp"
#include "host/host.hpp"
#include "ipc/rpc_server.hpp"
#include "proxy/proxy_platform.hpp"
#include "test_helpers.hpp"

using namespace plughost;
using json = nlohmann::json;

namespace {

host::HostConfig builtin_config(const test::TempDir& dir) {
    host::HostConfig config;
    config.socket_path = dir.file("host.sock");
    config.dispatch_threads = 2;
    config.adapters = runtime::parse_adapter_configs(json{
        {"cache", "builtin:memory-cache"},
        {"db", "builtin:memory-document-db"},
        {"logger", "builtin:logger"},
        {"logBuffer", {{"module", "builtin:log-ring-buffer"}, {"config", {{"maxSize", 16}}}}}
    });
    return config;
}

} // anonymous namespace

TEST_CASE("host loads adapters and serves them", "[integration][host]") {
    test::TempDir dir;
    host::Host host(builtin_config(dir));
    REQUIRE(host.init());

    REQUIRE(host.adapters().instances.size() == 4);
    REQUIRE(host.get_adapter("queue") == nullptr);
    REQUIRE(host.get_adapter_as<adapters::builtin::MemoryCache>("cache") != nullptr);
    REQUIRE(host.get_adapter_as<adapters::builtin::MemoryCache>("db") == nullptr);
    REQUIRE(host.rpc_server()->is_started());

    REQUIRE(host.adapters().extensions.size() == 1);
    REQUIRE(host.adapters().extensions[0].connected);

    transport::TransportConfig transport_config;
    transport_config.socket_path = host.get_config().socket_path;
    auto platform = proxy::create_proxy_platform(transport_config);

    platform.cache->set("k", "from plugin");
    // The proxy and the host share one adapter instance
    REQUIRE(host.get_adapter_as<adapters::builtin::MemoryCache>("cache")->get("k") == "from plugin");

    platform.close();
}

TEST_CASE("log history is reachable through proxies", "[integration][host]") {
    test::TempDir dir;
    host::HostConfig config = builtin_config(dir);
    config.adapters["logs"] = runtime::AdapterConfigEntry{"builtin:log-persistence"};

    host::Host host(config);
    REQUIRE(host.init());
    REQUIRE(host.adapters().extensions.size() == 2);

    auto logger = host.get_adapter_as<adapters::Logger>("logger");
    REQUIRE(logger != nullptr);
    logger->info("checkout started");
    logger->error("checkout failed", {{"order", 7}});

    transport::TransportConfig transport_config;
    transport_config.socket_path = host.get_config().socket_path;
    auto platform = proxy::create_proxy_platform(transport_config);

    SECTION("ring buffer") {
        adapters::LogQuery errors;
        errors.level = adapters::LogLevel::Error;
        auto records = platform.log_buffer->query(errors);
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].message == "checkout failed");
        REQUIRE(records[0].fields["order"] == 7);

        auto stats = platform.log_buffer->stats();
        REQUIRE(stats.max_size == 16);
        REQUIRE(stats.total_appended >= 2);
    }

    SECTION("persistence") {
        adapters::LogPage page = platform.log_store->search("CHECKOUT");
        REQUIRE(page.total == 2);
        REQUIRE(page.logs[0].message == "checkout failed");
        REQUIRE_FALSE(page.has_more);

        adapters::LogQuery newest;
        newest.limit = 1;
        adapters::LogPage first = platform.log_store->query(newest);
        REQUIRE(first.logs.size() == 1);
        REQUIRE(first.has_more);

        REQUIRE(platform.log_store->stats()["byLevel"]["error"] == 1);
        REQUIRE(platform.log_store->delete_older_than(adapters::now_ms() + 1000) == first.total);
        REQUIRE(platform.log_store->search("checkout").total == 0);
    }

    platform.close();
}

TEST_CASE("host run loop stops on shutdown", "[integration][host]") {
    test::TempDir dir;
    host::Host host(builtin_config(dir));
    REQUIRE(host.init());

    std::thread runner([&host] { host.run(); });
    REQUIRE(test::wait_until([&host] { return host.is_running(); }));

    host.shutdown();
    runner.join();

    REQUIRE_FALSE(host.is_running());
    REQUIRE_FALSE(host.rpc_server()->is_started());
    REQUIRE_FALSE(std::filesystem::exists(dir.file("host.sock")));
}

TEST_CASE("host init fails on an unsatisfiable adapter set", "[integration][host]") {
    test::TempDir dir;
    host::HostConfig config;
    config.socket_path = dir.file("host.sock");
    config.adapters = runtime::parse_adapter_configs(json{
        {"persistence", "builtin:log-persistence"}
    });

    auto sink = std::make_unique<test::RecordingDiagnosticSink>();
    host::Host::Dependencies deps;
    deps.modules = std::make_unique<adapters::ModuleRegistry>();
    adapters::builtin::register_builtin_modules(*deps.modules);
    deps.diagnostics = std::move(sink);

    host::Host host(config, std::move(deps));
    REQUIRE_FALSE(host.init());
    REQUIRE(host.rpc_server() == nullptr);
    REQUIRE_FALSE(std::filesystem::exists(config.socket_path));
}
