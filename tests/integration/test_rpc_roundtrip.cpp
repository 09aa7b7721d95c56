#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include <set>
#include "adapters/builtin/memory_cache.hpp"
#include "adapters/builtin/memory_document_db.hpp"
#include "core/errors.hpp"
#include "core/serializer.hpp"
#include "ipc/rpc_server.hpp"
#include "proxy/proxy_platform.hpp"
#include "proxy/remote_adapter.hpp"
#include "transport/unix_socket_transport.hpp"
#include "test_helpers.hpp"

using namespace plughost;
using json = nlohmann::json;

namespace {

// Untyped proxy onto the test adapter
class TestAdapterProxy : public proxy::RemoteAdapter {
public:
    using RemoteAdapter::RemoteAdapter;

    json call(const std::string& method, const std::vector<json>& args) const {
        return call_remote(method, args);
    }
};

struct ServerFixture {
    explicit ServerFixture(size_t dispatch_threads) {
        adapters = {
            {"cache", std::make_shared<adapters::builtin::MemoryCache>()},
            {"db", std::make_shared<adapters::builtin::MemoryDocumentDatabase>()},
            {"test", std::make_shared<test::TestAdapter>()}
        };
        ipc::RpcServerConfig config;
        config.socket_path = dir.file("host.sock");
        config.dispatch_threads = dispatch_threads;
        config.bulk.temp_dir = bulk_dir.path();
        server = std::make_unique<ipc::AdapterRpcServer>(adapters, config, &sink);
        REQUIRE(server->start());
    }

    transport::TransportConfig transport_config() const {
        transport::TransportConfig config;
        config.socket_path = server->socket_path();
        config.bulk.temp_dir = bulk_dir.path();
        return config;
    }

    test::TempDir dir;
    test::TempDir bulk_dir;
    test::RecordingDiagnosticSink sink;
    runtime::AdapterInstances adapters;
    std::unique_ptr<ipc::AdapterRpcServer> server;
};

} // anonymous namespace

TEST_CASE("proxies reach the host adapters", "[integration][rpc]") {
    size_t threads = GENERATE(as<size_t>(), 0, 4);
    ServerFixture fixture(threads);

    auto platform = proxy::create_proxy_platform(fixture.transport_config());

    SECTION("cache") {
        platform.cache->set("greeting", json{{"text", "hello"}});
        REQUIRE(platform.cache->get("greeting") == json{{"text", "hello"}});

        platform.cache->remove("greeting");
        REQUIRE(platform.cache->get("greeting").is_null());
    }

    SECTION("document database") {
        json doc = platform.document_database->insert_one("notes", json{{"title", "first"}, {"rank", 2}});
        REQUIRE(doc.contains("id"));
        platform.document_database->insert_one("notes", json{{"title", "second"}, {"rank", 1}});

        adapters::FindOptions options;
        options.sort = json{{"rank", 1}};
        auto found = platform.document_database->find("notes", json::object(), options);
        REQUIRE(found.size() == 2);
        REQUIRE(found[0]["title"] == "second");

        REQUIRE(platform.document_database->count("notes", json{{"title", "first"}}) == 1);
        REQUIRE(platform.document_database->find_by_id("notes", doc["id"].get<std::string>())["title"] == "first");
    }

    SECTION("remote errors keep their name and code") {
        TestAdapterProxy test_proxy("test", platform.transport);
        try {
            test_proxy.call("fail", {"over quota"});
            FAIL("expected ApplicationError");
        } catch (const ApplicationError& e) {
            REQUIRE(e.name() == "QuotaExceededError");
            REQUIRE(e.code() == "E_QUOTA");
            REQUIRE(std::string(e.what()) == "over quota");
        }
    }

    SECTION("binary values survive the trip") {
        TestAdapterProxy test_proxy("test", platform.transport);
        json bytes = core::make_bytes({0x00, 0xff, 0x10});
        REQUIRE(core::as_bytes(test_proxy.call("echo", {bytes})) == std::vector<uint8_t>{0x00, 0xff, 0x10});
    }

    platform.close();
}

TEST_CASE("large values use bulk transfer both ways", "[integration][rpc]") {
    ServerFixture fixture(4);
    auto platform = proxy::create_proxy_platform(fixture.transport_config());
    TestAdapterProxy test_proxy("test", platform.transport);

    json result = test_proxy.call("blob", {2000000});
    REQUIRE(result.get<std::string>().size() == 2000000);

    std::string big(1500000, 'q');
    REQUIRE(test_proxy.call("echo", {big}) == big);

    REQUIRE(fixture.bulk_dir.entry_count() == 0);
    platform.close();
}

TEST_CASE("raw protocol framing", "[integration][rpc]") {
    size_t threads = GENERATE(as<size_t>(), 0, 4);
    ServerFixture fixture(threads);
    test::RawClient client(fixture.server->socket_path());

    SECTION("a message split across writes") {
        std::string line = test::make_call("r1", "test", "add", {1, 2}).dump() + "\n";
        client.write_raw(line.substr(0, 10));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        client.write_raw(line.substr(10));

        json response = client.read_json();
        REQUIRE(response["type"] == "adapter:response");
        REQUIRE(response["requestId"] == "r1");
        REQUIRE(response["result"] == 3);
    }

    SECTION("several messages in one write") {
        client.write_raw(test::make_call("a", "test", "add", {1, 1}).dump() + "\n" +
                         test::make_call("b", "test", "add", {2, 2}).dump() + "\n");

        std::set<std::string> ids;
        for (int i = 0; i < 2; i++) {
            json response = client.read_json();
            REQUIRE(response.is_object());
            ids.insert(response["requestId"].get<std::string>());
        }
        REQUIRE(ids == std::set<std::string>{"a", "b"});
    }

    SECTION("unknown adapter and method") {
        client.write_raw(test::make_call("r2", "queue", "push").dump() + "\n");
        json response = client.read_json();
        REQUIRE(response["error"]["name"] == "AdapterNotFoundError");
        REQUIRE_THAT(response["error"]["message"].get<std::string>(), Catch::Contains("cache, db, test"));

        client.write_raw(test::make_call("r3", "cache", "keys").dump() + "\n");
        REQUIRE(client.read_json()["error"]["name"] == "MethodNotFoundError");
    }

    SECTION("legacy call without a version") {
        json call = test::make_call("r4", "test", "echo", {"old"});
        call.erase("version");
        client.write_raw(call.dump() + "\n");

        REQUIRE(client.read_json()["result"] == "old");
        REQUIRE(fixture.sink.count(core::WarningKind::ProtocolVersionMismatch) == 1);
    }

    SECTION("malformed input is dropped and the connection survives") {
        client.write_raw("{not json\n");
        REQUIRE(client.read_line(std::chrono::milliseconds(200)).empty());
        REQUIRE(test::wait_until([&] {
            return fixture.sink.count(core::WarningKind::MalformedMessage) == 1;
        }));

        client.write_raw(test::make_call("r5", "test", "add", {4, 5}).dump() + "\n");
        REQUIRE(client.read_json()["result"] == 9);
    }

    SECTION("deeply nested input is dropped and the connection survives") {
        size_t depth = 2000000;
        std::string args = std::string(depth, '[') + std::string(depth, ']');
        client.write_raw(R"({"type":"adapter:call","requestId":"deep","adapter":"test","method":"echo","args":)" +
                         args + "}\n");
        REQUIRE(test::wait_until([&] {
            return fixture.sink.count(core::WarningKind::MalformedMessage) == 1;
        }));

        client.write_raw(test::make_call("r7", "test", "add", {2, 3}).dump() + "\n");
        json response = client.read_json();
        REQUIRE(response["requestId"] == "r7");
        REQUIRE(response["result"] == 5);
    }

    SECTION("bulk references outside the bulk directory are refused") {
        std::string victim = fixture.dir.file("victim.txt");
        std::string named_victim = fixture.dir.file("plughost-bulk-1-1-00000000.json");
        std::ofstream(victim) << "\"keep me\"";
        std::ofstream(named_victim) << "\"keep me\"";

        for (const auto& path : {victim, named_victim}) {
            json reference = {{"__type", "BulkTransfer"}, {"path", path}};
            client.write_raw(test::make_call("r8", "test", "echo", json::array({reference})).dump() + "\n");
            json response = client.read_json();
            REQUIRE(response["requestId"] == "r8");
            REQUIRE(response["error"]["name"] == "DeserializationError");
            REQUIRE(std::filesystem::exists(path));
        }
    }

    SECTION("a non-call that carries a request id gets an error") {
        client.write_raw(R"({"type":"adapter:ping","requestId":"r6"})" "\n");
        json response = client.read_json();
        REQUIRE(response["requestId"] == "r6");
        REQUIRE(response["error"]["name"] == "DeserializationError");
    }
}

TEST_CASE("independent connections are served concurrently", "[integration][rpc]") {
    ServerFixture fixture(4);
    test::RawClient slow(fixture.server->socket_path());
    test::RawClient fast(fixture.server->socket_path());

    slow.write_raw(test::make_call("slow", "test", "sleep", {300}).dump() + "\n");
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    fast.write_raw(test::make_call("fast", "test", "add", {1, 2}).dump() + "\n");

    // The fast call must not wait behind the sleeping one
    json fast_response = fast.read_json(std::chrono::milliseconds(200));
    REQUIRE(fast_response.is_object());
    REQUIRE(fast_response["requestId"] == "fast");
    REQUIRE(fast_response["result"] == 3);

    json slow_response = slow.read_json();
    REQUIRE(slow_response["requestId"] == "slow");
    REQUIRE(slow_response["result"] == "slept");
    REQUIRE(test::wait_until([&] { return fixture.server->connection_count() == 2; }));
}

TEST_CASE("server lifecycle", "[integration][rpc]") {
    ServerFixture fixture(0);
    std::string path = fixture.server->socket_path();

    REQUIRE(fixture.server->is_started());
    REQUIRE_FALSE(fixture.server->start());
    REQUIRE(std::filesystem::exists(path));

    fixture.server->close();
    REQUIRE_FALSE(fixture.server->is_started());
    REQUIRE_FALSE(std::filesystem::exists(path));

    // Second close is a no-op
    fixture.server->close();

    REQUIRE_THROWS(test::RawClient(path));
}
