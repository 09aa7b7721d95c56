#include <catch2/catch.hpp>
#include "adapters/builtin/memory_cache.hpp"
#include "core/serializer.hpp"
#include "ipc/adapter_dispatcher.hpp"
#include "test_helpers.hpp"

using namespace plughost;
using namespace plughost::ipc;
using json = nlohmann::json;

namespace {

AdapterCall make(const std::string& adapter, const std::string& method, json args = json::array(),
                 int version = PROTOCOL_VERSION) {
    AdapterCall call;
    call.request_id = "req-1";
    call.version = version;
    call.adapter = adapter;
    call.method = method;
    call.args = std::move(args);
    return call;
}

struct DispatcherFixture {
    test::TempDir dir;
    BulkTransfer bulk{BulkTransferOptions{1024, dir.path()}};
    test::RecordingDiagnosticSink sink;
    runtime::AdapterInstances adapters{
        {"cache", std::make_shared<adapters::builtin::MemoryCache>()},
        {"test", std::make_shared<test::TestAdapter>()}
    };
    AdapterDispatcher dispatcher{adapters, bulk, &sink};
};

} // anonymous namespace

TEST_CASE_METHOD(DispatcherFixture, "dispatch invokes the published method", "[ipc][dispatcher]") {
    auto set = dispatcher.dispatch(make("cache", "set", json::array({"k", {{"n", 1}}})));
    REQUIRE_FALSE(set.is_error());
    REQUIRE(set.request_id == "req-1");

    auto get = dispatcher.dispatch(make("cache", "get", {"k"}));
    REQUIRE(get.result.value() == json{{"n", 1}});

    REQUIRE(dispatcher.has_adapter("test"));
    REQUIRE(dispatcher.tokens() == std::vector<std::string>{"cache", "test"});
    REQUIRE(dispatcher.methods("cache").size() == 4);
}

TEST_CASE_METHOD(DispatcherFixture, "unknown adapters and methods list what exists", "[ipc][dispatcher]") {
    auto no_adapter = dispatcher.dispatch(make("queue", "push"));
    REQUIRE(no_adapter.is_error());
    REQUIRE((*no_adapter.error)["name"] == "AdapterNotFoundError");
    REQUIRE_THAT((*no_adapter.error)["message"].get<std::string>(),
                 Catch::Contains("Available adapters: cache, test"));

    auto no_method = dispatcher.dispatch(make("cache", "keys"));
    REQUIRE((*no_method.error)["name"] == "MethodNotFoundError");
    REQUIRE_THAT((*no_method.error)["message"].get<std::string>(),
                 Catch::Contains("Available methods: clear, delete, get, set"));
}

TEST_CASE_METHOD(DispatcherFixture, "adapter errors keep their name and code", "[ipc][dispatcher]") {
    auto response = dispatcher.dispatch(make("test", "fail", {"quota exceeded"}));
    REQUIRE(response.is_error());

    core::ErrorValue error = core::deserialize_error(*response.error);
    REQUIRE(error.name == "QuotaExceededError");
    REQUIRE(error.message == "quota exceeded");
    REQUIRE(error.code == "E_QUOTA");

    SECTION("bad arguments surface as plain errors") {
        auto bad = dispatcher.dispatch(make("cache", "get", {42}));
        REQUIRE(bad.is_error());
        REQUIRE((*bad.error)["name"] == "Error");
    }
}

TEST_CASE_METHOD(DispatcherFixture, "binary arguments and results", "[ipc][dispatcher]") {
    json wire_arg = core::serialize(core::make_bytes({1, 2, 3}));
    auto response = dispatcher.dispatch(make("test", "echo", json::array({wire_arg})));
    REQUIRE(response.result.value() == wire_arg);
}

TEST_CASE_METHOD(DispatcherFixture, "large results leave the envelope", "[ipc][dispatcher]") {
    auto response = dispatcher.dispatch(make("test", "blob", {5000}));
    REQUIRE(BulkTransfer::is_reference(*response.result));
    REQUIRE(bulk.unwrap(*response.result) == json(std::string(5000, 'x')));
}

TEST_CASE_METHOD(DispatcherFixture, "version mismatch warns but still dispatches", "[ipc][dispatcher]") {
    auto response = dispatcher.dispatch(make("test", "add", {2, 3}, LEGACY_PROTOCOL_VERSION));
    REQUIRE(response.result.value() == 5);
    REQUIRE(sink.count(core::WarningKind::ProtocolVersionMismatch) == 1);

    dispatcher.dispatch(make("test", "add", {2, 3}));
    REQUIRE(sink.count(core::WarningKind::ProtocolVersionMismatch) == 1);
}
