#include <catch2/catch.hpp>
#include "ipc/protocol.hpp"

using namespace plughost::ipc;
using json = nlohmann::json;

TEST_CASE("calls encode to a single terminated line", "[ipc][protocol]") {
    AdapterCall call;
    call.request_id = "1a-2b-3";
    call.adapter = "cache";
    call.method = "get";
    call.args = json::array({"line\nbreak"});
    call.timeout_ms = 5000;
    call.context = CallContext{"trace-1", "", "plugin-a", "", ""};

    std::string line = encode_call(call);
    REQUIRE(line.back() == '\n');
    REQUIRE(line.find('\n') == line.size() - 1);

    json j = json::parse(line);
    REQUIRE(j["type"] == "adapter:call");
    REQUIRE(j["version"] == PROTOCOL_VERSION);
    REQUIRE(j["timeout"] == 5000);
    REQUIRE(j["context"] == json{{"traceId", "trace-1"}, {"pluginId", "plugin-a"}});

    auto decoded = decode_call(j);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->request_id == "1a-2b-3");
    REQUIRE(decoded->args[0] == "line\nbreak");
    REQUIRE(decoded->context->plugin_id == "plugin-a");
}

TEST_CASE("calls without a version are legacy calls", "[ipc][protocol]") {
    json j = {{"type", "adapter:call"}, {"requestId", "r"}, {"adapter", "db"}, {"method", "count"}};
    auto call = decode_call(j);
    REQUIRE(call.has_value());
    REQUIRE(call->version == LEGACY_PROTOCOL_VERSION);
    REQUIRE(call->args == json::array());
    REQUIRE_FALSE(call->timeout_ms.has_value());
}

TEST_CASE("malformed calls are rejected", "[ipc][protocol]") {
    json good = {{"type", "adapter:call"}, {"requestId", "r"}, {"version", 2},
                 {"adapter", "db"}, {"method", "count"}, {"args", json::array()}};
    REQUIRE(decode_call(good).has_value());

    for (const char* key : {"requestId", "adapter", "method"}) {
        json j = good;
        j.erase(key);
        REQUIRE_FALSE(decode_call(j).has_value());
    }

    json wrong_args = good;
    wrong_args["args"] = "x";
    REQUIRE_FALSE(decode_call(wrong_args).has_value());

    json wrong_type = good;
    wrong_type["type"] = "adapter:response";
    REQUIRE_FALSE(decode_call(wrong_type).has_value());

    REQUIRE_FALSE(decode_call(json::array()).has_value());
}

TEST_CASE("responses carry a result or an error", "[ipc][protocol]") {
    AdapterResponse ok;
    ok.request_id = "r1";
    ok.result = json{{"n", 1}};
    auto decoded = decode_response(json::parse(encode_response(ok)));
    REQUIRE(decoded.has_value());
    REQUIRE_FALSE(decoded->is_error());
    REQUIRE((*decoded->result)["n"] == 1);

    AdapterResponse failed;
    failed.request_id = "r2";
    failed.error = json{{"__type", "Error"}, {"name", "Error"}, {"message", "boom"}};
    decoded = decode_response(json::parse(encode_response(failed)));
    REQUIRE(decoded->is_error());
    REQUIRE_FALSE(decoded->result.has_value());

    SECTION("null result is kept") {
        AdapterResponse empty;
        empty.request_id = "r3";
        empty.result = json();
        auto j = json::parse(encode_response(empty));
        REQUIRE(j.contains("result"));
        REQUIRE(decode_response(j)->result->is_null());
    }

    REQUIRE_FALSE(decode_response(json{{"type", "adapter:response"}}).has_value());
}
