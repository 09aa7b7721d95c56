#include "ipc/protocol.hpp"

namespace plughost::ipc {

using json = nlohmann::json;

bool CallContext::empty() const {
    return trace_id.empty() && session_id.empty() && plugin_id.empty() &&
           workspace_id.empty() && tenant_id.empty();
}

void to_json(json& j, const CallContext& context) {
    j = json::object();
    if (!context.trace_id.empty()) j["traceId"] = context.trace_id;
    if (!context.session_id.empty()) j["sessionId"] = context.session_id;
    if (!context.plugin_id.empty()) j["pluginId"] = context.plugin_id;
    if (!context.workspace_id.empty()) j["workspaceId"] = context.workspace_id;
    if (!context.tenant_id.empty()) j["tenantId"] = context.tenant_id;
}

void from_json(const json& j, CallContext& context) {
    auto read = [&j](const char* key) {
        auto it = j.find(key);
        return it != j.end() && it->is_string() ? it->get<std::string>() : std::string();
    };
    context.trace_id = read("traceId");
    context.session_id = read("sessionId");
    context.plugin_id = read("pluginId");
    context.workspace_id = read("workspaceId");
    context.tenant_id = read("tenantId");
}

json call_to_json(const AdapterCall& call) {
    json j = {
        {"type", CALL_TYPE},
        {"requestId", call.request_id},
        {"version", call.version},
        {"adapter", call.adapter},
        {"method", call.method},
        {"args", call.args.is_array() ? call.args : json::array()}
    };
    if (call.timeout_ms) {
        j["timeout"] = *call.timeout_ms;
    }
    if (call.context && !call.context->empty()) {
        j["context"] = *call.context;
    }
    return j;
}

json response_to_json(const AdapterResponse& response) {
    json j = {
        {"type", RESPONSE_TYPE},
        {"requestId", response.request_id}
    };
    if (response.error) {
        j["error"] = *response.error;
    } else if (response.result) {
        j["result"] = *response.result;
    }
    return j;
}

std::optional<AdapterCall> decode_call(const json& j) {
    if (!j.is_object() || j.value("type", std::string()) != CALL_TYPE) {
        return std::nullopt;
    }

    auto request_id = j.find("requestId");
    auto adapter = j.find("adapter");
    auto method = j.find("method");
    if (request_id == j.end() || !request_id->is_string() ||
        adapter == j.end() || !adapter->is_string() ||
        method == j.end() || !method->is_string()) {
        return std::nullopt;
    }

    AdapterCall call;
    call.request_id = request_id->get<std::string>();
    call.adapter = adapter->get<std::string>();
    call.method = method->get<std::string>();

    auto version = j.find("version");
    if (version == j.end() || version->is_null()) {
        call.version = LEGACY_PROTOCOL_VERSION;
    } else if (version->is_number_integer()) {
        call.version = version->get<int>();
    } else {
        return std::nullopt;
    }

    auto args = j.find("args");
    if (args == j.end() || args->is_null()) {
        call.args = json::array();
    } else if (args->is_array()) {
        call.args = *args;
    } else {
        return std::nullopt;
    }

    if (auto timeout = j.find("timeout"); timeout != j.end() && timeout->is_number_unsigned()) {
        call.timeout_ms = timeout->get<uint64_t>();
    }
    if (auto context = j.find("context"); context != j.end() && context->is_object()) {
        call.context = context->get<CallContext>();
    }
    return call;
}

std::optional<AdapterResponse> decode_response(const json& j) {
    if (!j.is_object() || j.value("type", std::string()) != RESPONSE_TYPE) {
        return std::nullopt;
    }
    auto request_id = j.find("requestId");
    if (request_id == j.end() || !request_id->is_string()) {
        return std::nullopt;
    }

    AdapterResponse response;
    response.request_id = request_id->get<std::string>();
    if (auto error = j.find("error"); error != j.end() && !error->is_null()) {
        response.error = *error;
    } else if (auto result = j.find("result"); result != j.end()) {
        response.result = *result;
    }
    return response;
}

std::string encode_line(const json& j) {
    // Invalid UTF-8 is replaced rather than failing the whole message
    std::string line = j.dump(-1, ' ', false, json::error_handler_t::replace);
    line.push_back(MESSAGE_TERMINATOR);
    return line;
}

std::string encode_call(const AdapterCall& call) {
    return encode_line(call_to_json(call));
}

std::string encode_response(const AdapterResponse& response) {
    return encode_line(response_to_json(response));
}

} // namespace plughost::ipc
