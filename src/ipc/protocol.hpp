#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/serializer.hpp"

namespace plughost::ipc {

constexpr int PROTOCOL_VERSION = 2;
constexpr int LEGACY_PROTOCOL_VERSION = 1;

constexpr char MESSAGE_TERMINATOR = '\n';
constexpr const char* CALL_TYPE = "adapter:call";
constexpr const char* RESPONSE_TYPE = "adapter:response";

// Containers a message may nest: the envelope and the args array around
// values of up to core::MAX_NESTING_DEPTH levels
constexpr int MAX_MESSAGE_DEPTH = core::MAX_NESTING_DEPTH + 2;

// Tracing identifiers attached to a call
struct CallContext {
    std::string trace_id;
    std::string session_id;
    std::string plugin_id;
    std::string workspace_id;
    std::string tenant_id;

    bool empty() const;
};

void to_json(nlohmann::json& j, const CallContext& context);
void from_json(const nlohmann::json& j, CallContext& context);

struct AdapterCall {
    std::string request_id;
    int version = PROTOCOL_VERSION;
    std::string adapter;
    std::string method;
    nlohmann::json args = nlohmann::json::array();  // serialized values
    std::optional<uint64_t> timeout_ms;
    std::optional<CallContext> context;
};

// Exactly one of result or error is set for a well-formed response
struct AdapterResponse {
    std::string request_id;
    std::optional<nlohmann::json> result;
    std::optional<nlohmann::json> error;

    bool is_error() const { return error.has_value(); }
};

nlohmann::json call_to_json(const AdapterCall& call);
nlohmann::json response_to_json(const AdapterResponse& response);

// Returns nullopt if j is not a well-formed envelope of that kind. A call
// without a version is a legacy call.
std::optional<AdapterCall> decode_call(const nlohmann::json& j);
std::optional<AdapterResponse> decode_response(const nlohmann::json& j);

// Single-line JSON followed by MESSAGE_TERMINATOR
std::string encode_call(const AdapterCall& call);
std::string encode_response(const AdapterResponse& response);
std::string encode_line(const nlohmann::json& j);

} // namespace plughost::ipc
