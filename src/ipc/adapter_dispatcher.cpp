#include "ipc/adapter_dispatcher.hpp"
#include "core/errors.hpp"
#include "core/serializer.hpp"
#include <spdlog/spdlog.h>

namespace plughost::ipc {

using json = nlohmann::json;

namespace {

std::string join(const std::vector<std::string>& items) {
    if (items.empty()) {
        return "(none)";
    }
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

AdapterResponse error_response(const std::string& request_id, const std::exception& e) {
    AdapterResponse response;
    response.request_id = request_id;
    response.error = core::serialize_exception(e);
    return response;
}

} // anonymous namespace

AdapterDispatcher::AdapterDispatcher(const runtime::AdapterInstances& adapters, BulkTransfer& bulk,
                                     core::DiagnosticSink* diagnostics)
    : bulk_(bulk), diagnostics_(diagnostics) {
    for (const auto& [token, instance] : adapters) {
        if (!instance) {
            continue;
        }
        Entry entry;
        entry.instance = instance;
        instance->register_methods(entry.methods);
        spdlog::debug("Dispatcher: adapter {} exposes {} method(s)", token, entry.methods.size());
        table_.emplace(token, std::move(entry));
    }
}

std::vector<std::string> AdapterDispatcher::tokens() const {
    std::vector<std::string> result;
    for (const auto& [token, entry] : table_) {
        result.push_back(token);
    }
    return result;
}

std::vector<std::string> AdapterDispatcher::methods(const std::string& token) const {
    auto it = table_.find(token);
    if (it == table_.end()) {
        return {};
    }
    return it->second.methods.names();
}

AdapterResponse AdapterDispatcher::dispatch(const AdapterCall& call) const {
    if (call.version != PROTOCOL_VERSION) {
        core::report_warning(diagnostics_, core::Warning{
            core::WarningKind::ProtocolVersionMismatch,
            "Call " + call.request_id + " uses protocol version " + std::to_string(call.version) +
                ", host speaks " + std::to_string(PROTOCOL_VERSION),
            {{"requestId", call.request_id}, {"received", call.version}, {"expected", PROTOCOL_VERSION}}
        });
    }

    if (call.context) {
        spdlog::debug("Call {} {}.{} (trace={}, plugin={}, session={})", call.request_id,
                      call.adapter, call.method, call.context->trace_id, call.context->plugin_id,
                      call.context->session_id);
    }

    auto it = table_.find(call.adapter);
    if (it == table_.end()) {
        return error_response(call.request_id, AdapterNotFoundError(
            "Adapter \"" + call.adapter + "\" not found. Available adapters: " + join(tokens())));
    }

    return invoke(it->second, call);
}

AdapterResponse AdapterDispatcher::invoke(const Entry& entry, const AdapterCall& call) const {
    const adapters::Method* method = entry.methods.find(call.method);
    if (!method) {
        return error_response(call.request_id, MethodNotFoundError(
            "Method \"" + call.method + "\" not found on adapter \"" + call.adapter +
            "\". Available methods: " + join(entry.methods.names())));
    }

    try {
        std::vector<json> args;
        if (!call.args.is_array()) {
            throw DeserializationError("Call arguments must be an array");
        }
        args.reserve(call.args.size());
        for (const auto& arg : call.args) {
            args.push_back(core::deserialize(bulk_.unwrap(arg)));
        }

        json result = (*method)(args);

        AdapterResponse response;
        response.request_id = call.request_id;
        response.result = bulk_.wrap(core::serialize(result));
        return response;
    } catch (const std::exception& e) {
        spdlog::debug("Call {} {}.{} failed: {}", call.request_id, call.adapter, call.method, e.what());
        return error_response(call.request_id, e);
    } catch (...) {
        spdlog::warn("Call {} {}.{} threw a non-standard exception", call.request_id,
                     call.adapter, call.method);
        return error_response(call.request_id, Error("Error", "Unknown error"));
    }
}

} // namespace plughost::ipc
