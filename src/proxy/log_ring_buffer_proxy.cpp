#include "proxy/log_ring_buffer_proxy.hpp"

namespace plughost::proxy {

using json = nlohmann::json;

LogRingBufferProxy::LogRingBufferProxy(std::shared_ptr<transport::Transport> transport,
                                       std::string adapter_token)
    : RemoteAdapter(std::move(adapter_token), std::move(transport)) {}

std::vector<adapters::LogRecord> LogRingBufferProxy::query(const adapters::LogQuery& query) {
    return call_remote("query", {adapters::log_query_to_json(query)}).get<std::vector<adapters::LogRecord>>();
}

adapters::LogBufferStats LogRingBufferProxy::stats() {
    return call_remote("stats", {}).get<adapters::LogBufferStats>();
}

} // namespace plughost::proxy
