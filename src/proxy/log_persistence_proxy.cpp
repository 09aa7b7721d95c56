#include "proxy/log_persistence_proxy.hpp"

namespace plughost::proxy {

using json = nlohmann::json;

LogPersistenceProxy::LogPersistenceProxy(std::shared_ptr<transport::Transport> transport,
                                         std::string adapter_token)
    : RemoteAdapter(std::move(adapter_token), std::move(transport)) {}

adapters::LogPage LogPersistenceProxy::query(const adapters::LogQuery& query, size_t offset) {
    return call_remote("query", {adapters::log_query_to_json(query), offset}).get<adapters::LogPage>();
}

adapters::LogPage LogPersistenceProxy::search(const std::string& text, size_t limit, size_t offset) {
    return call_remote("search", {text, limit, offset}).get<adapters::LogPage>();
}

int64_t LogPersistenceProxy::delete_older_than(int64_t timestamp_ms) {
    return call_remote("deleteOlderThan", {timestamp_ms}).get<int64_t>();
}

json LogPersistenceProxy::stats() {
    return call_remote("stats", {});
}

} // namespace plughost::proxy
