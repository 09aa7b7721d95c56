#include "proxy/cache_proxy.hpp"

namespace plughost::proxy {

using json = nlohmann::json;

CacheProxy::CacheProxy(std::shared_ptr<transport::Transport> transport, std::string adapter_token)
    : RemoteAdapter(std::move(adapter_token), std::move(transport)) {}

json CacheProxy::get(const std::string& key) {
    return call_remote("get", {key});
}

void CacheProxy::set(const std::string& key, const json& value, std::optional<int64_t> ttl_ms) {
    std::vector<json> args{key, value};
    if (ttl_ms) {
        args.push_back(*ttl_ms);
    }
    call_remote("set", args);
}

void CacheProxy::remove(const std::string& key) {
    call_remote("delete", {key});
}

void CacheProxy::clear(const std::optional<std::string>& pattern) {
    if (pattern) {
        call_remote("clear", {*pattern});
    } else {
        call_remote("clear", {});
    }
}

} // namespace plughost::proxy
