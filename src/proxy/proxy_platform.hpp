#pragma once
#include <memory>
#include <optional>
#include <string>
#include "proxy/cache_proxy.hpp"
#include "proxy/document_database_proxy.hpp"
#include "proxy/log_persistence_proxy.hpp"
#include "proxy/log_ring_buffer_proxy.hpp"
#include "transport/unix_socket_transport.hpp"

namespace plughost::proxy {

struct ProxyPlatformOptions {
    std::string cache_token = CacheProxy::DEFAULT_TOKEN;
    std::string document_database_token = DocumentDatabaseProxy::DEFAULT_TOKEN;
    std::string log_buffer_token = LogRingBufferProxy::DEFAULT_TOKEN;
    std::string log_store_token = LogPersistenceProxy::DEFAULT_TOKEN;
    std::optional<ipc::CallContext> context;
};

// Proxies a sandboxed plugin uses in place of the host's adapters, all
// sharing one transport
struct ProxyPlatform {
    std::shared_ptr<transport::Transport> transport;
    std::shared_ptr<CacheProxy> cache;
    std::shared_ptr<DocumentDatabaseProxy> document_database;
    std::shared_ptr<LogRingBufferProxy> log_buffer;
    std::shared_ptr<LogPersistenceProxy> log_store;

    void close();
};

ProxyPlatform create_proxy_platform(std::shared_ptr<transport::Transport> transport,
                                    const ProxyPlatformOptions& options = {});

// Opens a UnixSocketTransport to config.socket_path
ProxyPlatform create_proxy_platform(const transport::TransportConfig& config,
                                    const ProxyPlatformOptions& options = {});

} // namespace plughost::proxy
