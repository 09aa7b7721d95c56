#include "proxy/proxy_platform.hpp"

namespace plughost::proxy {

void ProxyPlatform::close() {
    if (transport) {
        transport->close();
    }
}

ProxyPlatform create_proxy_platform(std::shared_ptr<transport::Transport> transport,
                                    const ProxyPlatformOptions& options) {
    ProxyPlatform platform;
    platform.transport = transport;
    platform.cache = std::make_shared<CacheProxy>(transport, options.cache_token);
    platform.document_database = std::make_shared<DocumentDatabaseProxy>(transport,
                                                                          options.document_database_token);
    platform.log_buffer = std::make_shared<LogRingBufferProxy>(transport, options.log_buffer_token);
    platform.log_store = std::make_shared<LogPersistenceProxy>(transport, options.log_store_token);
    if (options.context) {
        platform.cache->set_context(options.context);
        platform.document_database->set_context(options.context);
        platform.log_buffer->set_context(options.context);
        platform.log_store->set_context(options.context);
    }
    return platform;
}

ProxyPlatform create_proxy_platform(const transport::TransportConfig& config,
                                    const ProxyPlatformOptions& options) {
    return create_proxy_platform(std::make_shared<transport::UnixSocketTransport>(config), options);
}

} // namespace plughost::proxy
