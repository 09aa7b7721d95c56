#pragma once
#include "adapters/log_store.hpp"
#include "proxy/remote_adapter.hpp"

namespace plughost::proxy {

class LogRingBufferProxy final : public adapters::LogBuffer, public RemoteAdapter {
public:
    static constexpr const char* DEFAULT_TOKEN = "logBuffer";

    explicit LogRingBufferProxy(std::shared_ptr<transport::Transport> transport,
                                std::string adapter_token = DEFAULT_TOKEN);

    std::vector<adapters::LogRecord> query(const adapters::LogQuery& query) override;
    adapters::LogBufferStats stats() override;
};

} // namespace plughost::proxy
