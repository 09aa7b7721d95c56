#pragma once
#include "adapters/log_store.hpp"
#include "proxy/remote_adapter.hpp"

namespace plughost::proxy {

class LogPersistenceProxy final : public adapters::LogStore, public RemoteAdapter {
public:
    static constexpr const char* DEFAULT_TOKEN = "logs";

    explicit LogPersistenceProxy(std::shared_ptr<transport::Transport> transport,
                                 std::string adapter_token = DEFAULT_TOKEN);

    adapters::LogPage query(const adapters::LogQuery& query, size_t offset = 0) override;
    adapters::LogPage search(const std::string& text, size_t limit = 100, size_t offset = 0) override;
    int64_t delete_older_than(int64_t timestamp_ms) override;
    nlohmann::json stats() override;
};

} // namespace plughost::proxy
