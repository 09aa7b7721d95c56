#pragma once
#include "adapters/cache.hpp"
#include "proxy/remote_adapter.hpp"

namespace plughost::proxy {

class CacheProxy final : public adapters::Cache, public RemoteAdapter {
public:
    static constexpr const char* DEFAULT_TOKEN = "cache";

    explicit CacheProxy(std::shared_ptr<transport::Transport> transport,
                        std::string adapter_token = DEFAULT_TOKEN);

    nlohmann::json get(const std::string& key) override;
    void set(const std::string& key, const nlohmann::json& value,
             std::optional<int64_t> ttl_ms = std::nullopt) override;
    void remove(const std::string& key) override;
    void clear(const std::optional<std::string>& pattern = std::nullopt) override;
};

} // namespace plughost::proxy
