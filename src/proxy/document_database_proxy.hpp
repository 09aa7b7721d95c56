#pragma once
#include "adapters/document_database.hpp"
#include "proxy/remote_adapter.hpp"

namespace plughost::proxy {

class DocumentDatabaseProxy final : public adapters::DocumentDatabase, public RemoteAdapter {
public:
    static constexpr const char* DEFAULT_TOKEN = "db";

    explicit DocumentDatabaseProxy(std::shared_ptr<transport::Transport> transport,
                                   std::string adapter_token = DEFAULT_TOKEN);

    std::vector<nlohmann::json> find(const std::string& collection, const nlohmann::json& filter,
                                     const adapters::FindOptions& options = {}) override;
    nlohmann::json find_by_id(const std::string& collection, const std::string& id) override;
    nlohmann::json insert_one(const std::string& collection, const nlohmann::json& document) override;
    int64_t update_many(const std::string& collection, const nlohmann::json& filter,
                        const nlohmann::json& update) override;
    nlohmann::json update_by_id(const std::string& collection, const std::string& id,
                                const nlohmann::json& update) override;
    int64_t delete_many(const std::string& collection, const nlohmann::json& filter) override;
    bool delete_by_id(const std::string& collection, const std::string& id) override;
    int64_t count(const std::string& collection, const nlohmann::json& filter) override;
};

} // namespace plughost::proxy
