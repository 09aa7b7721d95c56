#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "adapters/adapter.hpp"

namespace plughost::adapters {

struct FindOptions {
    std::optional<size_t> limit;
    size_t skip = 0;
    // field -> 1 (ascending) | -1 (descending), applied in key order
    nlohmann::json sort = nlohmann::json::object();
};

FindOptions find_options_from_json(const nlohmann::json& j);
nlohmann::json find_options_to_json(const FindOptions& options);

// IDocumentDatabase capability. Documents are JSON objects with a string "id".
class DocumentDatabase : public Adapter {
public:
    virtual std::vector<nlohmann::json> find(const std::string& collection,
                                             const nlohmann::json& filter,
                                             const FindOptions& options = {}) = 0;

    // Document or null
    virtual nlohmann::json find_by_id(const std::string& collection, const std::string& id) = 0;

    // Returns the stored document including its assigned id
    virtual nlohmann::json insert_one(const std::string& collection,
                                      const nlohmann::json& document) = 0;

    // Returns the number of documents modified
    virtual int64_t update_many(const std::string& collection, const nlohmann::json& filter,
                                const nlohmann::json& update) = 0;

    // Updated document or null
    virtual nlohmann::json update_by_id(const std::string& collection, const std::string& id,
                                        const nlohmann::json& update) = 0;

    virtual int64_t delete_many(const std::string& collection, const nlohmann::json& filter) = 0;
    virtual bool delete_by_id(const std::string& collection, const std::string& id) = 0;
    virtual int64_t count(const std::string& collection, const nlohmann::json& filter) = 0;

    void register_methods(MethodTable& table) override;
};

} // namespace plughost::adapters
