#pragma once
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "adapters/document_database.hpp"

namespace plughost::adapters::builtin {

// Document database kept in memory. Collections are created on first insert
// and keep documents in insertion order.
class MemoryDocumentDatabase final : public DocumentDatabase {
public:
    MemoryDocumentDatabase();

    std::vector<nlohmann::json> find(const std::string& collection, const nlohmann::json& filter,
                                     const FindOptions& options = {}) override;
    nlohmann::json find_by_id(const std::string& collection, const std::string& id) override;
    nlohmann::json insert_one(const std::string& collection, const nlohmann::json& document) override;
    int64_t update_many(const std::string& collection, const nlohmann::json& filter,
                        const nlohmann::json& update) override;
    nlohmann::json update_by_id(const std::string& collection, const std::string& id,
                                const nlohmann::json& update) override;
    int64_t delete_many(const std::string& collection, const nlohmann::json& filter) override;
    bool delete_by_id(const std::string& collection, const std::string& id) override;
    int64_t count(const std::string& collection, const nlohmann::json& filter) override;

    std::vector<std::string> collections();

private:
    std::string generate_id();

    std::mutex mutex_;
    std::map<std::string, std::vector<nlohmann::json>> collections_;
    std::string id_prefix_;
    std::atomic<uint64_t> next_id_{1};
};

// Filter evaluation: plain values compare for equality, objects of
// $eq $ne $gt $gte $lt $lte $in $nin operators combine with AND.
// Dotted keys address nested fields.
bool matches_filter(const nlohmann::json& document, const nlohmann::json& filter);

// Applies $set $unset $inc; an object without operators is treated as $set.
// The "id" field is never modified.
void apply_update(nlohmann::json& document, const nlohmann::json& update);

// Orders two values of the same kind (numbers, strings, booleans);
// nullopt when they are not comparable
std::optional<int> compare_values(const nlohmann::json& a, const nlohmann::json& b);

} // namespace plughost::adapters::builtin
