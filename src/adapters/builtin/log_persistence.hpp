#pragma once
#include <memory>
#include <string>
#include <vector>
#include "adapters/document_database.hpp"
#include "adapters/log_store.hpp"

namespace plughost::adapters::builtin {

// Stores log records in a document-database collection.
// Extension method: write (attached to logger.onLog).
class LogPersistence final : public LogStore {
public:
    static constexpr const char* DEFAULT_COLLECTION = "logs";

    LogPersistence(std::shared_ptr<DocumentDatabase> database,
                   std::string collection = DEFAULT_COLLECTION);

    void write(const LogRecord& record);

    LogPage query(const LogQuery& query, size_t offset = 0) override;
    LogPage search(const std::string& text, size_t limit = 100, size_t offset = 0) override;
    int64_t delete_older_than(int64_t timestamp_ms) override;
    nlohmann::json stats() override;

    HookCallback extension_method(const std::string& name) override;

    const std::string& collection() const { return collection_; }

private:
    nlohmann::json to_filter(const LogQuery& query) const;

    std::shared_ptr<DocumentDatabase> database_;
    std::string collection_;
};

} // namespace plughost::adapters::builtin
