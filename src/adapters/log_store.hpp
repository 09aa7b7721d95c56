#pragma once
#include <cstdint>
#include <vector>
#include "adapters/logger.hpp"

namespace plughost::adapters {

struct LogBufferStats {
    size_t size = 0;
    size_t max_size = 0;
    uint64_t total_appended = 0;
    uint64_t dropped = 0;
};

void to_json(nlohmann::json& j, const LogBufferStats& stats);
void from_json(const nlohmann::json& j, LogBufferStats& stats);

// One page of a newest-first listing
struct LogPage {
    std::vector<LogRecord> logs;
    int64_t total = 0;
    bool has_more = false;
};

void to_json(nlohmann::json& j, const LogPage& page);
void from_json(const nlohmann::json& j, LogPage& page);

// ILogBuffer capability: recent log history held in memory.
// RPC surface: query, stats.
class LogBuffer : public Adapter {
public:
    // Oldest first; limit keeps the newest matches
    virtual std::vector<LogRecord> query(const LogQuery& query) = 0;

    virtual LogBufferStats stats() = 0;

    void register_methods(MethodTable& table) override;
};

// ILogPersistence capability: durable log history.
// RPC surface: query, search, deleteOlderThan, stats.
class LogStore : public Adapter {
public:
    // Newest first
    virtual LogPage query(const LogQuery& query, size_t offset = 0) = 0;

    // Case-insensitive substring match on the message, newest first
    virtual LogPage search(const std::string& text, size_t limit = 100, size_t offset = 0) = 0;

    // Returns the number of records removed
    virtual int64_t delete_older_than(int64_t timestamp_ms) = 0;

    // totalLogs, oldestTimestamp, newestTimestamp, byLevel
    virtual nlohmann::json stats() = 0;

    void register_methods(MethodTable& table) override;
};

} // namespace plughost::adapters
