#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace plughost::transport {

constexpr std::chrono::milliseconds FALLBACK_TIMEOUT{30000};

// Per-operation timeout budgets keyed by "adapter.method", "adapter.*" or "*"
class TimeoutTable {
public:
    // Built-in budgets for the cache, document database and log adapters
    static TimeoutTable defaults();

    void set(const std::string& key, std::chrono::milliseconds timeout);

    // Exact match, then adapter wildcard, then global wildcard, then FALLBACK_TIMEOUT
    std::chrono::milliseconds lookup(const std::string& adapter, const std::string& method) const;

    size_t size() const { return entries_.size(); }

private:
    std::map<std::string, std::chrono::milliseconds> entries_;
};

// Explicit per-call timeout, then the transport default, then the table
std::chrono::milliseconds select_timeout(const TimeoutTable& table, const std::string& adapter,
                                         const std::string& method,
                                         std::optional<std::chrono::milliseconds> per_call,
                                         std::optional<std::chrono::milliseconds> configured_default);

} // namespace plughost::transport
