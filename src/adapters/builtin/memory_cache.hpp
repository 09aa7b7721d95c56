#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "adapters/cache.hpp"

namespace plughost::adapters::builtin {

struct MemoryCacheConfig {
    std::optional<int64_t> default_ttl_ms;
    size_t max_entries = 10000; // 0 = unbounded
};

MemoryCacheConfig memory_cache_config_from_json(const nlohmann::json& settings);

// In-process cache with per-entry TTL. When full, the oldest inserted entry
// is evicted.
class MemoryCache final : public Cache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit MemoryCache(MemoryCacheConfig config = {}, Clock clock = nullptr);

    nlohmann::json get(const std::string& key) override;
    void set(const std::string& key, const nlohmann::json& value,
             std::optional<int64_t> ttl_ms = std::nullopt) override;
    void remove(const std::string& key) override;
    void clear(const std::optional<std::string>& pattern = std::nullopt) override;

    // Live (non-expired) entries
    size_t size();

private:
    struct Entry {
        nlohmann::json value;
        std::optional<std::chrono::steady_clock::time_point> expires_at;
        std::list<std::string>::iterator order;
    };

    bool expired(const Entry& entry, std::chrono::steady_clock::time_point now) const;
    void erase_locked(std::unordered_map<std::string, Entry>::iterator it);

    MemoryCacheConfig config_;
    Clock clock_;
    std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> insertion_order_;
};

} // namespace plughost::adapters::builtin
