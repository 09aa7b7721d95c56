#include "adapters/builtin/memory_cache.hpp"
#include <iterator>

namespace plughost::adapters::builtin {

using json = nlohmann::json;

MemoryCacheConfig memory_cache_config_from_json(const json& settings) {
    MemoryCacheConfig config;
    if (!settings.is_object()) {
        return config;
    }
    if (auto it = settings.find("defaultTtlMs"); it != settings.end() && it->is_number()) {
        config.default_ttl_ms = it->get<int64_t>();
    }
    if (auto it = settings.find("maxEntries"); it != settings.end() && it->is_number_integer()) {
        int64_t max_entries = it->get<int64_t>();
        config.max_entries = max_entries > 0 ? static_cast<size_t>(max_entries) : 0;
    }
    return config;
}

MemoryCache::MemoryCache(MemoryCacheConfig config, Clock clock)
    : config_(config), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

bool MemoryCache::expired(const Entry& entry, std::chrono::steady_clock::time_point now) const {
    return entry.expires_at && now >= *entry.expires_at;
}

void MemoryCache::erase_locked(std::unordered_map<std::string, Entry>::iterator it) {
    insertion_order_.erase(it->second.order);
    entries_.erase(it);
}

json MemoryCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    if (expired(it->second, clock_())) {
        erase_locked(it);
        return nullptr;
    }
    return it->second.value;
}

void MemoryCache::set(const std::string& key, const json& value, std::optional<int64_t> ttl_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<int64_t> ttl = ttl_ms ? ttl_ms : config_.default_ttl_ms;
    std::optional<std::chrono::steady_clock::time_point> expires_at;
    if (ttl && *ttl > 0) {
        expires_at = clock_() + std::chrono::milliseconds(*ttl);
    }

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.value = value;
        it->second.expires_at = expires_at;
        return;
    }

    if (config_.max_entries > 0 && entries_.size() >= config_.max_entries) {
        auto oldest = entries_.find(insertion_order_.front());
        if (oldest != entries_.end()) {
            erase_locked(oldest);
        }
    }

    insertion_order_.push_back(key);
    entries_.emplace(key, Entry{value, expires_at, std::prev(insertion_order_.end())});
}

void MemoryCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        erase_locked(it);
    }
}

void MemoryCache::clear(const std::optional<std::string>& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pattern) {
        entries_.clear();
        insertion_order_.clear();
        return;
    }

    for (auto it = entries_.begin(); it != entries_.end();) {
        if (glob_match(*pattern, it->first)) {
            insertion_order_.erase(it->second.order);
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t MemoryCache::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    size_t live = 0;
    for (const auto& [key, entry] : entries_) {
        if (!expired(entry, now)) {
            live++;
        }
    }
    return live;
}

} // namespace plughost::adapters::builtin
