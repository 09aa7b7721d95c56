#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "adapters/adapter.hpp"

namespace plughost::adapters {

// ICache capability. RPC surface: get, set, delete, clear.
class Cache : public Adapter {
public:
    // Value stored under key, or null when absent or expired
    virtual nlohmann::json get(const std::string& key) = 0;

    virtual void set(const std::string& key, const nlohmann::json& value,
                     std::optional<int64_t> ttl_ms = std::nullopt) = 0;

    // Published as "delete"
    virtual void remove(const std::string& key) = 0;

    // Removes every key, or only keys matching a '*' glob
    virtual void clear(const std::optional<std::string>& pattern = std::nullopt) = 0;

    void register_methods(MethodTable& table) override;
};

// '*' matches any run of characters, everything else matches literally
bool glob_match(const std::string& pattern, const std::string& text);

} // namespace plughost::adapters
