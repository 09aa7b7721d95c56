#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "adapters/adapter.hpp"

namespace plughost::adapters {

// Callbacks attached to one hook. Fired in registration order; a throwing
// callback is logged and does not stop the others.
class HookList {
public:
    explicit HookList(std::string name) : name_(std::move(name)) {}

    void add(HookCallback callback);
    void fire(const nlohmann::json& payload) const;

    // Registrar handed out by Adapter::hook
    HookRegistrar registrar();

    size_t size() const;
    const std::string& name() const { return name_; }

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::vector<HookCallback> callbacks_;
};

} // namespace plughost::adapters
