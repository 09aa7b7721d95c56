#include "adapters/hook_list.hpp"
#include <spdlog/spdlog.h>

namespace plughost::adapters {

void HookList::add(HookCallback callback) {
    if (!callback) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

void HookList::fire(const nlohmann::json& payload) const {
    std::vector<HookCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks = callbacks_;
    }

    for (size_t i = 0; i < callbacks.size(); i++) {
        try {
            callbacks[i](payload);
        } catch (const std::exception& e) {
            spdlog::warn("Hook '{}' callback #{} failed: {}", name_, i, e.what());
        }
    }
}

HookRegistrar HookList::registrar() {
    return [this](HookCallback callback) { add(std::move(callback)); };
}

size_t HookList::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return callbacks_.size();
}

} // namespace plughost::adapters
