#include "adapters/dependency_bundle.hpp"

namespace plughost::adapters {

void DependencyBundle::add(const std::string& alias, std::shared_ptr<Adapter> instance) {
    deps_[alias] = std::move(instance);
}

bool DependencyBundle::has(const std::string& alias) const {
    return deps_.count(alias) > 0;
}

std::shared_ptr<Adapter> DependencyBundle::get(const std::string& alias) const {
    auto it = deps_.find(alias);
    if (it == deps_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> DependencyBundle::aliases() const {
    std::vector<std::string> result;
    result.reserve(deps_.size());
    for (const auto& [alias, instance] : deps_) {
        result.push_back(alias);
    }
    return result;
}

} // namespace plughost::adapters
