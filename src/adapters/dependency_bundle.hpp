#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "adapters/adapter.hpp"
#include "core/errors.hpp"

namespace plughost::adapters {

// Dependencies handed to an adapter factory, keyed by alias
class DependencyBundle {
public:
    DependencyBundle() = default;

    void add(const std::string& alias, std::shared_ptr<Adapter> instance);

    bool has(const std::string& alias) const;

    // Returns nullptr if absent
    std::shared_ptr<Adapter> get(const std::string& alias) const;

    // Returns nullptr if absent or not of type T
    template <typename T>
    std::shared_ptr<T> get_as(const std::string& alias) const {
        return std::dynamic_pointer_cast<T>(get(alias));
    }

    // Throws ConfigurationError if absent or not of type T
    template <typename T>
    std::shared_ptr<T> require(const std::string& alias, const char* interface_name) const {
        auto instance = get(alias);
        if (!instance) {
            throw ConfigurationError("Missing dependency '" + alias + "'");
        }
        auto typed = std::dynamic_pointer_cast<T>(instance);
        if (!typed) {
            throw ConfigurationError("Dependency '" + alias + "' does not implement " +
                                     interface_name);
        }
        return typed;
    }

    std::vector<std::string> aliases() const;
    size_t size() const { return deps_.size(); }

private:
    std::map<std::string, std::shared_ptr<Adapter>> deps_;
};

} // namespace plughost::adapters
