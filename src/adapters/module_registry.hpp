#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "adapters/adapter.hpp"
#include "adapters/dependency_bundle.hpp"
#include "adapters/manifest.hpp"

namespace plughost::adapters {

using AdapterFactory = std::function<std::shared_ptr<Adapter>(
    const nlohmann::json& settings, const DependencyBundle& deps)>;

// What a module reference resolves to
struct AdapterModule {
    AdapterManifest manifest;
    AdapterFactory create;
};

using ModuleResolver = std::function<AdapterModule(const std::string& module_ref)>;

// Shared-library module ABI. A library exports MODULE_ENTRY_SYMBOL as a
// ModuleEntryFn returning a descriptor that lives as long as the library.
constexpr uint32_t MODULE_ABI_VERSION = 1;
constexpr const char* MODULE_ENTRY_SYMBOL = "plughost_adapter_module";

struct ModuleDescriptor {
    uint32_t abi_version;
    const char* manifest_json;
    std::shared_ptr<Adapter> (*create)(const nlohmann::json& settings, const DependencyBundle& deps);
};

using ModuleEntryFn = const ModuleDescriptor* (*)();

// Resolves module references: registered (built-in) modules first, then
// paths ending in ".so" through dlopen. Loaded libraries stay open until the
// registry is destroyed.
class ModuleRegistry {
public:
    ModuleRegistry() = default;
    ~ModuleRegistry();

    // Non-copyable
    ModuleRegistry(const ModuleRegistry&) = delete;
    ModuleRegistry& operator=(const ModuleRegistry&) = delete;

    // Returns false if the reference is already registered
    bool register_module(const std::string& module_ref, AdapterModule module);

    bool contains(const std::string& module_ref) const;

    // Throws ConfigurationError if the reference cannot be resolved
    AdapterModule resolve(const std::string& module_ref);

    // Resolver bound to this registry, for the adapter loader
    ModuleResolver resolver();

    std::vector<std::string> module_refs() const;

private:
    AdapterModule load_shared_library(const std::string& path);

    mutable std::mutex mutex_;
    std::map<std::string, AdapterModule> modules_;
    std::vector<void*> libraries_;
};

bool is_shared_library_ref(const std::string& module_ref);

} // namespace plughost::adapters
