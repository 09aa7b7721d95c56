#include "adapters/module_registry.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <dlfcn.h>

namespace plughost::adapters {

using json = nlohmann::json;

bool is_shared_library_ref(const std::string& module_ref) {
    const std::string suffix = ".so";
    if (module_ref.size() > suffix.size() &&
        module_ref.compare(module_ref.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return true;
    }
    // Versioned names like libfoo.so.1
    return module_ref.find(".so.") != std::string::npos;
}

ModuleRegistry::~ModuleRegistry() {
    for (void* handle : libraries_) {
        dlclose(handle);
    }
}

bool ModuleRegistry::register_module(const std::string& module_ref, AdapterModule module) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (modules_.count(module_ref)) {
        spdlog::warn("Module '{}' already registered", module_ref);
        return false;
    }
    modules_.emplace(module_ref, std::move(module));
    spdlog::debug("Registered adapter module '{}'", module_ref);
    return true;
}

bool ModuleRegistry::contains(const std::string& module_ref) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return modules_.count(module_ref) > 0;
}

AdapterModule ModuleRegistry::resolve(const std::string& module_ref) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = modules_.find(module_ref);
        if (it != modules_.end()) {
            return it->second;
        }
    }

    if (!is_shared_library_ref(module_ref)) {
        throw ConfigurationError("Unknown adapter module '" + module_ref + "'");
    }

    AdapterModule module = load_shared_library(module_ref);
    std::lock_guard<std::mutex> lock(mutex_);
    modules_.emplace(module_ref, module);
    return module;
}

ModuleResolver ModuleRegistry::resolver() {
    return [this](const std::string& module_ref) { return resolve(module_ref); };
}

std::vector<std::string> ModuleRegistry::module_refs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> refs;
    refs.reserve(modules_.size());
    for (const auto& [ref, module] : modules_) {
        refs.push_back(ref);
    }
    return refs;
}

AdapterModule ModuleRegistry::load_shared_library(const std::string& path) {
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* err = dlerror();
        throw ConfigurationError("Failed to load adapter module '" + path + "': " +
                                 (err ? err : "unknown error"));
    }

    auto entry = reinterpret_cast<ModuleEntryFn>(dlsym(handle, MODULE_ENTRY_SYMBOL));
    if (!entry) {
        dlclose(handle);
        throw ConfigurationError("Adapter module '" + path + "' does not export " +
                                 MODULE_ENTRY_SYMBOL);
    }

    const ModuleDescriptor* descriptor = entry();
    if (!descriptor || !descriptor->manifest_json || !descriptor->create) {
        dlclose(handle);
        throw ConfigurationError("Adapter module '" + path + "' returned an incomplete descriptor");
    }
    if (descriptor->abi_version != MODULE_ABI_VERSION) {
        uint32_t version = descriptor->abi_version;
        dlclose(handle);
        throw ConfigurationError("Adapter module '" + path + "' has ABI version " +
                                 std::to_string(version) + ", expected " +
                                 std::to_string(MODULE_ABI_VERSION));
    }

    AdapterModule module;
    try {
        module.manifest = parse_manifest(json::parse(descriptor->manifest_json));
    } catch (const std::exception& e) {
        dlclose(handle);
        throw ConfigurationError("Adapter module '" + path + "' has an invalid manifest: " + e.what());
    }
    module.create = descriptor->create;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        libraries_.push_back(handle);
    }
    spdlog::info("Loaded adapter module {} ({} v{})", path, module.manifest.id,
                 module.manifest.version);
    return module;
}

} // namespace plughost::adapters
