#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace plughost::adapters {

enum class AdapterType {
    Core,
    Extension,
    Proxy
};

const char* adapter_type_to_string(AdapterType type);
std::optional<AdapterType> adapter_type_from_string(const std::string& name);

// Required dependency on another runtime token, injected under alias
struct AdapterDependency {
    std::string id;
    std::string alias;

    const std::string& effective_alias() const { return alias.empty() ? id : alias; }
};

// Declares that this adapter attaches `method` to `hook` on `adapter`
struct AdapterExtension {
    std::string adapter;
    std::string hook;
    std::string method;
    int priority = 0;
};

struct AdapterCapabilities {
    bool streaming = false;
    bool batch = false;
    bool search = false;
    bool transactions = false;
    nlohmann::json custom = nlohmann::json::object();
};

struct AdapterManifest {
    std::string manifest_version = "1.0.0";
    std::string id;
    std::string name;
    std::string version;
    std::string description;
    AdapterType type = AdapterType::Core;
    std::string implements;
    std::vector<AdapterDependency> required_adapters;
    std::string platform_requirement;
    std::vector<std::string> optional_adapters;
    std::optional<AdapterExtension> extends;
    AdapterCapabilities capabilities;
};

// Parse and validate; throws ConfigurationError naming the offending field
AdapterManifest parse_manifest(const nlohmann::json& j);

// Throws ConfigurationError naming the offending field
void validate_manifest(const AdapterManifest& manifest);

nlohmann::json manifest_to_json(const AdapterManifest& manifest);

// MAJOR.MINOR.PATCH with an optional -prerelease suffix
bool is_semver(const std::string& version);

} // namespace plughost::adapters
