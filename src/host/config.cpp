#include "host/config.hpp"
#include "core/errors.hpp"
#include <cstdlib>
#include <fstream>

namespace plughost::host {

using json = nlohmann::json;

namespace {

template <typename T>
void read_field(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid host configuration field '") + key + "': " + e.what());
    }
}

} // anonymous namespace

HostConfig host_config_from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("Host configuration must be a JSON object");
    }

    HostConfig config;
    read_field(j, "socketPath", config.socket_path);
    read_field(j, "logLevel", config.log_level);
    read_field(j, "dispatchThreads", config.dispatch_threads);
    read_field(j, "maxMessageBytes", config.max_message_bytes);
    read_field(j, "bulkThresholdBytes", config.bulk_threshold_bytes);
    read_field(j, "bulkTempDir", config.bulk_temp_dir);

    if (auto it = j.find("adapters"); it != j.end()) {
        config.adapters = runtime::parse_adapter_configs(*it);
    }
    if (config.socket_path.empty()) {
        throw ConfigurationError("Host configuration field 'socketPath' must not be empty");
    }
    return config;
}

HostConfig load_host_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("Cannot open host configuration " + path);
    }

    json j;
    try {
        j = json::parse(in, nullptr, true, true);
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Cannot parse host configuration " + path + ": " + e.what());
    }
    return host_config_from_json(j);
}

void apply_env_overrides(HostConfig& config) {
    if (const char* socket = std::getenv("PLUGHOST_SOCKET"); socket && *socket) {
        config.socket_path = socket;
    }
    if (const char* level = std::getenv("PLUGHOST_LOG_LEVEL"); level && *level) {
        config.log_level = level;
    }
}

} // namespace plughost::host
