#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "ipc/bulk_transfer.hpp"
#include "runtime/adapter_loader.hpp"

namespace plughost::host {

// Host configuration
struct HostConfig {
    std::string socket_path = "/tmp/plughost.sock";
    std::string log_level = "info";
    size_t dispatch_threads = 4;         // 0 = dispatch on the I/O thread
    size_t max_message_bytes = 64 * 1024 * 1024;
    size_t bulk_threshold_bytes = ipc::DEFAULT_BULK_THRESHOLD;
    std::string bulk_temp_dir;           // empty = $TMPDIR or /tmp
    runtime::AdapterConfigSet adapters;
};

// Missing keys keep their defaults. Throws ConfigurationError on wrong types.
HostConfig host_config_from_json(const nlohmann::json& j);

// Throws ConfigurationError if the file cannot be read or parsed
HostConfig load_host_config(const std::string& path);

// PLUGHOST_SOCKET and PLUGHOST_LOG_LEVEL take precedence over the file
void apply_env_overrides(HostConfig& config);

} // namespace plughost::host
