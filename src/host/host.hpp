/**
 * plughost Host
 *
 * Owns the pieces a plugin host runs with:
 * - ModuleRegistry (built-in and shared-library adapter modules)
 * - Adapter set (loaded once, read-shared afterwards)
 * - AdapterRpcServer (serves the adapter set to sandboxed plugins)
 */
#pragma once
#include <atomic>
#include <memory>
#include <string>
#include "core/diagnostics.hpp"
#include "host/config.hpp"
#include "runtime/adapter_loader.hpp"

namespace plughost::adapters {
class ModuleRegistry;
} // namespace plughost::adapters

namespace plughost::ipc {
class AdapterRpcServer;
} // namespace plughost::ipc

namespace plughost::host {

class Host {
public:
    using Config = HostConfig;

    struct Dependencies {
        std::unique_ptr<adapters::ModuleRegistry> modules;
        std::unique_ptr<core::DiagnosticSink> diagnostics;
    };

    Host();
    explicit Host(const Config& config);
    Host(const Config& config, Dependencies deps);
    ~Host();

    // Non-copyable
    Host(const Host&) = delete;
    Host& operator=(const Host&) = delete;

    // Load the adapter set and start the RPC server
    bool init();

    // Block until shutdown() (or SIGINT/SIGTERM), then stop the server
    void run();

    // Request shutdown; safe from a signal handler
    void shutdown();

    bool is_running() const { return running_; }

    // Returns nullptr for an unknown token
    std::shared_ptr<adapters::Adapter> get_adapter(const std::string& token) const;

    template <typename T>
    std::shared_ptr<T> get_adapter_as(const std::string& token) const {
        return std::dynamic_pointer_cast<T>(get_adapter(token));
    }

    const runtime::LoadedAdapters& adapters() const { return loaded_; }
    const Config& get_config() const { return config_; }
    adapters::ModuleRegistry& modules() { return *modules_; }
    ipc::AdapterRpcServer* rpc_server() { return server_.get(); }

private:
    Config config_;
    std::unique_ptr<adapters::ModuleRegistry> modules_;
    std::unique_ptr<core::DiagnosticSink> diagnostics_;
    runtime::LoadedAdapters loaded_;
    std::unique_ptr<ipc::AdapterRpcServer> server_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
};

} // namespace plughost::host
