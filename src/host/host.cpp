#include "host/host.hpp"
#include "adapters/builtin/builtin_modules.hpp"
#include "adapters/module_registry.hpp"
#include "core/errors.hpp"
#include "ipc/rpc_server.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <thread>

namespace plughost::host {

// Global host pointer for signal handling
static Host* g_host = nullptr;

static void signal_handler(int /*signum*/) {
    if (g_host) {
        g_host->shutdown();
    }
}

Host::Host() : Host(Config{}) {}

Host::Host(const Config& config) : Host(config, Dependencies{}) {}

Host::Host(const Config& config, Dependencies deps)
    : config_(config),
      modules_(std::move(deps.modules)),
      diagnostics_(std::move(deps.diagnostics)) {
    if (!modules_) {
        modules_ = std::make_unique<adapters::ModuleRegistry>();
        adapters::builtin::register_builtin_modules(*modules_);
    }
    if (!diagnostics_) {
        diagnostics_ = std::make_unique<core::LogDiagnosticSink>();
    }
}

Host::~Host() {
    if (server_) {
        server_->close();
    }
    if (g_host == this) {
        g_host = nullptr;
    }
}

bool Host::init() {
    spdlog::info("Initializing plughost...");

    try {
        runtime::AdapterLoader loader(modules_->resolver(), diagnostics_.get());
        loaded_ = loader.load_adapters(config_.adapters);
    } catch (const ConfigurationError& e) {
        spdlog::error("Failed to load adapters: {}", e.what());
        return false;
    }

    ipc::RpcServerConfig server_config;
    server_config.socket_path = config_.socket_path;
    server_config.dispatch_threads = config_.dispatch_threads;
    server_config.max_message_bytes = config_.max_message_bytes;
    server_config.bulk.threshold = config_.bulk_threshold_bytes;
    server_config.bulk.temp_dir = config_.bulk_temp_dir;

    server_ = std::make_unique<ipc::AdapterRpcServer>(loaded_.instances, server_config, diagnostics_.get());
    if (!server_->start()) {
        spdlog::error("Failed to start adapter RPC server on {}", config_.socket_path);
        return false;
    }

    // Set up signal handlers
    g_host = this;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    size_t connected = 0;
    for (const auto& ext : loaded_.extensions) {
        if (ext.connected) {
            connected++;
        }
    }
    spdlog::info("Host initialized: {} adapter(s), {}/{} extension(s) connected",
                 loaded_.instances.size(), connected, loaded_.extensions.size());
    return true;
}

void Host::run() {
    running_ = true;
    spdlog::info("plughost running on {}", config_.socket_path);
    spdlog::info("Press Ctrl+C to exit");

    while (!shutdown_requested_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Host shutting down...");
    if (server_) {
        server_->close();
    }
    running_ = false;
    spdlog::info("Host stopped");
}

void Host::shutdown() {
    shutdown_requested_ = true;
}

std::shared_ptr<adapters::Adapter> Host::get_adapter(const std::string& token) const {
    auto it = loaded_.instances.find(token);
    if (it == loaded_.instances.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace plughost::host
