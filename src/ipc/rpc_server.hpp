#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "core/diagnostics.hpp"
#include "ipc/adapter_dispatcher.hpp"
#include "ipc/bulk_transfer.hpp"
#include "ipc/dispatch_pool.hpp"
#include "ipc/reactor.hpp"
#include "ipc/socket_server.hpp"
#include "runtime/adapter_loader.hpp"

namespace plughost::ipc {

struct RpcServerConfig {
    std::string socket_path = "/tmp/plughost.sock";
    // 0 = dispatch inline on the I/O thread
    size_t dispatch_threads = 4;
    size_t max_message_bytes = 64 * 1024 * 1024;
    BulkTransferOptions bulk;
};

// Serves adapter calls on a Unix socket. One I/O thread runs the reactor;
// calls are dispatched inline or on a worker pool and their responses are
// written back by the I/O thread.
class AdapterRpcServer {
public:
    AdapterRpcServer(const runtime::AdapterInstances& adapters, RpcServerConfig config,
                     core::DiagnosticSink* diagnostics = nullptr);
    ~AdapterRpcServer();

    // Non-copyable
    AdapterRpcServer(const AdapterRpcServer&) = delete;
    AdapterRpcServer& operator=(const AdapterRpcServer&) = delete;

    // Bind and start accepting; false if already started or binding failed
    bool start();

    // Stop accepting, close connections, remove the socket file. Idempotent.
    void close();

    bool is_started() const { return started_; }

    const std::string& socket_path() const { return config_.socket_path; }

    size_t connection_count() const { return connections_; }

    const AdapterDispatcher& dispatcher() const { return *dispatcher_; }

private:
    void on_server_event(int fd, uint32_t events);
    void on_client_event(int fd, uint32_t events);
    void update_client_events(int fd);
    void drop_client(int fd);
    void handle_message(uint64_t connection_id, const std::string& message);
    void deliver(uint64_t connection_id, const std::string& encoded);

    RpcServerConfig config_;
    core::DiagnosticSink* diagnostics_;
    std::unique_ptr<BulkTransfer> bulk_;
    std::unique_ptr<AdapterDispatcher> dispatcher_;

    std::unique_ptr<Reactor> reactor_;
    std::unique_ptr<SocketServer> socket_server_;
    std::unique_ptr<DispatchPool> pool_;
    std::thread io_thread_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> started_{false};
    std::atomic<size_t> connections_{0};
};

} // namespace plughost::ipc
