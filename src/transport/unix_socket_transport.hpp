#pragma once
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include "ipc/bulk_transfer.hpp"
#include "ipc/line_framer.hpp"
#include "ipc/reactor.hpp"
#include "transport/circuit_breaker.hpp"
#include "transport/timeout_config.hpp"
#include "transport/transport.hpp"

namespace plughost::transport {

struct RetryPolicy {
    uint32_t max_retries = 0;
    std::chrono::milliseconds retry_delay{1000};
    double backoff_multiplier = 2.0;
};

struct TransportConfig {
    std::string socket_path = "/tmp/plughost.sock";
    std::optional<std::chrono::milliseconds> default_timeout;
    TimeoutTable timeouts = TimeoutTable::defaults();
    CircuitBreakerConfig breaker;
    CircuitBreaker::Clock breaker_clock;
    ipc::BulkTransferOptions bulk;
    RetryPolicy retry;
    size_t max_message_bytes = 64 * 1024 * 1024;
};

// Transport over a Unix stream socket. Connects lazily, reconnects on the
// next send after the connection drops. A dedicated I/O thread reads
// responses and completes the matching pending call.
class UnixSocketTransport final : public Transport {
public:
    explicit UnixSocketTransport(TransportConfig config = {});
    ~UnixSocketTransport() override;

    // Non-copyable
    UnixSocketTransport(const UnixSocketTransport&) = delete;
    UnixSocketTransport& operator=(const UnixSocketTransport&) = delete;

    // Connect now instead of on first send. Throws TransportError.
    void connect();

    ipc::AdapterResponse send(const std::string& adapter, const std::string& method,
                              const nlohmann::json& args, const CallOptions& options = {}) override;

    void close() override;
    bool is_closed() const override { return closed_; }

    bool is_connected() const { return connected_; }
    size_t pending_count() const;
    const CircuitBreaker& breaker() const { return breaker_; }
    const TransportConfig& config() const { return config_; }

private:
    struct PendingRequest {
        std::promise<ipc::AdapterResponse> promise;
        std::chrono::steady_clock::time_point deadline;
    };

    ipc::AdapterResponse send_once(const std::string& adapter, const std::string& method,
                                   const nlohmann::json& args, const CallOptions& options);
    std::string next_request_id();
    void ensure_connected();
    void discard_bulk(const nlohmann::json& wrapped_args);

    // I/O thread
    void on_socket_event(int fd, uint32_t events);
    void read_responses();
    void flush_writes();
    void disconnect(const std::string& reason);
    void complete(const std::string& line);

    void fail_pending(const std::string& reason);

    TransportConfig config_;
    CircuitBreaker breaker_;
    ipc::BulkTransfer bulk_;

    std::unique_ptr<ipc::Reactor> reactor_;
    std::thread io_thread_;
    int fd_ = -1;                 // owned by the I/O thread
    ipc::LineFramer framer_;      // owned by the I/O thread

    std::mutex connect_mutex_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> closed_{false};

    std::mutex write_mutex_;
    std::string send_buffer_;

    mutable std::mutex pending_mutex_;
    std::unordered_map<std::string, std::shared_ptr<PendingRequest>> pending_;

    std::string id_prefix_;
    std::atomic<uint64_t> sequence_{0};
};

} // namespace plughost::transport
