#include "transport/unix_socket_transport.hpp"
#include "core/errors.hpp"
#include "core/serializer.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <random>

namespace plughost::transport {

using json = nlohmann::json;

namespace {

// A call the breaker let through. Ending without an outcome hands a
// half-open trial slot back.
class BreakerAdmission {
public:
    explicit BreakerAdmission(CircuitBreaker& breaker) : breaker_(breaker) {}
    ~BreakerAdmission() {
        if (!settled_) {
            breaker_.release_trial();
        }
    }

    BreakerAdmission(const BreakerAdmission&) = delete;
    BreakerAdmission& operator=(const BreakerAdmission&) = delete;

    void succeeded() {
        settled_ = true;
        breaker_.record_success();
    }

    void failed() {
        settled_ = true;
        breaker_.record_failure();
    }

private:
    CircuitBreaker& breaker_;
    bool settled_ = false;
};

} // anonymous namespace

UnixSocketTransport::UnixSocketTransport(TransportConfig config)
    : config_(std::move(config)),
      breaker_(config_.breaker, config_.breaker_clock),
      bulk_(config_.bulk),
      framer_(config_.max_message_bytes) {
    std::random_device rd;
    char prefix[32];
    snprintf(prefix, sizeof(prefix), "%x-%08x", static_cast<unsigned>(getpid()), rd());
    id_prefix_ = prefix;
}

UnixSocketTransport::~UnixSocketTransport() {
    close();
}

std::string UnixSocketTransport::next_request_id() {
    return id_prefix_ + "-" + std::to_string(++sequence_);
}

size_t UnixSocketTransport::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

void UnixSocketTransport::connect() {
    if (closed_) {
        throw TransportError("Transport closed");
    }
    std::lock_guard<std::mutex> lock(connect_mutex_);
    if (connected_) {
        return;
    }

    if (!reactor_) {
        auto reactor = std::make_unique<ipc::Reactor>();
        if (!reactor->init()) {
            throw TransportError("Failed to initialize transport event loop");
        }
        reactor_ = std::move(reactor);
        io_thread_ = std::thread([this]() { reactor_->run(); });
    }

    struct sockaddr_un addr;
    if (config_.socket_path.size() >= sizeof(addr.sun_path)) {
        throw TransportError("Socket path too long: " + config_.socket_path);
    }
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, config_.socket_path.c_str(), sizeof(addr.sun_path) - 1);

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw TransportError(std::string("Failed to create socket: ") + strerror(errno));
    }
    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        throw TransportError("Failed to connect to " + config_.socket_path + ": " + strerror(err),
                             err == ENOENT ? "ENOENT" : "ECONNREFUSED");
    }
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        int err = errno;
        ::close(fd);
        throw TransportError(std::string("Failed to configure socket: ") + strerror(err));
    }

    connected_ = true;
    reactor_->post([this, fd]() {
        fd_ = fd;
        framer_.clear();
        if (!reactor_->add(fd, EPOLLIN | EPOLLRDHUP,
                           [this](int event_fd, uint32_t events) { on_socket_event(event_fd, events); })) {
            disconnect("Failed to watch connection");
            return;
        }
        flush_writes();
    });
    spdlog::debug("Transport connected to {}", config_.socket_path);
}

void UnixSocketTransport::ensure_connected() {
    if (!connected_) {
        connect();
    }
}

ipc::AdapterResponse UnixSocketTransport::send(const std::string& adapter, const std::string& method,
                                               const json& args, const CallOptions& options) {
    uint32_t attempt = 0;
    auto delay = config_.retry.retry_delay;

    while (true) {
        try {
            return send_once(adapter, method, args, options);
        } catch (const CircuitOpenError&) {
            throw;
        } catch (const TransportError& e) {
            if (closed_ || attempt >= config_.retry.max_retries) {
                throw;
            }
            attempt++;
            spdlog::warn("{}.{} failed ({}), retry {}/{} in {}ms", adapter, method, e.what(),
                         attempt, config_.retry.max_retries, delay.count());
            std::this_thread::sleep_for(delay);
            delay = std::chrono::milliseconds(
                static_cast<int64_t>(static_cast<double>(delay.count()) * config_.retry.backoff_multiplier));
        }
    }
}

ipc::AdapterResponse UnixSocketTransport::send_once(const std::string& adapter, const std::string& method,
                                                    const json& args, const CallOptions& options) {
    if (closed_) {
        throw TransportError("Transport closed");
    }
    if (!args.is_array()) {
        throw SerializationError("Call arguments must be an array");
    }
    auto timeout = select_timeout(config_.timeouts, adapter, method, options.timeout,
                                  config_.default_timeout);

    ipc::AdapterCall call;
    call.request_id = next_request_id();
    call.adapter = adapter;
    call.method = method;
    call.args = json::array();
    for (const auto& arg : args) {
        try {
            call.args.push_back(bulk_.wrap(arg));
        } catch (const TransportError&) {
            discard_bulk(call.args);
            throw;
        }
    }
    call.timeout_ms = static_cast<uint64_t>(timeout.count());
    call.context = options.context;

    if (!breaker_.allow_request()) {
        discard_bulk(call.args);
        throw CircuitOpenError("Circuit breaker open for " + config_.socket_path + ", retry in " +
                               std::to_string(breaker_.retry_after().count()) + "ms");
    }
    BreakerAdmission admission(breaker_);

    try {
        ensure_connected();
    } catch (const TransportError&) {
        discard_bulk(call.args);
        admission.failed();
        throw;
    }

    std::string line;
    try {
        line = ipc::encode_call(call);
    } catch (const std::exception&) {
        discard_bulk(call.args);
        throw;
    }

    auto pending = std::make_shared<PendingRequest>();
    pending->deadline = std::chrono::steady_clock::now() + timeout;
    auto future = pending->promise.get_future();

    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_[call.request_id] = pending;
        }
        send_buffer_.append(line);
    }
    reactor_->post([this]() { flush_writes(); });

    if (future.wait_until(pending->deadline) == std::future_status::timeout) {
        bool removed;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            removed = pending_.erase(call.request_id) > 0;
        }
        // Not removed: the response won the race and the future is ready
        if (removed) {
            admission.failed();
            spdlog::debug("Call {} {}.{} timed out after {}ms", call.request_id, adapter, method,
                          timeout.count());
            throw TimeoutError("Call to " + adapter + "." + method + " timed out after " +
                               std::to_string(timeout.count()) + "ms",
                               static_cast<uint64_t>(timeout.count()));
        }
    }

    ipc::AdapterResponse response;
    try {
        response = future.get();
    } catch (const TransportError&) {
        admission.failed();
        throw;
    }
    admission.succeeded();

    if (response.result) {
        response.result = bulk_.unwrap(*response.result);
    }
    return response;
}

void UnixSocketTransport::discard_bulk(const json& wrapped_args) {
    for (const auto& arg : wrapped_args) {
        bulk_.discard(arg);
    }
}

void UnixSocketTransport::on_socket_event(int fd, uint32_t events) {
    if (fd != fd_) {
        return;
    }

    if (events & EPOLLIN) {
        read_responses();
        if (fd != fd_) {
            return;
        }
    }

    if (events & (EPOLLHUP | EPOLLERR | EPOLLRDHUP)) {
        disconnect("Connection closed by host");
        return;
    }

    if (events & EPOLLOUT) {
        flush_writes();
    }
}

void UnixSocketTransport::read_responses() {
    char buf[65536];
    while (fd_ >= 0) {
        ssize_t n = recv(fd_, buf, sizeof(buf), 0);
        if (n > 0) {
            auto lines = framer_.feed(buf, static_cast<size_t>(n));
            if (framer_.overflowed()) {
                disconnect("Response exceeds " + std::to_string(config_.max_message_bytes) + " bytes");
                return;
            }
            for (const auto& line : lines) {
                complete(line);
            }
            continue;
        }
        if (n == 0) {
            disconnect("Connection closed by host");
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        disconnect(std::string("Read failed: ") + strerror(errno));
        return;
    }
}

void UnixSocketTransport::flush_writes() {
    std::string failure;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (send_buffer_.empty()) {
            return;
        }
        if (fd_ < 0) {
            // Connecting: the task that installs the socket flushes
            if (connected_) {
                return;
            }
            send_buffer_.clear();
            fail_pending("Connection closed");
            return;
        }

        while (!send_buffer_.empty()) {
            ssize_t n = ::send(fd_, send_buffer_.data(), send_buffer_.size(), MSG_NOSIGNAL);
            if (n > 0) {
                send_buffer_.erase(0, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                reactor_->modify(fd_, EPOLLIN | EPOLLRDHUP | EPOLLOUT);
                return;
            }
            failure = std::string("Write failed: ") + strerror(errno);
            break;
        }
    }

    if (!failure.empty()) {
        disconnect(failure);
        return;
    }
    reactor_->modify(fd_, EPOLLIN | EPOLLRDHUP);
}

void UnixSocketTransport::complete(const std::string& line) {
    json j;
    try {
        j = core::parse_wire(line, ipc::MAX_MESSAGE_DEPTH);
    } catch (const DeserializationError& e) {
        spdlog::warn("Dropping unparseable response: {}", e.what());
        return;
    }

    std::optional<ipc::AdapterResponse> response;
    try {
        response = ipc::decode_response(j);
    } catch (const std::exception& e) {
        spdlog::warn("Dropping malformed response: {}", e.what());
        return;
    }
    if (!response) {
        spdlog::warn("Dropping message that is not an adapter response");
        return;
    }

    std::shared_ptr<PendingRequest> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(response->request_id);
        if (it == pending_.end()) {
            spdlog::debug("Dropping response for unknown or expired request {}", response->request_id);
            return;
        }
        pending = it->second;
        pending_.erase(it);
    }
    pending->promise.set_value(std::move(*response));
}

void UnixSocketTransport::disconnect(const std::string& reason) {
    if (fd_ >= 0) {
        reactor_->remove(fd_);
        ::close(fd_);
        fd_ = -1;
    }
    framer_.clear();
    connected_ = false;

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        send_buffer_.clear();
        fail_pending(reason);
    }
    spdlog::warn("Transport disconnected from {}: {}", config_.socket_path, reason);
}

void UnixSocketTransport::fail_pending(const std::string& reason) {
    std::unordered_map<std::string, std::shared_ptr<PendingRequest>> failed;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        failed.swap(pending_);
    }
    for (auto& [request_id, pending] : failed) {
        pending->promise.set_exception(std::make_exception_ptr(TransportError(reason)));
    }
}

void UnixSocketTransport::close() {
    if (closed_.exchange(true)) {
        return;
    }

    std::lock_guard<std::mutex> lock(connect_mutex_);
    if (reactor_) {
        reactor_->stop();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }
    connected_ = false;

    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        send_buffer_.clear();
        fail_pending("Transport closed");
    }
    bulk_.cleanup();
    spdlog::debug("Transport to {} closed", config_.socket_path);
}

} // namespace plughost::transport
