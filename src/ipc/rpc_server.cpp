#include "ipc/rpc_server.hpp"
#include "core/errors.hpp"
#include "core/serializer.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>

namespace plughost::ipc {

using json = nlohmann::json;

AdapterRpcServer::AdapterRpcServer(const runtime::AdapterInstances& adapters, RpcServerConfig config,
                                   core::DiagnosticSink* diagnostics)
    : config_(std::move(config)), diagnostics_(diagnostics) {
    bulk_ = std::make_unique<BulkTransfer>(config_.bulk);
    dispatcher_ = std::make_unique<AdapterDispatcher>(adapters, *bulk_, diagnostics_);
}

AdapterRpcServer::~AdapterRpcServer() {
    close();
}

bool AdapterRpcServer::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_) {
        spdlog::warn("RPC server already started on {}", config_.socket_path);
        return false;
    }

    auto reactor = std::make_unique<Reactor>();
    if (!reactor->init()) {
        return false;
    }

    auto server = std::make_unique<SocketServer>(config_.socket_path, config_.max_message_bytes);
    if (!server->init()) {
        return false;
    }
    server->set_handler([this](uint64_t connection_id, const std::string& message) {
        handle_message(connection_id, message);
    });

    if (!reactor->add(server->get_server_fd(), EPOLLIN,
                      [this](int fd, uint32_t events) { on_server_event(fd, events); })) {
        server->stop();
        return false;
    }

    reactor_ = std::move(reactor);
    socket_server_ = std::move(server);
    if (config_.dispatch_threads > 0) {
        pool_ = std::make_unique<DispatchPool>(config_.dispatch_threads);
    }

    started_ = true;
    io_thread_ = std::thread([this]() { reactor_->run(); });

    spdlog::info("Adapter RPC server started on {} ({} adapter(s), {} dispatch thread(s))",
                 config_.socket_path, dispatcher_->tokens().size(), config_.dispatch_threads);
    return true;
}

void AdapterRpcServer::close() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!started_) {
        return;
    }

    reactor_->stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    if (pool_) {
        pool_->shutdown();
        pool_.reset();
    }

    socket_server_->stop();
    socket_server_.reset();
    reactor_.reset();
    connections_ = 0;
    started_ = false;

    spdlog::info("Adapter RPC server on {} closed", config_.socket_path);
}

void AdapterRpcServer::on_server_event(int /*fd*/, uint32_t /*events*/) {
    // Accept all pending connections
    while (true) {
        int client_fd = socket_server_->accept_connection();
        if (client_fd < 0) {
            break;
        }

        reactor_->add(client_fd, EPOLLIN | EPOLLRDHUP,
                      [this](int fd, uint32_t events) { on_client_event(fd, events); });
        connections_++;
    }
}

void AdapterRpcServer::on_client_event(int fd, uint32_t events) {
    if (events & EPOLLIN) {
        if (!socket_server_->handle_client(fd)) {
            drop_client(fd);
            return;
        }
    }

    if (events & (EPOLLHUP | EPOLLERR | EPOLLRDHUP)) {
        drop_client(fd);
        return;
    }

    if (events & EPOLLOUT) {
        if (!socket_server_->flush_client(fd)) {
            drop_client(fd);
            return;
        }
    }

    update_client_events(fd);
}

void AdapterRpcServer::update_client_events(int fd) {
    uint32_t events = EPOLLIN | EPOLLRDHUP;
    if (socket_server_->client_wants_write(fd)) {
        events |= EPOLLOUT;
    }
    reactor_->modify(fd, events);
}

void AdapterRpcServer::drop_client(int fd) {
    if (!socket_server_->has_client(fd)) {
        return;
    }
    reactor_->remove(fd);
    socket_server_->remove_client(fd);
    if (connections_ > 0) {
        connections_--;
    }
}

void AdapterRpcServer::handle_message(uint64_t connection_id, const std::string& message) {
    json j;
    try {
        j = core::parse_wire(message, MAX_MESSAGE_DEPTH);
    } catch (const DeserializationError& e) {
        core::report_warning(diagnostics_, core::Warning{
            core::WarningKind::MalformedMessage,
            "Dropping unparseable message on connection " + std::to_string(connection_id) + ": " + e.what(),
            {{"connection", connection_id}}
        });
        return;
    }

    std::optional<AdapterCall> call;
    try {
        call = decode_call(j);
    } catch (const std::exception& e) {
        spdlog::debug("Call decoding failed: {}", e.what());
    }

    if (!call) {
        auto request_id = j.is_object() ? j.find("requestId") : j.end();
        core::report_warning(diagnostics_, core::Warning{
            core::WarningKind::MalformedMessage,
            "Dropping message that is not an adapter call on connection " + std::to_string(connection_id),
            {{"connection", connection_id}}
        });
        // Answer when the sender can still correlate the failure
        if (j.is_object() && request_id != j.end() && request_id->is_string()) {
            AdapterResponse response;
            response.request_id = request_id->get<std::string>();
            response.error = core::serialize_exception(
                DeserializationError("Malformed adapter call"));
            deliver(connection_id, encode_response(response));
        }
        return;
    }

    if (!pool_) {
        deliver(connection_id, encode_response(dispatcher_->dispatch(*call)));
        return;
    }

    std::string request_id = call->request_id;
    bool queued = pool_->submit(connection_id, [this, connection_id, call = std::move(*call)]() {
        std::string encoded = encode_response(dispatcher_->dispatch(call));
        reactor_->post([this, connection_id, encoded = std::move(encoded)]() {
            deliver(connection_id, encoded);
        });
    });
    if (!queued) {
        spdlog::debug("Dispatch pool stopped, dropping call {}", request_id);
    }
}

void AdapterRpcServer::deliver(uint64_t connection_id, const std::string& encoded) {
    int fd = socket_server_->fd_for(connection_id);
    if (fd < 0) {
        spdlog::debug("Connection {} closed before its response was written", connection_id);
        return;
    }

    socket_server_->queue_message(connection_id, encoded);
    if (!socket_server_->flush_client(fd)) {
        drop_client(fd);
        return;
    }
    update_client_events(fd);
}

} // namespace plughost::ipc
