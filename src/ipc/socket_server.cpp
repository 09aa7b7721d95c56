#include "ipc/socket_server.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace plughost::ipc {

SocketServer::SocketServer(const std::string& socket_path, size_t max_message_bytes)
    : socket_path_(socket_path), max_message_bytes_(max_message_bytes) {}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::init() {
    struct sockaddr_un addr;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        spdlog::error("Socket path too long: {}", socket_path_);
        return false;
    }

    // Remove stale socket file
    if (unlink(socket_path_.c_str()) == 0) {
        spdlog::debug("Removed stale socket file {}", socket_path_);
    }

    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        spdlog::error("Failed to create socket: {}", strerror(errno));
        return false;
    }

    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("Failed to bind {}: {}", socket_path_, strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, SOMAXCONN) < 0) {
        spdlog::error("Failed to listen on {}: {}", socket_path_, strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
        return false;
    }

    // Sandboxed subprocesses may run as another user
    if (chmod(socket_path_.c_str(), 0666) < 0) {
        spdlog::warn("Failed to chmod {}: {}", socket_path_, strerror(errno));
    }

    spdlog::info("Listening on {}", socket_path_);
    return true;
}

void SocketServer::set_handler(MessageHandler handler) {
    handler_ = std::move(handler);
}

int SocketServer::accept_connection() {
    int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            spdlog::error("Failed to accept connection: {}", strerror(errno));
        }
        return -1;
    }

    uint64_t id = next_connection_id_++;
    clients_[client_fd] = std::make_unique<ClientConnection>(client_fd, id, max_message_bytes_);
    connection_fds_[id] = client_fd;
    spdlog::debug("Client connected (fd={}, connection={})", client_fd, id);
    return client_fd;
}

bool SocketServer::handle_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }
    ClientConnection& client = *it->second;
    uint64_t connection_id = client.id;

    char buf[65536];
    while (true) {
        ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
        if (n > 0) {
            auto messages = client.framer.feed(buf, static_cast<size_t>(n));
            if (client.framer.overflowed()) {
                spdlog::warn("Connection {} exceeded {} bytes without a message terminator, closing",
                             connection_id, max_message_bytes_);
                return false;
            }
            for (const auto& message : messages) {
                if (handler_) {
                    handler_(connection_id, message);
                }
            }
            // The handler may have removed this client
            if (!clients_.count(client_fd)) {
                return false;
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        spdlog::debug("recv failed on fd {}: {}", client_fd, strerror(errno));
        return false;
    }
}

bool SocketServer::queue_message(uint64_t connection_id, const std::string& data) {
    int fd = fd_for(connection_id);
    if (fd < 0) {
        return false;
    }
    auto& client = *clients_.at(fd);
    client.send_buffer.append(data);
    client.want_write = true;
    return true;
}

bool SocketServer::flush_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }
    ClientConnection& client = *it->second;

    while (!client.send_buffer.empty()) {
        ssize_t n = send(client_fd, client.send_buffer.data(), client.send_buffer.size(), MSG_NOSIGNAL);
        if (n > 0) {
            client.send_buffer.erase(0, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            client.want_write = true;
            return true;
        }
        spdlog::debug("send failed on fd {}: {}", client_fd, strerror(errno));
        return false;
    }

    client.want_write = false;
    return true;
}

bool SocketServer::client_wants_write(int client_fd) const {
    auto it = clients_.find(client_fd);
    return it != clients_.end() && it->second->want_write;
}

void SocketServer::remove_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return;
    }
    spdlog::debug("Client disconnected (fd={}, connection={})", client_fd, it->second->id);
    connection_fds_.erase(it->second->id);
    clients_.erase(it);
    close(client_fd);
}

int SocketServer::fd_for(uint64_t connection_id) const {
    auto it = connection_fds_.find(connection_id);
    return it == connection_fds_.end() ? -1 : it->second;
}

std::vector<int> SocketServer::client_fds() const {
    std::vector<int> fds;
    fds.reserve(clients_.size());
    for (const auto& [fd, client] : clients_) {
        fds.push_back(fd);
    }
    return fds;
}

void SocketServer::stop() {
    for (int fd : client_fds()) {
        remove_client(fd);
    }
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
        spdlog::info("Stopped listening on {}", socket_path_);
    }
}

} // namespace plughost::ipc
