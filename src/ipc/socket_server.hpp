#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "ipc/line_framer.hpp"

namespace plughost::ipc {

struct ClientConnection {
    int fd;
    uint64_t id;
    LineFramer framer;
    std::string send_buffer;
    bool want_write = false;

    ClientConnection(int fd, uint64_t id, size_t max_message_bytes)
        : fd(fd), id(id), framer(max_message_bytes) {}
};

// (connection id, one framed message)
using MessageHandler = std::function<void(uint64_t connection_id, const std::string& message)>;

// Unix-domain stream listener. Not thread-safe: all calls belong to the
// thread running the reactor.
class SocketServer {
public:
    explicit SocketServer(const std::string& socket_path,
                          size_t max_message_bytes = 64 * 1024 * 1024);
    ~SocketServer();

    // Non-copyable
    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    // Remove a stale socket file, bind, listen, make the file world-accessible
    bool init();

    // Called once per framed message, on the reactor thread
    void set_handler(MessageHandler handler);

    // Listening fd, watched for EPOLLIN by the owner
    int get_server_fd() const { return server_fd_; }

    // Accept new connection, returns client fd or -1
    int accept_connection();

    // Read and frame client data
    // Returns false if client disconnected or overflowed its buffer
    bool handle_client(int client_fd);

    // Append a framed message to the connection's send queue
    // Returns false if the connection is gone
    bool queue_message(uint64_t connection_id, const std::string& data);

    // Send pending data to client
    bool flush_client(int client_fd);

    // True while queued bytes are waiting for EPOLLOUT
    bool client_wants_write(int client_fd) const;

    // Close the fd and forget the connection
    void remove_client(int client_fd);

    // Client fd for a connection id, or -1
    int fd_for(uint64_t connection_id) const;

    bool has_client(int client_fd) const { return clients_.count(client_fd) > 0; }
    std::vector<int> client_fds() const;
    size_t client_count() const { return clients_.size(); }

    // Close every client and the listener, unlink the socket file
    void stop();

    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;
    size_t max_message_bytes_;
    int server_fd_ = -1;
    uint64_t next_connection_id_ = 1;
    std::unordered_map<int, std::unique_ptr<ClientConnection>> clients_;
    std::unordered_map<uint64_t, int> connection_fds_;
    MessageHandler handler_;
};

} // namespace plughost::ipc
