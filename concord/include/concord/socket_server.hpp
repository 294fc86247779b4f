#pragma once
// Socket Server: Unix domain socket front end for concordd
//
// Newline-delimited JSON-RPC 2.0 frames, multiplexed with poll().
// Single-threaded: the daemon loop calls poll(), handles the returned
// requests, and queues responses with respond().

#include <string>
#include <vector>
#include <cstddef>
#include <unistd.h>

namespace concord {

// A complete frame received from a client
struct ClientRequest {
    int client_fd;
    std::string data;
};

struct ClientConnection {
    int fd = -1;
    std::string read_buffer;
    std::string write_buffer;
    bool wants_close = false;

    bool has_complete_message() const;
    std::string extract_message();
};

class SocketServer {
public:
    // UID-scoped socket path for multi-user safety
    static std::string default_socket_path() {
        return "/tmp/concord-" + std::to_string(getuid()) + ".sock";
    }
    static constexpr int MAX_CONNECTIONS = 32;
    static constexpr size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;  // 16MB

    SocketServer();
    explicit SocketServer(std::string socket_path);
    ~SocketServer();

    // Owns file descriptors
    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;
    SocketServer(SocketServer&&) = delete;
    SocketServer& operator=(SocketServer&&) = delete;

    bool start();
    void stop();
    bool running() const { return server_fd_ >= 0; }

    // timeout_ms: -1 = block forever, 0 = non-blocking, >0 = wait up to N ms
    std::vector<ClientRequest> poll(int timeout_ms = 100);

    // Queue a response frame; written on a later poll()
    void respond(int client_fd, const std::string& response);

    size_t connection_count() const { return connections_.size(); }
    size_t pending_writes() const;

    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;
    int server_fd_ = -1;
    std::vector<ClientConnection> connections_;

    bool create_socket();
    void accept_new_connections();
    void cleanup_closed_connections();
};

} // namespace concord
