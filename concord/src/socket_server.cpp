#include <concord/socket_server.hpp>
#include <concord/log.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

namespace concord {

namespace {

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

} // namespace

// Framing: one JSON document per line
bool ClientConnection::has_complete_message() const {
    return read_buffer.find('\n') != std::string::npos;
}

std::string ClientConnection::extract_message() {
    size_t pos = read_buffer.find('\n');
    if (pos == std::string::npos) return "";

    std::string msg = read_buffer.substr(0, pos);
    read_buffer.erase(0, pos + 1);
    if (!msg.empty() && msg.back() == '\r') msg.pop_back();
    return msg;
}

SocketServer::SocketServer()
    : socket_path_(default_socket_path()) {}

SocketServer::SocketServer(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::start() {
    if (server_fd_ >= 0) return true;

    if (!create_socket()) {
        return false;
    }

    log_info("socket", "listening on %s", socket_path_.c_str());
    return true;
}

void SocketServer::stop() {
    for (auto& conn : connections_) {
        if (conn.fd >= 0) {
            close(conn.fd);
        }
    }
    connections_.clear();

    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
    }
}

bool SocketServer::create_socket() {
    if (socket_path_.size() >= sizeof(sockaddr_un::sun_path)) {
        log_error("socket", "socket path too long: %s", socket_path_.c_str());
        return false;
    }

    // Remove stale socket file
    unlink(socket_path_.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        log_error("socket", "socket() failed: %s", strerror(errno));
        return false;
    }
    set_nonblocking(server_fd_);

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        log_error("socket", "bind() failed: %s", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // Owner read/write only
    chmod(socket_path_.c_str(), 0600);

    if (listen(server_fd_, MAX_CONNECTIONS) < 0) {
        log_error("socket", "listen() failed: %s", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
        return false;
    }

    return true;
}

std::vector<ClientRequest> SocketServer::poll(int timeout_ms) {
    std::vector<ClientRequest> requests;

    if (server_fd_ < 0) return requests;

    std::vector<pollfd> fds;
    fds.reserve(1 + connections_.size());
    fds.push_back({server_fd_, POLLIN, 0});
    for (const auto& conn : connections_) {
        short events = POLLIN;
        if (!conn.write_buffer.empty()) {
            events |= POLLOUT;
        }
        fds.push_back({conn.fd, events, 0});
    }

    int ret = ::poll(fds.data(), fds.size(), timeout_ms);
    if (ret < 0) {
        if (errno != EINTR) {
            log_warn("socket", "poll() error: %s", strerror(errno));
        }
        return requests;
    }
    if (ret == 0) return requests;

    // Client sockets first: accepting appends to connections_
    for (size_t i = 1; i < fds.size() && i - 1 < connections_.size(); ++i) {
        auto& conn = connections_[i - 1];

        if (fds[i].revents & POLLIN) {
            char buf[4096];
            ssize_t n = read(conn.fd, buf, sizeof(buf));

            if (n > 0) {
                conn.read_buffer.append(buf, static_cast<size_t>(n));
                if (conn.read_buffer.size() > MAX_MESSAGE_SIZE) {
                    log_warn("socket", "client message too large (fd=%d), closing", conn.fd);
                    conn.wants_close = true;
                }
            } else if (n == 0 || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)) {
                conn.wants_close = true;
            }
        }

        if ((fds[i].revents & POLLOUT) && !conn.write_buffer.empty()) {
            ssize_t n = send(conn.fd, conn.write_buffer.data(), conn.write_buffer.size(), MSG_NOSIGNAL);
            if (n > 0) {
                conn.write_buffer.erase(0, static_cast<size_t>(n));
            } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                conn.wants_close = true;
            }
        }

        if (fds[i].revents & (POLLERR | POLLNVAL)) {
            conn.wants_close = true;
        }
    }

    if (fds[0].revents & POLLIN) {
        accept_new_connections();
    }

    for (auto& conn : connections_) {
        if (conn.wants_close) continue;
        while (conn.has_complete_message()) {
            std::string msg = conn.extract_message();
            if (msg.empty()) continue;
            requests.push_back({conn.fd, std::move(msg)});
        }
    }

    cleanup_closed_connections();

    return requests;
}

void SocketServer::respond(int client_fd, const std::string& response) {
    for (auto& conn : connections_) {
        if (conn.fd == client_fd) {
            conn.write_buffer += response + "\n";
            return;
        }
    }
    log_debug("socket", "dropping response for closed client fd=%d", client_fd);
}

void SocketServer::accept_new_connections() {
    while (true) {
        int client_fd = accept(server_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                log_warn("socket", "accept() error: %s", strerror(errno));
            }
            break;
        }

        if (connections_.size() >= static_cast<size_t>(MAX_CONNECTIONS)) {
            log_warn("socket", "max connections reached, rejecting fd=%d", client_fd);
            close(client_fd);
            continue;
        }

        set_nonblocking(client_fd);
        connections_.push_back({client_fd, "", "", false});
        log_debug("socket", "client connected (fd=%d, total=%zu)", client_fd, connections_.size());
    }
}

void SocketServer::cleanup_closed_connections() {
    auto it = std::remove_if(connections_.begin(), connections_.end(),
        [](const ClientConnection& conn) {
            if (conn.wants_close) {
                log_debug("socket", "client disconnected (fd=%d)", conn.fd);
                close(conn.fd);
                return true;
            }
            return false;
        });
    connections_.erase(it, connections_.end());
}

size_t SocketServer::pending_writes() const {
    size_t total = 0;
    for (const auto& conn : connections_) {
        total += conn.write_buffer.size();
    }
    return total;
}

} // namespace concord
