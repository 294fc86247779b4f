// concordd - advisory consensus daemon
//
// Hosts one coordinator, audit matrix and state hub behind a Unix socket
// speaking newline-delimited JSON-RPC 2.0.
//
// Options:
//   --socket-path PATH   Unix socket path (default: /tmp/concord-UID.sock,
//                        or $CONCORD_SOCKET_PATH)
//   --audit-path PATH    JSONL audit trail (default: $CONCORD_AUDIT_PATH,
//                        otherwise memory only)
//   --capacity N         Retained audit entries (default: 1000)
//   --timeout-ms N       Per-peer request timeout (default: 5000)
//   --base-path PATH     Root searched for softmax_core4_endpoints.json
//   --temperature T      Softmax temperature (default: 1.0)
//   --verbose            Debug logging
//
// A raw "shutdown" line on the socket stops the daemon.

#include <concord/concord.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace concord;

static std::atomic<bool> daemon_running{true};

void daemon_signal_handler(int sig) {
    (void)sig;
    daemon_running = false;
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  --socket-path PATH  Unix socket path (default: " << SocketServer::default_socket_path() << ")\n"
              << "  --audit-path PATH   JSONL audit trail (default: memory only)\n"
              << "  --capacity N        Retained audit entries (default: 1000)\n"
              << "  --timeout-ms N      Per-peer request timeout in ms (default: 5000)\n"
              << "  --base-path PATH    Root searched for softmax_core4_endpoints.json\n"
              << "  --temperature T     Softmax temperature (default: 1.0)\n"
              << "  --verbose           Debug logging\n"
              << "  --version           Print version and exit\n"
              << "  --help              Show this help message\n";
}

// Method name for request logging, without a full parse
static std::string peek_method(const std::string& data) {
    auto method_pos = data.find("\"method\":");
    if (method_pos == std::string::npos) return "unknown";
    auto start = data.find('"', method_pos + 9);
    if (start == std::string::npos) return "unknown";
    auto end = data.find('"', start + 1);
    if (end == std::string::npos) return "unknown";
    return data.substr(start + 1, end - start - 1);
}

int run_daemon(const std::string& socket_path, AuditConfig audit_config,
               AcquirerConfig acquirer_config, CoordinatorConfig coordinator_config) {
    AuditMatrix audit(std::move(audit_config));
    StateHub hub;
    VerdictAcquirer acquirer(std::move(acquirer_config));
    KeywordPeerInferrer inferrer;
    IntegrationCoordinator coordinator(acquirer, audit, hub, inferrer, coordinator_config);

    SocketServer server(socket_path);
    if (!server.start()) {
        log_error("daemon", "failed to start socket server on %s", socket_path.c_str());
        return 1;
    }

    rpc::Handler handler(coordinator, audit, hub, rpc::HandlerContext{socket_path});

    std::signal(SIGTERM, daemon_signal_handler);
    std::signal(SIGINT, daemon_signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    std::string endpoints;
    for (const auto& ep : acquirer.endpoints()) {
        if (!endpoints.empty()) endpoints += ", ";
        endpoints += ep.core_name;
    }
    log_info("daemon", "started (version=%s, socket=%s, pid=%d, audit=%s, peers=[%s])",
             CONCORD_VERSION, socket_path.c_str(), static_cast<int>(getpid()),
             audit.path().empty() ? "memory" : audit.path().c_str(), endpoints.c_str());

    size_t total_requests = 0;

    while (daemon_running) {
        auto requests = server.poll(100);

        for (const auto& req : requests) {
            total_requests++;

            if (req.data == "shutdown") {
                log_info("daemon", "shutdown requested");
                server.respond(req.client_fd,
                    json{{"status", "shutting_down"}, {"version", CONCORD_VERSION}}.dump());
                daemon_running = false;
                continue;
            }

            std::string method = peek_method(req.data);
            auto start = std::chrono::steady_clock::now();
            std::string response = handler.handle(req.data);
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();

            log_debug("rpc", "request #%zu fd=%d method=%s handled in %lldms (resp_len=%zu)",
                      total_requests, req.client_fd, method.c_str(),
                      static_cast<long long>(elapsed), response.size());

            server.respond(req.client_fd, response);
        }
    }

    // Flush queued responses (the shutdown acknowledgement included)
    for (int i = 0; i < 10 && server.pending_writes() > 0; ++i) {
        server.poll(10);
    }
    server.stop();

    log_info("daemon", "stopped (requests=%zu, audit entries=%zu)", total_requests, audit.size());
    return 0;
}

int main(int argc, char* argv[]) {
    std::string socket_path = process_env("CONCORD_SOCKET_PATH").value_or(SocketServer::default_socket_path());

    AuditConfig audit_config;
    audit_config.path = process_env("CONCORD_AUDIT_PATH").value_or("");
    AcquirerConfig acquirer_config;
    CoordinatorConfig coordinator_config;

    try {
        for (int i = 1; i < argc; ++i) {
            if (strcmp(argv[i], "--socket-path") == 0 && i + 1 < argc) {
                socket_path = argv[++i];
            } else if (strcmp(argv[i], "--audit-path") == 0 && i + 1 < argc) {
                audit_config.path = argv[++i];
            } else if (strcmp(argv[i], "--capacity") == 0 && i + 1 < argc) {
                int capacity = std::stoi(argv[++i]);
                if (capacity <= 0) throw std::invalid_argument("--capacity must be positive");
                audit_config.capacity = static_cast<size_t>(capacity);
            } else if (strcmp(argv[i], "--timeout-ms") == 0 && i + 1 < argc) {
                coordinator_config.timeout = std::chrono::milliseconds(std::stol(argv[++i]));
            } else if (strcmp(argv[i], "--base-path") == 0 && i + 1 < argc) {
                acquirer_config.base_path = argv[++i];
            } else if (strcmp(argv[i], "--temperature") == 0 && i + 1 < argc) {
                double t = std::stod(argv[++i]);
                if (!(t > 0.0)) throw std::invalid_argument("--temperature must be positive");
                coordinator_config.advisor.temperature = t;
            } else if (strcmp(argv[i], "--verbose") == 0) {
                set_log_level(LogLevel::Debug);
            } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
                std::cout << "concordd " << CONCORD_VERSION << " (protocol "
                          << CONCORD_PROTOCOL_VERSION_MAJOR << "."
                          << CONCORD_PROTOCOL_VERSION_MINOR << ")\n";
                return 0;
            } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    return run_daemon(socket_path, std::move(audit_config),
                      std::move(acquirer_config), coordinator_config);
}
