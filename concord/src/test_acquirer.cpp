// Acquirer tests: endpoint discovery, response classification and live
// fan-out against an in-process HTTP peer on 127.0.0.1.

#include <concord/concord.hpp>
#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <stdlib.h>

using namespace concord;
namespace fs = std::filesystem;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

// ═══════════════════════════════════════════════════════════════════════════
// Fixtures
// ═══════════════════════════════════════════════════════════════════════════

struct CapturedLine {
    LogLevel level;
    std::string component;
    std::string message;
};

// Collects log lines for the duration of a test
class LogCapture {
public:
    LogCapture() {
        set_log_level(LogLevel::Debug);
        set_log_sink([this](LogLevel level, const std::string& component, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back({level, component, message});
        });
    }

    ~LogCapture() {
        set_log_sink(nullptr);
        set_log_level(LogLevel::Error);
    }

    bool contains(LogLevel level, const std::string& a, const std::string& b = "") const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& l : lines_) {
            if (l.level != level) continue;
            if (l.message.find(a) == std::string::npos) continue;
            if (!b.empty() && l.message.find(b) == std::string::npos) continue;
            return true;
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::vector<CapturedLine> lines_;
};

using EnvMap = std::map<std::string, std::string>;

static EnvLookup lookup_in(const EnvMap& vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

static fs::path fresh_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static EndpointConfig endpoint(const std::string& core_name, const std::string& url,
                               const std::string& method = "POST") {
    EndpointConfig ep;
    ep.core_name = core_name;
    ep.url = url;
    ep.method = method;
    return ep;
}

// In-process HTTP peer on an ephemeral 127.0.0.1 port. One thread per
// connection so slow paths never block the others.
//
//   /ok     200 {"assertion":"approve","confidence":0.9}
//   /empty  200, empty body
//   /slow   same as /ok after 1500ms
//   /delay  same as /ok after 300ms
//   /error  500
//   /text   200, body is not JSON
//   /shape  200, JSON without assertion or confidence
class StubPeerServer {
public:
    struct Seen {
        std::string method;
        std::string path;
        std::string body;
    };

    StubPeerServer()
        : acceptor_(ioc_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
    {
        acceptor_.non_blocking(true);
        port_ = acceptor_.local_endpoint().port();
        running_ = true;
        accept_thread_ = std::thread([this] { accept_loop(); });
    }

    ~StubPeerServer() { stop(); }

    void stop() {
        if (!running_.exchange(false)) return;
        accept_thread_.join();
        beast::error_code ec;
        acceptor_.close(ec);
        for (auto& t : connections_) t.join();
        connections_.clear();
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::optional<Seen> last_request(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = seen_.rbegin(); it != seen_.rend(); ++it) {
            if (it->path == path) return *it;
        }
        return std::nullopt;
    }

private:
    asio::io_context ioc_;
    tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    std::vector<std::thread> connections_;  // Touched by the accept thread, then stop()
    mutable std::mutex mutex_;
    std::vector<Seen> seen_;

    void accept_loop() {
        while (running_) {
            tcp::socket socket(ioc_);
            beast::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec == asio::error::would_block) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }
            if (ec) continue;
            connections_.emplace_back([this, socket = std::move(socket)]() mutable {
                serve(std::move(socket));
            });
        }
    }

    // Sleep in short steps so stop() is never held up for long
    void pause_for(int ms) {
        auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
        while (running_ && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    void serve(tcp::socket socket) {
        beast::error_code ec;
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(socket, buffer, req, ec);
        if (ec) return;

        std::string path(req.target().data(), req.target().size());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            seen_.push_back({std::string(req.method_string().data(), req.method_string().size()),
                             path, req.body()});
        }

        http::response<http::string_body> res{http::status::ok, req.version()};
        res.body() = R"({"assertion":"approve","confidence":0.9})";
        if (path == "/empty") {
            res.body().clear();
        } else if (path == "/slow") {
            pause_for(1500);
        } else if (path == "/delay") {
            pause_for(300);
        } else if (path == "/error") {
            res.result(http::status::internal_server_error);
            res.body() = R"({"error":"boom"})";
        } else if (path == "/text") {
            res.body() = "definitely not json";
        } else if (path == "/shape") {
            res.body() = R"({"result":"approve","core_name":"Shape_Core"})";
        }
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);
        res.prepare_payload();

        http::write(socket, res, ec);
        socket.shutdown(tcp::socket::shutdown_send, ec);
    }
};

// A URL on a port that was just released, so connections are refused
static std::string refused_url() {
    StubPeerServer gone;
    std::string url = gone.url("/api");
    gone.stop();
    return url;
}

static const PeerOutcome& outcome_for(const CollectReport& report, const std::string& core_name) {
    for (const auto& o : report.outcomes) {
        if (o.endpoint.core_name == core_name) return o;
    }
    assert(false && "missing outcome");
    return report.outcomes.front();
}

// ═══════════════════════════════════════════════════════════════════════════
// Discovery
// ═══════════════════════════════════════════════════════════════════════════

void test_discovery_inline() {
    std::cout << "Testing discovery from inline env..." << std::endl;
    LogCapture logs;

    EnvMap vars;
    vars["CORE4_VERDICT_ENDPOINTS"] =
        R"([{"core_name":"KayGee_1.0","url":"http://a/api","method":"get"},)"
        R"( {"core_name":"Cali_X_One","url":"http://b/api","payload_key":"prompt"}])";
    AcquirerConfig config;
    config.env = lookup_in(vars);

    auto endpoints = discover_endpoints(config);
    assert(endpoints.size() == 2);
    assert(endpoints[0].core_name == "KayGee_1.0");
    assert(endpoints[0].method == "GET");
    assert(endpoints[0].payload_key == "query");
    assert(endpoints[1].method == "POST");
    assert(endpoints[1].payload_key == "prompt");

    std::cout << "  PASS" << std::endl;
}

void test_discovery_fallthrough() {
    std::cout << "Testing discovery fallthrough..." << std::endl;
    LogCapture logs;

    fs::path dir = fresh_dir("concord_test_discovery");
    fs::path list_file = dir / "endpoints.json";
    write_file(list_file, R"([{"core_name":"FromFile","url":"http://file/api"}])");

    // Broken inline JSON falls through to the file
    EnvMap vars;
    vars["CORE4_VERDICT_ENDPOINTS"] = "[{not json";
    vars["CORE4_VERDICT_ENDPOINTS_FILE"] = list_file.string();
    AcquirerConfig config;
    config.env = lookup_in(vars);
    auto endpoints = discover_endpoints(config);
    assert(endpoints.size() == 1);
    assert(endpoints[0].core_name == "FromFile");
    assert(logs.contains(LogLevel::Warn, "CORE4_VERDICT_ENDPOINTS"));

    // An empty inline list also falls through
    vars["CORE4_VERDICT_ENDPOINTS"] = "[]";
    config.env = lookup_in(vars);
    assert(discover_endpoints(config)[0].core_name == "FromFile");

    // Missing file, nothing else: built-in default
    vars["CORE4_VERDICT_ENDPOINTS_FILE"] = (dir / "missing.json").string();
    config.env = lookup_in(vars);
    endpoints = discover_endpoints(config);
    assert(endpoints.size() == 1);
    assert(endpoints[0].core_name == "UCM_Core_ECM");
    assert(endpoints[0].url == "http://localhost:8002/api/adjudicate");

    // Blank values count as unset; ECM_ENDPOINT moves the default
    EnvMap blank;
    blank["CORE4_VERDICT_ENDPOINTS"] = "   ";
    blank["ECM_ENDPOINT"] = "http://ecm.internal:9000/judge";
    config.env = lookup_in(blank);
    endpoints = discover_endpoints(config);
    assert(endpoints.size() == 1);
    assert(endpoints[0].url == "http://ecm.internal:9000/judge");

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_discovery_base_path() {
    std::cout << "Testing discovery under base path..." << std::endl;
    LogCapture logs;

    fs::path dir = fresh_dir("concord_test_base");
    AcquirerConfig config;
    config.env = lookup_in({});
    config.base_path = dir.string();

    // Only the CALI subdirectory has a list
    write_file(dir / "CALI" / "softmax_core4_endpoints.json",
               R"([{"core_name":"FromSubdir","url":"http://sub/api"}])");
    auto endpoints = discover_endpoints(config);
    assert(endpoints.size() == 1);
    assert(endpoints[0].core_name == "FromSubdir");

    // An empty list at the root does not shadow the subdirectory
    write_file(dir / "softmax_core4_endpoints.json", "[]");
    assert(discover_endpoints(config)[0].core_name == "FromSubdir");

    // A usable root list wins
    write_file(dir / "softmax_core4_endpoints.json",
               R"([{"core_name":"FromRoot","url":"http://root/api"}])");
    assert(discover_endpoints(config)[0].core_name == "FromRoot");

    // Env still outranks files
    EnvMap vars;
    vars["CORE4_VERDICT_ENDPOINTS"] = R"([{"core_name":"FromEnv","url":"http://env/api"}])";
    config.env = lookup_in(vars);
    assert(discover_endpoints(config)[0].core_name == "FromEnv");

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_parse_endpoint_list() {
    std::cout << "Testing parse_endpoint_list..." << std::endl;
    LogCapture logs;

    json data = json::parse(R"([
        {"core_name": "A"},
        5,
        {"core_name": "  ", "url": "http://blank"},
        {"core_name": "B", "url": "http://b", "method": "put"}
    ])");
    auto endpoints = parse_endpoint_list(data);
    assert(endpoints.size() == 1);
    assert(endpoints[0].core_name == "B");
    assert(endpoints[0].method == "PUT");
    assert(logs.contains(LogLevel::Warn, "skipping invalid endpoint config"));

    assert(parse_endpoint_list(json::object()).empty());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Classification
// ═══════════════════════════════════════════════════════════════════════════

void test_classify_response() {
    std::cout << "Testing classify_response..." << std::endl;
    LogCapture logs;

    EndpointConfig ep = endpoint("Peer", "http://peer/api");

    auto o = classify_response(ep, 204, "");
    assert(o.status == PeerStatus::NoPayload);
    assert(!o.verdict);

    o = classify_response(ep, 404, R"({"assertion":"approve","confidence":0.9})");
    assert(o.status == PeerStatus::HttpError);
    assert(o.http_status == 404);

    o = classify_response(ep, 200, "<html>");
    assert(o.status == PeerStatus::InvalidJson);

    o = classify_response(ep, 200, R"({"verdict":"approve"})");
    assert(o.status == PeerStatus::NonConforming);
    assert(o.detail == "non_conforming assertion: missing confidence");

    // Conforming shape that no rule can fully read
    o = classify_response(ep, 200,
        R"({"verdict":"approve","final_verdict":{"meta":{"confidence":0.5}}})");
    assert(o.status == PeerStatus::Unusable);

    o = classify_response(ep, 200, R"({"final_verdict":{"decision":"hold","inevitability":0.7}})");
    assert(o.status == PeerStatus::Verdict);
    assert(o.detail == "final_verdict");
    assert(o.verdict->verdict() == "hold");
    assert(o.verdict->core_name() == "Peer");

    assert(availability_for(PeerStatus::NoPayload) == Availability::Silent);
    assert(availability_for(PeerStatus::HttpError) == Availability::Unavailable);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Live fan-out
// ═══════════════════════════════════════════════════════════════════════════

void test_silence_vs_unavailability() {
    std::cout << "Testing silent peer vs unavailable peer..." << std::endl;
    StubPeerServer server;
    LogCapture logs;

    VerdictAcquirer acquirer({
        endpoint("Empty_Core", server.url("/empty")),
        endpoint("Slow_Core", server.url("/slow")),
        endpoint("Ok_Core", server.url("/ok")),
    });

    auto report = acquirer.gather("ship it?", std::chrono::milliseconds(500));
    assert(report.outcomes.size() == 3);
    assert(report.verdicts.size() == 1);
    assert(report.verdicts[0].core_name() == "Ok_Core");
    assert(report.verdicts[0].verdict() == "approve");

    assert(outcome_for(report, "Empty_Core").status == PeerStatus::NoPayload);
    assert(outcome_for(report, "Slow_Core").status == PeerStatus::Unreachable);
    assert(outcome_for(report, "Ok_Core").status == PeerStatus::Verdict);

    assert(logs.contains(LogLevel::Info, "Empty_Core", "no usable payload"));
    assert(logs.contains(LogLevel::Warn, "Slow_Core", "unreachable"));
    assert(!logs.contains(LogLevel::Warn, "Empty_Core"));

    auto body = server.last_request("/ok");
    assert(body.has_value());
    assert(body->method == "POST");
    assert(json::parse(body->body) == json({{"query", "ship it?"}}));

    server.stop();
    std::cout << "  PASS" << std::endl;
}

void test_failure_classes() {
    std::cout << "Testing failure classes..." << std::endl;
    StubPeerServer server;
    LogCapture logs;

    std::string refused = refused_url();
    VerdictAcquirer acquirer({
        endpoint("Error_Core", server.url("/error")),
        endpoint("Text_Core", server.url("/text")),
        endpoint("Shape_Core", server.url("/shape")),
        endpoint("Gone_Core", refused),
    });

    auto report = acquirer.gather("anything", std::chrono::milliseconds(2000));
    assert(report.verdicts.empty());
    assert(outcome_for(report, "Error_Core").status == PeerStatus::HttpError);
    assert(outcome_for(report, "Error_Core").http_status == 500);
    assert(outcome_for(report, "Text_Core").status == PeerStatus::InvalidJson);
    assert(outcome_for(report, "Shape_Core").status == PeerStatus::NonConforming);
    assert(outcome_for(report, "Gone_Core").status == PeerStatus::Unreachable);

    assert(logs.contains(LogLevel::Warn, "Error_Core", "HTTP 500"));
    assert(logs.contains(LogLevel::Warn, "Text_Core", "not JSON"));
    assert(logs.contains(LogLevel::Info, "assertion skipped", "Shape_Core"));
    assert(logs.contains(LogLevel::Warn, "Gone_Core", "unreachable"));

    // The report serializes every peer
    json j = report.to_json();
    assert(j["verdict_count"] == 0);
    assert(j["peers"].size() == 4);

    server.stop();
    std::cout << "  PASS" << std::endl;
}

void test_request_shape() {
    std::cout << "Testing request method and payload key..." << std::endl;
    StubPeerServer server;
    LogCapture logs;

    EndpointConfig get = endpoint("Get_Core", server.url("/ok"), "GET");
    EndpointConfig keyed = endpoint("Keyed_Core", server.url("/delay"));
    keyed.payload_key = "prompt";

    VerdictAcquirer acquirer({get, keyed});
    auto verdicts = acquirer.collect("route ecm", std::chrono::milliseconds(2000));
    assert(verdicts.size() == 2);
    assert(verdicts[0].core_name() == "Get_Core");
    assert(verdicts[1].core_name() == "Keyed_Core");

    auto seen_get = server.last_request("/ok");
    assert(seen_get && seen_get->method == "GET");
    auto seen_post = server.last_request("/delay");
    assert(seen_post && seen_post->method == "POST");
    assert(json::parse(seen_post->body) == json({{"prompt", "route ecm"}}));

    server.stop();
    std::cout << "  PASS" << std::endl;
}

void test_concurrent_fanout() {
    std::cout << "Testing concurrent fan-out..." << std::endl;
    StubPeerServer server;
    LogCapture logs;

    VerdictAcquirer acquirer({
        endpoint("A", server.url("/delay")),
        endpoint("B", server.url("/delay")),
        endpoint("C", server.url("/delay")),
    });

    auto start = std::chrono::steady_clock::now();
    auto report = acquirer.gather("parallel", std::chrono::milliseconds(3000));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    assert(report.verdicts.size() == 3);
    // Endpoint order is kept regardless of completion order
    assert(report.verdicts[0].core_name() == "A");
    assert(report.verdicts[2].core_name() == "C");
    assert(elapsed < 800);
    std::cout << "  (3 x 300ms peers in " << elapsed << "ms)" << std::endl;

    // Timeouts below the floor are raised to it
    VerdictAcquirer quick({endpoint("Fast", server.url("/ok"))});
    assert(quick.collect("tiny budget", std::chrono::milliseconds(1)).size() == 1);

    // No endpoints, no verdicts
    VerdictAcquirer none(std::vector<EndpointConfig>{});
    auto empty = none.gather("nobody", std::chrono::milliseconds(100));
    assert(empty.outcomes.empty());
    assert(empty.verdicts.empty());

    server.stop();
    std::cout << "  PASS" << std::endl;
}

// Refuses every worker thread after the first `allowed`
class ThreadLimitedAcquirer : public VerdictAcquirer {
public:
    using VerdictAcquirer::VerdictAcquirer;

    size_t allowed = 1;
    size_t attempts = 0;

protected:
    std::thread start_worker(std::function<void()> work) override {
        if (attempts++ >= allowed) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "thread limit reached");
        }
        return VerdictAcquirer::start_worker(std::move(work));
    }
};

void test_worker_start_failure() {
    std::cout << "Testing fan-out when threads run out..." << std::endl;
    StubPeerServer server;
    LogCapture logs;

    ThreadLimitedAcquirer acquirer({
        endpoint("First", server.url("/ok")),
        endpoint("Second", server.url("/ok")),
        endpoint("Third", server.url("/ok")),
    });

    auto report = acquirer.gather("crowded host", std::chrono::milliseconds(2000));
    assert(acquirer.attempts == 2);
    assert(report.outcomes.size() == 3);
    assert(report.verdicts.size() == 1);
    assert(report.verdicts[0].core_name() == "First");

    for (const char* name : {"Second", "Third"}) {
        const auto& o = outcome_for(report, name);
        assert(o.status == PeerStatus::Unreachable);
        assert(o.detail == "request not started");
        assert(o.endpoint.url == server.url("/ok"));
    }
    assert(logs.contains(LogLevel::Warn, "could not start worker", "thread limit reached"));

    server.stop();
    std::cout << "  PASS" << std::endl;
}

void test_invalid_utf8_context() {
    std::cout << "Testing request body with invalid UTF-8 context..." << std::endl;
    StubPeerServer server;
    LogCapture logs;

    VerdictAcquirer acquirer({endpoint("Ok_Core", server.url("/ok"))});
    auto report = acquirer.gather("deploy \xff\xfe", std::chrono::milliseconds(2000));
    assert(report.verdicts.size() == 1);
    assert(outcome_for(report, "Ok_Core").status == PeerStatus::Verdict);

    // Bad bytes go out as U+FFFD
    auto seen = server.last_request("/ok");
    assert(seen.has_value());
    assert(json::parse(seen->body)["query"] == "deploy \xEF\xBF\xBD\xEF\xBF\xBD");

    server.stop();
    std::cout << "  PASS" << std::endl;
}

void test_coordinator_with_live_peers() {
    std::cout << "Testing coordinator over live peers..." << std::endl;
    StubPeerServer server;
    LogCapture logs;

    VerdictAcquirer acquirer({
        endpoint("KayGee_1.0", server.url("/ok")),
        endpoint("UCM_Core_ECM", server.url("/error")),
        endpoint("Caleon_Genesis_1.12", server.url("/empty")),
    });
    AuditMatrix audit;
    StateHub hub;
    KeywordPeerInferrer inferrer;
    IntegrationCoordinator coordinator(acquirer, audit, hub, inferrer);

    auto advice = coordinator.consult("empirical sanity check");
    assert(advice.report.outcomes.size() == 3);
    assert(advice.signal.dominant_verdict == std::string("approve"));
    assert(audit.size() == 1);
    assert(hub.peer("KayGee_1.0")->availability == Availability::Available);
    assert(hub.peer("UCM_Core_ECM")->availability == Availability::Unavailable);
    assert(hub.peer("Caleon_Genesis_1.12")->availability == Availability::Silent);

    auto action = coordinator.interpret(advice.signal, "empirical sanity check");
    assert(action.target_peer == std::string("KayGee_1.0"));

    server.stop();
    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Concord Acquirer Tests ===" << std::endl;
    std::cout << std::endl;

    // Local stub only; a proxy would swallow 127.0.0.1 requests
    for (const char* var : {"http_proxy", "HTTP_PROXY", "https_proxy", "HTTPS_PROXY",
                            "all_proxy", "ALL_PROXY"}) {
        unsetenv(var);
    }
    set_log_level(LogLevel::Error);

    test_discovery_inline();
    test_discovery_fallthrough();
    test_discovery_base_path();
    test_parse_endpoint_list();
    test_classify_response();

    std::cout << std::endl;
    std::cout << "=== Live Peers ===" << std::endl;
    test_silence_vs_unavailability();
    test_failure_classes();
    test_request_shape();
    test_concurrent_fanout();
    test_worker_start_failure();
    test_invalid_utf8_context();
    test_coordinator_with_live_peers();

    std::cout << std::endl;
    std::cout << "=== All tests passed ===" << std::endl;
    return 0;
}
