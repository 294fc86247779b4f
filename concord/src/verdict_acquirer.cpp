#include <concord/verdict_acquirer.hpp>
#include <concord/log.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <system_error>
#include <thread>

namespace concord {

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

namespace {

bool blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::optional<json> read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    try {
        json data;
        in >> data;
        return data;
    } catch (const json::parse_error& e) {
        log_warn("acquirer", "failed to read endpoint config %s: %s", path.c_str(), e.what());
        return std::nullopt;
    }
}

int64_t millis_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

std::once_flag curl_init_flag;

void ensure_curl_global() {
    std::call_once(curl_init_flag, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            log_error("acquirer", "curl_global_init failed: %s", curl_easy_strerror(rc));
        }
    });
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Discovery
// ═══════════════════════════════════════════════════════════════════════════

std::vector<EndpointConfig> parse_endpoint_list(const json& data) {
    std::vector<EndpointConfig> endpoints;
    if (!data.is_array()) {
        log_warn("acquirer", "endpoint config must be a list; got %s", data.type_name());
        return endpoints;
    }

    for (const auto& item : data) {
        if (!item.is_object() || !has_string(item, "core_name") || !has_string(item, "url")) {
            log_warn("acquirer", "skipping invalid endpoint config %s", dump_lossy(item).c_str());
            continue;
        }
        EndpointConfig ep;
        ep.core_name = item["core_name"].get<std::string>();
        ep.url = item["url"].get<std::string>();
        if (has_string(item, "method")) ep.method = upper(item["method"].get<std::string>());
        if (has_string(item, "payload_key")) ep.payload_key = item["payload_key"].get<std::string>();
        endpoints.push_back(std::move(ep));
    }
    return endpoints;
}

std::vector<EndpointConfig> discover_endpoints(const AcquirerConfig& config) {
    auto env = [&config](const std::string& name) -> std::optional<std::string> {
        if (!config.env) return std::nullopt;
        auto value = config.env(name);
        if (!value || blank(*value)) return std::nullopt;
        return value;
    };

    if (auto raw = env(config.endpoints_env)) {
        json data = json::parse(*raw, nullptr, false);
        if (data.is_discarded()) {
            log_warn("acquirer", "invalid %s JSON, falling back", config.endpoints_env.c_str());
        } else {
            auto endpoints = parse_endpoint_list(data);
            if (!endpoints.empty()) return endpoints;
            log_warn("acquirer", "%s holds no usable endpoints, falling back",
                     config.endpoints_env.c_str());
        }
    }

    if (auto path = env(config.endpoints_file_env)) {
        if (auto data = read_json_file(*path)) {
            auto endpoints = parse_endpoint_list(*data);
            if (!endpoints.empty()) return endpoints;
        }
        log_warn("acquirer", "%s=%s yielded no endpoints, falling back",
                 config.endpoints_file_env.c_str(), path->c_str());
    }

    if (!config.base_path.empty()) {
        std::vector<std::string> roots = {config.base_path};
        if (!config.config_subdir.empty()) {
            roots.push_back(config.base_path + "/" + config.config_subdir);
        }
        for (const auto& root : roots) {
            std::string candidate = root + "/" + config.config_filename;
            auto data = read_json_file(candidate);
            if (!data) continue;
            auto endpoints = parse_endpoint_list(*data);
            if (!endpoints.empty()) return endpoints;
            log_warn("acquirer", "%s yielded no endpoints, falling back", candidate.c_str());
        }
    }

    EndpointConfig fallback;
    fallback.core_name = config.default_core_name;
    fallback.url = env(config.default_url_env).value_or(config.default_url);
    return {fallback};
}

// ═══════════════════════════════════════════════════════════════════════════
// Response classification
// ═══════════════════════════════════════════════════════════════════════════

PeerOutcome classify_response(const EndpointConfig& endpoint, long http_status,
                              const std::string& body) {
    PeerOutcome outcome;
    outcome.endpoint = endpoint;
    outcome.http_status = http_status;

    if (http_status < 200 || http_status >= 300) {
        outcome.status = PeerStatus::HttpError;
        outcome.detail = "HTTP " + std::to_string(http_status);
        log_warn("acquirer", "%s (%s) returned HTTP %ld",
                 endpoint.core_name.c_str(), endpoint.url.c_str(), http_status);
        return outcome;
    }

    if (blank(body)) {
        outcome.status = PeerStatus::NoPayload;
        outcome.detail = "no usable payload";
        log_info("acquirer", "%s answered with no usable payload (HTTP %ld, empty body)",
                 endpoint.core_name.c_str(), http_status);
        return outcome;
    }

    json payload = json::parse(body, nullptr, false);
    if (payload.is_discarded()) {
        outcome.status = PeerStatus::InvalidJson;
        outcome.detail = "body is not JSON";
        log_warn("acquirer", "%s (%s) returned invalid data: body is not JSON",
                 endpoint.core_name.c_str(), endpoint.url.c_str());
        return outcome;
    }

    ShapeObservation shape = observe(payload);
    if (!shape.conforming) {
        outcome.status = PeerStatus::NonConforming;
        outcome.detail = shape.reason;
        std::string who = endpoint.core_name;
        if (shape.hints.contains("core_name") && shape.hints["core_name"].is_string()) {
            who = shape.hints["core_name"].get<std::string>();
        }
        log_info("acquirer", "assertion skipped (%s) from %s", shape.reason.c_str(), who.c_str());
        return outcome;
    }

    auto verdict = extract_verdict(endpoint.core_name, payload);
    if (!verdict) {
        outcome.status = PeerStatus::Unusable;
        outcome.detail = "no extraction rule produced assertion and confidence";
        log_info("acquirer", "assertion skipped (%s) from %s",
                 outcome.detail.c_str(), endpoint.core_name.c_str());
        return outcome;
    }

    outcome.status = PeerStatus::Verdict;
    outcome.detail = matching_rule(payload);
    outcome.verdict = std::move(verdict);
    return outcome;
}

// ═══════════════════════════════════════════════════════════════════════════
// Acquirer
// ═══════════════════════════════════════════════════════════════════════════

VerdictAcquirer::VerdictAcquirer(AcquirerConfig config)
    : config_(std::move(config))
{
    ensure_curl_global();
}

VerdictAcquirer::VerdictAcquirer(std::vector<EndpointConfig> endpoints, AcquirerConfig config)
    : config_(std::move(config))
    , fixed_endpoints_(std::move(endpoints))
{
    ensure_curl_global();
}

std::vector<EndpointConfig> VerdictAcquirer::endpoints() const {
    if (fixed_endpoints_) return *fixed_endpoints_;
    return discover_endpoints(config_);
}

CollectReport VerdictAcquirer::gather(const std::string& decision_context,
                                      std::chrono::milliseconds timeout) {
    auto start = std::chrono::steady_clock::now();
    timeout = std::max(timeout, config_.min_timeout);

    std::vector<EndpointConfig> targets = endpoints();
    std::vector<PeerOutcome> slots(targets.size());

    // One thread per endpoint; each writes only its own slot
    std::vector<std::thread> workers;
    workers.reserve(targets.size());
    size_t started = 0;
    try {
        for (; started < targets.size(); ++started) {
            size_t i = started;
            workers.push_back(start_worker([this, &targets, &slots, &decision_context, timeout, i] {
                try {
                    slots[i] = query(targets[i], decision_context, timeout);
                } catch (const std::exception& e) {
                    slots[i].endpoint = targets[i];
                    slots[i].status = PeerStatus::Unreachable;
                    slots[i].detail = e.what();
                    log_warn("acquirer", "%s query failed: %s", targets[i].core_name.c_str(), e.what());
                }
            }));
        }
    } catch (const std::system_error& e) {
        log_warn("acquirer", "could not start worker %zu/%zu: %s",
                 started + 1, targets.size(), e.what());
    }
    for (auto& w : workers) {
        if (w.joinable()) w.join();
    }

    for (size_t i = started; i < targets.size(); ++i) {
        slots[i].endpoint = targets[i];
        slots[i].status = PeerStatus::Unreachable;
        slots[i].detail = "request not started";
        log_warn("acquirer", "%s unreachable: request not started", targets[i].core_name.c_str());
    }

    CollectReport report;
    report.outcomes = std::move(slots);
    for (const auto& outcome : report.outcomes) {
        if (outcome.verdict) report.verdicts.push_back(*outcome.verdict);
    }
    report.elapsed_ms = millis_since(start);

    log_debug("acquirer", "collected %zu/%zu verdicts in %lldms",
              report.verdicts.size(), report.outcomes.size(),
              static_cast<long long>(report.elapsed_ms));
    return report;
}

PeerOutcome VerdictAcquirer::query(const EndpointConfig& endpoint,
                                   const std::string& decision_context,
                                   std::chrono::milliseconds timeout) const {
    auto start = std::chrono::steady_clock::now();

    PeerOutcome failed;
    failed.endpoint = endpoint;
    failed.status = PeerStatus::Unreachable;

    CURL* curl = curl_easy_init();
    if (!curl) {
        failed.detail = "curl_easy_init failed";
        log_warn("acquirer", "%s unreachable: %s", endpoint.url.c_str(), failed.detail.c_str());
        return failed;
    }

    std::string request_body = dump_lossy(json{{endpoint.payload_key, decision_context}});
    std::string response_body;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    if (endpoint.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body.size()));
        if (endpoint.method != "POST") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, endpoint.method.c_str());
        }
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long http_status = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        failed.detail = curl_easy_strerror(res);
        failed.elapsed_ms = millis_since(start);
        log_warn("acquirer", "%s (%s) unreachable: %s",
                 endpoint.core_name.c_str(), endpoint.url.c_str(), failed.detail.c_str());
        return failed;
    }

    PeerOutcome outcome = classify_response(endpoint, http_status, response_body);
    outcome.elapsed_ms = millis_since(start);
    return outcome;
}

} // namespace concord
