#pragma once
// Verdict Acquirer: concurrent fan-out to peer endpoints
//
// collect(context, timeout) -> verdicts
//
// Endpoint discovery, first non-empty source wins:
//   1. CORE4_VERDICT_ENDPOINTS       inline JSON array of descriptors
//   2. CORE4_VERDICT_ENDPOINTS_FILE  path to a JSON file holding the same
//   3. softmax_core4_endpoints.json  under base_path, then base_path/CALI
//   4. built-in default              UCM_Core_ECM at ECM_ENDPOINT or localhost:8002
//
// One thread and one curl handle per endpoint, all bounded by the same
// timeout; the caller blocks until every request has finished or timed out.
// A peer that fails for any reason is omitted, never synthesized. The
// per-peer report keeps silence (answered, nothing usable) and
// unavailability (transport or HTTP failure) apart.

#include "shape_guide.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace concord {

struct EndpointConfig {
    std::string core_name;
    std::string url;
    std::string method = "POST";
    std::string payload_key = "query";

    json to_json() const {
        return {{"core_name", core_name}, {"url", url},
                {"method", method}, {"payload_key", payload_key}};
    }
};

// Environment lookup (injectable for tests); nullopt = unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> process_env(const std::string& name);

struct AcquirerConfig {
    std::string base_path;                                   // Empty = skip file search
    std::string config_subdir = "CALI";
    std::string config_filename = "softmax_core4_endpoints.json";
    std::string endpoints_env = "CORE4_VERDICT_ENDPOINTS";
    std::string endpoints_file_env = "CORE4_VERDICT_ENDPOINTS_FILE";
    std::string default_url_env = "ECM_ENDPOINT";
    std::string default_core_name = "UCM_Core_ECM";
    std::string default_url = "http://localhost:8002/api/adjudicate";
    std::chrono::milliseconds min_timeout{100};
    EnvLookup env = process_env;
};

// Parse a JSON array of descriptors. Invalid items are skipped with a warning;
// a non-array yields an empty list.
std::vector<EndpointConfig> parse_endpoint_list(const json& data);

// Resolve endpoints in discovery order. Never empty.
std::vector<EndpointConfig> discover_endpoints(const AcquirerConfig& config);

// ═══════════════════════════════════════════════════════════════════════════
// Collection report
// ═══════════════════════════════════════════════════════════════════════════

enum class PeerStatus : uint8_t {
    Verdict = 0,        // Usable verdict extracted
    Unreachable = 1,    // Connect failure, timeout, transport error
    HttpError = 2,      // Non-2xx status
    NoPayload = 3,      // 2xx with an empty body
    InvalidJson = 4,    // Body did not parse as JSON
    NonConforming = 5,  // Shape guide rejected the payload
    Unusable = 6,       // Conforming shape, but no rule produced both fields
};

inline const char* peer_status_name(PeerStatus s) {
    switch (s) {
        case PeerStatus::Verdict:       return "verdict";
        case PeerStatus::Unreachable:   return "unreachable";
        case PeerStatus::HttpError:     return "http_error";
        case PeerStatus::NoPayload:     return "no_payload";
        case PeerStatus::InvalidJson:   return "invalid_json";
        case PeerStatus::NonConforming: return "non_conforming";
        case PeerStatus::Unusable:      return "unusable";
    }
    return "unusable";
}

struct PeerOutcome {
    EndpointConfig endpoint;
    PeerStatus status = PeerStatus::Unreachable;
    long http_status = 0;
    std::string detail;
    int64_t elapsed_ms = 0;
    std::optional<Verdict> verdict;

    json to_json() const {
        json j = {
            {"core_name", endpoint.core_name},
            {"url", endpoint.url},
            {"status", peer_status_name(status)},
            {"http_status", http_status},
            {"detail", detail},
            {"elapsed_ms", elapsed_ms}
        };
        if (verdict) j["verdict"] = verdict->to_json();
        return j;
    }
};

struct CollectReport {
    std::vector<Verdict> verdicts;      // Endpoint order, usable only
    std::vector<PeerOutcome> outcomes;  // One per endpoint, endpoint order
    int64_t elapsed_ms = 0;

    json to_json() const {
        json peers = json::array();
        for (const auto& o : outcomes) peers.push_back(o.to_json());
        return {{"verdict_count", verdicts.size()}, {"peers", peers}, {"elapsed_ms", elapsed_ms}};
    }
};

// Anything that can produce verdicts for a context
class VerdictSource {
public:
    virtual ~VerdictSource() = default;

    virtual CollectReport gather(const std::string& decision_context,
                                 std::chrono::milliseconds timeout) = 0;

    std::vector<Verdict> collect(const std::string& decision_context,
                                 std::chrono::milliseconds timeout) {
        return gather(decision_context, timeout).verdicts;
    }
};

// Turn one completed HTTP exchange into an outcome, logging any skip
PeerOutcome classify_response(const EndpointConfig& endpoint, long http_status,
                              const std::string& body);

class VerdictAcquirer : public VerdictSource {
public:
    explicit VerdictAcquirer(AcquirerConfig config = {});

    // Fixed endpoint list, discovery skipped
    VerdictAcquirer(std::vector<EndpointConfig> endpoints, AcquirerConfig config = {});

    CollectReport gather(const std::string& decision_context,
                         std::chrono::milliseconds timeout) override;

    // Endpoints used by the next gather (rediscovered each call unless fixed)
    std::vector<EndpointConfig> endpoints() const;

    const AcquirerConfig& config() const { return config_; }

protected:
    // Starts one fan-out worker. May throw std::system_error when the
    // system refuses another thread; gather() then skips the rest.
    virtual std::thread start_worker(std::function<void()> work) {
        return std::thread(std::move(work));
    }

private:
    AcquirerConfig config_;
    std::optional<std::vector<EndpointConfig>> fixed_endpoints_;

    PeerOutcome query(const EndpointConfig& endpoint, const std::string& decision_context,
                      std::chrono::milliseconds timeout) const;
};

} // namespace concord
