#pragma once
// RPC Handler: JSON-RPC 2.0 dispatch for the advisory daemon
//
// One method table, filled at construction. Handlers return the result
// object or throw InvalidParams; everything else thrown becomes
// INTERNAL_ERROR. Handlers never see malformed frames.

#include "protocol.hpp"
#include "../coordinator.hpp"
#include "../log.hpp"
#include "../version.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace concord::rpc {

struct HandlerContext {
    std::string socket_path;
};

using MethodHandler = std::function<json(const json& params)>;

class Handler {
public:
    Handler(IntegrationCoordinator& coordinator, AuditMatrix& audit, StateHub& hub,
            HandlerContext context = {})
        : coordinator_(coordinator)
        , audit_(audit)
        , hub_(hub)
        , context_(std::move(context))
        , start_time_(std::chrono::steady_clock::now())
    {
        register_methods();
    }

    // Process a JSON-RPC request string, return response string
    std::string handle(const std::string& request_str) {
        try {
            auto request = json::parse(request_str);
            // Invalid UTF-8 anywhere in the payload is replaced, never thrown
            return dump_lossy(handle_request(request));
        } catch (const json::parse_error& e) {
            return dump_lossy(make_error(json(), error::PARSE_ERROR,
                                         std::string("JSON parse error: ") + e.what()));
        } catch (const std::exception& e) {
            return dump_lossy(make_error(json(), error::INTERNAL_ERROR,
                                         std::string("Internal error: ") + e.what()));
        }
    }

    json handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);
        auto it = methods_.find(info.method);
        if (it == methods_.end()) {
            return make_error(info.id, error::METHOD_NOT_FOUND, "Unknown method: " + info.method);
        }

        try {
            return make_result(info.id, it->second(info.params));
        } catch (const InvalidParams& e) {
            return make_error(info.id, error::INVALID_PARAMS, e.what());
        } catch (const json::exception& e) {
            return make_error(info.id, error::INVALID_PARAMS, std::string("Bad parameter: ") + e.what());
        } catch (const std::exception& e) {
            log_error("rpc", "%s failed: %s", info.method.c_str(), e.what());
            return make_error(info.id, error::INTERNAL_ERROR,
                              std::string("Method failed: ") + e.what());
        }
    }

    std::vector<std::string> methods() const {
        std::vector<std::string> names;
        for (const auto& [name, _] : methods_) names.push_back(name);
        std::sort(names.begin(), names.end());
        return names;
    }

private:
    IntegrationCoordinator& coordinator_;
    AuditMatrix& audit_;
    StateHub& hub_;
    HandlerContext context_;
    std::chrono::steady_clock::time_point start_time_;
    std::unordered_map<std::string, MethodHandler> methods_;

    void register_methods() {
        methods_["version"] = [this](const json&) { return method_version(); };
        methods_["advise"] = [this](const json& p) { return method_advise(p); };
        methods_["audit/summary"] = [this](const json&) { return method_audit_summary(); };
        methods_["audit/snapshot"] = [this](const json& p) { return method_audit_snapshot(p); };
        methods_["audit/verify"] = [this](const json&) { return method_audit_verify(); };
        methods_["hub/snapshot"] = [this](const json&) { return hub_.snapshot(); };
        methods_["hub/events"] = [this](const json& p) { return method_hub_events(p); };
        methods_["hub/control"] = [this](const json& p) { return method_hub_control(p); };
    }

    json method_version() {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time_).count();
        return {
            {"name", "concord"},
            {"version", CONCORD_VERSION},
            {"protocol", {
                {"major", CONCORD_PROTOCOL_VERSION_MAJOR},
                {"minor", CONCORD_PROTOCOL_VERSION_MINOR}
            }},
            {"audit_format", CONCORD_AUDIT_FORMAT},
            {"socket_path", context_.socket_path},
            {"uptime_seconds", uptime}
        };
    }

    json method_advise(const json& params) {
        std::string missing = validate_required(params, {"context"});
        if (!missing.empty()) throw InvalidParams(missing);
        if (!params["context"].is_string()) throw InvalidParams("context must be a string");

        std::string context = params["context"].get<std::string>();
        bool interpret = params.value("interpret", true);

        Advice advice = coordinator_.consult(context);
        json result = advice.signal.to_json();
        result["audit_sequence"] = advice.entry.sequence;
        result["peers"] = advice.report.to_json()["peers"];
        if (interpret) {
            result["action"] = coordinator_.interpret(advice.signal, context).to_json();
        }
        return result;
    }

    json method_audit_summary() {
        return coordinator_.advisory_statistics();
    }

    json method_audit_snapshot(const json& params) {
        std::vector<AuditEntry> entries;
        if (params.contains("limit")) {
            if (!params["limit"].is_number_unsigned()) {
                throw InvalidParams("limit must be a non-negative integer");
            }
            entries = audit_.recent(params["limit"].get<size_t>());
        } else {
            entries = audit_.snapshot();
        }
        json out = json::array();
        for (const auto& e : entries) out.push_back(e.to_json());
        return out;
    }

    json method_audit_verify() {
        ChainReport report = audit_.verify_chain();
        return {
            {"ok", report.ok},
            {"first_bad_sequence", report.ok ? json() : json(report.first_bad_sequence)},
            {"retained", audit_.size()}
        };
    }

    json method_hub_events(const json& params) {
        Timestamp since = 0;
        if (params.contains("since")) {
            if (!params["since"].is_number()) throw InvalidParams("since must be a number");
            since = params["since"].get<Timestamp>();
        }
        return json(hub_.events_since(since));
    }

    json method_hub_control(const json& params) {
        if (!params.is_object() || params.empty()) {
            throw InvalidParams("control packet must be a non-empty object");
        }
        return coordinator_.submit_control(params);
    }
};

} // namespace concord::rpc
