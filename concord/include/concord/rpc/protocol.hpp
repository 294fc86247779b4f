#pragma once
// RPC Protocol: JSON-RPC 2.0 helpers and error codes

#include <nlohmann/json.hpp>
#include <initializer_list>
#include <stdexcept>
#include <string>

namespace concord::rpc {

using json = nlohmann::json;

// JSON-RPC 2.0 error codes
namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
}

// Thrown by method handlers for bad params; becomes INVALID_PARAMS
struct InvalidParams : std::runtime_error {
    using std::runtime_error::runtime_error;
};

inline json make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

inline json make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

inline bool validate_request(const json& request, std::string& error_msg) {
    if (!request.is_object()) {
        error_msg = "Request must be a JSON object";
        return false;
    }
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        error_msg = "Missing or invalid jsonrpc version";
        return false;
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        error_msg = "Missing or invalid method";
        return false;
    }
    if (request.contains("params") && !request["params"].is_object()) {
        error_msg = "params must be an object";
        return false;
    }
    return true;
}

struct RequestInfo {
    std::string method;
    json params;
    json id;
};

inline RequestInfo parse_request(const json& request) {
    return {
        request["method"].get<std::string>(),
        request.value("params", json::object()),
        request.value("id", json())
    };
}

// Empty string if all required params present, otherwise an error message
inline std::string validate_required(const json& params, std::initializer_list<const char*> required) {
    for (const char* key : required) {
        if (!params.contains(key)) {
            return std::string("Missing required parameter: ") + key;
        }
    }
    return "";
}

} // namespace concord::rpc
