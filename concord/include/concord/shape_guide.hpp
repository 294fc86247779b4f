#pragma once
// Shape Guide: visibility for peer payload shape (a guiderail, not a gate)
//
// Peers answer with whatever JSON they like. The guide reports whether a
// payload carries the two fields the consensus needs (an assertion string and
// a numeric confidence) and surfaces identifying fields for logging. It never
// mutates, coerces or defaults anything: callers decide whether to skip.
//
// Extraction goes through an ordered rule table. The first rule whose
// predicate matches the payload decides where assertion and confidence are
// read from, so precedence is explicit and testable on its own.

#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace concord {

// Top-level keys that may hold the assertion text
inline const std::vector<std::string>& assertion_keys() {
    static const std::vector<std::string> keys = {"assertion", "verdict", "status", "response"};
    return keys;
}

// Keys inside final_verdict that may hold the assertion text
inline const std::vector<std::string>& final_verdict_assertion_keys() {
    static const std::vector<std::string> keys = {"status", "verdict", "decision"};
    return keys;
}

// Keys inside final_verdict that may hold the confidence
inline const std::vector<std::string>& final_verdict_confidence_keys() {
    static const std::vector<std::string> keys = {"inevitability", "confidence", "probability"};
    return keys;
}

// Non-blank string at obj[key]
inline bool has_string(const json& obj, const std::string& key) {
    if (!obj.is_object()) return false;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return false;
    const auto& s = it->get_ref<const std::string&>();
    return s.find_first_not_of(" \t\r\n") != std::string::npos;
}

// Parse a JSON value as a finite number (numbers or numeric strings)
inline std::optional<double> parse_number(const json& value) {
    if (value.is_number()) {
        double d = value.get<double>();
        if (std::isnan(d)) return std::nullopt;
        return d;
    }
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        char* end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        while (end && *end && std::isspace(static_cast<unsigned char>(*end))) ++end;
        if (end == s.c_str() || (end && *end != '\0') || std::isnan(d)) return std::nullopt;
        return d;
    }
    return std::nullopt;
}

inline bool has_number(const json& obj, const std::string& key) {
    if (!obj.is_object()) return false;
    auto it = obj.find(key);
    return it != obj.end() && parse_number(*it).has_value();
}

// Object at obj[key], or null json
inline const json& child_object(const json& obj, const std::string& key) {
    static const json null_value;
    if (!obj.is_object()) return null_value;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object()) return null_value;
    return *it;
}

// ═══════════════════════════════════════════════════════════════════════════
// Observation
// ═══════════════════════════════════════════════════════════════════════════

struct ShapeObservation {
    bool conforming = false;
    std::string reason;
    json hints = json::object();   // core_name / assertion_id / timestamp passthrough
};

inline bool assertion_present(const json& payload) {
    for (const auto& key : assertion_keys()) {
        if (has_string(payload, key)) return true;
    }
    const json& fv = child_object(payload, "final_verdict");
    for (const auto& key : final_verdict_assertion_keys()) {
        if (has_string(fv, key)) return true;
    }
    return false;
}

inline bool confidence_present(const json& payload) {
    if (has_number(payload, "confidence")) return true;
    const json& fv = child_object(payload, "final_verdict");
    for (const auto& key : final_verdict_confidence_keys()) {
        if (has_number(fv, key)) return true;
    }
    return has_number(child_object(fv, "meta"), "confidence");
}

// Inspect payload shape. Pure: payload is only read.
inline ShapeObservation observe(const json& payload) {
    ShapeObservation obs;

    if (!payload.is_object()) {
        obs.reason = "non_conforming assertion: not a JSON object";
        return obs;
    }

    // Hints are surfaced even for non-conforming payloads so callers can
    // attribute the skip to a peer.
    for (const char* key : {"core_name", "assertion_id", "timestamp"}) {
        auto it = payload.find(key);
        if (it != payload.end()) {
            obs.hints[key] = *it;
        }
    }

    bool has_assertion = assertion_present(payload);
    bool has_confidence = confidence_present(payload);

    if (!has_assertion && !has_confidence) {
        obs.reason = "non_conforming assertion: missing assertion and confidence";
    } else if (!has_assertion) {
        obs.reason = "non_conforming assertion: missing assertion";
    } else if (!has_confidence) {
        obs.reason = "non_conforming assertion: missing confidence";
    } else {
        obs.conforming = true;
        obs.reason = "conforming assertion";
    }
    return obs;
}

// ═══════════════════════════════════════════════════════════════════════════
// Extraction rules
// ═══════════════════════════════════════════════════════════════════════════

struct Extraction {
    std::optional<std::string> assertion;
    std::optional<double> confidence;   // Raw, not yet clamped
    json metadata = json::object();
    std::vector<std::string> consumed;  // Keys the rule read from the payload
};

struct ExtractionRule {
    std::string name;
    std::function<bool(const json&)> matches;
    std::function<Extraction(const json&)> extract;
};

// Trimmed string value, or nullopt when absent / blank / not a scalar
inline std::optional<std::string> coerce_string(const json& value) {
    std::string text;
    if (value.is_string()) {
        text = value.get<std::string>();
    } else if (value.is_number() || value.is_boolean()) {
        text = value.dump();
    } else {
        return std::nullopt;
    }
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::nullopt;
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// First key in `keys` that yields a non-blank string
inline std::optional<std::string> first_string(const json& obj,
                                               const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        auto it = obj.find(key);
        if (it == obj.end()) continue;
        if (auto s = coerce_string(*it)) return s;
    }
    return std::nullopt;
}

// Assertion and confidence sit side by side at the top level
inline ExtractionRule flat_rule(const std::string& key, bool require_confidence_key) {
    return {
        key,
        [key, require_confidence_key](const json& p) {
            return p.contains(key) && (!require_confidence_key || p.contains("confidence"));
        },
        [key](const json& p) {
            Extraction ex;
            ex.assertion = coerce_string(p.at(key));
            if (p.contains("confidence")) {
                ex.confidence = parse_number(p.at("confidence"));
            }
            ex.consumed = {key, "confidence"};
            return ex;
        }
    };
}

inline ExtractionRule final_verdict_rule() {
    return {
        "final_verdict",
        [](const json& p) { return child_object(p, "final_verdict").is_object(); },
        [](const json& p) {
            const json& fv = p.at("final_verdict");
            Extraction ex;
            ex.assertion = first_string(fv, final_verdict_assertion_keys());
            for (const auto& key : final_verdict_confidence_keys()) {
                auto it = fv.find(key);
                if (it == fv.end()) continue;
                if (auto n = parse_number(*it)) {
                    ex.confidence = n;
                    break;
                }
            }
            if (!ex.confidence) {
                const json& meta = child_object(fv, "meta");
                if (meta.contains("confidence")) {
                    ex.confidence = parse_number(meta.at("confidence"));
                }
            }
            ex.metadata["final_verdict"] = fv;
            ex.consumed = {"final_verdict"};
            return ex;
        }
    };
}

// Default precedence, top to bottom
inline const std::vector<ExtractionRule>& default_extraction_rules() {
    static const std::vector<ExtractionRule> rules = {
        flat_rule("assertion", false),
        final_verdict_rule(),
        flat_rule("verdict", true),
        flat_rule("status", true),
        flat_rule("response", true),
    };
    return rules;
}

// Name of the first rule matching the payload (empty if none)
inline std::string matching_rule(const json& payload,
                                 const std::vector<ExtractionRule>& rules = default_extraction_rules()) {
    if (!payload.is_object()) return "";
    for (const auto& rule : rules) {
        if (rule.matches(payload)) return rule.name;
    }
    return "";
}

// Build a Verdict from a conforming payload. Returns nullopt when the first
// matching rule cannot produce both fields; nothing is ever invented.
// Extra payload fields are carried into metadata untouched.
inline std::optional<Verdict> extract_verdict(
    const std::string& fallback_core_name,
    const json& payload,
    const std::vector<ExtractionRule>& rules = default_extraction_rules())
{
    if (!payload.is_object()) return std::nullopt;

    const ExtractionRule* rule = nullptr;
    for (const auto& r : rules) {
        if (r.matches(payload)) {
            rule = &r;
            break;
        }
    }
    if (!rule) return std::nullopt;

    Extraction ex = rule->extract(payload);
    if (!ex.assertion || !ex.confidence) return std::nullopt;

    std::string core_name = fallback_core_name;
    if (has_string(payload, "core_name")) {
        core_name = *coerce_string(payload.at("core_name"));
    }

    json metadata = std::move(ex.metadata);
    for (auto it = payload.begin(); it != payload.end(); ++it) {
        const std::string& key = it.key();
        if (key == "core_name") continue;
        if (std::find(ex.consumed.begin(), ex.consumed.end(), key) != ex.consumed.end()) continue;
        metadata[key] = it.value();
    }

    return Verdict(core_name, *ex.assertion, *ex.confidence, std::move(metadata));
}

} // namespace concord
