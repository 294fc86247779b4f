#pragma once
// Peer inference: which peer does a decision context talk about?
//
// The coordinator only needs a name (or nothing). Matching is a strategy so
// it can be swapped without touching the coordinator.

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace concord {

class PeerInferrer {
public:
    virtual ~PeerInferrer() = default;

    // Target peer for the context, if one can be named
    virtual std::optional<std::string> infer(const std::string& decision_context) const = 0;
};

struct KeywordRule {
    std::vector<std::string> keywords;   // Lower case
    std::string core_name;
};

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Case-insensitive substring match; first rule with any hit wins
class KeywordPeerInferrer : public PeerInferrer {
public:
    KeywordPeerInferrer() : rules_(default_rules()) {}
    explicit KeywordPeerInferrer(std::vector<KeywordRule> rules) : rules_(std::move(rules)) {
        for (auto& rule : rules_) {
            for (auto& kw : rule.keywords) kw = to_lower(kw);
        }
    }

    static std::vector<KeywordRule> default_rules() {
        return {
            {{"kaygee", "empirical"}, "KayGee_1.0"},
            {{"ecm", "convergent"}, "UCM_Core_ECM"},
            {{"genesis"}, "Caleon_Genesis_1.12"},
            {{"cali_x"}, "Cali_X_One"},
        };
    }

    std::optional<std::string> infer(const std::string& decision_context) const override {
        std::string text = to_lower(decision_context);
        for (const auto& rule : rules_) {
            for (const auto& kw : rule.keywords) {
                if (!kw.empty() && text.find(kw) != std::string::npos) {
                    return rule.core_name;
                }
            }
        }
        return std::nullopt;
    }

    const std::vector<KeywordRule>& rules() const { return rules_; }

private:
    std::vector<KeywordRule> rules_;
};

} // namespace concord
