#pragma once
// Integration Coordinator: acquire -> advise -> record -> interpret
//
// Every collaborator is handed in by reference and must outlive the
// coordinator. The coordinator never dispatches anything: interpret()
// at most writes an attributed control intent into the hub.
//
// Audit and hub writes are independent. If the hub update is lost the
// audit entry still stands; the hub is only a live cache.

#include "audit_matrix.hpp"
#include "consensus.hpp"
#include "log.hpp"
#include "peer_inferrer.hpp"
#include "state_hub.hpp"
#include "verdict_acquirer.hpp"
#include <chrono>
#include <cstdio>
#include <optional>
#include <string>

namespace concord {

struct CoordinatorConfig {
    std::chrono::milliseconds timeout{5000};
    double command_threshold = 0.7;    // consensus above this issues a command, else a suggestion
    AdvisorConfig advisor;
};

// What the caller should do, in words. Advisory only.
struct ActionRecommendation {
    Recommendation recommendation = Recommendation::EscalateToReview;
    double advisory_confidence = 0.0;
    std::string context;
    std::string action;
    std::string justification;
    std::optional<std::string> target_peer;
    std::optional<std::string> assertion_level;   // "command" | "suggestion", when targeted

    json to_json() const {
        json j = {
            {"recommendation", recommendation_name(recommendation)},
            {"advisory_confidence", advisory_confidence},
            {"context", context},
            {"action", action},
            {"action_justification", justification},
            {"target_peer", target_peer ? json(*target_peer) : json()},
        };
        if (assertion_level) j["assertion_level"] = *assertion_level;
        return j;
    }
};

inline const char* action_label(Recommendation r) {
    switch (r) {
        case Recommendation::Proceed:              return "execute_immediately";
        case Recommendation::ProceedCautiously:    return "execute_with_monitoring";
        case Recommendation::PauseAndVerify:       return "defer_and_validate";
        case Recommendation::EscalateToReview:     return "escalate_for_manual_review";
        case Recommendation::OutlierInvestigation: return "investigate_outlier";
    }
    return "escalate_for_manual_review";
}

inline Availability availability_for(PeerStatus status) {
    switch (status) {
        case PeerStatus::Verdict:     return Availability::Available;
        case PeerStatus::Unreachable:
        case PeerStatus::HttpError:   return Availability::Unavailable;
        default:                      return Availability::Silent;
    }
}

// Full result of one advisory cycle
struct Advice {
    AdvisorySignal signal;
    CollectReport report;
    AuditEntry entry;
};

class IntegrationCoordinator {
public:
    IntegrationCoordinator(VerdictSource& source, AuditMatrix& audit, StateHub& hub,
                           const PeerInferrer& inferrer, CoordinatorConfig config = {})
        : source_(source)
        , audit_(audit)
        , hub_(hub)
        , inferrer_(inferrer)
        , config_(config)
        , advisor_(config.advisor)
    {}

    AdvisorySignal advise(const std::string& decision_context) {
        return consult(decision_context).signal;
    }

    // advise() plus the per-peer report and the audit entry written
    Advice consult(const std::string& decision_context) {
        Advice advice;

        try {
            advice.report = source_.gather(decision_context, config_.timeout);
        } catch (const std::exception& e) {
            log_error("coordinator", "verdict collection failed: %s", e.what());
            advice.report = CollectReport{};
        }

        update_hub(advice.report);

        advice.signal = advisor_.process(advice.report.verdicts);

        json peers = json::object();
        for (const auto& o : advice.report.outcomes) {
            peers[o.endpoint.core_name] = peer_status_name(o.status);
        }
        json derivation = {
            {"verdicts_used", advice.report.verdicts.size()},
            {"consensus_calculation_method", "softmax_weighted"},
            {"outlier_detection_method", "iqr"},
            {"temperature", advisor_.config().temperature},
            {"timeout_ms", config_.timeout.count()},
            {"peer_outcomes", peers}
        };
        advice.entry = audit_.record(decision_context, advice.signal,
                                     advice.report.verdicts, derivation);

        hub_.set_divergence(advice.signal.verdict_distribution.size() > 1);
        hub_.record_event({
            {"type", "advisory"},
            {"sequence", advice.entry.sequence},
            {"consensus_level", advice.signal.consensus_level},
            {"recommendation", recommendation_name(advice.signal.recommendation)},
            {"verdict_count", advice.report.verdicts.size()}
        });

        log_info("coordinator", "advisory #%llu: %s (consensus=%.4f, verdicts=%zu/%zu)",
                 static_cast<unsigned long long>(advice.entry.sequence),
                 recommendation_name(advice.signal.recommendation),
                 advice.signal.consensus_level,
                 advice.report.verdicts.size(), advice.report.outcomes.size());
        return advice;
    }

    ActionRecommendation interpret(const AdvisorySignal& advisory,
                                   const std::string& decision_context) {
        ActionRecommendation rec;
        rec.recommendation = advisory.recommendation;
        rec.advisory_confidence = advisory.consensus_level;
        rec.context = decision_context;
        rec.action = action_label(advisory.recommendation);
        rec.justification = justification(advisory);

        rec.target_peer = inferrer_.infer(decision_context);
        if (rec.target_peer) {
            rec.assertion_level = advisory.consensus_level > config_.command_threshold
                                      ? "command" : "suggestion";
            hub_.record_control({
                {"source", "concord"},
                {"target", *rec.target_peer},
                {"command", rec.action},
                {"justification", rec.justification},
                {"assertion_level", *rec.assertion_level},
                {"params", {
                    {"advisory_consensus", advisory.consensus_level},
                    {"advisory_recommendation", recommendation_name(advisory.recommendation)},
                    {"context", decision_context}
                }}
            });
        }
        return rec;
    }

    // Store a control packet as-is; dispatch is someone else's job
    json submit_control(const json& packet) {
        ControlLogEntry entry = hub_.record_control(packet);
        return {{"status", "recorded"}, {"timestamp", entry.timestamp}};
    }

    json advisory_statistics() const {
        AuditSummary summary = audit_.summarize();
        return {
            {"audit_summary", summary.to_json()},
            {"total_advisories_recorded", summary.total_retained},
            {"consensus_distribution", summary.by_consensus_bucket},
            {"recommendation_history", summary.by_recommendation},
            {"advisor_state", "stateless_deterministic"}
        };
    }

    const CoordinatorConfig& config() const { return config_; }
    const ConsensusAdvisor& advisor() const { return advisor_; }

private:
    VerdictSource& source_;
    AuditMatrix& audit_;
    StateHub& hub_;
    const PeerInferrer& inferrer_;
    CoordinatorConfig config_;
    ConsensusAdvisor advisor_;

    void update_hub(const CollectReport& report) {
        for (const auto& o : report.outcomes) {
            // A verdict may rename its peer; the hub tracks the name it reported
            if (o.verdict) {
                hub_.record_assertion(o.verdict->core_name(), o.verdict->to_json());
            } else {
                hub_.update_peer(o.endpoint.core_name, availability_for(o.status));
            }
        }
    }

    static std::string justification(const AdvisorySignal& advisory) {
        char buf[128];
        switch (advisory.recommendation) {
            case Recommendation::Proceed:
                return "High consensus across peers";
            case Recommendation::ProceedCautiously:
                return "Moderate consensus, proceed with observation";
            case Recommendation::PauseAndVerify:
                std::snprintf(buf, sizeof(buf), "Weak consensus (%.2f), validate inputs",
                              advisory.consensus_level);
                return buf;
            case Recommendation::EscalateToReview:
                return advisory.softmax_probabilities.empty()
                           ? "No peer verdicts received"
                           : "Significant disagreement among peers";
            case Recommendation::OutlierInvestigation:
                return "Statistical outlier detected: " +
                       advisory.outlier_detected.value_or("unknown");
        }
        return "";
    }
};

} // namespace concord
