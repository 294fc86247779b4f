#pragma once
// Consensus Advisor: deterministic aggregation of peer verdicts
//
// process(verdicts) -> AdvisorySignal
//
// Stateless and pure. Softmax over confidences gives each peer a weight;
// the verdict of the most confident peer is dominant; consensus combines the
// softmax mass behind the dominant verdict with the plain agreement rate.
// An IQR fence flags a statistically anomalous confidence. The resulting
// recommendation is advisory only, never an action.
//
// Same ordered input, same output, bit for bit.

#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace concord {

enum class ConfidenceClustering : uint8_t {
    Unanimous = 0,   // Same verdict everywhere, confidences within a narrow band
    Strong = 1,
    Moderate = 2,
    Fragmented = 3,
    Conflicted = 4,  // Verdicts split, confidences comparable
};

enum class Recommendation : uint8_t {
    Proceed = 0,
    ProceedCautiously = 1,
    PauseAndVerify = 2,
    EscalateToReview = 3,
    OutlierInvestigation = 4,
};

inline const char* clustering_name(ConfidenceClustering c) {
    switch (c) {
        case ConfidenceClustering::Unanimous:  return "unanimous";
        case ConfidenceClustering::Strong:     return "strong";
        case ConfidenceClustering::Moderate:   return "moderate";
        case ConfidenceClustering::Fragmented: return "fragmented";
        case ConfidenceClustering::Conflicted: return "conflicted";
    }
    return "fragmented";
}

inline const char* recommendation_name(Recommendation r) {
    switch (r) {
        case Recommendation::Proceed:              return "PROCEED";
        case Recommendation::ProceedCautiously:    return "PROCEED_CAUTIOUSLY";
        case Recommendation::PauseAndVerify:       return "PAUSE_AND_VERIFY";
        case Recommendation::EscalateToReview:     return "ESCALATE_TO_REVIEW";
        case Recommendation::OutlierInvestigation: return "OUTLIER_INVESTIGATION";
    }
    return "ESCALATE_TO_REVIEW";
}

inline std::optional<Recommendation> recommendation_from_name(const std::string& name) {
    for (auto r : {Recommendation::Proceed, Recommendation::ProceedCautiously,
                   Recommendation::PauseAndVerify, Recommendation::EscalateToReview,
                   Recommendation::OutlierInvestigation}) {
        if (name == recommendation_name(r)) return r;
    }
    return std::nullopt;
}

// Consensus bucket used by audit summaries
inline const char* consensus_bucket(double consensus_level) {
    if (consensus_level >= 0.90) return "unanimous";
    if (consensus_level >= 0.75) return "strong";
    if (consensus_level >= 0.60) return "moderate";
    if (consensus_level >= 0.40) return "fragmented";
    return "conflicted";
}

// Fixed thresholds. Depends on nothing but its two arguments.
inline Recommendation recommend(double consensus_level, bool outlier_detected) {
    if (outlier_detected && consensus_level >= 0.80) {
        return Recommendation::OutlierInvestigation;
    }
    if (consensus_level >= 0.90) return Recommendation::Proceed;
    if (consensus_level >= 0.75) return Recommendation::ProceedCautiously;
    if (consensus_level >= 0.60) return Recommendation::PauseAndVerify;
    return Recommendation::EscalateToReview;
}

struct AdvisorConfig {
    double temperature = 1.0;         // Softmax temperature (>0)
    double mass_weight = 0.6;         // Share of consensus from softmax mass; rest from agreement
    double iqr_multiplier = 1.5;      // Tukey fence width
    double min_iqr = 0.05;            // IQR floor so tight clusters don't flag noise
    double small_sample_gap = 0.5;    // n==3: distance from median that counts as extreme
    double small_sample_band = 0.1;   // n==3: the other two must sit this close together
    double unanimous_band = 0.10;     // max-min spread allowed for "unanimous"
    double tight_cv = 0.25;           // Coefficient of variation thresholds
    double loose_cv = 0.50;
};

constexpr size_t MAX_EXPLANATION_LENGTH = 300;

// Immutable advisory. Computed fresh per call; carries no identity.
struct AdvisorySignal {
    std::optional<std::string> dominant_verdict;
    std::vector<std::pair<std::string, double>> softmax_probabilities;  // Input order
    std::optional<std::string> outlier_detected;
    ConfidenceClustering confidence_clustering = ConfidenceClustering::Fragmented;
    double consensus_level = 0.0;
    Recommendation recommendation = Recommendation::EscalateToReview;

    std::vector<double> raw_confidences;
    std::map<std::string, int> verdict_distribution;
    double agreement_rate = 0.0;
    double effective_entropy = 0.0;   // 0 = all mass on one peer, 1 = uniform
    std::string explanation;

    double probability_sum() const {
        double sum = 0.0;
        for (const auto& [_, p] : softmax_probabilities) sum += p;
        return sum;
    }

    json to_json() const {
        json probs = json::array();
        for (const auto& [core, p] : softmax_probabilities) {
            probs.push_back({{"core_name", core}, {"probability", p}});
        }
        json distribution = json::object();
        for (const auto& [verdict, count] : verdict_distribution) {
            distribution[verdict] = count;
        }
        return {
            {"dominant_verdict", dominant_verdict ? json(*dominant_verdict) : json()},
            {"softmax_probabilities", probs},
            {"outlier_detected", outlier_detected ? json(*outlier_detected) : json()},
            {"confidence_clustering", clustering_name(confidence_clustering)},
            {"consensus_level", round4(consensus_level)},
            {"recommendation", recommendation_name(recommendation)},
            {"raw_confidences", raw_confidences},
            {"verdict_distribution", distribution},
            {"agreement_rate", round4(agreement_rate)},
            {"effective_entropy", round4(effective_entropy)},
            {"explanation", explanation}
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Statistics helpers
// ═══════════════════════════════════════════════════════════════════════════

// Temperatures below this are raised to it; smaller ones only push the
// exponent arguments toward overflow without sharpening the result further.
constexpr double MIN_TEMPERATURE = 1e-6;

// Numerically stable softmax. Identical inputs give an exactly uniform result.
// Non-finite inputs count as 0; a non-positive or non-finite temperature means 1.
inline std::vector<double> softmax(std::vector<double> values, double temperature = 1.0) {
    std::vector<double> out(values.size(), 0.0);
    if (values.empty()) return out;
    for (auto& v : values) {
        if (!std::isfinite(v)) v = 0.0;
    }

    auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    if (*lo == *hi) {
        std::fill(out.begin(), out.end(), 1.0 / static_cast<double>(values.size()));
        return out;
    }

    double t = (temperature > 0.0 && std::isfinite(temperature))
                   ? std::max(temperature, MIN_TEMPERATURE) : 1.0;
    double shift = *hi / t;
    double sum = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        out[i] = std::exp(values[i] / t - shift);
        sum += out[i];
    }
    for (auto& p : out) p /= sum;
    return out;
}

// Linear-interpolated percentile over a sorted sample, p in [0,1]
inline double percentile_sorted(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    double pos = p * static_cast<double>(sorted.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(pos));
    size_t upper = std::min(lower + 1, sorted.size() - 1);
    double frac = pos - static_cast<double>(lower);
    return sorted[lower] + (sorted[upper] - sorted[lower]) * frac;
}

// Normalized Shannon entropy (log2), 0 for a single outcome
inline double normalized_entropy(const std::vector<double>& probs) {
    size_t nonzero = 0;
    double h = 0.0;
    for (double p : probs) {
        if (p > 0.0) {
            h -= p * std::log2(p);
            ++nonzero;
        }
    }
    if (nonzero <= 1) return 0.0;
    double max_h = std::log2(static_cast<double>(nonzero));
    return std::clamp(h / max_h, 0.0, 1.0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Advisor
// ═══════════════════════════════════════════════════════════════════════════

class ConsensusAdvisor {
public:
    explicit ConsensusAdvisor(AdvisorConfig config = {}) : config_(config) {}

    const AdvisorConfig& config() const { return config_; }

    AdvisorySignal process(const std::vector<Verdict>& verdicts) const {
        AdvisorySignal signal;

        if (verdicts.empty()) {
            signal.consensus_level = 0.0;
            signal.recommendation = Recommendation::EscalateToReview;
            signal.confidence_clustering = ConfidenceClustering::Fragmented;
            signal.explanation = "No peer verdicts received; no consensus possible";
            return signal;
        }

        const size_t n = verdicts.size();
        std::vector<double> confidences;
        confidences.reserve(n);
        for (const auto& v : verdicts) confidences.push_back(clamp_confidence(v.confidence()));

        auto probs = softmax(confidences, config_.temperature);
        signal.raw_confidences = confidences;
        signal.softmax_probabilities.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            signal.softmax_probabilities.emplace_back(verdicts[i].core_name(), probs[i]);
        }

        // Highest confidence wins; ties go to the earliest entry
        size_t dominant_idx = 0;
        for (size_t i = 1; i < n; ++i) {
            if (confidences[i] > confidences[dominant_idx]) dominant_idx = i;
        }
        const std::string& dominant = verdicts[dominant_idx].verdict();
        signal.dominant_verdict = dominant;

        double dominant_mass = 0.0;
        size_t agreeing = 0;
        for (size_t i = 0; i < n; ++i) {
            signal.verdict_distribution[verdicts[i].verdict()] += 1;
            if (verdicts[i].verdict() == dominant) {
                dominant_mass += probs[i];
                ++agreeing;
            }
        }
        signal.agreement_rate = static_cast<double>(agreeing) / static_cast<double>(n);
        signal.effective_entropy = normalized_entropy(probs);

        double mass_weight = std::clamp(config_.mass_weight, 0.0, 1.0);
        double consensus = mass_weight * dominant_mass +
                           (1.0 - mass_weight) * signal.agreement_rate;
        signal.consensus_level = std::clamp(round4(consensus), 0.0, 1.0);

        if (auto idx = detect_outlier(confidences)) {
            signal.outlier_detected = verdicts[*idx].core_name();
        }

        signal.confidence_clustering = classify_clustering(confidences, signal.agreement_rate);
        signal.recommendation = recommend(signal.consensus_level, signal.outlier_detected.has_value());
        signal.explanation = explain(signal);
        return signal;
    }

    // Index of the flagged confidence, if any.
    // n >= 4: Tukey fences on the IQR (with a floor). The value furthest
    // outside a fence is reported; ties go to the earliest entry.
    // n == 3: flagged only when one value sits at least small_sample_gap from
    // the median while the other two agree within small_sample_band.
    // n < 3: never.
    std::optional<size_t> detect_outlier(const std::vector<double>& confidences) const {
        const size_t n = confidences.size();
        if (n < 3) return std::nullopt;

        std::vector<double> sorted = confidences;
        std::sort(sorted.begin(), sorted.end());

        if (n == 3) {
            double median = sorted[1];
            size_t far_idx = 0;
            double far_dist = -1.0;
            for (size_t i = 0; i < n; ++i) {
                double d = std::fabs(confidences[i] - median);
                if (d > far_dist) {
                    far_dist = d;
                    far_idx = i;
                }
            }
            double others_lo = 2.0, others_hi = -1.0;
            for (size_t i = 0; i < n; ++i) {
                if (i == far_idx) continue;
                others_lo = std::min(others_lo, confidences[i]);
                others_hi = std::max(others_hi, confidences[i]);
            }
            if (far_dist >= config_.small_sample_gap &&
                others_hi - others_lo <= config_.small_sample_band) {
                return far_idx;
            }
            return std::nullopt;
        }

        double q1 = percentile_sorted(sorted, 0.25);
        double q3 = percentile_sorted(sorted, 0.75);
        double iqr = std::max(q3 - q1, config_.min_iqr);
        double lower = q1 - config_.iqr_multiplier * iqr;
        double upper = q3 + config_.iqr_multiplier * iqr;

        std::optional<size_t> flagged;
        double worst = 0.0;
        for (size_t i = 0; i < n; ++i) {
            double excess = 0.0;
            if (confidences[i] < lower) excess = lower - confidences[i];
            else if (confidences[i] > upper) excess = confidences[i] - upper;
            if (excess > worst) {
                worst = excess;
                flagged = i;
            }
        }
        return flagged;
    }

    ConfidenceClustering classify_clustering(const std::vector<double>& confidences,
                                             double agreement_rate) const {
        if (confidences.empty()) return ConfidenceClustering::Fragmented;

        auto [lo, hi] = std::minmax_element(confidences.begin(), confidences.end());
        double spread = *hi - *lo;
        double mean = std::accumulate(confidences.begin(), confidences.end(), 0.0) /
                      static_cast<double>(confidences.size());
        double var = 0.0;
        for (double c : confidences) var += (c - mean) * (c - mean);
        var /= static_cast<double>(confidences.size());
        double cv = mean > 0.0 ? std::sqrt(var) / mean : 0.0;

        if (agreement_rate >= 1.0) {
            if (spread <= config_.unanimous_band) return ConfidenceClustering::Unanimous;
            if (cv < config_.tight_cv) return ConfidenceClustering::Strong;
            if (cv < config_.loose_cv) return ConfidenceClustering::Moderate;
            return ConfidenceClustering::Fragmented;
        }

        if (agreement_rate <= 0.5 && cv < config_.tight_cv) return ConfidenceClustering::Conflicted;
        if (agreement_rate >= 0.75 && cv < config_.tight_cv) return ConfidenceClustering::Strong;
        if (agreement_rate > 0.5 && cv < config_.loose_cv) return ConfidenceClustering::Moderate;
        return ConfidenceClustering::Fragmented;
    }

private:
    AdvisorConfig config_;

    static std::string percent(double v) {
        std::ostringstream ss;
        ss.setf(std::ios::fixed);
        ss.precision(1);
        ss << v * 100.0 << "%";
        return ss.str();
    }

    static std::string explain(const AdvisorySignal& s) {
        std::vector<std::string> parts;

        double c = s.consensus_level;
        if (c >= 0.95) parts.push_back("Near-unanimous agreement");
        else if (c >= 0.80) parts.push_back("Strong weighted consensus");
        else if (c >= 0.60) parts.push_back("Moderate consensus");
        else if (c >= 0.40) parts.push_back("Fragmented alignment");
        else parts.push_back("Deep disagreement detected");

        parts.push_back("dominant: " + s.dominant_verdict.value_or("none") + " (" + percent(c) + ")");

        // Distribution summary: all entries when short, top two otherwise
        std::string dist;
        if (s.verdict_distribution.size() <= 3) {
            for (const auto& [verdict, count] : s.verdict_distribution) {
                if (!dist.empty()) dist += ", ";
                dist += verdict + ":" + std::to_string(count);
            }
        } else {
            std::vector<std::pair<std::string, int>> top(s.verdict_distribution.begin(),
                                                         s.verdict_distribution.end());
            std::stable_sort(top.begin(), top.end(),
                             [](const auto& a, const auto& b) { return a.second > b.second; });
            dist = top[0].first + ":" + std::to_string(top[0].second) + ", " +
                   top[1].first + ":" + std::to_string(top[1].second) +
                   " (+" + std::to_string(top.size() - 2) + " more)";
        }
        parts.push_back("votes: " + dist);
        parts.push_back(std::string("clustering: ") + clustering_name(s.confidence_clustering));

        if (s.effective_entropy < 0.2) parts.push_back("low decision entropy");
        else if (s.effective_entropy > 0.7) parts.push_back("high uncertainty");

        if (s.outlier_detected) parts.push_back("statistical outlier: " + *s.outlier_detected);

        std::string out;
        for (const auto& p : parts) {
            if (!out.empty()) out += "; ";
            out += p;
        }
        if (out.size() > MAX_EXPLANATION_LENGTH) out.resize(MAX_EXPLANATION_LENGTH);
        return out;
    }
};

} // namespace concord
