#include <concord/concord.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace concord;
namespace fs = std::filesystem;

static bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

static std::vector<Verdict> scenario_a() {
    return {
        Verdict("KayGee", "approve", 0.94),
        Verdict("ECM", "approve", 0.78),
        Verdict("Caleon", "reject", 0.91),
    };
}

static std::vector<Verdict> scenario_b() {
    return {
        Verdict("KayGee_1.0", "approve", 0.95),
        Verdict("UCM_Core_ECM", "approve", 0.93),
        Verdict("Caleon_Genesis_1.12", "approve", 0.91),
        Verdict("Cali_X_One", "approve", 0.97),
    };
}

static std::vector<Verdict> scenario_c() {
    return {
        Verdict("KayGee_1.0", "approve", 0.90),
        Verdict("UCM_Core_ECM", "approve", 0.91),
        Verdict("Caleon_Genesis_1.12", "approve", 0.89),
        Verdict("Cali_X_One", "approve", 0.12),
    };
}

static fs::path fresh_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static size_t count_lines(const fs::path& path) {
    std::ifstream in(path);
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) ++n;
    }
    return n;
}

// ═══════════════════════════════════════════════════════════════════════════
// Shape guide and extraction
// ═══════════════════════════════════════════════════════════════════════════

void test_shape_guide() {
    std::cout << "Testing ShapeGuide..." << std::endl;

    auto obs = observe(json::array({1, 2}));
    assert(!obs.conforming);
    assert(obs.reason == "non_conforming assertion: not a JSON object");

    obs = observe(json::object());
    assert(!obs.conforming);
    assert(obs.reason == "non_conforming assertion: missing assertion and confidence");

    obs = observe({{"confidence", 0.5}});
    assert(obs.reason == "non_conforming assertion: missing assertion");

    obs = observe({{"assertion", "approve"}, {"core_name", "KayGee_1.0"}});
    assert(obs.reason == "non_conforming assertion: missing confidence");
    assert(obs.hints["core_name"] == "KayGee_1.0");

    json payload = {
        {"assertion", "approve"},
        {"confidence", "0.7"},
        {"core_name", "KayGee_1.0"},
        {"assertion_id", "a-17"}
    };
    json before = payload;
    obs = observe(payload);
    assert(obs.conforming);
    assert(obs.reason == "conforming assertion");
    assert(obs.hints["assertion_id"] == "a-17");
    assert(payload == before);

    // Nested confidence under final_verdict.meta
    obs = observe({{"final_verdict", {{"status", "go"}, {"meta", {{"confidence", 0.8}}}}}});
    assert(obs.conforming);

    // Blank assertion text does not count
    obs = observe({{"verdict", "   "}, {"confidence", 0.4}});
    assert(!obs.conforming);

    std::cout << "  PASS" << std::endl;
}

void test_extraction_rules() {
    std::cout << "Testing extraction rule precedence..." << std::endl;

    json both = {
        {"assertion", "approve"},
        {"confidence", 0.6},
        {"final_verdict", {{"status", "reject"}, {"confidence", 0.9}}}
    };
    assert(matching_rule(both) == "assertion");
    auto v = extract_verdict("Fallback", both);
    assert(v.has_value());
    assert(v->verdict() == "approve");
    assert(near(v->confidence(), 0.6));
    assert(v->metadata().contains("final_verdict"));

    json nested = {
        {"final_verdict", {{"verdict", "hold"}, {"probability", 0.4}}},
        {"verdict", "ignored"},
        {"confidence", 0.9}
    };
    assert(matching_rule(nested) == "final_verdict");
    v = extract_verdict("Fallback", nested);
    assert(v.has_value());
    assert(v->verdict() == "hold");
    assert(near(v->confidence(), 0.4));
    assert(v->metadata()["final_verdict"]["verdict"] == "hold");
    assert(v->metadata()["verdict"] == "ignored");

    // Payload core_name wins, confidence clamped, extras passed through
    json status = {
        {"status", "ok"},
        {"confidence", 1.7},
        {"core_name", "Peer"},
        {"extra", {{"a", 1}}}
    };
    v = extract_verdict("Fallback", status);
    assert(v.has_value());
    assert(v->core_name() == "Peer");
    assert(v->confidence() == 1.0);
    assert(v->metadata()["extra"]["a"] == 1);
    assert(!v->metadata().contains("core_name"));

    v = extract_verdict("Fallback", {{"response", "yes"}, {"confidence", -0.3}});
    assert(v.has_value());
    assert(v->core_name() == "Fallback");
    assert(v->confidence() == 0.0);

    // Nothing is invented
    assert(matching_rule({{"verdict", "approve"}}).empty());
    assert(!extract_verdict("X", {{"verdict", "approve"}}).has_value());
    assert(!extract_verdict("X", {{"assertion", "   "}, {"confidence", 0.5}}).has_value());
    assert(!extract_verdict("X", {{"response", "yes"}, {"confidence", "abc"}}).has_value());
    assert(!extract_verdict("X", json("approve")).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_verdict_clamp() {
    std::cout << "Testing Verdict clamping..." << std::endl;

    assert(Verdict("a", "x", 1.5).confidence() == 1.0);
    assert(Verdict("a", "x", -2.0).confidence() == 0.0);
    assert(Verdict("a", "x", 0.25).confidence() == 0.25);
    assert(Verdict("a", "x", 0.5, json("not an object")).metadata().is_object());

    // Non-finite confidence carries nothing
    assert(Verdict("a", "x", std::numeric_limits<double>::quiet_NaN()).confidence() == 0.0);
    assert(Verdict("a", "x", std::numeric_limits<double>::infinity()).confidence() == 0.0);
    assert(Verdict("a", "x", -std::numeric_limits<double>::infinity()).confidence() == 0.0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Consensus
// ═══════════════════════════════════════════════════════════════════════════

void test_softmax() {
    std::cout << "Testing softmax..." << std::endl;

    auto uniform = softmax({0.7, 0.7, 0.7});
    for (double p : uniform) assert(p == 1.0 / 3.0);

    auto p = softmax({0.9, 0.1});
    assert(p[0] > p[1]);
    assert(near(p[0] + p[1], 1.0));

    // Lower temperature sharpens
    auto sharp = softmax({0.9, 0.1}, 0.1);
    assert(sharp[0] > p[0]);

    assert(softmax({}).empty());

    // Non-finite inputs count as zero
    const double nan = std::numeric_limits<double>::quiet_NaN();
    auto with_nan = softmax({nan, 0.5});
    assert(near(with_nan[0] + with_nan[1], 1.0));
    assert(with_nan[1] > with_nan[0]);
    auto all_nan = softmax({nan, nan});
    assert(all_nan[0] == 0.5 && all_nan[1] == 0.5);

    // Vanishing temperature saturates instead of overflowing
    auto frozen = softmax({0.9, 0.1}, 1e-300);
    assert(frozen[0] == 1.0 && frozen[1] == 0.0);
    auto denormal = softmax({1.0, 0.0}, std::numeric_limits<double>::denorm_min());
    assert(std::isfinite(denormal[0]) && near(denormal[0] + denormal[1], 1.0));
    auto bad_t = softmax({0.9, 0.1}, nan);
    assert(near(bad_t[0], p[0]) && near(bad_t[1], p[1]));

    std::cout << "  PASS" << std::endl;
}

void test_consensus_empty() {
    std::cout << "Testing consensus with no verdicts..." << std::endl;

    ConsensusAdvisor advisor;
    auto signal = advisor.process({});
    assert(signal.consensus_level == 0.0);
    assert(signal.recommendation == Recommendation::EscalateToReview);
    assert(!signal.dominant_verdict.has_value());
    assert(!signal.outlier_detected.has_value());
    assert(signal.softmax_probabilities.empty());
    assert(!signal.explanation.empty());

    std::cout << "  PASS" << std::endl;
}

void test_consensus_determinism() {
    std::cout << "Testing consensus determinism..." << std::endl;

    ConsensusAdvisor advisor;
    auto first = advisor.process(scenario_a());
    auto second = advisor.process(scenario_a());

    assert(first.consensus_level == second.consensus_level);
    assert(first.outlier_detected == second.outlier_detected);
    assert(first.recommendation == second.recommendation);
    assert(first.to_json() == second.to_json());

    assert(first.dominant_verdict == std::string("approve"));
    assert(!first.outlier_detected.has_value());
    assert(first.consensus_level > 0.65 && first.consensus_level < 0.67);
    assert(first.recommendation == Recommendation::PauseAndVerify);
    assert(first.confidence_clustering == ConfidenceClustering::Moderate);
    assert(first.verdict_distribution.at("approve") == 2);
    assert(first.verdict_distribution.at("reject") == 1);

    // Probabilities keep input order
    assert(first.softmax_probabilities[0].first == "KayGee");
    assert(first.softmax_probabilities[2].first == "Caleon");

    std::cout << "  PASS" << std::endl;
}

void test_consensus_high_agreement() {
    std::cout << "Testing consensus high agreement..." << std::endl;

    ConsensusAdvisor advisor;
    auto signal = advisor.process(scenario_b());
    assert(signal.consensus_level > 0.90);
    assert(signal.recommendation == Recommendation::Proceed);
    assert(!signal.outlier_detected.has_value());
    assert(signal.confidence_clustering == ConfidenceClustering::Unanimous);
    assert(signal.agreement_rate == 1.0);

    std::cout << "  PASS" << std::endl;
}

void test_consensus_outlier() {
    std::cout << "Testing consensus outlier..." << std::endl;

    ConsensusAdvisor advisor;
    auto signal = advisor.process(scenario_c());
    assert(signal.dominant_verdict == std::string("approve"));
    assert(signal.consensus_level >= 0.8);
    assert(signal.recommendation == Recommendation::Proceed ||
           signal.recommendation == Recommendation::ProceedCautiously ||
           signal.recommendation == Recommendation::OutlierInvestigation);
    assert(signal.outlier_detected == std::string("Cali_X_One"));
    assert(signal.recommendation == Recommendation::OutlierInvestigation);
    assert(signal.explanation.find("Cali_X_One") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_outlier_escalation() {
    std::cout << "Testing outlier escalation..." << std::endl;

    ConsensusAdvisor advisor;
    std::vector<double> tight = {0.80, 0.82, 0.85, 0.81};
    assert(!advisor.detect_outlier(tight).has_value());

    std::vector<double> with_low = tight;
    with_low.push_back(0.10);
    auto idx = advisor.detect_outlier(with_low);
    assert(idx.has_value() && *idx == 4);

    // Small samples
    assert(!advisor.detect_outlier({0.9, 0.1}).has_value());
    auto three = advisor.detect_outlier({0.90, 0.92, 0.10});
    assert(three.has_value() && *three == 2);
    assert(!advisor.detect_outlier({0.9, 0.5, 0.1}).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_probability_normalization() {
    std::cout << "Testing probability normalization..." << std::endl;

    ConsensusAdvisor advisor;
    std::vector<std::vector<Verdict>> lists = {scenario_a(), scenario_b(), scenario_c()};
    lists.push_back({Verdict("solo", "approve", 0.3)});
    std::vector<Verdict> many;
    for (int i = 0; i < 25; ++i) {
        many.emplace_back("peer" + std::to_string(i), i % 3 ? "approve" : "reject", (i % 10) / 10.0);
    }
    lists.push_back(many);

    for (const auto& list : lists) {
        auto signal = advisor.process(list);
        assert(near(signal.probability_sum(), 1.0, 1e-9));
        assert(signal.consensus_level >= 0.0 && signal.consensus_level <= 1.0);
        assert(signal.explanation.size() <= MAX_EXPLANATION_LENGTH);
    }

    std::cout << "  PASS" << std::endl;
}

void test_consensus_degenerate_inputs() {
    std::cout << "Testing consensus with degenerate inputs..." << std::endl;

    ConsensusAdvisor advisor;
    auto signal = advisor.process({
        Verdict("A", "approve", 0.9),
        Verdict("B", "reject", std::numeric_limits<double>::quiet_NaN())});
    assert(signal.raw_confidences[1] == 0.0);
    assert(near(signal.probability_sum(), 1.0, 1e-9));
    assert(std::isfinite(signal.consensus_level));
    assert(signal.consensus_level >= 0.0 && signal.consensus_level <= 1.0);
    assert(signal.dominant_verdict == std::string("approve"));

    AdvisorConfig cold;
    cold.temperature = 1e-300;
    ConsensusAdvisor frozen(cold);
    for (const auto& list : {scenario_a(), scenario_b(), scenario_c()}) {
        auto s = frozen.process(list);
        assert(near(s.probability_sum(), 1.0, 1e-9));
        assert(s.consensus_level >= 0.0 && s.consensus_level <= 1.0);
    }

    std::cout << "  PASS" << std::endl;
}

void test_confidence_clustering() {
    std::cout << "Testing confidence clustering..." << std::endl;

    ConsensusAdvisor advisor;
    using CC = ConfidenceClustering;

    // Full agreement: band, then coefficient of variation
    assert(advisor.classify_clustering({0.90, 0.92, 0.95}, 1.0) == CC::Unanimous);
    assert(advisor.classify_clustering({0.60, 0.80, 0.90}, 1.0) == CC::Strong);     // cv 0.163
    assert(advisor.classify_clustering({0.30, 0.60, 0.90}, 1.0) == CC::Moderate);   // cv 0.408
    assert(advisor.classify_clustering({0.10, 0.90}, 1.0) == CC::Fragmented);       // cv 0.8

    // Split verdicts
    assert(advisor.classify_clustering({0.80, 0.85, 0.90, 0.82}, 0.75) == CC::Strong);
    assert(advisor.classify_clustering({0.50, 0.90, 0.70}, 2.0 / 3.0) == CC::Moderate);
    assert(advisor.classify_clustering({0.80, 0.82}, 0.5) == CC::Conflicted);
    assert(advisor.classify_clustering({0.10, 0.90}, 0.5) == CC::Fragmented);
    assert(advisor.classify_clustering({}, 1.0) == CC::Fragmented);

    // Opposed peers with comparable confidence
    auto split = advisor.process({Verdict("a", "reject", 0.80), Verdict("b", "approve", 0.82)});
    assert(split.agreement_rate == 0.5);
    assert(split.confidence_clustering == CC::Conflicted);
    assert(split.to_json()["confidence_clustering"] == "conflicted");

    std::cout << "  PASS" << std::endl;
}

void test_consensus_entropy() {
    std::cout << "Testing consensus falls with entropy..." << std::endl;

    ConsensusAdvisor advisor;
    auto decisive = advisor.process({
        Verdict("a", "approve", 0.95), Verdict("b", "approve", 0.90), Verdict("c", "reject", 0.10)});
    auto muddled = advisor.process({
        Verdict("a", "approve", 0.60), Verdict("b", "approve", 0.55), Verdict("c", "reject", 0.50)});

    assert(decisive.effective_entropy < muddled.effective_entropy);
    assert(decisive.consensus_level > muddled.consensus_level);

    // Ties go to the first entry
    auto tie = advisor.process({Verdict("a", "reject", 0.8), Verdict("b", "approve", 0.8)});
    assert(tie.dominant_verdict == std::string("reject"));

    std::cout << "  PASS" << std::endl;
}

void test_recommendation_mapping() {
    std::cout << "Testing recommendation mapping..." << std::endl;

    assert(recommend(0.95, false) == Recommendation::Proceed);
    assert(recommend(0.90, false) == Recommendation::Proceed);
    assert(recommend(0.80, false) == Recommendation::ProceedCautiously);
    assert(recommend(0.75, false) == Recommendation::ProceedCautiously);
    assert(recommend(0.70, false) == Recommendation::PauseAndVerify);
    assert(recommend(0.60, false) == Recommendation::PauseAndVerify);
    assert(recommend(0.59, false) == Recommendation::EscalateToReview);
    assert(recommend(0.85, true) == Recommendation::OutlierInvestigation);
    assert(recommend(0.80, true) == Recommendation::OutlierInvestigation);
    assert(recommend(0.79, true) == Recommendation::ProceedCautiously);
    assert(recommend(0.50, true) == Recommendation::EscalateToReview);

    // The advisory's recommendation is a function of consensus and outlier alone
    ConsensusAdvisor advisor;
    for (const auto& list : {scenario_a(), scenario_b(), scenario_c()}) {
        auto s = advisor.process(list);
        assert(s.recommendation == recommend(s.consensus_level, s.outlier_detected.has_value()));
    }

    for (auto r : {Recommendation::Proceed, Recommendation::ProceedCautiously,
                   Recommendation::PauseAndVerify, Recommendation::EscalateToReview,
                   Recommendation::OutlierInvestigation}) {
        assert(recommendation_from_name(recommendation_name(r)) == r);
    }
    assert(!recommendation_from_name("ABSTAIN").has_value());

    assert(std::string(consensus_bucket(0.95)) == "unanimous");
    assert(std::string(consensus_bucket(0.80)) == "strong");
    assert(std::string(consensus_bucket(0.65)) == "moderate");
    assert(std::string(consensus_bucket(0.45)) == "fragmented");
    assert(std::string(consensus_bucket(0.10)) == "conflicted");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Audit matrix
// ═══════════════════════════════════════════════════════════════════════════

void test_sha256() {
    std::cout << "Testing sha256_hex..." << std::endl;

    assert(sha256_hex("abc") ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(sha256_hex("").size() == 64);

    std::cout << "  PASS" << std::endl;
}

void test_audit_fifo() {
    std::cout << "Testing AuditMatrix FIFO retention..." << std::endl;

    AuditConfig config;
    config.capacity = 3;
    AuditMatrix audit(config);
    ConsensusAdvisor advisor;
    auto signal = advisor.process(scenario_b());

    for (int i = 1; i <= 5; ++i) {
        audit.record("ctx-" + std::to_string(i), signal, scenario_b());
    }

    auto entries = audit.snapshot();
    assert(entries.size() == 3);
    assert(entries[0].sequence == 3);
    assert(entries[1].sequence == 4);
    assert(entries[2].sequence == 5);
    assert(entries[0].decision_context == "ctx-3");
    assert(entries[2].decision_context == "ctx-5");

    auto summary = audit.summarize();
    assert(summary.total_retained == 3);
    assert(summary.total_ever_recorded == 5);

    auto recent = audit.recent(2);
    assert(recent.size() == 2);
    assert(recent[0].sequence == 4);
    assert(audit.recent(10).size() == 3);

    // Snapshots are copies
    entries[0].decision_context = "tampered";
    assert(audit.snapshot()[0].decision_context == "ctx-3");

    std::cout << "  PASS" << std::endl;
}

void test_audit_chain() {
    std::cout << "Testing AuditMatrix hash chain..." << std::endl;

    AuditConfig config;
    config.capacity = 2;
    AuditMatrix audit(config);
    ConsensusAdvisor advisor;

    assert(audit.verify_chain().ok);

    auto first = audit.record("one", advisor.process(scenario_a()), scenario_a());
    assert(first.previous_hash.empty());
    assert(first.entry_hash.size() == 64);
    assert(first.entry_hash == first.compute_hash());
    assert(first.entry_id.size() == 36);

    auto second = audit.record("two", advisor.process(scenario_b()), scenario_b(),
                               {{"method", "softmax_weighted"}});
    assert(second.previous_hash == first.entry_hash);
    assert(second.derivation["method"] == "softmax_weighted");

    audit.record("three", advisor.process(scenario_c()), scenario_c());
    audit.record("four", advisor.process({}), {});

    // Evicted predecessors do not break verification
    auto report = audit.verify_chain();
    assert(report.ok);
    assert(report.first_bad_sequence == 0);

    auto entries = audit.snapshot();
    assert(entries[1].previous_hash == entries[0].entry_hash);

    // Any edit changes the hash
    AuditEntry edited = entries[0];
    edited.decision_context = "changed";
    assert(edited.compute_hash() != edited.entry_hash);

    std::cout << "  PASS" << std::endl;
}

void test_audit_summary() {
    std::cout << "Testing AuditMatrix summary..." << std::endl;

    AuditMatrix audit;
    ConsensusAdvisor advisor;
    audit.record("b", advisor.process(scenario_b()), scenario_b());
    audit.record("a", advisor.process(scenario_a()), scenario_a());
    audit.record("empty", advisor.process({}), {});

    auto summary = audit.summarize();
    assert(summary.total_retained == 3);
    assert(summary.by_consensus_bucket["unanimous"] == 1);
    assert(summary.by_consensus_bucket["moderate"] == 1);
    assert(summary.by_consensus_bucket["conflicted"] == 1);
    assert(summary.by_recommendation["PROCEED"] == 1);
    assert(summary.by_recommendation["PAUSE_AND_VERIFY"] == 1);
    assert(summary.by_recommendation["ESCALATE_TO_REVIEW"] == 1);
    assert(summary.by_source["KayGee_1.0"] == 1);
    assert(summary.by_source["KayGee"] == 1);

    json j = summary.to_json();
    assert(j["total_ever_recorded"] == 3);

    std::cout << "  PASS" << std::endl;
}

void test_audit_persistence() {
    std::cout << "Testing AuditMatrix persistence..." << std::endl;

    fs::path dir = fresh_dir("concord_test_audit");
    std::string path = (dir / "audit.jsonl").string();

    ConsensusAdvisor advisor;
    AuditConfig config;
    config.capacity = 5;
    config.path = path;

    {
        AuditMatrix audit(config);
        for (int i = 0; i < 3; ++i) {
            audit.record("ctx-" + std::to_string(i), advisor.process(scenario_b()), scenario_b());
        }
    }
    assert(count_lines(path) == 3);

    {
        AuditMatrix reopened(config);
        assert(reopened.size() == 3);
        assert(reopened.last_sequence() == 3);
        auto next = reopened.record("ctx-3", advisor.process(scenario_a()), scenario_a());
        assert(next.sequence == 4);
        assert(next.previous_hash == reopened.snapshot()[2].entry_hash);
        assert(reopened.verify_chain().ok);
    }

    // Tamper with one persisted entry
    std::vector<std::string> lines;
    {
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
    }
    json second = json::parse(lines[1]);
    second["decision_context"] = "rewritten";
    lines[1] = second.dump();
    {
        std::ofstream out(path, std::ios::trunc);
        for (const auto& l : lines) out << l << "\n";
    }

    {
        // Moved aside, but numbering continues past it
        AuditMatrix damaged(config);
        assert(damaged.size() == 0);
        assert(damaged.last_sequence() == 4);
        assert(!fs::exists(path));
        size_t quarantined = 0;
        for (const auto& e : fs::directory_iterator(dir)) {
            if (e.path().filename().string().rfind("audit.jsonl.corrupt.", 0) == 0) ++quarantined;
        }
        assert(quarantined == 1);
        auto next = damaged.record("ctx-4", advisor.process(scenario_b()), scenario_b());
        assert(next.sequence == 5);
        assert(damaged.verify_chain().ok);
    }
    {
        AuditMatrix resumed(config);
        assert(resumed.size() == 1);
        assert(resumed.last_sequence() == 5);
    }

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_audit_torn_tail() {
    std::cout << "Testing AuditMatrix torn final line..." << std::endl;

    fs::path dir = fresh_dir("concord_test_torn");
    std::string path = (dir / "audit.jsonl").string();

    ConsensusAdvisor advisor;
    AuditConfig config;
    config.capacity = 10;
    config.path = path;

    {
        AuditMatrix audit(config);
        for (int i = 0; i < 5; ++i) {
            audit.record("ctx-" + std::to_string(i), advisor.process(scenario_a()), scenario_a());
        }
    }
    {
        // Crash mid-append
        std::ofstream out(path, std::ios::app);
        out << "{\"sequence\":6,\"entry_id\":\"3fa9";
    }

    {
        AuditMatrix reopened(config);
        assert(reopened.size() == 5);
        assert(reopened.last_sequence() == 5);
        assert(reopened.verify_chain().ok);
        assert(count_lines(path) == 5);
        auto next = reopened.record("ctx-5", advisor.process(scenario_a()), scenario_a());
        assert(next.sequence == 6);
    }

    AuditMatrix again(config);
    assert(again.size() == 6);
    assert(again.last_sequence() == 6);
    assert(again.verify_chain().ok);
    for (const auto& e : fs::directory_iterator(dir)) {
        assert(e.path().filename().string().find(".corrupt.") == std::string::npos);
    }

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_audit_invalid_utf8() {
    std::cout << "Testing AuditMatrix with invalid UTF-8 context..." << std::endl;

    fs::path dir = fresh_dir("concord_test_utf8");
    std::string path = (dir / "audit.jsonl").string();
    const std::string context = "deploy \xff\xfe";

    ConsensusAdvisor advisor;
    AuditConfig config;
    config.path = path;

    {
        AuditMatrix audit(config);
        auto entry = audit.record(context, advisor.process(scenario_b()), scenario_b());
        assert(entry.sequence == 1);
        assert(audit.last_sequence() == 1);
        assert(audit.size() == 1);
        assert(audit.verify_chain().ok);
        assert(audit.record("plain", advisor.process(scenario_b()), scenario_b()).sequence == 2);
    }

    {
        // Bad bytes persist as U+FFFD and the chain still verifies
        AuditMatrix reopened(config);
        assert(reopened.size() == 2);
        assert(reopened.last_sequence() == 2);
        assert(reopened.verify_chain().ok);
        assert(reopened.snapshot()[0].decision_context.find("\xEF\xBF\xBD") != std::string::npos);
    }

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_audit_compaction() {
    std::cout << "Testing AuditMatrix compaction..." << std::endl;

    fs::path dir = fresh_dir("concord_test_compact");
    std::string path = (dir / "audit.jsonl").string();

    ConsensusAdvisor advisor;
    AuditConfig config;
    config.capacity = 2;
    config.compact_factor = 2;
    config.path = path;

    {
        AuditMatrix audit(config);
        for (int i = 0; i < 4; ++i) {
            audit.record("ctx", advisor.process(scenario_c()), scenario_c());
        }
        assert(count_lines(path) == 4);
        audit.record("ctx", advisor.process(scenario_c()), scenario_c());
        assert(count_lines(path) == 2);
    }

    AuditMatrix reopened(config);
    assert(reopened.size() == 2);
    assert(reopened.last_sequence() == 5);
    assert(reopened.snapshot()[0].sequence == 4);
    assert(reopened.verify_chain().ok);

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// State hub
// ═══════════════════════════════════════════════════════════════════════════

void test_hub_peers() {
    std::cout << "Testing StateHub peer state..." << std::endl;

    StateHub hub;
    hub.update_peer("A", Availability::Available, {{"verdict", "approve"}}, 1000);
    hub.update_peer("A", Availability::Unavailable, json(), 500);

    auto a = hub.peer("A");
    assert(a.has_value());
    assert(a->last_seen == 1000);
    assert(a->availability == Availability::Unavailable);
    assert(a->last_assertion["verdict"] == "approve");

    hub.record_assertion("A", {{"verdict", "reject"}}, 2000);
    a = hub.peer("A");
    assert(a->availability == Availability::Available);
    assert(a->last_seen == 2000);
    assert(a->last_assertion["verdict"] == "reject");

    assert(!hub.peer("missing").has_value());
    hub.update_peer("B", Availability::Silent);
    assert(hub.peers().size() == 2);
    assert(hub.peer("B")->last_seen > 0);

    std::cout << "  PASS" << std::endl;
}

void test_hub_bounds() {
    std::cout << "Testing StateHub bounded logs..." << std::endl;

    HubConfig config;
    config.max_events = 3;
    config.max_control_log = 2;
    StateHub hub(config);

    for (int i = 1; i <= 5; ++i) {
        hub.record_event({{"type", "tick"}, {"n", i}, {"timestamp", i * 100}});
    }
    auto events = hub.events();
    assert(events.size() == 3);
    assert(events.front()["n"] == 3);
    assert(events.back()["n"] == 5);
    assert(hub.events_since(350).size() == 2);
    assert(hub.events_since(0).size() == 3);

    // Non-object events are wrapped and stamped
    json wrapped = hub.record_event("plain");
    assert(wrapped["value"] == "plain");
    assert(wrapped.contains("timestamp"));

    for (int i = 0; i < 3; ++i) {
        hub.record_control({{"command", "c" + std::to_string(i)}});
    }
    auto control = hub.control_log();
    assert(control.size() == 2);
    assert(control[0].action_payload["command"] == "c1");
    assert(hub.events().size() == 3);
    assert(hub.events().back()["type"] == "control");

    std::cout << "  PASS" << std::endl;
}

void test_hub_control_mirror() {
    std::cout << "Testing StateHub control mirroring..." << std::endl;

    StateHub hub;
    auto entry = hub.record_control({{"command", "pause"}, {"timestamp", 123}});
    assert(entry.timestamp == 123);

    auto events = hub.events();
    assert(events.size() == 1);
    assert(events[0]["type"] == "control");
    assert(events[0]["command"] == "pause");
    assert(events[0]["timestamp"] == 123);

    std::cout << "  PASS" << std::endl;
}

void test_hub_snapshot_restore() {
    std::cout << "Testing StateHub snapshot/restore..." << std::endl;

    StateHub hub;
    hub.record_assertion("A", {{"verdict", "approve"}}, 1000);
    hub.set_divergence(true);
    hub.set_accepting(false);
    hub.record_control({{"command", "hold"}});

    json snap = hub.snapshot();
    snap["peers"]["A"]["last_seen"] = 1;
    assert(hub.peer("A")->last_seen == 1000);

    json clean = hub.snapshot();
    StateHub copy;
    assert(copy.restore(clean));
    assert(copy.peer("A")->last_seen == 1000);
    assert(copy.peer("A")->availability == Availability::Available);
    assert(copy.divergence());
    assert(!copy.accepting());
    assert(copy.control_log().size() == 1);
    assert(copy.events().size() == 1);

    assert(!copy.restore(json::array()));

    std::cout << "  PASS" << std::endl;
}

void test_hub_listeners() {
    std::cout << "Testing StateHub listeners..." << std::endl;

    StateHub hub;
    int seen = 0;
    size_t events_at_callback = 0;
    hub.add_event_listener([](const json&) { throw std::runtime_error("listener failure"); });
    hub.add_event_listener([&](const json& e) {
        ++seen;
        // Re-entrant read must not deadlock
        events_at_callback = hub.events().size();
        assert(e.contains("timestamp"));
    });

    set_log_sink([](LogLevel, const std::string&, const std::string&) {});
    hub.record_event({{"type", "ping"}});
    hub.record_control({{"command", "go"}});
    set_log_sink(nullptr);

    assert(seen == 2);
    assert(events_at_callback == 2);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Peer inference
// ═══════════════════════════════════════════════════════════════════════════

void test_peer_inference() {
    std::cout << "Testing KeywordPeerInferrer..." << std::endl;

    KeywordPeerInferrer inferrer;
    assert(inferrer.infer("Run the EMPIRICAL check") == std::string("KayGee_1.0"));
    assert(inferrer.infer("route to ECM") == std::string("UCM_Core_ECM"));
    assert(inferrer.infer("convergent plan") == std::string("UCM_Core_ECM"));
    assert(inferrer.infer("ask genesis") == std::string("Caleon_Genesis_1.12"));
    assert(inferrer.infer("forward to cali_x") == std::string("Cali_X_One"));
    assert(inferrer.infer("kaygee and genesis") == std::string("KayGee_1.0"));
    assert(!inferrer.infer("nothing to see").has_value());

    std::vector<KeywordRule> rules;
    rules.push_back(KeywordRule{{"ALPHA"}, "Alpha_Core"});
    KeywordPeerInferrer custom(rules);
    assert(custom.infer("alpha test") == std::string("Alpha_Core"));
    assert(!custom.infer("kaygee").has_value());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Coordinator
// ═══════════════════════════════════════════════════════════════════════════

class FakeSource : public VerdictSource {
public:
    CollectReport next;
    bool fail = false;
    std::string last_context;
    std::chrono::milliseconds last_timeout{0};

    CollectReport gather(const std::string& decision_context,
                         std::chrono::milliseconds timeout) override {
        last_context = decision_context;
        last_timeout = timeout;
        if (fail) throw std::runtime_error("source exploded");
        return next;
    }
};

static PeerOutcome outcome(const std::string& name, PeerStatus status,
                           std::optional<Verdict> verdict = std::nullopt) {
    PeerOutcome o;
    o.endpoint.core_name = name;
    o.endpoint.url = "http://127.0.0.1:1/" + name;
    o.status = status;
    o.verdict = std::move(verdict);
    return o;
}

static CollectReport mixed_report() {
    CollectReport report;
    Verdict a("KayGee_1.0", "approve", 0.95);
    Verdict d("Cali_X_One", "approve", 0.93);
    report.outcomes = {
        outcome("KayGee_1.0", PeerStatus::Verdict, a),
        outcome("UCM_Core_ECM", PeerStatus::Unreachable),
        outcome("Caleon_Genesis_1.12", PeerStatus::NoPayload),
        outcome("Cali_X_One", PeerStatus::Verdict, d),
    };
    report.verdicts = {a, d};
    return report;
}

void test_coordinator_advise() {
    std::cout << "Testing IntegrationCoordinator advise..." << std::endl;

    FakeSource source;
    source.next = mixed_report();
    AuditMatrix audit;
    StateHub hub;
    KeywordPeerInferrer inferrer;
    CoordinatorConfig config;
    config.timeout = std::chrono::milliseconds(1234);
    IntegrationCoordinator coordinator(source, audit, hub, inferrer, config);

    auto advice = coordinator.consult("deploy release 7");
    assert(source.last_context == "deploy release 7");
    assert(source.last_timeout.count() == 1234);
    assert(advice.signal.recommendation == Recommendation::Proceed);
    assert(advice.entry.sequence == 1);
    assert(audit.size() == 1);
    assert(audit.snapshot()[0].verdict_sources.size() == 2);
    assert(audit.snapshot()[0].derivation["peer_outcomes"]["UCM_Core_ECM"] == "unreachable");

    assert(hub.peer("KayGee_1.0")->availability == Availability::Available);
    assert(hub.peer("UCM_Core_ECM")->availability == Availability::Unavailable);
    assert(hub.peer("Caleon_Genesis_1.12")->availability == Availability::Silent);
    assert(hub.peer("KayGee_1.0")->last_assertion["verdict"] == "approve");
    assert(!hub.divergence());

    // Collection failure degrades to an empty advisory
    source.fail = true;
    auto signal = coordinator.advise("anything");
    assert(signal.consensus_level == 0.0);
    assert(signal.recommendation == Recommendation::EscalateToReview);
    assert(audit.size() == 2);

    auto stats = coordinator.advisory_statistics();
    assert(stats["total_advisories_recorded"] == 2);
    assert(stats["recommendation_history"]["PROCEED"] == 1);

    std::cout << "  PASS" << std::endl;
}

void test_coordinator_interpret() {
    std::cout << "Testing IntegrationCoordinator interpret..." << std::endl;

    FakeSource source;
    source.next = mixed_report();
    AuditMatrix audit;
    StateHub hub;
    KeywordPeerInferrer inferrer;
    IntegrationCoordinator coordinator(source, audit, hub, inferrer);

    auto signal = coordinator.advise("route through ecm");
    auto action = coordinator.interpret(signal, "route through ecm");
    assert(action.action == "execute_immediately");
    assert(action.target_peer == std::string("UCM_Core_ECM"));
    assert(action.assertion_level == std::string("command"));

    auto control = hub.control_log();
    assert(control.size() == 1);
    assert(control[0].action_payload["target"] == "UCM_Core_ECM");
    assert(control[0].action_payload["command"] == "execute_immediately");

    // No target, no control entry
    auto untargeted = coordinator.interpret(signal, "routine check");
    assert(!untargeted.target_peer.has_value());
    assert(!untargeted.assertion_level.has_value());
    assert(hub.control_log().size() == 1);

    // Low consensus targets as a suggestion
    ConsensusAdvisor advisor;
    auto weak = advisor.process(scenario_a());
    auto suggestion = coordinator.interpret(weak, "genesis review");
    assert(suggestion.action == "defer_and_validate");
    assert(suggestion.assertion_level == std::string("suggestion"));
    assert(suggestion.justification.find("0.66") != std::string::npos);

    auto outlier = coordinator.interpret(advisor.process(scenario_c()), "x");
    assert(outlier.action == "investigate_outlier");
    assert(outlier.justification.find("Cali_X_One") != std::string::npos);

    auto ack = coordinator.submit_control({{"command", "manual"}, {"timestamp", 42}});
    assert(ack["status"] == "recorded");
    assert(ack["timestamp"] == 42);
    assert(hub.control_log().size() == 3);

    assert(std::string(action_label(Recommendation::ProceedCautiously)) == "execute_with_monitoring");
    assert(std::string(action_label(Recommendation::EscalateToReview)) == "escalate_for_manual_review");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// RPC
// ═══════════════════════════════════════════════════════════════════════════

void test_coordinator_invalid_utf8() {
    std::cout << "Testing IntegrationCoordinator with invalid UTF-8 context..." << std::endl;

    Verdict v("KayGee_1.0", "approve", 0.9);
    FakeSource source;
    source.next.outcomes = {outcome("KayGee_1.0", PeerStatus::Verdict, v)};
    source.next.verdicts = {v};
    AuditMatrix audit;
    StateHub hub;
    KeywordPeerInferrer inferrer;
    IntegrationCoordinator coordinator(source, audit, hub, inferrer);

    auto advice = coordinator.consult("deploy \xff\xfe");
    assert(advice.entry.sequence == 1);
    assert(audit.size() == 1);
    assert(audit.verify_chain().ok);

    rpc::Handler handler(coordinator, audit, hub, rpc::HandlerContext{"/tmp/concord-test.sock"});
    auto response = json::parse(handler.handle(
        R"({"jsonrpc":"2.0","id":1,"method":"audit/snapshot","params":{"limit":1}})"));
    assert(response["result"].size() == 1);
    assert(response["result"][0]["decision_context"] == "deploy \xEF\xBF\xBD\xEF\xBF\xBD");

    std::cout << "  PASS" << std::endl;
}

void test_rpc_handler() {
    std::cout << "Testing RPC handler..." << std::endl;

    FakeSource source;
    source.next = mixed_report();
    AuditMatrix audit;
    StateHub hub;
    KeywordPeerInferrer inferrer;
    IntegrationCoordinator coordinator(source, audit, hub, inferrer);
    rpc::Handler handler(coordinator, audit, hub, rpc::HandlerContext{"/tmp/concord-test.sock"});

    auto call = [&](const json& request) { return json::parse(handler.handle(request.dump())); };

    auto resp = json::parse(handler.handle("not json"));
    assert(resp["error"]["code"] == rpc::error::PARSE_ERROR);

    resp = call({{"method", "version"}, {"id", 1}});
    assert(resp["error"]["code"] == rpc::error::INVALID_REQUEST);

    resp = call({{"jsonrpc", "2.0"}, {"method", "nope"}, {"id", 2}});
    assert(resp["error"]["code"] == rpc::error::METHOD_NOT_FOUND);
    assert(resp["id"] == 2);

    resp = call({{"jsonrpc", "2.0"}, {"method", "version"}, {"id", 3}});
    assert(resp["result"]["version"] == CONCORD_VERSION);
    assert(resp["result"]["protocol"]["major"] == CONCORD_PROTOCOL_VERSION_MAJOR);

    resp = call({{"jsonrpc", "2.0"}, {"method", "advise"}, {"params", json::object()}, {"id", 4}});
    assert(resp["error"]["code"] == rpc::error::INVALID_PARAMS);

    resp = call({{"jsonrpc", "2.0"}, {"method", "advise"},
                 {"params", {{"context", "check kaygee"}}}, {"id", 5}});
    assert(resp["result"]["recommendation"] == "PROCEED");
    assert(resp["result"]["action"]["target_peer"] == "KayGee_1.0");
    assert(resp["result"]["audit_sequence"] == 1);
    assert(resp["result"]["peers"].size() == 4);

    resp = call({{"jsonrpc", "2.0"}, {"method", "advise"},
                 {"params", {{"context", "quiet"}, {"interpret", false}}}, {"id", 6}});
    assert(!resp["result"].contains("action"));

    resp = call({{"jsonrpc", "2.0"}, {"method", "audit/summary"}, {"id", 7}});
    assert(resp["result"]["total_advisories_recorded"] == 2);

    resp = call({{"jsonrpc", "2.0"}, {"method", "audit/snapshot"}, {"params", {{"limit", 1}}}, {"id", 8}});
    assert(resp["result"].size() == 1);
    assert(resp["result"][0]["decision_context"] == "quiet");

    resp = call({{"jsonrpc", "2.0"}, {"method", "audit/snapshot"}, {"params", {{"limit", -1}}}, {"id", 9}});
    assert(resp["error"]["code"] == rpc::error::INVALID_PARAMS);

    resp = call({{"jsonrpc", "2.0"}, {"method", "audit/verify"}, {"id", 10}});
    assert(resp["result"]["ok"] == true);
    assert(resp["result"]["first_bad_sequence"].is_null());

    resp = call({{"jsonrpc", "2.0"}, {"method", "hub/control"},
                 {"params", {{"command", "hold"}, {"timestamp", 77}}}, {"id", 11}});
    assert(resp["result"]["status"] == "recorded");

    resp = call({{"jsonrpc", "2.0"}, {"method", "hub/events"}, {"params", {{"since", 0}}}, {"id", 12}});
    assert(resp["result"].is_array());
    assert(!resp["result"].empty());

    resp = call({{"jsonrpc", "2.0"}, {"method", "hub/snapshot"}, {"id", 13}});
    assert(resp["result"]["peers"].contains("UCM_Core_ECM"));

    resp = call({{"jsonrpc", "2.0"}, {"method", "hub/control"}, {"params", json::object()}, {"id", 14}});
    assert(resp["error"]["code"] == rpc::error::INVALID_PARAMS);

    assert(handler.methods().size() == 8);
    assert(version::protocol_compatible(CONCORD_PROTOCOL_VERSION_MAJOR, CONCORD_PROTOCOL_VERSION_MINOR));
    assert(!version::protocol_compatible(CONCORD_PROTOCOL_VERSION_MAJOR + 1, 0));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Concord Tests ===" << std::endl;
    std::cout << std::endl;

    // Quiet unless a test installs its own sink
    set_log_level(LogLevel::Error);

    test_shape_guide();
    test_extraction_rules();
    test_verdict_clamp();

    std::cout << std::endl;
    std::cout << "=== Consensus ===" << std::endl;
    test_softmax();
    test_consensus_empty();
    test_consensus_determinism();
    test_consensus_high_agreement();
    test_consensus_outlier();
    test_outlier_escalation();
    test_probability_normalization();
    test_consensus_degenerate_inputs();
    test_confidence_clustering();
    test_consensus_entropy();
    test_recommendation_mapping();

    std::cout << std::endl;
    std::cout << "=== Audit Matrix ===" << std::endl;
    test_sha256();
    test_audit_fifo();
    test_audit_chain();
    test_audit_summary();
    test_audit_persistence();
    test_audit_torn_tail();
    test_audit_invalid_utf8();
    test_audit_compaction();

    std::cout << std::endl;
    std::cout << "=== State Hub ===" << std::endl;
    test_hub_peers();
    test_hub_bounds();
    test_hub_control_mirror();
    test_hub_snapshot_restore();
    test_hub_listeners();

    std::cout << std::endl;
    std::cout << "=== Coordination ===" << std::endl;
    test_peer_inference();
    test_coordinator_advise();
    test_coordinator_interpret();
    test_coordinator_invalid_utf8();
    test_rpc_handler();

    std::cout << std::endl;
    std::cout << "=== All tests passed ===" << std::endl;
    return 0;
}
