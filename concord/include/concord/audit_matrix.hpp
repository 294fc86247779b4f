#pragma once
// Audit Matrix: append-only record of every advisory computed
//
// Design:
// - Append-only: entries are never edited; only the oldest are evicted (FIFO)
//   once the retention bound is exceeded
// - Hash chain: each entry stores the SHA-256 of its predecessor and of its
//   own canonical content; verify_chain() finds the first break
// - Optional JSONL persistence: one line per entry, replayed on open,
//   compacted atomically when the file grows well past the retained window.
//   A torn last line is dropped; any other damage moves the file aside and
//   numbering resumes after the highest sequence it held
// - Reads return copies; callers can never observe or corrupt a write

#include "consensus.hpp"
#include "types.hpp"
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace concord {

struct AuditEntry {
    uint64_t sequence = 0;             // Monotonic, never reused
    std::string entry_id;
    Timestamp timestamp = 0;
    std::string decision_context;
    json advisory;                     // AdvisorySignal snapshot
    std::vector<std::string> verdict_sources;
    json derivation = json::object();
    std::string previous_hash;
    std::string entry_hash;

    // Fields covered by entry_hash
    json content() const;
    json to_json() const;
    static AuditEntry from_json(const json& j);

    std::string compute_hash() const;

    double consensus_level() const;
    std::string recommendation() const;
};

struct AuditSummary {
    size_t total_retained = 0;
    uint64_t total_ever_recorded = 0;
    std::map<std::string, size_t> by_consensus_bucket;
    std::map<std::string, size_t> by_recommendation;
    std::map<std::string, size_t> by_source;

    json to_json() const {
        return {
            {"total_retained", total_retained},
            {"total_ever_recorded", total_ever_recorded},
            {"by_consensus_bucket", by_consensus_bucket},
            {"by_recommendation", by_recommendation},
            {"by_source", by_source}
        };
    }
};

struct ChainReport {
    bool ok = true;
    uint64_t first_bad_sequence = 0;   // 0 when ok
};

struct AuditConfig {
    size_t capacity = 1000;            // Retained entries
    std::string path;                  // JSONL file; empty = memory only
    size_t compact_factor = 2;         // Rewrite file past capacity * factor lines
};

// Hex SHA-256 of a string (OpenSSL EVP)
std::string sha256_hex(const std::string& data);

class AuditMatrix {
public:
    explicit AuditMatrix(AuditConfig config = {});

    AuditMatrix(const AuditMatrix&) = delete;
    AuditMatrix& operator=(const AuditMatrix&) = delete;

    // Append one entry. Never rejects: at capacity the oldest entry goes.
    AuditEntry record(const std::string& decision_context,
                      const AdvisorySignal& advisory,
                      const std::vector<Verdict>& verdicts,
                      const json& derivation = json::object());

    AuditSummary summarize() const;

    // Retained entries, oldest first
    std::vector<AuditEntry> snapshot() const;

    // Most recent `limit` entries, oldest first
    std::vector<AuditEntry> recent(size_t limit) const;

    ChainReport verify_chain() const;

    size_t size() const;
    size_t capacity() const { return config_.capacity; }
    uint64_t last_sequence() const;
    const std::string& path() const { return config_.path; }

private:
    AuditConfig config_;
    mutable std::mutex mutex_;
    std::deque<AuditEntry> entries_;
    uint64_t last_sequence_ = 0;
    std::string last_hash_;
    size_t file_lines_ = 0;

    void evict_locked();
    void load();
    static uint64_t highest_sequence(const std::vector<std::string>& lines);
    void append_to_file(const AuditEntry& entry);
    void compact_locked();
};

} // namespace concord
