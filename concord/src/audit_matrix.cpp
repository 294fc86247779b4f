#include <concord/audit_matrix.hpp>
#include <concord/log.hpp>
#include <concord/version.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

namespace concord {

std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        return "";
    }

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0F];
    }
    return out;
}

// ═══════════════════════════════════════════════════════════════════════════
// AuditEntry
// ═══════════════════════════════════════════════════════════════════════════

json AuditEntry::content() const {
    // nlohmann::json objects are key-ordered, so dump() is canonical
    return {
        {"sequence", sequence},
        {"entry_id", entry_id},
        {"timestamp", timestamp},
        {"decision_context", decision_context},
        {"advisory", advisory},
        {"verdict_sources", verdict_sources},
        {"derivation", derivation},
        {"previous_hash", previous_hash}
    };
}

json AuditEntry::to_json() const {
    json j = content();
    j["entry_hash"] = entry_hash;
    j["format"] = CONCORD_AUDIT_FORMAT;
    return j;
}

AuditEntry AuditEntry::from_json(const json& j) {
    AuditEntry e;
    e.sequence = j.at("sequence").get<uint64_t>();
    e.entry_id = j.at("entry_id").get<std::string>();
    e.timestamp = j.at("timestamp").get<Timestamp>();
    e.decision_context = j.at("decision_context").get<std::string>();
    e.advisory = j.at("advisory");
    e.verdict_sources = j.at("verdict_sources").get<std::vector<std::string>>();
    e.derivation = j.value("derivation", json::object());
    e.previous_hash = j.value("previous_hash", "");
    e.entry_hash = j.value("entry_hash", "");
    return e;
}

std::string AuditEntry::compute_hash() const {
    return sha256_hex(dump_lossy(content()));
}

double AuditEntry::consensus_level() const {
    auto it = advisory.find("consensus_level");
    if (it == advisory.end() || !it->is_number()) return 0.0;
    return it->get<double>();
}

std::string AuditEntry::recommendation() const {
    auto it = advisory.find("recommendation");
    if (it == advisory.end() || !it->is_string()) return "unknown";
    return it->get<std::string>();
}

// ═══════════════════════════════════════════════════════════════════════════
// AuditMatrix
// ═══════════════════════════════════════════════════════════════════════════

AuditMatrix::AuditMatrix(AuditConfig config)
    : config_(std::move(config))
{
    if (config_.capacity == 0) config_.capacity = 1;
    if (config_.compact_factor < 2) config_.compact_factor = 2;
    if (!config_.path.empty()) {
        load();
    }
}

AuditEntry AuditMatrix::record(const std::string& decision_context,
                               const AdvisorySignal& advisory,
                               const std::vector<Verdict>& verdicts,
                               const json& derivation) {
    std::lock_guard<std::mutex> lock(mutex_);

    // The sequence is claimed only once the entry is complete
    AuditEntry entry;
    entry.sequence = last_sequence_ + 1;
    entry.entry_id = EntryId::generate().to_string();
    entry.timestamp = now();
    entry.decision_context = decision_context;
    entry.advisory = advisory.to_json();
    entry.verdict_sources = core_names(verdicts);
    entry.derivation = derivation.is_object() ? derivation : json::object();
    entry.previous_hash = last_hash_;
    entry.entry_hash = entry.compute_hash();

    last_sequence_ = entry.sequence;
    last_hash_ = entry.entry_hash;
    entries_.push_back(entry);
    evict_locked();

    if (!config_.path.empty()) {
        append_to_file(entry);
        if (file_lines_ > config_.capacity * config_.compact_factor) {
            compact_locked();
        }
    }

    return entry;
}

void AuditMatrix::evict_locked() {
    while (entries_.size() > config_.capacity) {
        log_debug("audit", "evicting entry #%llu (capacity=%zu)",
                  static_cast<unsigned long long>(entries_.front().sequence), config_.capacity);
        entries_.pop_front();
    }
}

AuditSummary AuditMatrix::summarize() const {
    std::lock_guard<std::mutex> lock(mutex_);

    AuditSummary summary;
    summary.total_retained = entries_.size();
    summary.total_ever_recorded = last_sequence_;
    for (const auto& e : entries_) {
        summary.by_consensus_bucket[consensus_bucket(e.consensus_level())] += 1;
        summary.by_recommendation[e.recommendation()] += 1;
        for (const auto& source : e.verdict_sources) {
            summary.by_source[source] += 1;
        }
    }
    return summary;
}

std::vector<AuditEntry> AuditMatrix::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<AuditEntry>(entries_.begin(), entries_.end());
}

std::vector<AuditEntry> AuditMatrix::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t start = entries_.size() > limit ? entries_.size() - limit : 0;
    return std::vector<AuditEntry>(entries_.begin() + static_cast<std::ptrdiff_t>(start),
                                   entries_.end());
}

ChainReport AuditMatrix::verify_chain() const {
    std::lock_guard<std::mutex> lock(mutex_);

    ChainReport report;
    if (entries_.empty()) return report;

    // The oldest retained entry anchors the chain (its predecessor may be evicted)
    std::string expected = entries_.front().previous_hash;
    for (const auto& e : entries_) {
        if (e.previous_hash != expected || e.compute_hash() != e.entry_hash) {
            report.ok = false;
            report.first_bad_sequence = e.sequence;
            return report;
        }
        expected = e.entry_hash;
    }
    return report;
}

size_t AuditMatrix::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t AuditMatrix::last_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sequence_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════

void AuditMatrix::load() {
    std::ifstream in(config_.path);
    if (!in) return;  // Fresh matrix

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    in.close();

    std::deque<AuditEntry> loaded;
    std::string expected;
    bool torn_tail = false;

    try {
        for (size_t i = 0; i < lines.size(); ++i) {
            json j = json::parse(lines[i], nullptr, false);
            if (j.is_discarded()) {
                // A crash mid-append leaves a partial last line; everything before it holds
                if (i + 1 == lines.size()) {
                    log_warn("audit", "%s: dropping torn final line %zu", config_.path.c_str(), i + 1);
                    torn_tail = true;
                    break;
                }
                throw std::runtime_error("unparsable line " + std::to_string(i + 1));
            }

            int format = j.value("format", 1);
            if (!version::audit_format_supported(format)) {
                log_warn("audit", "%s line %zu: unsupported format %d",
                         config_.path.c_str(), i + 1, format);
                throw std::runtime_error("unsupported audit format");
            }

            AuditEntry entry = AuditEntry::from_json(j);
            if (i == 0) expected = entry.previous_hash;
            if (entry.previous_hash != expected || entry.compute_hash() != entry.entry_hash) {
                log_warn("audit", "%s: chain broken at entry #%llu",
                         config_.path.c_str(), static_cast<unsigned long long>(entry.sequence));
                throw std::runtime_error("audit chain broken");
            }
            expected = entry.entry_hash;

            loaded.push_back(std::move(entry));
            if (loaded.size() > config_.capacity) loaded.pop_front();
        }
    } catch (const std::exception& e) {
        // Damaged trail is moved aside for inspection; numbering continues past it
        last_sequence_ = highest_sequence(lines);
        log_warn("audit", "failed to load %s (%s), starting empty at sequence %llu",
                 config_.path.c_str(), e.what(),
                 static_cast<unsigned long long>(last_sequence_ + 1));
        std::string quarantine = config_.path + ".corrupt." + std::to_string(now());
        if (std::rename(config_.path.c_str(), quarantine.c_str()) != 0) {
            log_error("audit", "could not move damaged trail aside to %s", quarantine.c_str());
        }
        return;
    }

    entries_ = std::move(loaded);
    file_lines_ = torn_tail ? lines.size() - 1 : lines.size();
    if (!entries_.empty()) {
        last_sequence_ = entries_.back().sequence;
        last_hash_ = entries_.back().entry_hash;
    }
    if (torn_tail) compact_locked();

    log_info("audit", "loaded %zu entries from %s (last sequence %llu)",
             entries_.size(), config_.path.c_str(),
             static_cast<unsigned long long>(last_sequence_));
}

uint64_t AuditMatrix::highest_sequence(const std::vector<std::string>& lines) {
    uint64_t highest = 0;
    for (const auto& l : lines) {
        json j = json::parse(l, nullptr, false);
        if (!j.is_object()) continue;
        auto it = j.find("sequence");
        if (it != j.end() && it->is_number_unsigned()) {
            highest = std::max(highest, it->get<uint64_t>());
        }
    }
    return highest;
}

void AuditMatrix::append_to_file(const AuditEntry& entry) {
    std::ofstream out(config_.path, std::ios::app);
    if (!out) {
        log_warn("audit", "cannot open %s for append; entry #%llu kept in memory only",
                 config_.path.c_str(), static_cast<unsigned long long>(entry.sequence));
        return;
    }
    out << dump_lossy(entry.to_json()) << "\n";
    out.flush();
    if (!out) {
        log_warn("audit", "write to %s failed for entry #%llu",
                 config_.path.c_str(), static_cast<unsigned long long>(entry.sequence));
        return;
    }
    ++file_lines_;
}

void AuditMatrix::compact_locked() {
    bool ok = safe_save(config_.path, [this](FILE* f) {
        for (const auto& e : entries_) {
            std::string line = dump_lossy(e.to_json()) + "\n";
            if (std::fwrite(line.data(), 1, line.size(), f) != line.size()) return false;
        }
        return true;
    });

    if (ok) {
        log_debug("audit", "compacted %s: %zu -> %zu lines",
                  config_.path.c_str(), file_lines_, entries_.size());
        file_lines_ = entries_.size();
    } else {
        log_warn("audit", "compaction of %s failed; file keeps growing", config_.path.c_str());
    }
}

} // namespace concord
