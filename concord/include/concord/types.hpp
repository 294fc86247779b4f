#pragma once
// Core types: verdicts, identifiers, time
//
// A verdict is one peer's assertion about a decision context plus how sure
// the peer claims to be. Everything downstream (advisories, audit entries,
// hub state) is derived from lists of verdicts and never feeds back into them.

#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <random>
#include <string>
#include <vector>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace concord {

using json = nlohmann::json;

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Random 128-bit identifier for audit entries
struct EntryId {
    uint64_t high = 0;
    uint64_t low = 0;

    static EntryId generate() {
        static thread_local std::mt19937_64 gen(std::random_device{}());
        std::uniform_int_distribution<uint64_t> dis;
        return {dis(gen), dis(gen)};
    }

    std::string to_string() const {
        char buf[37];
        snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                 (uint32_t)(high >> 32),
                 (uint16_t)(high >> 16),
                 (uint16_t)high,
                 (uint16_t)(low >> 48),
                 (unsigned long long)(low & 0xFFFFFFFFFFFFULL));
        return buf;
    }
};

// Confidence values outside [0,1] are clamped, never rejected.
// Non-finite values (NaN, inf) carry no confidence at all and become 0.
inline double clamp_confidence(double value) {
    if (!std::isfinite(value)) return 0.0;
    return std::clamp(value, 0.0, 1.0);
}

// Compact dump that never throws on invalid UTF-8 (bad bytes become U+FFFD).
// Used wherever peer- or caller-supplied strings are serialized.
inline std::string dump_lossy(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Round to 4 decimals (reporting precision for consensus and entropy)
inline double round4(double value) {
    return std::round(value * 10000.0) / 10000.0;
}

// A single peer's normalized assertion. Immutable once constructed.
class Verdict {
public:
    Verdict(std::string core_name, std::string verdict, double confidence,
            json metadata = json::object())
        : core_name_(std::move(core_name))
        , verdict_(std::move(verdict))
        , confidence_(clamp_confidence(confidence))
        , metadata_(metadata.is_object() ? std::move(metadata) : json::object())
    {}

    const std::string& core_name() const { return core_name_; }
    const std::string& verdict() const { return verdict_; }
    double confidence() const { return confidence_; }
    const json& metadata() const { return metadata_; }

    json to_json() const {
        return {
            {"core_name", core_name_},
            {"verdict", verdict_},
            {"confidence", confidence_},
            {"metadata", metadata_}
        };
    }

private:
    std::string core_name_;
    std::string verdict_;
    double confidence_;
    json metadata_;
};

inline std::vector<std::string> core_names(const std::vector<Verdict>& verdicts) {
    std::vector<std::string> names;
    names.reserve(verdicts.size());
    for (const auto& v : verdicts) {
        names.push_back(v.core_name());
    }
    return names;
}

// Peer availability as last observed by the coordinator
enum class Availability : uint8_t {
    Available = 0,      // Sent a usable verdict
    Silent = 1,         // Answered, but nothing usable
    Unavailable = 2,    // Transport failure, timeout or HTTP error
};

inline const char* availability_name(Availability a) {
    switch (a) {
        case Availability::Available:   return "AVAILABLE";
        case Availability::Silent:      return "SILENT";
        case Availability::Unavailable: return "UNAVAILABLE";
    }
    return "UNAVAILABLE";
}

inline std::optional<Availability> availability_from_name(const std::string& name) {
    if (name == "AVAILABLE") return Availability::Available;
    if (name == "SILENT") return Availability::Silent;
    if (name == "UNAVAILABLE") return Availability::Unavailable;
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence: write temp → fsync → rename → fsync dir
// ═══════════════════════════════════════════════════════════════════════════

// Fsync parent directory for durability
inline bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

// Atomic save: write to temp file, fsync, rename to final path
// Writer function takes FILE* and returns true on success
template <typename Writer>
bool safe_save(const std::string& path, Writer&& write_fn) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) return false;

    bool ok = write_fn(f) && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0;

    ::fclose(f);
    if (!ok) { ::remove(tmp.c_str()); return false; }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    fsync_dir(path);
    return true;
}

} // namespace concord
