#pragma once
// State Hub: live view of peer availability and attributed control intents
//
// The hub is a cache, not the source of truth (that is the audit matrix).
// One mutex guards everything; every read returns a copy. Event and control
// logs are FIFO-bounded. Recording a control entry stores it and nothing
// else: dispatch belongs to whoever reads the log.
//
// Listeners are notified after the lock is released, so a listener may call
// back into the hub.

#include "log.hpp"
#include "types.hpp"
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace concord {

struct PeerState {
    std::string core_name;
    Availability availability = Availability::Unavailable;
    json last_assertion;           // null until the peer sends something usable
    Timestamp last_seen = 0;       // Never decreases

    json to_json() const {
        return {
            {"core_name", core_name},
            {"availability", availability_name(availability)},
            {"last_assertion", last_assertion},
            {"last_seen", last_seen}
        };
    }
};

struct ControlLogEntry {
    json action_payload;
    Timestamp timestamp = 0;

    json to_json() const {
        return {{"action_payload", action_payload}, {"timestamp", timestamp}};
    }
};

struct HubConfig {
    size_t max_events = 500;
    size_t max_control_log = 1000;
};

using EventListener = std::function<void(const json& event)>;

class StateHub {
public:
    explicit StateHub(HubConfig config = {}) : config_(config) {
        if (config_.max_events == 0) config_.max_events = 1;
        if (config_.max_control_log == 0) config_.max_control_log = 1;
    }

    StateHub(const StateHub&) = delete;
    StateHub& operator=(const StateHub&) = delete;

    // ═══════════════════════════════════════════════════════════════════
    // Peer telemetry
    // ═══════════════════════════════════════════════════════════════════

    // Set availability; last_assertion is kept unless a new one is supplied
    PeerState update_peer(const std::string& core_name, Availability availability,
                          const json& assertion = json(), Timestamp seen = 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        PeerState& peer = peer_locked(core_name);
        peer.availability = availability;
        if (!assertion.is_null()) peer.last_assertion = assertion;
        touch(peer, seen);
        return peer;
    }

    PeerState record_assertion(const std::string& core_name, const json& assertion,
                               Timestamp seen = 0) {
        return update_peer(core_name, Availability::Available, assertion, seen);
    }

    std::optional<PeerState> peer(const std::string& core_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = peers_.find(core_name);
        if (it == peers_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<PeerState> peers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<PeerState> out;
        out.reserve(peers_.size());
        for (const auto& [_, p] : peers_) out.push_back(p);
        return out;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Flags
    // ═══════════════════════════════════════════════════════════════════

    void set_divergence(bool divergence) {
        std::lock_guard<std::mutex> lock(mutex_);
        divergence_ = divergence;
    }

    bool divergence() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return divergence_;
    }

    void set_accepting(bool accepting) {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = accepting;
    }

    bool accepting() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return accepting_;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Events and control log
    // ═══════════════════════════════════════════════════════════════════

    // Append an attributed event. Non-object events are wrapped as {"value": ...};
    // a missing timestamp is filled in.
    json record_event(json event) {
        if (!event.is_object()) {
            event = json{{"value", std::move(event)}};
        }
        if (!event.contains("timestamp") || !event["timestamp"].is_number()) {
            event["timestamp"] = now();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            push_event_locked(event);
        }
        notify(event);
        return event;
    }

    // Events with timestamp strictly greater than `since`, oldest first
    std::vector<json> events_since(Timestamp since) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<json> out;
        for (const auto& e : events_) {
            if (event_time(e) > since) out.push_back(e);
        }
        return out;
    }

    std::vector<json> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<json>(events_.begin(), events_.end());
    }

    // Store a control intent and mirror it into the event log as
    // {"type":"control", ...payload}. Nothing is dispatched.
    ControlLogEntry record_control(const json& action_payload) {
        ControlLogEntry entry;
        entry.action_payload = action_payload;
        entry.timestamp = now();
        if (action_payload.is_object() && action_payload.contains("timestamp") &&
            action_payload["timestamp"].is_number_integer()) {
            entry.timestamp = action_payload["timestamp"].get<Timestamp>();
        }

        json event = {{"type", "control"}};
        if (action_payload.is_object()) {
            for (auto it = action_payload.begin(); it != action_payload.end(); ++it) {
                if (it.key() == "type") continue;
                event[it.key()] = it.value();
            }
        } else {
            event["payload"] = action_payload;
        }
        if (!event.contains("timestamp") || !event["timestamp"].is_number()) {
            event["timestamp"] = entry.timestamp;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            control_log_.push_back(entry);
            while (control_log_.size() > config_.max_control_log) control_log_.pop_front();
            push_event_locked(event);
        }
        notify(event);
        return entry;
    }

    std::vector<ControlLogEntry> control_log() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<ControlLogEntry>(control_log_.begin(), control_log_.end());
    }

    void add_event_listener(EventListener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.push_back(std::move(listener));
    }

    // ═══════════════════════════════════════════════════════════════════
    // Snapshot / restore
    // ═══════════════════════════════════════════════════════════════════

    json snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        json peers = json::object();
        for (const auto& [name, p] : peers_) peers[name] = p.to_json();
        json control = json::array();
        for (const auto& c : control_log_) control.push_back(c.to_json());
        return {
            {"peers", peers},
            {"divergence", divergence_},
            {"accepting", accepting_},
            {"events", json(std::vector<json>(events_.begin(), events_.end()))},
            {"control_log", control},
            {"timestamp", now()}
        };
    }

    // Replace state from a snapshot. Unknown or malformed parts are skipped.
    bool restore(const json& snap) {
        if (!snap.is_object()) return false;

        std::map<std::string, PeerState> peers;
        std::deque<json> events;
        std::deque<ControlLogEntry> control;

        try {
            if (snap.contains("peers") && snap["peers"].is_object()) {
                for (auto it = snap["peers"].begin(); it != snap["peers"].end(); ++it) {
                    const json& p = it.value();
                    PeerState state;
                    state.core_name = it.key();
                    auto avail = availability_from_name(p.value("availability", "UNAVAILABLE"));
                    state.availability = avail.value_or(Availability::Unavailable);
                    state.last_assertion = p.value("last_assertion", json());
                    state.last_seen = p.value("last_seen", Timestamp{0});
                    peers[state.core_name] = std::move(state);
                }
            }
            if (snap.contains("events") && snap["events"].is_array()) {
                for (const auto& e : snap["events"]) {
                    if (e.is_object()) events.push_back(e);
                }
            }
            if (snap.contains("control_log") && snap["control_log"].is_array()) {
                for (const auto& c : snap["control_log"]) {
                    if (!c.is_object()) continue;
                    control.push_back({c.value("action_payload", json()),
                                       c.value("timestamp", Timestamp{0})});
                }
            }
        } catch (const json::exception& e) {
            log_warn("hub", "restore rejected: %s", e.what());
            return false;
        }

        while (events.size() > config_.max_events) events.pop_front();
        while (control.size() > config_.max_control_log) control.pop_front();

        std::lock_guard<std::mutex> lock(mutex_);
        peers_ = std::move(peers);
        events_ = std::move(events);
        control_log_ = std::move(control);
        divergence_ = snap.value("divergence", false);
        accepting_ = snap.value("accepting", true);
        return true;
    }

    const HubConfig& config() const { return config_; }

private:
    HubConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, PeerState> peers_;
    std::deque<json> events_;
    std::deque<ControlLogEntry> control_log_;
    std::vector<EventListener> listeners_;
    bool divergence_ = false;
    bool accepting_ = true;

    PeerState& peer_locked(const std::string& core_name) {
        auto it = peers_.find(core_name);
        if (it == peers_.end()) {
            it = peers_.emplace(core_name, PeerState{}).first;
            it->second.core_name = core_name;
        }
        return it->second;
    }

    static void touch(PeerState& peer, Timestamp seen) {
        Timestamp t = seen > 0 ? seen : now();
        peer.last_seen = std::max(peer.last_seen, t);
    }

    static Timestamp event_time(const json& event) {
        auto it = event.find("timestamp");
        if (it == event.end() || !it->is_number()) return 0;
        return it->get<Timestamp>();
    }

    void push_event_locked(const json& event) {
        events_.push_back(event);
        while (events_.size() > config_.max_events) events_.pop_front();
    }

    void notify(const json& event) {
        std::vector<EventListener> listeners;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listeners = listeners_;
        }
        for (const auto& listener : listeners) {
            try {
                listener(event);
            } catch (const std::exception& e) {
                log_warn("hub", "event listener threw: %s", e.what());
            }
        }
    }
};

} // namespace concord
