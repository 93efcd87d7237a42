// ============================================================================
// peer_store.cpp - implementation for peer_store.hpp
// For the file layout see the matching .hpp.
// ============================================================================

#include "beacon/peer_store.hpp"
#include "beacon/log.hpp"
#include "beacon/paths.hpp"

#include "nlohmann/json.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace beacon {

static constexpr const char* PEERS_FILE    = "peers.json";
static constexpr const char* ACTIVITY_FILE = "activity.json";


// -------- helpers --------

static json peer_to_json(const Peer& p) {
    return json{
        {"name",      p.display_name},
        {"status",    to_string(p.status)},
        {"signal",    p.signal_strength},
        {"lastSeen",  p.last_seen_ms},
        {"emergency", p.is_emergency},
    };
}

static Peer peer_from_json(const std::string& id, const json& j) {
    Peer p;
    p.peer_id         = id;
    p.display_name    = j.value("name", std::string("Unknown"));
    parse_peer_status(j.value("status", std::string()), p.status);
    const int64_t signal = j.value("signal", static_cast<int64_t>(0));
    p.signal_strength = static_cast<uint8_t>(std::min<int64_t>(std::max<int64_t>(signal, 0), 5));
    p.last_seen_ms    = j.value("lastSeen", static_cast<uint64_t>(0));
    p.is_emergency    = j.value("emergency", false);
    return p;
}

/*
 * load_json()
 * -----------
 * Parse one store file. Missing file: false, quietly. Corrupt file: false,
 * logged; the caller starts empty and the next write replaces it.
 */
static bool load_json(const fs::path& path, json& out) {
    std::string text;
    if (!read_file(path, text)) return false;
    try {
        out = json::parse(text);
        return true;
    } catch (const json::exception& e) {
        log::Line(log::Level::Warn, "store").kv("status", "error").kv("reason", "corrupt")
            .kv("path", path.string()).kv("detail", e.what());
        return false;
    }
}


// -------- public API --------

JsonPeerStore::JsonPeerStore(fs::path dir) : dir_(std::move(dir)) {}

void JsonPeerStore::open() {
    peers_.clear();
    activity_.clear();

    json j;
    if (load_json(dir_ / PEERS_FILE, j) && j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.key().empty() || !it.value().is_object()) continue;
            try {
                peers_[it.key()] = peer_from_json(it.key(), it.value());
            } catch (const json::exception& e) {            // wrong value types
                log::Line(log::Level::Warn, "store").kv("status", "skipped")
                    .kv("peer", it.key()).kv("detail", e.what());
            }
        }
    }

    json a;
    if (load_json(dir_ / ACTIVITY_FILE, a) && a.is_array()) {
        for (const auto& r : a) {
            if (!r.is_object()) continue;
            try {
                ActivityRecord rec;
                rec.peer_id      = r.value("peerId", std::string());
                rec.event        = r.value("event", std::string());
                rec.details      = r.value("details", std::string());
                rec.timestamp_ms = r.value("timestamp", static_cast<uint64_t>(0));
                activity_.push_back(std::move(rec));
            } catch (const json::exception& e) {
                log::Line(log::Level::Warn, "store").kv("status", "skipped")
                    .kv("reason", "bad_activity").kv("detail", e.what());
            }
        }
        if (activity_.size() > MAX_ACTIVITY)
            activity_.erase(activity_.begin(), activity_.end() - MAX_ACTIVITY);
    }

    log::Line(log::Level::Debug, "store").kv("status", "open").kv("dir", dir_.string())
        .kv("peers", peers_.size()).kv("activity", activity_.size());
}

bool JsonPeerStore::save_peer(const Peer& peer) {
    if (peer.peer_id.empty()) return false;
    peers_[peer.peer_id] = peer;
    return write_peers();
}

std::vector<Peer> JsonPeerStore::load_peers() const {
    std::vector<Peer> out;
    out.reserve(peers_.size());
    for (const auto& kv : peers_) out.push_back(kv.second);
    return out;
}

bool JsonPeerStore::remove_peer(const std::string& peer_id) {
    if (peers_.erase(peer_id) == 0) return false;
    return write_peers();
}

bool JsonPeerStore::log_activity(const ActivityRecord& rec) {
    activity_.push_back(rec);
    if (activity_.size() > MAX_ACTIVITY) activity_.erase(activity_.begin());
    return write_activity();
}

std::vector<ActivityRecord> JsonPeerStore::load_recent_activity(size_t limit) const {
    std::vector<ActivityRecord> out;
    for (auto it = activity_.rbegin(); it != activity_.rend() && out.size() < limit; ++it)
        out.push_back(*it);
    return out;
}

bool JsonPeerStore::write_peers() const {
    json j = json::object();
    for (const auto& kv : peers_) j[kv.first] = peer_to_json(kv.second);
    return write_file_atomic(dir_ / PEERS_FILE, j.dump(2, ' ', false, json::error_handler_t::replace) + "\n");
}

bool JsonPeerStore::write_activity() const {
    json a = json::array();
    for (const auto& r : activity_) {
        a.push_back(json{
            {"peerId",    r.peer_id},
            {"event",     r.event},
            {"details",   r.details},
            {"timestamp", r.timestamp_ms},
        });
    }
    return write_file_atomic(dir_ / ACTIVITY_FILE, a.dump(2, ' ', false, json::error_handler_t::replace) + "\n");
}

} // namespace beacon
