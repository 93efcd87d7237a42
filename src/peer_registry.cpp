// -----------------------------------------------------------------------------
// peer_registry.cpp - snapshot diffing
// -----------------------------------------------------------------------------
#include "beacon/peer_registry.hpp"

#include "beacon/log.hpp"

namespace beacon {

std::vector<PeerEvent> PeerRegistry::update(const std::vector<Peer>& snapshot, uint64_t now_ms) {
  std::vector<PeerEvent> events;

  // Build the next state first so a bad entry leaves nothing half-applied.
  std::map<std::string, Peer> next;
  for (const auto& p : snapshot) {
    if (p.peer_id.empty()) {
      log::Line(log::Level::Error, "registry").kv("status", "error")
          .kv("reason", "empty_peer_id").kv("snapshot_size", snapshot.size());
      return events;
    }
    Peer rec = p;
    rec.last_seen_ms = now_ms;
    apply_connected(rec);
    next[rec.peer_id] = rec;                   // last occurrence wins
  }

  for (const auto& kv : next) {
    if (active_.find(kv.first) == active_.end()) {
      events.push_back(PeerEvent{PeerEvent::Kind::Joined, kv.second, now_ms});
    }
  }
  for (const auto& kv : active_) {
    if (next.find(kv.first) == next.end()) {
      events.push_back(PeerEvent{PeerEvent::Kind::Left, kv.second, now_ms});
    }
  }

  active_.swap(next);

  if (!events.empty()) {
    log::Line(log::Level::Debug, "registry").kv("status", "diff")
        .kv("events", events.size()).kv("active", active_.size());
  }
  return events;
}

std::vector<PeerEvent> PeerRegistry::clear(uint64_t now_ms) {
  std::vector<PeerEvent> events;
  events.reserve(active_.size());
  for (const auto& kv : active_) {
    events.push_back(PeerEvent{PeerEvent::Kind::Left, kv.second, now_ms});
  }
  active_.clear();
  return events;
}

void PeerRegistry::set_connected_peer(const std::string& peer_id) {
  connected_peer_ = peer_id;
  for (auto& kv : active_) {
    Peer& p = kv.second;
    if (p.peer_id == connected_peer_) {
      p.status = PeerStatus::Connected;
    } else if (p.status == PeerStatus::Connected) {
      p.status = PeerStatus::Available;        // stale until the next snapshot
    }
  }
}

std::vector<Peer> PeerRegistry::peers() const {
  std::vector<Peer> out;
  out.reserve(active_.size());
  for (const auto& kv : active_) out.push_back(kv.second);
  return out;
}

const Peer* PeerRegistry::find(const std::string& peer_id) const {
  auto it = active_.find(peer_id);
  return it == active_.end() ? nullptr : &it->second;
}

void PeerRegistry::apply_connected(Peer& p) const {
  if (!connected_peer_.empty() && p.peer_id == connected_peer_) p.status = PeerStatus::Connected;
}

} // namespace beacon
