// ============================================================================
// peer.cpp - implementation for peer.hpp
// ============================================================================

#include "beacon/peer.hpp"

namespace beacon {

bool operator==(const Peer& a, const Peer& b) {
  return a.peer_id == b.peer_id
      && a.display_name == b.display_name
      && a.status == b.status
      && a.signal_strength == b.signal_strength
      && a.last_seen_ms == b.last_seen_ms
      && a.is_emergency == b.is_emergency;
}

const char* to_string(PeerStatus s) {
  switch (s) {
    case PeerStatus::Available:   return "Available";
    case PeerStatus::Invited:     return "Invited";
    case PeerStatus::Connected:   return "Connected";
    case PeerStatus::Failed:      return "Failed";
    case PeerStatus::Unavailable: return "Unavailable";
  }
  return "Unavailable";
}

const char* to_string(PeerEvent::Kind k) {
  return k == PeerEvent::Kind::Joined ? "joined" : "left";
}

const char* to_string(ConnectionState s) {
  switch (s) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Negotiating:  return "negotiating";
    case ConnectionState::Hosting:      return "hosting";
    case ConnectionState::Connecting:   return "connecting";
    case ConnectionState::Active:       return "active";
  }
  return "disconnected";
}

const char* to_string(ConnectionEvent::Kind k) {
  switch (k) {
    case ConnectionEvent::Kind::SocketUp:   return "socket_up";
    case ConnectionEvent::Kind::SocketDown: return "socket_down";
    case ConnectionEvent::Kind::Failed:     return "failed";
  }
  return "socket_down";
}

bool parse_peer_status(const std::string& s, PeerStatus& out) {
  if      (s == "Available")   out = PeerStatus::Available;
  else if (s == "Invited")     out = PeerStatus::Invited;
  else if (s == "Connected")   out = PeerStatus::Connected;
  else if (s == "Failed")      out = PeerStatus::Failed;
  else if (s == "Unavailable") out = PeerStatus::Unavailable;
  else { out = PeerStatus::Unavailable; return false; }
  return true;
}

} // namespace beacon
