#pragma once
/**
 * @file peer.hpp
 * @brief Peer records and the events derived from them.
 *
 * @details
 * A Peer is whatever the discovery bridge last told us about one nearby
 * device. Its identity is `peer_id` and nothing else: two records with the
 * same id are the same device even if name, status or signal differ.
 *
 * PeerEvent (Joined/Left) is never reported by the radio. PeerRegistry
 * computes it by diffing consecutive snapshots. ConnectionEvent is published
 * by ConnectionNegotiator when the transport socket comes up, goes down, or
 * could not be established at all.
 */

#include <cstdint>
#include <string>

#include "beacon/errors.hpp"

namespace beacon {

enum class PeerStatus : uint8_t { Available, Invited, Connected, Failed, Unavailable };

struct Peer {
  std::string peer_id;          ///< Stable unique key (radio MAC or generated device id).
  std::string display_name;
  PeerStatus  status{PeerStatus::Available};
  uint8_t     signal_strength{0};   ///< Ordinal 0..5.
  uint64_t    last_seen_ms{0};      ///< Epoch milliseconds.
  bool        is_emergency{false};
};

bool operator==(const Peer& a, const Peer& b);
inline bool operator!=(const Peer& a, const Peer& b) { return !(a == b); }

struct PeerEvent {
  enum class Kind : uint8_t { Joined, Left };
  Kind     kind{Kind::Joined};
  Peer     peer;
  uint64_t observed_at_ms{0};
};

/// Externally visible transport state. At most one non-Disconnected state at a time.
enum class ConnectionState : uint8_t { Disconnected, Negotiating, Hosting, Connecting, Active };

struct ConnectionEvent {
  enum class Kind : uint8_t { SocketUp, SocketDown, Failed };
  Kind        kind{Kind::SocketDown};
  std::string remote_address;   ///< May be empty (e.g. host before accept).
  std::string peer_id;          ///< Bridge-reported peer, if known.
  Error       error{Error::None};   ///< Set for Failed, and for SocketDown caused by the socket.
};

const char* to_string(PeerStatus s);
const char* to_string(PeerEvent::Kind k);
const char* to_string(ConnectionState s);
const char* to_string(ConnectionEvent::Kind k);

/// Inverse of to_string(PeerStatus). Unknown text yields Unavailable and returns false.
bool parse_peer_status(const std::string& s, PeerStatus& out);

} // namespace beacon
