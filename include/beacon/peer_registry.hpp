#pragma once
/**
 * @file peer_registry.hpp
 * @brief Turns bridge snapshots into a stable peer map plus Joined/Left events.
 *
 * @details
 * The radio never says "this device left". It only hands us the full list of
 * what it can currently see. PeerRegistry keeps the previous list, keyed by
 * peer_id, and diffs:
 *
 *   added   = snapshot - previous   -> Joined (new record)
 *   removed = previous - snapshot   -> Left   (last known record)
 *
 * Identity is peer_id only. A peer whose name, status or signal changed is
 * updated in place and produces no event.
 *
 * There is no de-bounce. A device that drops out for one poll and comes back
 * yields Left then Joined.
 */

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "beacon/peer.hpp"

namespace beacon {

class PeerRegistry {
public:
  /**
   * @brief Apply a full snapshot and return the derived events.
   *
   * Joined events come first (in peer_id order), then Left events. Every
   * present peer is stamped last_seen_ms = now_ms. A snapshot with an empty
   * peer_id anywhere is rejected: logged, no events, state unchanged.
   */
  std::vector<PeerEvent> update(const std::vector<Peer>& snapshot, uint64_t now_ms);

  /// Forget every active peer, returning one Left each.
  std::vector<PeerEvent> clear(uint64_t now_ms);

  /// Mark which peer the transport is connected to (empty for none).
  void set_connected_peer(const std::string& peer_id);
  const std::string& connected_peer() const { return connected_peer_; }

  /// Active peers in peer_id order.
  std::vector<Peer> peers() const;
  const Peer* find(const std::string& peer_id) const;
  size_t size() const { return active_.size(); }

private:
  void apply_connected(Peer& p) const;

  std::map<std::string, Peer> active_;
  std::string connected_peer_;
};

} // namespace beacon
