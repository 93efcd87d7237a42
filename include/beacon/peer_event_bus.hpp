#pragma once
/**
 * @file peer_event_bus.hpp
 * @brief Ordered fan-out of PeerEvents and ConnectionEvents.
 *
 * @details
 * One dispatch path for both event kinds, so subscribers see them in the
 * order they were produced. Delivery is synchronous and never nested: an
 * event published from inside a handler is queued and delivered after the
 * current event has reached every subscriber.
 *
 * Subscribing or unsubscribing from inside a handler is allowed. A handler
 * removed mid-dispatch is not called again; one added mid-dispatch starts
 * with the next event.
 *
 * Single-threaded (the Session tick loop).
 */

#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

#include "beacon/peer.hpp"

namespace beacon {

class PeerEventBus {
public:
  using Token = uint32_t;
  using PeerHandler = std::function<void(const PeerEvent&)>;
  using ConnectionHandler = std::function<void(const ConnectionEvent&)>;

  Token subscribe_peers(PeerHandler handler);
  Token subscribe_connection(ConnectionHandler handler);

  /// Returns false for an unknown (or already removed) token.
  bool unsubscribe(Token token);

  void publish(const PeerEvent& ev);
  void publish(const ConnectionEvent& ev);

  size_t subscriber_count() const;

private:
  struct Pending {
    bool            is_peer;
    PeerEvent       peer;
    ConnectionEvent connection;
  };
  template <typename H>
  struct Slot {
    Token token;
    H     handler;    ///< Empty once unsubscribed; compacted after dispatch.
  };

  void enqueue(Pending p);
  void drain();
  void compact();

  std::vector<Slot<PeerHandler>>       peer_subs_;
  std::vector<Slot<ConnectionHandler>> conn_subs_;
  std::deque<Pending> pending_;
  Token next_token_{1};
  bool  dispatching_{false};
};

} // namespace beacon
