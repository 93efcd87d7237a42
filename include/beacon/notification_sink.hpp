#pragma once
/**
 * @file notification_sink.hpp
 * @brief Where user-facing notifications go (desktop toast, console, test recorder).
 *
 * Called on the Session tick loop. Implementations should return quickly.
 */

#include "beacon/message.hpp"
#include "beacon/peer.hpp"

namespace beacon {

class INotificationSink {
public:
  virtual ~INotificationSink() = default;
  virtual void notify_peer_joined(const Peer& peer) = 0;
  virtual void notify_peer_left(const Peer& peer) = 0;
  virtual void notify_message(const Message& msg) = 0;
};

} // namespace beacon
