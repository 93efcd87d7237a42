#include "beacon/peer_event_bus.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "beacon/log.hpp"

namespace beacon {

PeerEventBus::Token PeerEventBus::subscribe_peers(PeerHandler handler) {
  const Token t = next_token_++;
  peer_subs_.push_back(Slot<PeerHandler>{t, std::move(handler)});
  return t;
}

PeerEventBus::Token PeerEventBus::subscribe_connection(ConnectionHandler handler) {
  const Token t = next_token_++;
  conn_subs_.push_back(Slot<ConnectionHandler>{t, std::move(handler)});
  return t;
}

bool PeerEventBus::unsubscribe(Token token) {
  for (auto& s : peer_subs_) {
    if (s.token == token && s.handler) { s.handler = nullptr; if (!dispatching_) compact(); return true; }
  }
  for (auto& s : conn_subs_) {
    if (s.token == token && s.handler) { s.handler = nullptr; if (!dispatching_) compact(); return true; }
  }
  return false;
}

void PeerEventBus::publish(const PeerEvent& ev) {
  enqueue(Pending{true, ev, ConnectionEvent{}});
}

void PeerEventBus::publish(const ConnectionEvent& ev) {
  enqueue(Pending{false, PeerEvent{}, ev});
}

size_t PeerEventBus::subscriber_count() const {
  size_t n = 0;
  for (const auto& s : peer_subs_) if (s.handler) ++n;
  for (const auto& s : conn_subs_) if (s.handler) ++n;
  return n;
}

void PeerEventBus::enqueue(Pending p) {
  pending_.push_back(std::move(p));
  if (!dispatching_) drain();
}

namespace {

// Clears the dispatch flag however drain() exits.
struct DispatchScope {
  bool& flag;
  explicit DispatchScope(bool& f) : flag(f) { flag = true; }
  ~DispatchScope() { flag = false; }
};

template <typename Handler, typename Event>
void deliver(const Handler& h, const Event& ev) {
  try {
    h(ev);
  } catch (const std::exception& e) {
    log::Line(log::Level::Error, "bus").kv("status", "error")
        .kv("reason", "handler_threw").kv("detail", e.what());
  }
}

} // namespace

// drain() - deliver queued events one at a time, each to every subscriber
// that is live when the event starts. Handlers may publish; those land at the
// back of pending_ and are picked up by this same loop. A handler that throws
// is logged and skipped; the rest still see the event.
void PeerEventBus::drain() {
  {
    DispatchScope scope(dispatching_);
    while (!pending_.empty()) {
      Pending p = std::move(pending_.front());
      pending_.pop_front();

      if (p.is_peer) {
        const size_t n = peer_subs_.size();          // late subscribers wait for the next event
        for (size_t i = 0; i < n; ++i) {
          PeerHandler h = peer_subs_[i].handler;     // copy: the slot may be cleared by the call
          if (h) deliver(h, p.peer);
        }
      } else {
        const size_t n = conn_subs_.size();
        for (size_t i = 0; i < n; ++i) {
          ConnectionHandler h = conn_subs_[i].handler;
          if (h) deliver(h, p.connection);
        }
      }
    }
  }
  compact();
}

void PeerEventBus::compact() {
  peer_subs_.erase(std::remove_if(peer_subs_.begin(), peer_subs_.end(),
                                  [](const Slot<PeerHandler>& s) { return !s.handler; }),
                   peer_subs_.end());
  conn_subs_.erase(std::remove_if(conn_subs_.begin(), conn_subs_.end(),
                                  [](const Slot<ConnectionHandler>& s) { return !s.handler; }),
                   conn_subs_.end());
}

} // namespace beacon
