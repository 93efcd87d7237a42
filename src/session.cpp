// -----------------------------------------------------------------------------
// session.cpp - wiring and the tick loop
//
// API & event side effects: see include/beacon/session.hpp
// -----------------------------------------------------------------------------
#include "beacon/session.hpp"

#include <utility>

#include "beacon/bridge/device_mapping.hpp"
#include "beacon/log.hpp"

namespace beacon {

Session::Options session_options(const SessionConfig& cfg) {
  Session::Options o;
  o.negotiator.port               = cfg.tcp_port;
  o.negotiator.bind_address       = cfg.bind_address;
  o.negotiator.settle_delay_ms    = cfg.settle_delay_ms;
  o.negotiator.connect_timeout_ms = cfg.connect_timeout_ms;
  o.negotiator.accept_timeout_ms  = cfg.accept_timeout_ms;
  o.negotiator.retry.max_attempts = cfg.retry_attempts;
  o.negotiator.retry.base_delay_ms = cfg.retry_base_ms;
  o.negotiator.retry.max_delay_ms = cfg.retry_max_ms;
  o.identity.sender_id   = cfg.device_id;
  o.identity.sender_name = cfg.device_name;
  return o;
}

Session::Session(bridge::IDiscoveryBridge& bridge, Options options,
                 IPeerStore* store, INotificationSink* sink, WallClock clock)
: bridge_(bridge),
  store_(store),
  sink_(sink),
  clock_(std::move(clock)),
  default_identity_(options.identity),
  negotiator_(std::move(options.negotiator)),
  orchestrator_([this]() { return negotiator_.channel(); }, clock_) {
  orchestrator_.set_identity(default_identity_);
  negotiator_.set_clock(clock_);
  wire();
}

Session::~Session() {
  dispose();
  for (auto t : tokens_) bus_.unsubscribe(t);
}

// wire() - connect the components once. Handlers stay installed across
// dispose()/initialize(); they are inert while no events flow.
void Session::wire() {
  negotiator_.set_inbound_handler([this](const Message& m) { orchestrator_.on_inbound(m); });

  negotiator_.set_event_handler([this](const ConnectionEvent& ev) {
    switch (ev.kind) {
      case ConnectionEvent::Kind::SocketUp:
        registry_.set_connected_peer(ev.peer_id);
        record(ev.peer_id, "connected", ev.remote_address);
        break;
      case ConnectionEvent::Kind::SocketDown:
        registry_.set_connected_peer(std::string());
        record(ev.peer_id, "disconnected", ev.remote_address);
        if (ev.error != Error::None) release_group(ev.error);
        break;
      case ConnectionEvent::Kind::Failed:
        record(ev.peer_id, "failed", to_reason(ev.error));
        release_group(ev.error);
        break;
    }
    bus_.publish(ev);
  });

  orchestrator_.add_listener([this](const Message& m) {
    if (m.direction != Message::Direction::Inbound) return;
    record(m.sender_id, "message", m.text);
    if (sink_) sink_->notify_message(m);
  });

  tokens_.push_back(bus_.subscribe_peers([this](const PeerEvent& ev) {
    if (ev.kind == PeerEvent::Kind::Joined) {
      if (store_ && !store_->save_peer(ev.peer)) {
        log::Line(log::Level::Warn, "session").kv("status", "error")
            .kv("reason", "store_save").kv("peer", ev.peer.peer_id);
      }
      record(ev.peer.peer_id, "joined", ev.peer.display_name);
      if (sink_) sink_->notify_peer_joined(ev.peer);
    } else {
      record(ev.peer.peer_id, "left", ev.peer.display_name);
      if (sink_) sink_->notify_peer_left(ev.peer);
    }
  }));
}

Error Session::initialize() {
  if (init_error_ == Error::None) return Error::None;

  if (!bridge_.is_supported()) {
    init_error_ = Error::DiscoveryUnavailable;
  } else if (!bridge_.has_permissions()) {
    init_error_ = Error::PermissionDenied;
  } else {
    bridge_.set_listener(this);
    if (!bridge_.initialize()) {
      bridge_.set_listener(nullptr);
      init_error_ = Error::BridgeInitFailure;
    } else {
      init_error_ = Error::None;
    }
  }

  if (init_error_ != Error::None) {
    log::Line(log::Level::Error, "session").kv("status", "error")
        .kv("reason", to_reason(init_error_)).kv("bridge", bridge_.name());
    return init_error_;
  }

  log::Line(log::Level::Info, "session").kv("status", "ready").kv("bridge", bridge_.name())
      .kv("id", orchestrator_.identity().sender_id);
  drain_inbox(last_tick_ms_);          // identity reported during initialize()
  return Error::None;
}

Error Session::start_discovery() {
  if (init_error_ != Error::None) return init_error_;
  if (!bridge_.start_discovery()) {
    log::Line(log::Level::Error, "session").kv("status", "error")
        .kv("reason", to_reason(Error::DiscoveryUnavailable)).kv("op", "start_discovery");
    return Error::DiscoveryUnavailable;
  }
  negotiator_.on_discovery_started();
  log::Line(log::Level::Info, "session").kv("status", "discovering");
  return Error::None;
}

Error Session::stop_discovery() {
  if (init_error_ != Error::None) return init_error_;
  if (!bridge_.stop_discovery()) {
    log::Line(log::Level::Warn, "session").kv("status", "error")
        .kv("reason", "bridge_refused").kv("op", "stop_discovery");
  }
  negotiator_.on_discovery_stopped();
  publish_peer_events(registry_.clear(clock_()));
  log::Line(log::Level::Info, "session").kv("status", "discovery_stopped");
  return Error::None;
}

Error Session::connect(const std::string& peer_id) {
  if (init_error_ != Error::None) return init_error_;
  if (!bridge_.connect(peer_id)) {
    log::Line(log::Level::Warn, "session").kv("status", "error")
        .kv("reason", to_reason(Error::ConnectionFailed)).kv("peer", peer_id);
    return Error::ConnectionFailed;
  }
  return Error::None;
}

Error Session::disconnect() {
  if (init_error_ != Error::None) return init_error_;
  negotiator_.disconnect();
  bridge_.disconnect();                 // false just means no group was formed
  return Error::None;
}

bool Session::send_message(const std::string& text) {
  if (init_error_ != Error::None) {
    log::Line(log::Level::Warn, "session").kv("status", "error")
        .kv("reason", to_reason(init_error_)).kv("op", "send_message");
    return false;
  }
  return orchestrator_.send_message(text);
}

void Session::tick(uint64_t now_ms) {
  if (init_error_ != Error::None) return;
  last_tick_ms_ = now_ms;
  bridge_.poll(now_ms);
  drain_inbox(now_ms);
  negotiator_.tick(now_ms);
}

void Session::dispose() {
  if (init_error_ != Error::None) return;

  if (negotiator_.discovering()) {
    bridge_.stop_discovery();
    negotiator_.on_discovery_stopped();
  }
  negotiator_.disconnect();
  bridge_.disconnect();
  bridge_.set_listener(nullptr);
  {
    std::lock_guard<std::mutex> lock(inbox_mu_);
    inbox_.clear();
  }
  init_error_ = Error::NotInitialized;
  log::Line(log::Level::Info, "session").kv("status", "disposed");
}

size_t Session::dropped_events() const {
  std::lock_guard<std::mutex> lock(inbox_mu_);
  return dropped_;
}

// ---------- bridge inbox ----------

void Session::peers_updated(const std::vector<bridge::DeviceRecord>& devices) {
  BridgeEvent ev;
  ev.kind = BridgeEvent::Kind::Peers;
  ev.devices = devices;
  post(std::move(ev));
}

void Session::connection_changed(bool connected, bool is_host,
                                 const std::string& host_address,
                                 const std::string& peer_id) {
  BridgeEvent ev;
  ev.kind = BridgeEvent::Kind::Connection;
  ev.connected = connected;
  ev.is_host = is_host;
  ev.host_address = host_address;
  ev.peer_id = peer_id;
  post(std::move(ev));
}

void Session::this_device_changed(const bridge::ThisDevice& self) {
  BridgeEvent ev;
  ev.kind = BridgeEvent::Kind::ThisDevice;
  ev.self = self;
  post(std::move(ev));
}

void Session::radio_state_changed(bool enabled) {
  BridgeEvent ev;
  ev.kind = BridgeEvent::Kind::Radio;
  ev.enabled = enabled;
  post(std::move(ev));
}

void Session::post(BridgeEvent ev) {
  std::lock_guard<std::mutex> lock(inbox_mu_);

  // Snapshots are complete lists: a newer one supersedes a pending one.
  // It takes its place at the back, behind anything queued since.
  if (ev.kind == BridgeEvent::Kind::Peers) {
    for (auto it = inbox_.begin(); it != inbox_.end(); ++it) {
      if (it->kind == BridgeEvent::Kind::Peers) {
        inbox_.erase(it);
        break;
      }
    }
  }
  if (inbox_.full()) {
    ++dropped_;
    log::Line(log::Level::Warn, "session").kv("status", "dropped")
        .kv("reason", "inbox_full").kv("dropped", dropped_);
    return;
  }
  inbox_.push_back(std::move(ev));
}

void Session::drain_inbox(uint64_t now_ms) {
  for (;;) {
    BridgeEvent ev;
    {
      std::lock_guard<std::mutex> lock(inbox_mu_);
      if (inbox_.empty()) return;
      ev = std::move(inbox_.front());
      inbox_.pop_front();
    }
    apply(ev, now_ms);
  }
}

void Session::apply(const BridgeEvent& ev, uint64_t now_ms) {
  switch (ev.kind) {
    case BridgeEvent::Kind::Peers: {
      const uint64_t wall = clock_();
      publish_peer_events(registry_.update(bridge::to_peers(ev.devices, wall), wall));
      return;
    }
    case BridgeEvent::Kind::Connection:
      negotiator_.on_bridge_connection_changed(ev.connected, ev.is_host, ev.host_address,
                                               ev.peer_id, now_ms);
      return;
    case BridgeEvent::Kind::ThisDevice: {
      LocalIdentity id = orchestrator_.identity();
      if (!ev.self.device_address.empty()) id.sender_id = ev.self.device_address;
      if (!ev.self.device_name.empty())    id.sender_name = ev.self.device_name;
      orchestrator_.set_identity(id);
      log::Line(log::Level::Debug, "session").kv("status", "identity")
          .kv("id", id.sender_id).kv("name", id.sender_name);
      return;
    }
    case BridgeEvent::Kind::Radio:
      log::Line(log::Level::Info, "session").kv("status", "radio").kv("enabled", ev.enabled);
      if (!ev.enabled) negotiator_.disconnect();
      return;
  }
}

void Session::publish_peer_events(const std::vector<PeerEvent>& events) {
  for (const auto& e : events) {
    log::Line(log::Level::Info, "session").kv("status", to_string(e.kind))
        .kv("peer", e.peer.peer_id).kv("name", e.peer.display_name);
    bus_.publish(e);
  }
}

// The socket is gone but the radio group may still stand; leave it so the
// next connect() starts clean.
void Session::release_group(Error cause) {
  if (!bridge_.disconnect()) return;   // no group formed
  log::Line(log::Level::Info, "session").kv("status", "group_released")
      .kv("reason", to_reason(cause));
}

void Session::record(const std::string& peer_id, const char* event, const std::string& details) {
  if (!store_) return;
  ActivityRecord rec{peer_id, event, details, clock_()};
  if (!store_->log_activity(rec)) {
    log::Line(log::Level::Warn, "session").kv("status", "error")
        .kv("reason", "store_activity").kv("event", event);
  }
}

} // namespace beacon
