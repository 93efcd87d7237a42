#pragma once
/**
 * @file session.hpp
 * @brief One device's Beacon Link: bridge, peers, connection, messages.
 *
 * @details
 * PURPOSE
 * -------
 * Session is the object an app constructs once and drives from one loop. It
 * owns the PeerRegistry, ConnectionNegotiator, MessagingOrchestrator and
 * PeerEventBus, and borrows the bridge, store and notification sink it is
 * given. There is no global state; two Sessions in one process (as in tests)
 * are fully independent.
 *
 * EXECUTION MODEL
 * ---------------
 * Everything happens inside tick(now_ms), in this order:
 *   1) bridge.poll(now_ms)
 *   2) drain the bridge inbox (peer snapshots, group changes, identity, radio)
 *   3) negotiator.tick(now_ms) (bind/accept/connect progress, channel I/O)
 *
 * Bridge callbacks may come from any thread. They only append to a bounded,
 * mutex-guarded inbox. A newer peer snapshot replaces a pending one and
 * queues behind events posted after it.
 *
 * LIFECYCLE
 * ---------
 * initialize() must succeed first. Until it does, every operation returns
 * the initialization error (NotInitialized if it was never called) and does
 * nothing. dispose() stops discovery, drops the connection and detaches
 * from the bridge; the Session can be initialized again afterwards.
 *
 * SIDE EFFECTS OF EVENTS
 * ----------------------
 *   Joined      store.save_peer + activity "joined", sink.notify_peer_joined
 *   Left        activity "left", sink.notify_peer_left
 *   inbound msg activity "message", sink.notify_message
 *   SocketUp    activity "connected"; registry marks the peer Connected
 *   SocketDown  activity "disconnected"; bridge.disconnect() if the socket failed
 *   Failed      activity "failed"; bridge.disconnect() so connect() can start over
 *   radio off   connection torn down; peers stay until the next snapshot
 */

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "etl/deque.h"
#include "beacon/bridge/discovery_bridge.hpp"
#include "beacon/clock.hpp"
#include "beacon/config.hpp"
#include "beacon/connection_negotiator.hpp"
#include "beacon/errors.hpp"
#include "beacon/messaging_orchestrator.hpp"
#include "beacon/notification_sink.hpp"
#include "beacon/peer_event_bus.hpp"
#include "beacon/peer_registry.hpp"
#include "beacon/peer_store.hpp"

namespace beacon {

class Session : private bridge::BridgeListener {
public:
  static constexpr size_t INBOX_CAP = 64;

  struct Options {
    ConnectionNegotiator::Settings negotiator;
    LocalIdentity identity;          ///< Until the bridge reports this device.
  };

  /// @param store, sink  Optional (nullptr); must outlive the Session otherwise.
  Session(bridge::IDiscoveryBridge& bridge, Options options,
          IPeerStore* store = nullptr, INotificationSink* sink = nullptr,
          WallClock clock = wall_clock_ms);
  ~Session() override;

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /// DiscoveryUnavailable | PermissionDenied | BridgeInitFailure | None.
  Error initialize();
  bool initialized() const { return init_error_ == Error::None; }

  Error start_discovery();
  /// Emits Left for every active peer.
  Error stop_discovery();
  /// Ask the bridge to form a group with @p peer_id. The outcome arrives as events.
  Error connect(const std::string& peer_id);
  Error disconnect();
  /// False when not initialized, not connected, or the write failed.
  bool send_message(const std::string& text);

  void tick(uint64_t now_ms);
  void dispose();

  const std::vector<Message>& history() const { return orchestrator_.history(); }
  std::vector<Peer> peers() const { return registry_.peers(); }
  ConnectionState connection_state() const { return negotiator_.state(); }
  const LocalIdentity& identity() const { return orchestrator_.identity(); }
  bool discovering() const { return negotiator_.discovering(); }

  PeerEventBus& bus() { return bus_; }
  MessagingOrchestrator& messaging() { return orchestrator_; }
  const ConnectionNegotiator& negotiator() const { return negotiator_; }

  /// Bridge events dropped because the inbox was full.
  size_t dropped_events() const;

private:
  struct BridgeEvent {
    enum class Kind : uint8_t { Peers, Connection, ThisDevice, Radio };
    Kind kind{Kind::Peers};
    std::vector<bridge::DeviceRecord> devices;
    bool connected{false};
    bool is_host{false};
    bool enabled{false};
    std::string host_address;
    std::string peer_id;
    bridge::ThisDevice self;
  };

  // BridgeListener (any thread)
  void peers_updated(const std::vector<bridge::DeviceRecord>& devices) override;
  void connection_changed(bool connected, bool is_host,
                          const std::string& host_address,
                          const std::string& peer_id) override;
  void this_device_changed(const bridge::ThisDevice& self) override;
  void radio_state_changed(bool enabled) override;

  void post(BridgeEvent ev);
  void drain_inbox(uint64_t now_ms);
  void apply(const BridgeEvent& ev, uint64_t now_ms);
  void publish_peer_events(const std::vector<PeerEvent>& events);
  void wire();
  void record(const std::string& peer_id, const char* event, const std::string& details);
  void release_group(Error cause);

  bridge::IDiscoveryBridge& bridge_;
  IPeerStore*        store_;
  INotificationSink* sink_;
  WallClock          clock_;
  LocalIdentity      default_identity_;

  PeerRegistry          registry_;
  ConnectionNegotiator  negotiator_;
  MessagingOrchestrator orchestrator_;
  PeerEventBus          bus_;
  std::vector<PeerEventBus::Token> tokens_;

  Error    init_error_{Error::NotInitialized};
  uint64_t last_tick_ms_{0};

  mutable std::mutex inbox_mu_;
  etl::deque<BridgeEvent, INBOX_CAP> inbox_;
  size_t dropped_{0};
};

/// Session options from the loaded config.
Session::Options session_options(const SessionConfig& cfg);

} // namespace beacon
