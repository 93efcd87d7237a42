#pragma once
/**
 * @file connection_negotiator.hpp
 * @brief Decides who hosts the transport socket and gets that socket up.
 *
 * @details
 * The radio layer forms a group and tells us two things: that we are
 * connected, and whether this device owns the group. The group owner hosts
 * the TCP socket; everyone else connects to the owner's address. This class
 * turns that report into one live MessageChannel, or into a clear "could
 * not" after a bounded number of tries.
 *
 * @par Phases
 * ```
 *   Idle ──startDiscovery──► Discovering
 *     │                           │
 *     └──────bridge: connected────┴──► Negotiating ──settle──► Hosting ─┐
 *                                                       └────► Connecting┤
 *                                                                        ▼
 *   Idle/Discovering ◄──lost / disconnect / socket error / retries out── Active
 * ```
 * - Negotiating waits `settle_delay_ms` so the group network is actually
 *   usable before we bind or dial (radio stacks report "connected" early).
 * - Hosting: bind the well-known port, accept exactly one peer, close the
 *   listener. Connecting: non-blocking connect to `host_address:port`.
 * - Each attempt has its own deadline (`accept_timeout_ms` /
 *   `connect_timeout_ms`). Failures retry under RetryPolicy. When the
 *   attempts run out a ConnectionEvent::Failed is published and we fall
 *   back. That is a report, not a crash; the caller may start over.
 * - The role is fixed once negotiation starts. A second "connected" report
 *   with the same role is a duplicate and is ignored; one with the other
 *   role is logged and ignored.
 * - After a session ends we return to Discovering if discovery is still
 *   running, otherwise Idle. Both read as ConnectionState::Disconnected.
 *
 * @par Events
 * SocketUp on entering Active, SocketDown on leaving it, Failed on retry
 * exhaustion. SocketDown carries an error only when the socket itself went
 * away (EOF or I/O failure); bridge loss and local disconnect leave it None. Handlers run synchronously inside the call that caused them.
 *
 * Single-threaded: every method must be called from the owning tick loop.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "beacon/backoff.hpp"
#include "beacon/clock.hpp"
#include "beacon/errors.hpp"
#include "beacon/message_channel.hpp"
#include "beacon/peer.hpp"

namespace beacon {

class ConnectionNegotiator {
public:
  enum class Phase : uint8_t { Idle, Discovering, Negotiating, Hosting, Connecting, Active };

  static constexpr uint16_t DEFAULT_PORT = 8888;

  struct Settings {
    uint16_t    port{DEFAULT_PORT};
    std::string bind_address;              ///< Host side; empty binds all interfaces.
    uint32_t    settle_delay_ms{500};
    uint32_t    connect_timeout_ms{5000};
    uint32_t    accept_timeout_ms{30000};
    RetryPolicy retry;
  };

  using EventHandler = std::function<void(const ConnectionEvent&)>;

  ConnectionNegotiator();
  explicit ConnectionNegotiator(Settings settings);
  ~ConnectionNegotiator();

  ConnectionNegotiator(const ConnectionNegotiator&) = delete;
  ConnectionNegotiator& operator=(const ConnectionNegotiator&) = delete;

  void set_event_handler(EventHandler handler) { on_event_ = std::move(handler); }
  /// Installed on every channel this negotiator creates.
  void set_inbound_handler(MessageChannel::InboundHandler handler) { on_inbound_ = std::move(handler); }
  void set_clock(WallClock clock) { clock_ = std::move(clock); }

  void on_discovery_started();
  void on_discovery_stopped();

  /**
   * @brief Bridge report of group membership.
   * @param connected     true when a group formed, false when it dissolved.
   * @param is_host       true when this device owns the group (hosts the socket).
   * @param host_address  IPv4 of the group owner (client side needs it).
   * @param peer_id       Bridge id of the other device, if known.
   */
  void on_bridge_connection_changed(bool connected, bool is_host,
                                    const std::string& host_address,
                                    const std::string& peer_id,
                                    uint64_t now_ms);

  /// Local request to drop the session. No-op when nothing is live.
  void disconnect();

  /// Advance timers, progress bind/accept/connect, service the channel.
  void tick(uint64_t now_ms);

  Phase           phase() const { return phase_; }
  ConnectionState state() const;
  bool            is_host() const { return is_host_; }
  bool            discovering() const { return discovering_; }
  uint32_t        attempts() const { return attempts_; }
  const std::string& peer_id() const { return peer_id_; }

  /// Live channel while Active, nullptr otherwise.
  MessageChannel* channel() { return phase_ == Phase::Active ? channel_.get() : nullptr; }

  /// Port the host listener is bound to (differs from Settings::port only for port 0).
  uint16_t listening_port() const { return listening_port_; }

  const Settings& settings() const { return settings_; }

private:
  bool in_session() const;
  Phase rest_phase() const { return discovering_ ? Phase::Discovering : Phase::Idle; }

  void begin_attempt(uint64_t now_ms);
  void progress_host(uint64_t now_ms);
  void progress_client(uint64_t now_ms);
  void attempt_failed(uint64_t now_ms, Error cause, const std::string& detail);
  void go_active(int fd, const std::string& remote);
  void teardown(const char* reason, Error cause = Error::None);
  void close_pending();
  void publish(ConnectionEvent::Kind kind, Error error = Error::None);

  Settings settings_;
  Phase    phase_{Phase::Idle};
  bool     discovering_{false};

  // session (valid from Negotiating until teardown)
  bool        is_host_{false};
  std::string host_address_;
  std::string peer_id_;
  std::string remote_address_;
  uint64_t    settle_until_ms_{0};
  uint32_t    attempts_{0};
  uint64_t    next_attempt_ms_{0};
  uint64_t    attempt_deadline_ms_{0};
  Error       last_cause_{Error::None};

  int      listen_fd_{-1};
  int      connect_fd_{-1};
  uint16_t listening_port_{0};
  std::unique_ptr<MessageChannel> channel_;

  EventHandler on_event_;
  MessageChannel::InboundHandler on_inbound_;
  WallClock clock_{wall_clock_ms};
};

const char* to_string(ConnectionNegotiator::Phase p);

} // namespace beacon
