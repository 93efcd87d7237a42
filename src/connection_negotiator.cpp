// -----------------------------------------------------------------------------
// connection_negotiator.cpp - Implementation of ConnectionNegotiator
//
// API & phase diagram:
//   see include/beacon/connection_negotiator.hpp
//
// NOTE: Everything here runs on the tick loop. No call blocks: sockets are
// non-blocking, deadlines are compared against the now_ms we are handed.
// -----------------------------------------------------------------------------
#include "beacon/connection_negotiator.hpp"

#include "socket_io.hpp"
#include "beacon/log.hpp"

namespace beacon {

ConnectionNegotiator::ConnectionNegotiator()
: settings_() {}

ConnectionNegotiator::ConnectionNegotiator(Settings settings)
: settings_(std::move(settings)) {}

ConnectionNegotiator::~ConnectionNegotiator() {
  close_pending();
  channel_.reset();                       // closes the socket; no events from a destructor
}

ConnectionState ConnectionNegotiator::state() const {
  switch (phase_) {
    case Phase::Negotiating: return ConnectionState::Negotiating;
    case Phase::Hosting:     return ConnectionState::Hosting;
    case Phase::Connecting:  return ConnectionState::Connecting;
    case Phase::Active:      return ConnectionState::Active;
    default:                 return ConnectionState::Disconnected;
  }
}

void ConnectionNegotiator::on_discovery_started() {
  discovering_ = true;
  if (phase_ == Phase::Idle) phase_ = Phase::Discovering;
}

void ConnectionNegotiator::on_discovery_stopped() {
  discovering_ = false;
  if (phase_ == Phase::Discovering) phase_ = Phase::Idle;
}

void ConnectionNegotiator::on_bridge_connection_changed(bool connected, bool is_host,
                                                        const std::string& host_address,
                                                        const std::string& peer_id,
                                                        uint64_t now_ms) {
  if (!connected) {
    if (in_session()) teardown("bridge_lost");
    return;
  }

  // POLICY: role is fixed for the lifetime of one negotiated session.
  if (in_session()) {
    if (is_host != is_host_) {
      log::Line(log::Level::Warn, "negotiator").kv("status", "ignored")
          .kv("reason", "role_fixed").kv("phase", to_string(phase_))
          .kv("reported_host", is_host);
    }
    if (peer_id_.empty() && !peer_id.empty()) peer_id_ = peer_id;   // late detail is still useful
    return;
  }

  is_host_      = is_host;
  host_address_ = host_address;
  peer_id_      = peer_id;
  remote_address_.clear();
  attempts_     = 0;
  last_cause_   = Error::None;

  if (!is_host_ && host_address_.empty()) {
    // Nothing to dial. Report instead of waiting out the retries.
    log::Line(log::Level::Error, "negotiator").kv("status", "error")
        .kv("reason", "no_host_address").kv("peer", peer_id_);
    publish(ConnectionEvent::Kind::Failed, Error::ConnectionFailed);
    phase_ = rest_phase();
    return;
  }

  phase_ = Phase::Negotiating;
  settle_until_ms_ = now_ms + settings_.settle_delay_ms;
  log::Line(log::Level::Info, "negotiator").kv("status", "negotiating")
      .kv("role", is_host_ ? "host" : "client").kv("host", host_address_).kv("peer", peer_id_);
}

void ConnectionNegotiator::disconnect() {
  if (in_session()) teardown("local_disconnect");
}

void ConnectionNegotiator::tick(uint64_t now_ms) {
  switch (phase_) {
    case Phase::Negotiating:
      if (now_ms < settle_until_ms_) return;
      phase_ = is_host_ ? Phase::Hosting : Phase::Connecting;
      next_attempt_ms_ = now_ms;                       // first attempt right away
      begin_attempt(now_ms);
      return;

    case Phase::Hosting:
      progress_host(now_ms);
      return;

    case Phase::Connecting:
      progress_client(now_ms);
      return;

    case Phase::Active:
      channel_->service();
      if (!channel_->is_open()) {
        const Error cause = channel_->last_error();
        teardown("socket_closed", cause != Error::None ? cause : Error::ConnectionFailed);
      }
      return;

    default:
      return;
  }
}

// ---------- private ----------

bool ConnectionNegotiator::in_session() const {
  return phase_ == Phase::Negotiating || phase_ == Phase::Hosting
      || phase_ == Phase::Connecting  || phase_ == Phase::Active;
}

void ConnectionNegotiator::begin_attempt(uint64_t now_ms) {
  ++attempts_;

  if (is_host_) {
    listen_fd_ = open_listener(settings_.bind_address, settings_.port);
    if (listen_fd_ < 0) {
      attempt_failed(now_ms, Error::ConnectionFailed, "bind: " + last_error_text());
      return;
    }
    listening_port_ = local_port(listen_fd_);
    attempt_deadline_ms_ = now_ms + settings_.accept_timeout_ms;
    log::Line(log::Level::Info, "negotiator").kv("status", "listening")
        .kv("port", listening_port_).kv("attempt", attempts_);
  } else {
    connect_fd_ = begin_connect(host_address_, settings_.port);
    if (connect_fd_ < 0) {
      attempt_failed(now_ms, Error::ConnectionFailed, "connect: " + last_error_text());
      return;
    }
    attempt_deadline_ms_ = now_ms + settings_.connect_timeout_ms;
    log::Line(log::Level::Info, "negotiator").kv("status", "dialing")
        .kv("host", host_address_).kv("port", settings_.port).kv("attempt", attempts_);
  }
}

void ConnectionNegotiator::progress_host(uint64_t now_ms) {
  if (listen_fd_ < 0) {                                // waiting out a backoff
    if (now_ms >= next_attempt_ms_) begin_attempt(now_ms);
    return;
  }

  std::string remote;
  int fd = accept_peer(listen_fd_, remote);
  if (fd >= 0) {
    go_active(fd, remote);
    return;
  }
  if (now_ms >= attempt_deadline_ms_) {
    attempt_failed(now_ms, Error::ConnectionTimeout, "accept timed out");
  }
}

void ConnectionNegotiator::progress_client(uint64_t now_ms) {
  if (connect_fd_ < 0) {
    if (now_ms >= next_attempt_ms_) begin_attempt(now_ms);
    return;
  }

  switch (poll_connect(connect_fd_)) {
    case ConnectProgress::Connected: {
      int fd = connect_fd_;
      connect_fd_ = -1;                                // ownership moves to the channel
      std::string remote = peer_address(fd);
      go_active(fd, remote.empty() ? host_address_ + ":" + std::to_string(settings_.port) : remote);
      return;
    }
    case ConnectProgress::Failed:
      attempt_failed(now_ms, Error::ConnectionFailed, "connect: " + last_error_text());
      return;
    case ConnectProgress::InProgress:
      if (now_ms >= attempt_deadline_ms_) {
        attempt_failed(now_ms, Error::ConnectionTimeout, "connect timed out");
      }
      return;
  }
}

// attempt_failed() - close whatever was in flight, then either schedule the
// next attempt under the retry policy or report the session as failed.
void ConnectionNegotiator::attempt_failed(uint64_t now_ms, Error cause, const std::string& detail) {
  close_pending();
  last_cause_ = cause;

  if (settings_.retry.exhausted(attempts_)) {
    log::Line(log::Level::Error, "negotiator").kv("status", "error")
        .kv("reason", to_reason(cause)).kv("attempts", attempts_).kv("detail", detail);
    publish(ConnectionEvent::Kind::Failed, cause);
    phase_ = rest_phase();
    return;
  }

  const uint32_t delay = settings_.retry.delay_before(attempts_ + 1);
  next_attempt_ms_ = now_ms + delay;
  log::Line(log::Level::Warn, "negotiator").kv("status", "retry")
      .kv("reason", to_reason(cause)).kv("attempt", attempts_)
      .kv("delay_ms", delay).kv("detail", detail);
}

void ConnectionNegotiator::go_active(int fd, const std::string& remote) {
  close_pending();                                     // host: one inbound peer per session

  remote_address_ = remote;
  channel_ = std::make_unique<MessageChannel>(fd, remote_address_, peer_id_);
  channel_->set_inbound_handler(on_inbound_);
  channel_->set_clock(clock_);
  phase_ = Phase::Active;

  log::Line(log::Level::Info, "negotiator").kv("status", "active")
      .kv("role", is_host_ ? "host" : "client").kv("remote", remote_address_)
      .kv("attempt", attempts_);
  publish(ConnectionEvent::Kind::SocketUp);
}

void ConnectionNegotiator::teardown(const char* reason, Error cause) {
  const bool was_active = (phase_ == Phase::Active);
  close_pending();
  if (channel_) channel_->close();

  log::Line(log::Level::Info, "negotiator").kv("status", "down")
      .kv("reason", reason).kv("phase", to_string(phase_));

  phase_ = rest_phase();
  if (was_active) publish(ConnectionEvent::Kind::SocketDown, cause);
  channel_.reset();

  is_host_ = false;
  host_address_.clear();
  peer_id_.clear();
  remote_address_.clear();
  attempts_ = 0;
}

void ConnectionNegotiator::close_pending() {
  if (listen_fd_ >= 0) { close_socket(listen_fd_); listen_fd_ = -1; }
  if (connect_fd_ >= 0) { close_socket(connect_fd_); connect_fd_ = -1; }
}

void ConnectionNegotiator::publish(ConnectionEvent::Kind kind, Error error) {
  if (!on_event_) return;
  ConnectionEvent ev;
  ev.kind           = kind;
  ev.remote_address = remote_address_;
  ev.peer_id        = peer_id_;
  ev.error          = error;
  on_event_(ev);
}

const char* to_string(ConnectionNegotiator::Phase p) {
  switch (p) {
    case ConnectionNegotiator::Phase::Idle:        return "idle";
    case ConnectionNegotiator::Phase::Discovering: return "discovering";
    case ConnectionNegotiator::Phase::Negotiating: return "negotiating";
    case ConnectionNegotiator::Phase::Hosting:     return "hosting";
    case ConnectionNegotiator::Phase::Connecting:  return "connecting";
    case ConnectionNegotiator::Phase::Active:      return "active";
  }
  return "idle";
}

} // namespace beacon
