// -----------------------------------------------------------------------------
// udp_beacon_bridge.cpp - LAN discovery for Linux hosts
//
// See include/beacon/bridge/udp_beacon_bridge.hpp for the datagram format.
// -----------------------------------------------------------------------------
#include "beacon/bridge/udp_beacon_bridge.hpp"

#include <utility>

#include "nlohmann/json.hpp"

#include "socket_io.hpp"
#include "beacon/log.hpp"

using json = nlohmann::json;

namespace beacon::bridge {

UdpBeaconBridge::UdpBeaconBridge(Settings settings)
: settings_(std::move(settings)) {}

UdpBeaconBridge::~UdpBeaconBridge() {
  if (fd_ >= 0) close_socket(fd_);
}

bool UdpBeaconBridge::initialize() {
  if (fd_ >= 0) return true;
  if (settings_.device_id.empty()) {
    log::Line(log::Level::Error, "udp-bridge").kv("status", "error").kv("reason", "no_device_id");
    return false;
  }

  fd_ = open_udp(settings_.port, true);
  if (fd_ < 0) {
    log::Line(log::Level::Error, "udp-bridge").kv("status", "error")
        .kv("reason", "bind_failed").kv("port", settings_.port).kv("detail", last_error_text());
    return false;
  }
  bound_port_ = local_port(fd_);
  log::Line(log::Level::Info, "udp-bridge").kv("status", "ready").kv("port", bound_port_)
      .kv("id", settings_.device_id);

  if (listener_) {
    listener_->this_device_changed(ThisDevice{settings_.device_id, settings_.device_name});
    listener_->radio_state_changed(true);
  }
  return true;
}

bool UdpBeaconBridge::start_discovery() {
  if (fd_ < 0) return false;
  discovering_ = true;
  next_beacon_ms_ = 0;                       // beacon on the next poll
  return true;
}

bool UdpBeaconBridge::stop_discovery() {
  if (fd_ < 0) return false;
  discovering_ = false;
  return true;
}

// connect() - invite the peer. The answer (accept) arrives in poll().
bool UdpBeaconBridge::connect(const std::string& peer_address) {
  auto it = known_.find(peer_address);
  if (fd_ < 0 || it == known_.end()) {
    log::Line(log::Level::Warn, "udp-bridge").kv("status", "error")
        .kv("reason", "unknown_peer").kv("peer", peer_address);
    return false;
  }
  if (!group_peer_.empty()) {
    log::Line(log::Level::Warn, "udp-bridge").kv("status", "error")
        .kv("reason", "already_grouped").kv("peer", group_peer_);
    return false;
  }
  if (!send_to(it->second.ip, "invite")) return false;

  it->second.record.status = "Invited";
  it->second.invited = true;
  it->second.invited_at_ms = now_ms_;
  report_peers();
  return true;
}

bool UdpBeaconBridge::disconnect() {
  if (group_peer_.empty()) return false;
  leave_group(true);
  return true;
}

std::vector<DeviceRecord> UdpBeaconBridge::discovered_peers() const {
  std::vector<DeviceRecord> out;
  out.reserve(known_.size());
  for (const auto& kv : known_) out.push_back(kv.second.record);
  return out;
}

void UdpBeaconBridge::poll(uint64_t now_ms) {
  now_ms_ = now_ms;
  if (fd_ < 0) return;

  std::string payload, from;
  for (;;) {
    IoResult r = recv_datagram(fd_, payload, from);
    if (r != IoResult::Ok) {
      if (r == IoResult::Error) {
        log::Line(log::Level::Warn, "udp-bridge").kv("status", "error")
            .kv("reason", "recv_failed").kv("detail", last_error_text());
      }
      break;
    }
    handle(payload, from, now_ms);
  }

  if (discovering_ && now_ms >= next_beacon_ms_) {
    send_to(settings_.broadcast_address, "beacon");
    next_beacon_ms_ = now_ms + settings_.beacon_interval_ms;
  }

  expire(now_ms);
}

// ---------- private ----------

std::string UdpBeaconBridge::make_datagram(const char* kind) const {
  json j;
  j["kind"]       = kind;
  j["peerId"]     = settings_.device_id;
  j["name"]       = settings_.device_name;
  j["status"]     = group_peer_.empty() ? "Available" : "Connected";
  j["emergency"]  = settings_.emergency;
  j["deviceType"] = settings_.device_type;
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool UdpBeaconBridge::send_to(const std::string& ip, const char* kind) {
  if (!send_datagram(fd_, ip, settings_.peer_port, make_datagram(kind))) {
    log::Line(log::Level::Warn, "udp-bridge").kv("status", "error").kv("reason", "send_failed")
        .kv("kind", kind).kv("to", ip).kv("detail", last_error_text());
    return false;
  }
  return true;
}

void UdpBeaconBridge::handle(const std::string& payload, const std::string& from_ip, uint64_t now_ms) {
  std::string kind, id;
  DeviceRecord rec;
  try {
    json j = json::parse(payload);
    if (!j.is_object()) return;
    kind = j.value("kind", std::string());
    id   = j.value("peerId", std::string());
    rec.device_address  = id;
    rec.device_name     = j.value("name", std::string("Unknown"));
    rec.status          = j.value("status", std::string("Available"));
    rec.primary_device_type = j.value("deviceType", std::string());
    // the flag rides in the type so the name/type heuristic picks it up
    if (j.value("emergency", false)) {
      rec.primary_device_type += rec.primary_device_type.empty() ? "emergency" : " emergency";
    }
  } catch (const json::exception& e) {
    log::Line(log::Level::Debug, "udp-bridge").kv("status", "ignored")
        .kv("reason", "bad_datagram").kv("from", from_ip).kv("detail", e.what());
    return;
  }
  if (id.empty() || id == settings_.device_id) return;    // our own broadcast echo

  auto it = known_.find(id);
  const bool is_new = (it == known_.end());
  Known& k = known_[id];
  const std::string keep_status = is_new ? std::string() : k.record.status;
  k.record = rec;
  k.ip = from_ip;
  k.last_heard_ms = now_ms;

  // Local view of the relationship wins over what the peer advertises.
  if (group_peer_ == id)            k.record.status = "Connected";
  else if (keep_status == "Invited") k.record.status = "Invited";
  else                               k.record.status = "Available";

  if (kind == "invite") {
    if (!group_peer_.empty() && group_peer_ != id) {
      log::Line(log::Level::Info, "udp-bridge").kv("status", "ignored")
          .kv("reason", "busy").kv("from", id);
      report_peers();
      return;
    }
    group_peer_ = id;
    k.record.status = "Connected";
    k.invited = false;
    send_to(from_ip, "accept");
    log::Line(log::Level::Info, "udp-bridge").kv("status", "grouped").kv("role", "owner").kv("peer", id);
    report_peers();
    if (listener_) listener_->connection_changed(true, true, std::string(), id);
    return;
  }

  if (kind == "accept") {
    if (!k.invited && group_peer_ != id) {
      report_peers();                       // unsolicited
      return;
    }
    group_peer_ = id;
    k.record.status = "Connected";
    k.invited = false;
    log::Line(log::Level::Info, "udp-bridge").kv("status", "grouped").kv("role", "member").kv("peer", id);
    report_peers();
    if (listener_) listener_->connection_changed(true, false, from_ip, id);
    return;
  }

  if (kind == "leave") {
    if (group_peer_ == id) {
      leave_group(false);
    } else {
      k.record.status = "Available";
      report_peers();
    }
    return;
  }

  if (is_new) {
    log::Line(log::Level::Debug, "udp-bridge").kv("status", "heard").kv("peer", id).kv("ip", from_ip);
  }
  report_peers();
}

void UdpBeaconBridge::expire(uint64_t now_ms) {
  bool changed = false;
  bool lost_group = false;
  for (auto it = known_.begin(); it != known_.end();) {
    Known& k = it->second;
    if (k.invited && now_ms - k.invited_at_ms >= settings_.invite_timeout_ms) {
      k.invited = false;
      k.record.status = "Available";
      changed = true;
    }
    if (now_ms - k.last_heard_ms >= settings_.peer_expiry_ms && it->first != group_peer_) {
      it = known_.erase(it);
      changed = true;
      continue;
    }
    if (now_ms - k.last_heard_ms >= 3ull * settings_.peer_expiry_ms && it->first == group_peer_) {
      lost_group = true;                    // group peer vanished without a leave
    }
    ++it;
  }
  if (lost_group) {
    known_.erase(group_peer_);
    leave_group(false);
    return;
  }
  if (changed) report_peers();
}

void UdpBeaconBridge::report_peers() {
  if (listener_) listener_->peers_updated(discovered_peers());
}

void UdpBeaconBridge::leave_group(bool notify_peer) {
  const std::string peer = group_peer_;
  auto it = known_.find(peer);
  if (notify_peer && it != known_.end()) send_to(it->second.ip, "leave");
  if (it != known_.end()) it->second.record.status = "Available";
  group_peer_.clear();

  log::Line(log::Level::Info, "udp-bridge").kv("status", "ungrouped").kv("peer", peer);
  report_peers();
  if (listener_) listener_->connection_changed(false, false, std::string(), peer);
}

} // namespace beacon::bridge
