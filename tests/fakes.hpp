#pragma once
// Test doubles shared by the suite: scripted bridge, in-memory store,
// recording sink, manual clock, and a loopback socket pair helper.

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

#include "beacon/bridge/discovery_bridge.hpp"
#include "beacon/clock.hpp"
#include "beacon/notification_sink.hpp"
#include "beacon/peer_store.hpp"

namespace beacon::test {

struct ManualClock {
  uint64_t now{1700000000000ull};
  WallClock fn() { return [this]() { return now; }; }
};

class FakeBridge : public bridge::IDiscoveryBridge {
public:
  bool supported{true};
  bool permitted{true};
  bool init_ok{true};
  bool connect_ok{true};
  bool discovering{false};
  int  init_calls{0};
  int  polls{0};
  std::vector<std::string> connect_calls;
  int  disconnect_calls{0};
  std::vector<bridge::DeviceRecord> devices;
  bridge::ThisDevice self{"aa:bb:cc:00:00:01", "Field Laptop"};

  bool is_supported() const override { return supported; }
  bool has_permissions() const override { return permitted; }
  bool initialize() override {
    ++init_calls;
    if (!init_ok) return false;
    if (listener_) listener_->this_device_changed(self);
    return true;
  }
  bool start_discovery() override { discovering = true; return true; }
  bool stop_discovery() override { discovering = false; return true; }
  bool connect(const std::string& peer_address) override {
    connect_calls.push_back(peer_address);
    return connect_ok;
  }
  bool disconnect() override { ++disconnect_calls; return true; }
  std::vector<bridge::DeviceRecord> discovered_peers() const override { return devices; }
  void poll(uint64_t) override { ++polls; }
  void set_listener(bridge::BridgeListener* l) override { listener_ = l; }
  const char* name() const override { return "fake"; }

  // scripted events
  void emit_peers(std::vector<bridge::DeviceRecord> list) {
    devices = std::move(list);
    if (listener_) listener_->peers_updated(devices);
  }
  void emit_connection(bool connected, bool is_host, const std::string& host, const std::string& peer) {
    if (listener_) listener_->connection_changed(connected, is_host, host, peer);
  }
  void emit_this_device(const bridge::ThisDevice& d) {
    self = d;
    if (listener_) listener_->this_device_changed(self);
  }
  void emit_radio(bool enabled) {
    if (listener_) listener_->radio_state_changed(enabled);
  }
  bool attached() const { return listener_ != nullptr; }

private:
  bridge::BridgeListener* listener_{nullptr};
};

class MemoryStore : public IPeerStore {
public:
  std::map<std::string, Peer> peers;
  std::vector<ActivityRecord> activity;

  bool save_peer(const Peer& p) override { peers[p.peer_id] = p; return true; }
  std::vector<Peer> load_peers() const override {
    std::vector<Peer> out;
    for (const auto& kv : peers) out.push_back(kv.second);
    return out;
  }
  bool remove_peer(const std::string& id) override { return peers.erase(id) > 0; }
  bool log_activity(const ActivityRecord& r) override { activity.push_back(r); return true; }
  std::vector<ActivityRecord> load_recent_activity(size_t limit) const override {
    std::vector<ActivityRecord> out;
    for (auto it = activity.rbegin(); it != activity.rend() && out.size() < limit; ++it) out.push_back(*it);
    return out;
  }

  size_t count(const std::string& event) const {
    size_t n = 0;
    for (const auto& r : activity) if (r.event == event) ++n;
    return n;
  }
};

class RecordingSink : public INotificationSink {
public:
  std::vector<std::string> joined, left;
  std::vector<Message> messages;

  void notify_peer_joined(const Peer& p) override { joined.push_back(p.peer_id); }
  void notify_peer_left(const Peer& p) override { left.push_back(p.peer_id); }
  void notify_message(const Message& m) override { messages.push_back(m); }
};

inline bridge::DeviceRecord device(const std::string& addr, const std::string& name,
                                   const std::string& status = "Available") {
  bridge::DeviceRecord d;
  d.device_address = addr;
  d.device_name = name;
  d.status = status;
  return d;
}

inline Peer peer(const std::string& id, const std::string& name = "Device") {
  Peer p;
  p.peer_id = id;
  p.display_name = name;
  return p;
}

/// Connected, non-blocking AF_UNIX stream pair. Caller owns both fds.
inline bool socket_pair(int& a, int& b) {
  int fds[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) return false;
  for (int fd : fds) ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
  a = fds[0];
  b = fds[1];
  return true;
}

} // namespace beacon::test
