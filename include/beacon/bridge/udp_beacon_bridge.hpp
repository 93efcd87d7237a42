#pragma once
/**
 * @file udp_beacon_bridge.hpp
 * @brief IDiscoveryBridge over UDP broadcast, for Linux hosts on one segment.
 *
 * @details
 * Stands in for the phone's Wi-Fi Direct stack so two laptops can find each
 * other and form a one-to-one "group" with nothing but a shared LAN.
 *
 * DATAGRAMS (one JSON object each, port 8889 by default)
 * ------------------------------------------------------
 *   {"kind":"beacon","peerId":..,"name":..,"status":"Available","emergency":false,"deviceType":..}
 *   {"kind":"invite", ...}   sent by connect(), unicast to the peer's address
 *   {"kind":"accept", ...}   reply to invite
 *   {"kind":"leave",  ...}   sent by disconnect()
 *
 * ROLES
 * -----
 * The device that received the invite owns the group (hosts the TCP socket).
 * The inviter becomes the client and dials the host's source address.
 *
 * Peers not heard from for `peer_expiry_ms` drop out of the list. An invite
 * with no accept within `invite_timeout_ms` puts the peer back to Available.
 *
 * All listener calls happen inside poll() and the bridge calls that cause them.
 */

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "beacon/bridge/discovery_bridge.hpp"

namespace beacon::bridge {

class UdpBeaconBridge : public IDiscoveryBridge {
public:
  static constexpr uint16_t DEFAULT_PORT = 8889;

  struct Settings {
    uint16_t    port{DEFAULT_PORT};             ///< Local bind port; 0 picks one.
    uint16_t    peer_port{DEFAULT_PORT};        ///< Port other devices listen on.
    std::string broadcast_address{"255.255.255.255"};
    uint32_t    beacon_interval_ms{1000};
    uint32_t    peer_expiry_ms{5000};
    uint32_t    invite_timeout_ms{10000};
    std::string device_id;
    std::string device_name;
    std::string device_type{"laptop"};
    bool        emergency{false};
  };

  explicit UdpBeaconBridge(Settings settings);
  ~UdpBeaconBridge() override;

  UdpBeaconBridge(const UdpBeaconBridge&) = delete;
  UdpBeaconBridge& operator=(const UdpBeaconBridge&) = delete;

  bool is_supported() const override { return true; }
  bool has_permissions() const override { return true; }
  bool initialize() override;
  bool start_discovery() override;
  bool stop_discovery() override;
  bool connect(const std::string& peer_address) override;
  bool disconnect() override;
  std::vector<DeviceRecord> discovered_peers() const override;
  void poll(uint64_t now_ms) override;
  void set_listener(BridgeListener* listener) override { listener_ = listener; }
  const char* name() const override { return "udp-beacon"; }

  /// Bound port after initialize() (differs from Settings::port only for 0).
  uint16_t bound_port() const { return bound_port_; }
  void set_peer_port(uint16_t port) { settings_.peer_port = port; }

  bool discovering() const { return discovering_; }
  const std::string& group_peer() const { return group_peer_; }

private:
  struct Known {
    DeviceRecord record;
    std::string  ip;
    uint64_t     last_heard_ms{0};
    bool         invited{false};
    uint64_t     invited_at_ms{0};
  };

  std::string make_datagram(const char* kind) const;
  bool send_to(const std::string& ip, const char* kind);
  void handle(const std::string& payload, const std::string& from_ip, uint64_t now_ms);
  void expire(uint64_t now_ms);
  void report_peers();
  void leave_group(bool notify_peer);

  Settings settings_;
  BridgeListener* listener_{nullptr};
  int      fd_{-1};
  uint16_t bound_port_{0};
  bool     discovering_{false};
  uint64_t now_ms_{0};
  uint64_t next_beacon_ms_{0};

  std::map<std::string, Known> known_;
  std::string group_peer_;             ///< Empty when not in a group.
};

} // namespace beacon::bridge
