#pragma once
/**
 * @file discovery_bridge.hpp
 * @brief Interface to the platform radio discovery service.
 *
 * The bridge is a leaf: it knows how to find nearby devices and how to form a
 * group with one of them, and nothing about messages. Everything above it
 * sees only this interface, so a Wi-Fi Direct stack, the UDP beacon bridge
 * and the test fake are interchangeable.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace beacon::bridge {

/// One device as the radio reports it, before mapping to a Peer.
struct DeviceRecord {
  std::string device_address;          ///< Stable id (MAC on Wi-Fi Direct).
  std::string device_name{"Unknown"};
  std::string status{"Unknown"};       ///< "Available" | "Invited" | "Connected" | "Failed" | "Unavailable"
  bool        service_discovery_capable{false};
  std::string primary_device_type;
  std::string secondary_device_type;
};

/// Our own identity as the radio reports it.
struct ThisDevice {
  std::string device_address;
  std::string device_name;
};

/**
 * @brief Event sink a bridge reports into.
 *
 * Contract:
 *  - Calls may come from any thread the bridge owns. Implementations must
 *    not assume they run on the tick loop (Session queues them).
 *  - peers_updated() always carries the complete current list.
 *  - connection_changed(true, ...) reports that a group formed; is_host is
 *    true when this device owns it. host_address is the owner's IPv4.
 */
class BridgeListener {
public:
  virtual ~BridgeListener() = default;
  virtual void peers_updated(const std::vector<DeviceRecord>& devices) = 0;
  virtual void connection_changed(bool connected, bool is_host,
                                  const std::string& host_address,
                                  const std::string& peer_id) = 0;
  virtual void this_device_changed(const ThisDevice& self) = 0;
  virtual void radio_state_changed(bool enabled) = 0;
};

/**
 * @brief Radio discovery trait.
 *
 * Contract:
 *  - is_supported()/has_permissions() are cheap queries, valid before initialize().
 *  - initialize() acquires the radio; false means it could not.
 *  - start/stop_discovery() and connect()/disconnect() return false when the
 *    request could not even be issued. Outcomes arrive as listener events.
 *  - poll(now_ms) does non-blocking service work; bridges with their own
 *    threads may leave it empty.
 */
class IDiscoveryBridge {
public:
  virtual ~IDiscoveryBridge() = default;
  virtual bool is_supported() const = 0;
  virtual bool has_permissions() const = 0;
  virtual bool initialize() = 0;
  virtual bool start_discovery() = 0;
  virtual bool stop_discovery() = 0;
  virtual bool connect(const std::string& peer_address) = 0;
  virtual bool disconnect() = 0;
  virtual std::vector<DeviceRecord> discovered_peers() const = 0;
  virtual void poll(uint64_t now_ms) = 0;
  virtual void set_listener(BridgeListener* listener) = 0;
  virtual const char* name() const = 0;
};

} // namespace beacon::bridge
