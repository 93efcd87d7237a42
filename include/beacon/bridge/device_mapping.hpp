#pragma once
/**
 * @file device_mapping.hpp
 * @brief Raw bridge records -> Peer.
 *
 * The radio gives no RSSI and no notion of "emergency responder", so both are
 * estimated: signal from status (Connected 5, Available 3, else 1), emergency
 * from keywords in the device name or primary type.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "beacon/bridge/discovery_bridge.hpp"
#include "beacon/peer.hpp"

namespace beacon::bridge {

/// "Available" etc. Unknown text maps to Unavailable.
PeerStatus map_status(const std::string& radio_status);

/// Wi-Fi P2P device status codes (0 Connected, 1 Invited, 2 Failed, 3 Available, 4 Unavailable).
const char* status_from_code(int code);

uint8_t estimate_signal(const DeviceRecord& d);
bool    is_emergency_device(const DeviceRecord& d);

Peer to_peer(const DeviceRecord& d, uint64_t now_ms);
std::vector<Peer> to_peers(const std::vector<DeviceRecord>& devices, uint64_t now_ms);

} // namespace beacon::bridge
