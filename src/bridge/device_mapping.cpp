#include "beacon/bridge/device_mapping.hpp"

#include <algorithm>
#include <cctype>

namespace beacon::bridge {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool contains(const std::string& hay, const char* needle) {
  return hay.find(needle) != std::string::npos;
}

} // namespace

PeerStatus map_status(const std::string& radio_status) {
  PeerStatus s;
  parse_peer_status(radio_status, s);     // falls back to Unavailable
  return s;
}

const char* status_from_code(int code) {
  switch (code) {
    case 0:  return "Connected";
    case 1:  return "Invited";
    case 2:  return "Failed";
    case 3:  return "Available";
    case 4:  return "Unavailable";
    default: return "Unknown";
  }
}

uint8_t estimate_signal(const DeviceRecord& d) {
  if (d.status == "Connected") return 5;
  if (d.status == "Available") return 3;
  return 1;
}

bool is_emergency_device(const DeviceRecord& d) {
  const std::string name = lower(d.device_name);
  const std::string type = lower(d.primary_device_type);
  return contains(name, "emergency") || contains(name, "rescue")
      || contains(name, "medical")   || contains(type, "emergency");
}

Peer to_peer(const DeviceRecord& d, uint64_t now_ms) {
  Peer p;
  p.peer_id         = d.device_address;
  p.display_name    = d.device_name.empty() ? "Unknown" : d.device_name;
  p.status          = map_status(d.status);
  p.signal_strength = estimate_signal(d);
  p.last_seen_ms    = now_ms;
  p.is_emergency    = is_emergency_device(d);
  return p;
}

std::vector<Peer> to_peers(const std::vector<DeviceRecord>& devices, uint64_t now_ms) {
  std::vector<Peer> out;
  out.reserve(devices.size());
  for (const auto& d : devices) out.push_back(to_peer(d, now_ms));
  return out;
}

} // namespace beacon::bridge
