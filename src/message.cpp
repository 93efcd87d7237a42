// ============================================================================
// message.cpp - implementation for message.hpp
// ============================================================================

#include "beacon/message.hpp"

namespace beacon {

namespace {
constexpr uint64_t FNV_OFFSET = 1469598103934665603ull;
constexpr uint64_t FNV_PRIME  = 1099511628211ull;

void fnv_mix(uint64_t& h, const void* data, size_t n) {
  const auto* p = static_cast<const unsigned char*>(data);
  for (size_t i = 0; i < n; ++i) {
    h ^= p[i];
    h *= FNV_PRIME;
  }
}
} // namespace

bool operator==(const Message& a, const Message& b) {
  return a.sender_id == b.sender_id
      && a.sender_name == b.sender_name
      && a.text == b.text
      && a.timestamp_ms == b.timestamp_ms
      && a.direction == b.direction
      && a.envelope_type == b.envelope_type
      && a.delivery == b.delivery;
}

uint64_t fingerprint(const Message& m) {
  uint64_t h = FNV_OFFSET;
  const unsigned char sep = 0x1F;   // ASCII unit separator between fields

  fnv_mix(h, m.sender_id.data(), m.sender_id.size());
  fnv_mix(h, &sep, 1);

  // timestamp as fixed little-endian bytes so the key is platform-stable
  unsigned char ts[8];
  for (int i = 0; i < 8; ++i) ts[i] = static_cast<unsigned char>(m.timestamp_ms >> (8 * i));
  fnv_mix(h, ts, sizeof(ts));
  fnv_mix(h, &sep, 1);

  fnv_mix(h, m.text.data(), m.text.size());
  return h;
}

const char* to_string(Message::Direction d) {
  return d == Message::Direction::Outbound ? "outbound" : "inbound";
}

const char* to_string(Message::EnvelopeType t) {
  return t == Message::EnvelopeType::Control ? "control" : "chat";
}

const char* to_string(Message::Delivery d) {
  switch (d) {
    case Message::Delivery::Received: return "received";
    case Message::Delivery::Sent:     return "sent";
    case Message::Delivery::Failed:   return "failed";
  }
  return "received";
}

} // namespace beacon
