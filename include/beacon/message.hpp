#pragma once
/**
 * @file message.hpp
 * @brief The chat message as the application sees it.
 *
 * @details
 * A Message is what the orchestrator keeps in history and what the envelope
 * codec reads from and writes to the wire. Only five fields travel on the
 * wire (type, senderId, senderName, timestamp, text). `direction` and
 * `delivery` are local bookkeeping:
 *
 * - Outbound messages start as `Sent` and flip to `Failed` when the hand-off
 *   to the socket did not happen. They stay in history either way.
 * - Inbound messages are always `Received`.
 *
 * Timestamps are epoch milliseconds (UTC). There is no global clock between
 * devices, so the timestamp is informational; history order is receipt order.
 */

#include <cstdint>
#include <string>

namespace beacon {

struct Message {
  enum class Direction    : uint8_t { Outbound, Inbound };
  enum class EnvelopeType : uint8_t { Chat, Control };
  enum class Delivery     : uint8_t { Received, Sent, Failed };

  std::string  sender_id;
  std::string  sender_name;
  std::string  text;
  uint64_t     timestamp_ms{0};
  Direction    direction{Direction::Inbound};
  EnvelopeType envelope_type{EnvelopeType::Chat};
  Delivery     delivery{Delivery::Received};
  /// True when timestamp_ms was read from the sender's envelope rather than
  /// stamped at receipt. Only such messages take part in duplicate suppression.
  bool         sender_timestamp{false};
};

bool operator==(const Message& a, const Message& b);
inline bool operator!=(const Message& a, const Message& b) { return !(a == b); }

/**
 * @brief Duplicate-suppression key over (sender_id, timestamp_ms, text).
 *
 * 64-bit FNV-1a with a separator byte between fields, so ("ab","c") and
 * ("a","bc") do not collide trivially.
 */
uint64_t fingerprint(const Message& m);

const char* to_string(Message::Direction d);
const char* to_string(Message::EnvelopeType t);
const char* to_string(Message::Delivery d);

} // namespace beacon
