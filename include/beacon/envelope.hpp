#pragma once
/**
 * @file envelope.hpp
 * @brief JSON envelope codec for chat traffic on the transport socket.
 *
 * @details
 * PURPOSE
 * -------
 * Every logical write on the socket is one JSON object on one line:
 *
 * @code
 *   {"type":"chat","senderId":"a2:f0:..","senderName":"Medic 3",
 *    "timestamp":"2025-03-14T09:26:53.589Z","text":"need water at gate B"}
 * @endcode
 *
 * encode() produces that object (without the trailing newline, which belongs
 * to the framer). decode() turns one received line back into a Message.
 *
 * TOLERANCE RULES
 * ---------------
 * - Unknown extra fields are ignored. Older builds add `isFromCurrentUser`;
 *   newer ones may add more.
 * - If the line is not JSON, not an object, has no string `type`, or the
 *   `type` is neither "chat" nor "control", the *whole line* becomes the text
 *   of a plain message. The sender is taken from the socket context. Nothing
 *   is thrown and no byte is dropped. Note that this cannot tell a peer that
 *   intentionally sends plain text from a corrupted transmission; both land
 *   in history the same way.
 * - On a valid envelope, missing fields fall back: senderId -> socket peer,
 *   senderName -> "Unknown", timestamp -> receipt time, text -> "".
 *
 * Timestamps are ISO-8601. We write UTC with millisecond precision and a `Z`.
 * We read any fraction length (truncated to ms), `Z`, `+hh:mm`, `+hhmm`, or
 * no zone at all (taken as UTC).
 */

#include <cstdint>
#include <string>

#include "beacon/errors.hpp"
#include "beacon/message.hpp"

namespace beacon {
namespace envelope {

/// What the channel knows about the far end when a line arrives.
struct DecodeContext {
  std::string remote_peer_id;    ///< Bridge peer id, may be empty.
  std::string remote_address;    ///< "ip:port" of the socket peer, may be empty.
  uint64_t    received_ms{0};    ///< Epoch ms used when the envelope has no usable timestamp.
};

/// Serialize @p msg as one compact JSON object (no newline). Invalid UTF-8 is replaced.
std::string encode(const Message& msg);

/**
 * @brief Parse one received line into an Inbound Message. Never throws.
 * @param raw  Line contents without the framing newline.
 * @param ctx  Socket context for fallbacks.
 * @param err  Optional; set to MalformedEnvelope when the raw-text fallback was used,
 *             None otherwise.
 */
Message decode(const std::string& raw, const DecodeContext& ctx, Error* err = nullptr);

/// Sender id used for raw text: peer id, else socket address, else "unknown". Never empty.
std::string fallback_sender_id(const DecodeContext& ctx);

/// Human label for a socket address ("/10.0.0.2:4100" -> "10.0.0.2:4100").
std::string sender_name_from_address(const std::string& address);

std::string format_iso8601(uint64_t epoch_ms);
bool        parse_iso8601(const std::string& text, uint64_t& epoch_ms);

} // namespace envelope
} // namespace beacon
