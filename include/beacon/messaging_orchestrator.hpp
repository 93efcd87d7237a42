#pragma once
/**
 * @file messaging_orchestrator.hpp
 * @brief Conversation history: local sends, inbound merge, duplicate suppression.
 *
 * @details
 * Owns the append-only history shown to the user. Outbound messages are
 * recorded before they hit the wire, so a failed send is still visible (with
 * delivery == Failed) instead of silently vanishing. Inbound messages are
 * recorded in arrival order unless the same (sender, timestamp, text) was seen
 * within the last DEDUPE_WINDOW inbound messages. Only messages carrying the
 * sender's own timestamp are compared; raw text and envelopes without a
 * timestamp are always kept.
 *
 * The orchestrator does not own the socket. It asks a ChannelProvider for
 * the live channel at send time; nullptr means "not connected".
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "etl/deque.h"
#include "beacon/clock.hpp"
#include "beacon/message.hpp"
#include "beacon/message_channel.hpp"

namespace beacon {

struct LocalIdentity {
  std::string sender_id;
  std::string sender_name;
};

class MessagingOrchestrator {
public:
  static constexpr size_t DEDUPE_WINDOW = 128;

  using ChannelProvider = std::function<MessageChannel*()>;
  using MessageListener = std::function<void(const Message&)>;

  explicit MessagingOrchestrator(ChannelProvider channel, WallClock clock = wall_clock_ms);

  void set_identity(const LocalIdentity& id) { identity_ = id; }
  const LocalIdentity& identity() const { return identity_; }

  /**
   * @brief Record and send one chat message from the local identity.
   * @return true when handed to the transport. False when no channel is
   *         live or the write failed; the history entry is then Failed.
   */
  bool send_message(const std::string& text);

  /**
   * @brief Merge one decoded inbound message.
   * @return false when suppressed as a duplicate.
   */
  bool on_inbound(const Message& msg);

  const std::vector<Message>& history() const { return history_; }

  /// Called for every message appended to history, after its delivery is final.
  void add_listener(MessageListener listener) { listeners_.push_back(std::move(listener)); }

private:
  bool seen_recently(uint64_t fp) const;
  void remember(uint64_t fp);
  void notify(const Message& m);

  ChannelProvider channel_;
  WallClock clock_;
  LocalIdentity identity_;
  std::vector<Message> history_;
  etl::deque<uint64_t, DEDUPE_WINDOW> recent_;
  std::vector<MessageListener> listeners_;
};

} // namespace beacon
