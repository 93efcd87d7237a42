#include "beacon/messaging_orchestrator.hpp"

#include <algorithm>
#include <utility>

#include "beacon/log.hpp"

namespace beacon {

MessagingOrchestrator::MessagingOrchestrator(ChannelProvider channel, WallClock clock)
: channel_(std::move(channel)), clock_(std::move(clock)) {}

bool MessagingOrchestrator::send_message(const std::string& text) {
  Message m;
  m.sender_id     = identity_.sender_id;
  m.sender_name   = identity_.sender_name;
  m.text          = text;
  m.timestamp_ms  = clock_();
  m.direction     = Message::Direction::Outbound;
  m.envelope_type = Message::EnvelopeType::Chat;
  m.delivery      = Message::Delivery::Sent;

  history_.push_back(m);
  const size_t idx = history_.size() - 1;

  MessageChannel* ch = channel_ ? channel_() : nullptr;
  bool ok = false;
  Error err = Error::ConnectionFailed;
  if (ch) {
    ok = ch->send(m);
    if (!ok) err = ch->last_error();
  }

  if (!ok) {
    history_[idx].delivery = Message::Delivery::Failed;
    log::Line(log::Level::Warn, "messaging").kv("status", "error")
        .kv("reason", ch ? to_reason(err) : "not_connected").kv("bytes", text.size());
  }

  const Message appended = history_[idx];   // listeners may append
  notify(appended);
  return ok;
}

bool MessagingOrchestrator::on_inbound(const Message& msg) {
  // A receipt-time stamp says nothing about identity: two equal raw lines in
  // one read would collide. Those are always kept.
  if (msg.sender_timestamp) {
    const uint64_t fp = fingerprint(msg);
    if (seen_recently(fp)) {
      log::Line(log::Level::Debug, "messaging").kv("status", "duplicate").kv("from", msg.sender_id);
      return false;
    }
    remember(fp);
  }

  Message m = msg;
  m.direction = Message::Direction::Inbound;
  m.delivery  = Message::Delivery::Received;
  history_.push_back(m);
  notify(m);
  return true;
}

bool MessagingOrchestrator::seen_recently(uint64_t fp) const {
  return std::find(recent_.begin(), recent_.end(), fp) != recent_.end();
}

void MessagingOrchestrator::remember(uint64_t fp) {
  if (recent_.full()) recent_.pop_front();
  recent_.push_back(fp);
}

void MessagingOrchestrator::notify(const Message& m) {
  for (auto& l : listeners_) {
    if (l) l(m);
  }
}

} // namespace beacon
