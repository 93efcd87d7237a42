// ============================================================================
// message_channel.cpp - implementation for message_channel.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "beacon/message_channel.hpp"

#include "socket_io.hpp"
#include "beacon/envelope.hpp"
#include "beacon/log.hpp"

#include <vector>

namespace beacon {

MessageChannel::MessageChannel(int fd, std::string remote_address, std::string remote_peer_id)
: fd_(fd),
  remote_address_(std::move(remote_address)),
  remote_peer_id_(std::move(remote_peer_id)) {}

MessageChannel::~MessageChannel() {
  close();
}

bool MessageChannel::send(const Message& msg) {
  if (fd_ < 0) {
    last_error_ = Error::SocketWriteFailure;
    return false;
  }
  if (outbox_.full()) {                      // peer not draining; refuse rather than grow
    last_error_ = Error::SocketWriteFailure;
    log::Line(log::Level::Warn, "channel").kv("status", "error")
        .kv("reason", "write_queue_full").kv("pending", outbox_.size());
    return false;
  }

  outbox_.push_back(encode_line(envelope::encode(msg)));
  return flush();
}

void MessageChannel::service() {
  if (fd_ < 0) return;
  read_available();
  if (fd_ >= 0 && !outbox_.empty()) flush();
}

void MessageChannel::close() {
  if (fd_ < 0) return;
  if (!outbox_.empty()) {
    log::Line(log::Level::Debug, "channel").kv("status", "close")
        .kv("dropped_writes", outbox_.size());
  }
  close_socket(fd_);
  fd_ = -1;
  outbox_.clear();
  head_written_ = 0;
}

// flush() - push queued lines to the kernel, oldest first, until it pushes back.
// Returns false only on a hard socket failure (which also closes the channel).
bool MessageChannel::flush() {
  while (!outbox_.empty()) {
    const std::string& line = outbox_.front();
    size_t n = 0;
    IoResult r = write_some(fd_, line.data() + head_written_, line.size() - head_written_, n);

    if (r == IoResult::Ok) {
      head_written_ += n;
      if (head_written_ >= line.size()) {    // whole line out
        outbox_.pop_front();
        head_written_ = 0;
        continue;
      }
      if (n == 0) return true;               // kernel took nothing; try next service()
      continue;
    }
    if (r == IoResult::WouldBlock) return true;

    last_error_ = Error::SocketWriteFailure;
    log::Line(log::Level::Warn, "channel").kv("status", "error")
        .kv("reason", to_reason(last_error_)).kv("remote", remote_address_)
        .kv("detail", r == IoResult::Closed ? std::string("peer_closed") : last_error_text());
    close();
    return false;
  }
  return true;
}

void MessageChannel::read_available() {
  char buf[READ_CHUNK];
  std::vector<std::string> lines;

  for (size_t i = 0; i < MAX_READS_PER_SERVICE && fd_ >= 0; ++i) {
    size_t got = 0;
    IoResult r = read_some(fd_, buf, sizeof(buf), got);

    if (r == IoResult::Ok) {
      framer_.feed(buf, got, lines);
      continue;
    }
    if (r == IoResult::WouldBlock) break;

    // Closed or Error: hand up what we have, then drop the socket.
    std::string tail;
    if (framer_.flush(tail)) lines.push_back(std::move(tail));
    log::Line(log::Level::Info, "channel").kv("status", "closed")
        .kv("remote", remote_address_)
        .kv("reason", r == IoResult::Closed ? std::string("eof") : last_error_text());
    close();
  }

  for (const auto& line : lines) deliver(line);
}

void MessageChannel::deliver(const std::string& line) {
  envelope::DecodeContext ctx;
  ctx.remote_peer_id = remote_peer_id_;
  ctx.remote_address = remote_address_;
  ctx.received_ms    = clock_ ? clock_() : wall_clock_ms();

  Error err = Error::None;
  Message msg = envelope::decode(line, ctx, &err);
  if (err == Error::MalformedEnvelope) {
    log::Line(log::Level::Debug, "channel").kv("status", "raw_text")
        .kv("reason", to_reason(err)).kv("bytes", line.size());
  }
  if (on_inbound_) on_inbound_(msg);
}

} // namespace beacon
