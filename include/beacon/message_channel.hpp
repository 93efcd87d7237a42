#pragma once
/**
 * @file message_channel.hpp
 * @brief The one active transport socket, with envelope framing on top.
 *
 * @details
 * A MessageChannel exists exactly while the connection is Active. The
 * negotiator creates it around an accepted (host) or connected (client)
 * socket and destroys it when the link drops. Nothing else touches the fd.
 *
 * WRITE PATH (single writer)
 * --------------------------
 * send() encodes the envelope, appends one framed line to a bounded queue,
 * and immediately tries to flush. Whatever the kernel does not take now is
 * flushed by later service() calls, in order, from the same queue. Two
 * messages never interleave on the wire.
 *
 * READ PATH
 * ---------
 * service() drains what the socket has, feeds the line framer, decodes each
 * complete line, and hands the Message to the inbound handler. It never
 * touches the write queue. Undecodable lines become raw text messages (see
 * envelope.hpp); bytes left over at EOF are delivered too.
 *
 * FAILURE MODEL
 * -------------
 * - Queue full or socket error on write: send() returns false,
 *   last_error() == SocketWriteFailure. No exception, no retry.
 * - Peer closed or read error: is_open() turns false; the owner notices on
 *   its next tick and tears the connection down.
 * - Delivery is at-most-once. A `true` from send() means "handed to the
 *   transport", not "the other side has it".
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#include "etl/deque.h"
#include "line_framer.hpp"
#include "beacon/clock.hpp"
#include "beacon/errors.hpp"
#include "beacon/message.hpp"

namespace beacon {

class MessageChannel {
public:
  static constexpr size_t WRITE_QUEUE_CAP   = 32;     ///< Framed lines awaiting the kernel.
  static constexpr size_t READ_CHUNK        = 4096;
  static constexpr size_t MAX_READS_PER_SERVICE = 64; ///< Keeps one tick bounded under flood.

  using InboundHandler = std::function<void(const Message&)>;

  /**
   * @brief Take ownership of a connected, non-blocking socket.
   * @param fd              Connected socket; closed by this object.
   * @param remote_address  "ip:port" of the far end (raw-text sender fallback).
   * @param remote_peer_id  Bridge id of the far end, if known (preferred fallback).
   */
  MessageChannel(int fd, std::string remote_address, std::string remote_peer_id);
  ~MessageChannel();

  MessageChannel(const MessageChannel&) = delete;
  MessageChannel& operator=(const MessageChannel&) = delete;

  void set_inbound_handler(InboundHandler handler) { on_inbound_ = std::move(handler); }
  void set_clock(WallClock clock) { clock_ = std::move(clock); }

  /// Encode, queue and flush one message. False if closed, queue full, or write failed.
  bool send(const Message& msg);

  /// Read what is available and flush pending writes. Cheap when idle.
  void service();

  /// Close now. Queued writes are dropped (best-effort semantics).
  void close();

  bool is_open() const { return fd_ >= 0; }
  Error last_error() const { return last_error_; }
  size_t pending_writes() const { return outbox_.size(); }

  const std::string& remote_address() const { return remote_address_; }
  const std::string& remote_peer_id() const { return remote_peer_id_; }
  void set_remote_peer_id(const std::string& id) { remote_peer_id_ = id; }

private:
  bool flush();
  void read_available();
  void deliver(const std::string& line);

  int fd_;
  std::string remote_address_;
  std::string remote_peer_id_;
  Error last_error_{Error::None};

  etl::deque<std::string, WRITE_QUEUE_CAP> outbox_;
  size_t head_written_{0};     ///< Bytes of outbox_.front() already accepted by the kernel.
  line_framer framer_;

  InboundHandler on_inbound_;
  WallClock clock_{wall_clock_ms};
};

} // namespace beacon
