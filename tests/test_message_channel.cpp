#include <doctest/doctest.h>
#include "beacon/message_channel.hpp"
#include "beacon/envelope.hpp"
#include "socket_io.hpp"
#include "fakes.hpp"

#include <string>
#include <vector>
#include <unistd.h>

using namespace beacon;

namespace {

Message chat(const std::string& text, uint64_t ts) {
  Message m;
  m.sender_id = "bcn-a";
  m.sender_name = "Alpha";
  m.text = text;
  m.timestamp_ms = ts;
  return m;
}

std::string read_all(int fd) {
  std::string out;
  char buf[4096];
  for (;;) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n <= 0) break;
    out.append(buf, static_cast<size_t>(n));
  }
  return out;
}

} // namespace

TEST_CASE("send writes one framed envelope per message, in order") {
  int a = -1, b = -1;
  REQUIRE(test::socket_pair(a, b));
  MessageChannel ch(a, "peer:1", "peer-id");

  CHECK(ch.send(chat("one", 1000)));
  CHECK(ch.send(chat("two", 2000)));

  const std::string wire = read_all(b);
  auto nl = wire.find('\n');
  REQUIRE(nl != std::string::npos);
  envelope::DecodeContext ctx;
  CHECK(envelope::decode(wire.substr(0, nl), ctx).text == "one");
  CHECK(envelope::decode(wire.substr(nl + 1, wire.size() - nl - 2), ctx).text == "two");
  CHECK(wire.back() == '\n');
  ::close(b);
}

TEST_CASE("A frame split across reads decodes to one message") {
  int a = -1, b = -1;
  REQUIRE(test::socket_pair(a, b));
  MessageChannel ch(a, "10.0.0.2:8888", "peer-b");
  std::vector<Message> got;
  ch.set_inbound_handler([&](const Message& m) { got.push_back(m); });

  const std::string line = envelope::encode(chat("split me", 1700000000000ull)) + "\n";
  const size_t half = line.size() / 2;

  REQUIRE(::write(b, line.data(), half) == static_cast<ssize_t>(half));
  ch.service();
  CHECK(got.empty());

  REQUIRE(::write(b, line.data() + half, line.size() - half) == static_cast<ssize_t>(line.size() - half));
  ch.service();
  REQUIRE(got.size() == 1);
  CHECK(got[0].text == "split me");
  CHECK(got[0].sender_id == "bcn-a");
  CHECK(got[0].direction == Message::Direction::Inbound);
  ::close(b);
}

TEST_CASE("Garbage line arrives as raw text tagged with the remote peer") {
  int a = -1, b = -1;
  REQUIRE(test::socket_pair(a, b));
  MessageChannel ch(a, "10.0.0.2:8888", "peer-b");
  ch.set_clock([] { return uint64_t{42}; });
  std::vector<Message> got;
  ch.set_inbound_handler([&](const Message& m) { got.push_back(m); });

  REQUIRE(::write(b, "not-json\n", 9) == 9);
  ch.service();
  REQUIRE(got.size() == 1);
  CHECK(got[0].text == "not-json");
  CHECK(got[0].sender_id == "peer-b");
  CHECK(got[0].timestamp_ms == 42);
  ::close(b);
}

TEST_CASE("EOF delivers trailing bytes and closes the channel") {
  int a = -1, b = -1;
  REQUIRE(test::socket_pair(a, b));
  MessageChannel ch(a, "x", "y");
  std::vector<Message> got;
  ch.set_inbound_handler([&](const Message& m) { got.push_back(m); });

  REQUIRE(::write(b, "tail without newline", 20) == 20);
  ::close(b);
  ch.service();

  CHECK_FALSE(ch.is_open());
  REQUIRE(got.size() == 1);
  CHECK(got[0].text == "tail without newline");
}

TEST_CASE("send on a closed channel fails with SocketWriteFailure") {
  int a = -1, b = -1;
  REQUIRE(test::socket_pair(a, b));
  MessageChannel ch(a, "x", "y");
  ch.close();
  CHECK_FALSE(ch.send(chat("late", 1)));
  CHECK(ch.last_error() == Error::SocketWriteFailure);
  ::close(b);
}

TEST_CASE("A peer that never reads fills the queue and send reports failure") {
  int a = -1, b = -1;
  REQUIRE(test::socket_pair(a, b));
  MessageChannel ch(a, "x", "y");

  const std::string big(16 * 1024, 'z');
  bool refused = false;
  for (int i = 0; i < 4096 && !refused; ++i) refused = !ch.send(chat(big, 1));

  CHECK(refused);
  CHECK(ch.last_error() == Error::SocketWriteFailure);
  CHECK(ch.pending_writes() == MessageChannel::WRITE_QUEUE_CAP);
  CHECK(ch.is_open());
  ::close(b);
}
