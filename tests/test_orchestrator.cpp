#include <doctest/doctest.h>
#include "beacon/messaging_orchestrator.hpp"
#include "beacon/envelope.hpp"
#include "fakes.hpp"

#include <memory>
#include <unistd.h>

using namespace beacon;

namespace {

Message inbound(const std::string& from, const std::string& text, uint64_t ts) {
  Message m;
  m.sender_id = from;
  m.sender_name = from;
  m.text = text;
  m.timestamp_ms = ts;
  m.sender_timestamp = true;
  return m;
}

} // namespace

TEST_CASE("Sending with no active connection records a failed outbound message") {
  test::ManualClock clock;
  MessagingOrchestrator orch([] { return static_cast<MessageChannel*>(nullptr); }, clock.fn());
  orch.set_identity({"bcn-self", "Me"});
  std::vector<Message> seen;
  orch.add_listener([&](const Message& m) { seen.push_back(m); });

  CHECK_FALSE(orch.send_message("hello?"));

  REQUIRE(orch.history().size() == 1);
  const Message& m = orch.history()[0];
  CHECK(m.direction == Message::Direction::Outbound);
  CHECK(m.delivery == Message::Delivery::Failed);
  CHECK(m.text == "hello?");
  CHECK(m.sender_id == "bcn-self");
  CHECK(m.timestamp_ms == clock.now);
  REQUIRE(seen.size() == 1);
  CHECK(seen[0].delivery == Message::Delivery::Failed);
}

TEST_CASE("Sending over a live channel puts the envelope on the wire") {
  int a = -1, b = -1;
  REQUIRE(test::socket_pair(a, b));
  MessageChannel ch(a, "peer", "peer-id");
  test::ManualClock clock;
  MessagingOrchestrator orch([&] { return &ch; }, clock.fn());
  orch.set_identity({"bcn-self", "Me"});

  CHECK(orch.send_message("status: all clear"));
  CHECK(orch.history().back().delivery == Message::Delivery::Sent);

  char buf[1024];
  ssize_t n = ::read(b, buf, sizeof(buf));
  REQUIRE(n > 0);
  std::string line(buf, static_cast<size_t>(n));
  REQUIRE(line.back() == '\n');
  line.pop_back();
  Message wire = envelope::decode(line, envelope::DecodeContext{});
  CHECK(wire.text == "status: all clear");
  CHECK(wire.sender_name == "Me");
  CHECK(wire.timestamp_ms == clock.now);
  ::close(b);
}

TEST_CASE("Inbound messages append in arrival order") {
  MessagingOrchestrator orch([] { return static_cast<MessageChannel*>(nullptr); });
  CHECK(orch.on_inbound(inbound("A", "first", 10)));
  CHECK(orch.on_inbound(inbound("B", "second", 5)));

  REQUIRE(orch.history().size() == 2);
  CHECK(orch.history()[0].text == "first");
  CHECK(orch.history()[1].text == "second");
  CHECK(orch.history()[1].direction == Message::Direction::Inbound);
}

TEST_CASE("The same inbound message twice is kept once") {
  MessagingOrchestrator orch([] { return static_cast<MessageChannel*>(nullptr); });
  int notified = 0;
  orch.add_listener([&](const Message&) { ++notified; });

  CHECK(orch.on_inbound(inbound("A", "dup", 1700000000000ull)));
  CHECK_FALSE(orch.on_inbound(inbound("A", "dup", 1700000000000ull)));
  CHECK(orch.on_inbound(inbound("A", "dup", 1700000000001ull)));      // different timestamp
  CHECK(orch.history().size() == 2);
  CHECK(notified == 2);
}

TEST_CASE("Duplicate suppression forgets after the window") {
  MessagingOrchestrator orch([] { return static_cast<MessageChannel*>(nullptr); });
  CHECK(orch.on_inbound(inbound("A", "old", 1)));
  for (size_t i = 0; i < MessagingOrchestrator::DEDUPE_WINDOW; ++i) {
    orch.on_inbound(inbound("B", "filler " + std::to_string(i), 2));
  }
  CHECK(orch.on_inbound(inbound("A", "old", 1)));
}

TEST_CASE("Messages stamped at receipt are never merged") {
  MessagingOrchestrator orch([] { return static_cast<MessageChannel*>(nullptr); });
  Message raw = inbound("10.0.0.2:4100", "ok", 1700000000000ull);
  raw.sender_timestamp = false;

  CHECK(orch.on_inbound(raw));
  CHECK(orch.on_inbound(raw));
  CHECK(orch.history().size() == 2);
}

TEST_CASE("Two identical raw lines in one read both reach history") {
  int a = -1, b = -1;
  REQUIRE(test::socket_pair(a, b));
  test::ManualClock clock;
  MessageChannel ch(a, "10.0.0.2:4100", "22:22");
  ch.set_clock(clock.fn());
  MessagingOrchestrator orch([&] { return &ch; }, clock.fn());
  ch.set_inbound_handler([&](const Message& m) { orch.on_inbound(m); });

  const std::string lines = "ok\nok\n";
  REQUIRE(::write(b, lines.data(), lines.size()) == static_cast<ssize_t>(lines.size()));
  ch.service();

  REQUIRE(orch.history().size() == 2);
  CHECK(orch.history()[0].text == "ok");
  CHECK(orch.history()[1].text == "ok");
  CHECK(orch.history()[0].timestamp_ms == orch.history()[1].timestamp_ms);
  ::close(b);
}
