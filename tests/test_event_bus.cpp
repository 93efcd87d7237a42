#include <doctest/doctest.h>
#include "beacon/peer_event_bus.hpp"
#include "fakes.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace beacon;

static PeerEvent joined(const std::string& id) {
  return PeerEvent{PeerEvent::Kind::Joined, test::peer(id), 0};
}

TEST_CASE("Subscribers see events in production order across both kinds") {
  PeerEventBus bus;
  std::vector<std::string> seen;
  bus.subscribe_peers([&](const PeerEvent& e) { seen.push_back("peer:" + e.peer.peer_id); });
  bus.subscribe_connection([&](const ConnectionEvent& e) { seen.push_back(std::string("conn:") + to_string(e.kind)); });

  bus.publish(joined("A"));
  ConnectionEvent up;
  up.kind = ConnectionEvent::Kind::SocketUp;
  bus.publish(up);
  bus.publish(joined("B"));

  CHECK(seen == std::vector<std::string>{"peer:A", "conn:socket_up", "peer:B"});
}

TEST_CASE("An event published from a handler is delivered after the current one") {
  PeerEventBus bus;
  std::vector<std::string> seen;

  bus.subscribe_peers([&](const PeerEvent& e) {
    seen.push_back("first:" + e.peer.peer_id);
    if (e.peer.peer_id == "A") bus.publish(joined("B"));
  });
  bus.subscribe_peers([&](const PeerEvent& e) { seen.push_back("second:" + e.peer.peer_id); });

  bus.publish(joined("A"));

  CHECK(seen == std::vector<std::string>{"first:A", "second:A", "first:B", "second:B"});
}

TEST_CASE("Unsubscribe by token, including from inside a handler") {
  PeerEventBus bus;
  int a = 0, b = 0;
  PeerEventBus::Token ta = 0;
  ta = bus.subscribe_peers([&](const PeerEvent&) { ++a; bus.unsubscribe(ta); });
  auto tb = bus.subscribe_peers([&](const PeerEvent&) { ++b; });
  CHECK(bus.subscriber_count() == 2);

  bus.publish(joined("A"));
  bus.publish(joined("B"));
  CHECK(a == 1);
  CHECK(b == 2);
  CHECK(bus.subscriber_count() == 1);

  CHECK(bus.unsubscribe(tb));
  CHECK_FALSE(bus.unsubscribe(tb));
  bus.publish(joined("C"));
  CHECK(b == 2);
}

TEST_CASE("A subscriber added during dispatch starts with the next event") {
  PeerEventBus bus;
  int late = 0;
  bool added = false;
  bus.subscribe_peers([&](const PeerEvent&) {
    if (!added) {
      added = true;
      bus.subscribe_peers([&](const PeerEvent&) { ++late; });
    }
  });
  bus.publish(joined("A"));
  CHECK(late == 0);
  bus.publish(joined("B"));
  CHECK(late == 1);
}

TEST_CASE("A throwing subscriber does not stall the bus") {
  PeerEventBus bus;
  std::vector<std::string> seen;
  bus.subscribe_peers([](const PeerEvent&) { throw std::runtime_error("ui gone"); });
  bus.subscribe_peers([&](const PeerEvent& e) { seen.push_back(e.peer.peer_id); });

  bus.publish(joined("A"));
  bus.publish(joined("B"));

  CHECK(seen == std::vector<std::string>{"A", "B"});
}
