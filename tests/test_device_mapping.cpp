#include <doctest/doctest.h>
#include "beacon/bridge/device_mapping.hpp"
#include "fakes.hpp"

using namespace beacon;
using namespace beacon::bridge;

TEST_CASE("Radio status text maps onto PeerStatus") {
  CHECK(map_status("Available") == PeerStatus::Available);
  CHECK(map_status("Invited") == PeerStatus::Invited);
  CHECK(map_status("Connected") == PeerStatus::Connected);
  CHECK(map_status("Failed") == PeerStatus::Failed);
  CHECK(map_status("Unavailable") == PeerStatus::Unavailable);
  CHECK(map_status("Unknown") == PeerStatus::Unavailable);
}

TEST_CASE("Wi-Fi P2P status codes") {
  CHECK(std::string(status_from_code(0)) == "Connected");
  CHECK(std::string(status_from_code(3)) == "Available");
  CHECK(std::string(status_from_code(99)) == "Unknown");
}

TEST_CASE("Signal estimate follows status") {
  CHECK(estimate_signal(test::device("a", "x", "Connected")) == 5);
  CHECK(estimate_signal(test::device("a", "x", "Available")) == 3);
  CHECK(estimate_signal(test::device("a", "x", "Invited")) == 1);
}

TEST_CASE("Emergency devices are recognised by name or type") {
  CHECK(is_emergency_device(test::device("a", "City MEDICAL unit")));
  CHECK(is_emergency_device(test::device("a", "rescue-2")));
  auto d = test::device("a", "Pixel 7");
  CHECK_FALSE(is_emergency_device(d));
  d.primary_device_type = "10-0050F204-5 Emergency";
  CHECK(is_emergency_device(d));
}

TEST_CASE("to_peer fills every field") {
  Peer p = to_peer(test::device("de:ad:be:ef:00:01", "", "Connected"), 1234);
  CHECK(p.peer_id == "de:ad:be:ef:00:01");
  CHECK(p.display_name == "Unknown");
  CHECK(p.status == PeerStatus::Connected);
  CHECK(p.signal_strength == 5);
  CHECK(p.last_seen_ms == 1234);
  CHECK_FALSE(p.is_emergency);
}
