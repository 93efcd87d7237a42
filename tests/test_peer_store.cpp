#include <doctest/doctest.h>
#include "beacon/peer_store.hpp"
#include "beacon/paths.hpp"

#include <filesystem>
#include <random>

using namespace beacon;
namespace fs = std::filesystem;

namespace {

struct TempDir {
  fs::path path;
  TempDir() {
    std::random_device rd;
    path = fs::temp_directory_path() / ("beacon-test-" + std::to_string(rd()) + std::to_string(rd()));
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

Peer make_peer(const std::string& id, const std::string& name, bool emergency = false) {
  Peer p;
  p.peer_id = id;
  p.display_name = name;
  p.status = PeerStatus::Available;
  p.signal_strength = 3;
  p.last_seen_ms = 1700000000000ull;
  p.is_emergency = emergency;
  return p;
}

} // namespace

TEST_CASE("Peers survive a reopen") {
  TempDir dir;
  {
    JsonPeerStore store(dir.path);
    store.open();
    CHECK(store.load_peers().empty());
    CHECK(store.save_peer(make_peer("A", "Alpha", true)));
    CHECK(store.save_peer(make_peer("B", "Bravo")));
    CHECK(store.save_peer(make_peer("A", "Alpha renamed", true)));
  }
  CHECK(fs::exists(dir.path / "peers.json"));
  CHECK_FALSE(fs::exists(dir.path / "peers.json.tmp"));

  JsonPeerStore again(dir.path);
  again.open();
  auto peers = again.load_peers();
  REQUIRE(peers.size() == 2);
  CHECK(peers[0] == make_peer("A", "Alpha renamed", true));
  CHECK(peers[1] == make_peer("B", "Bravo"));

  CHECK(again.remove_peer("A"));
  CHECK_FALSE(again.remove_peer("A"));
  CHECK(again.load_peers().size() == 1);
}

TEST_CASE("Recent activity comes back newest first and is capped") {
  TempDir dir;
  JsonPeerStore store(dir.path);
  store.open();
  for (uint64_t i = 0; i < JsonPeerStore::MAX_ACTIVITY + 5; ++i) {
    REQUIRE(store.log_activity(ActivityRecord{"A", "message", std::to_string(i), i}));
  }

  auto recent = store.load_recent_activity(3);
  REQUIRE(recent.size() == 3);
  CHECK(recent[0].timestamp_ms == JsonPeerStore::MAX_ACTIVITY + 4);
  CHECK(recent[2].timestamp_ms == JsonPeerStore::MAX_ACTIVITY + 2);

  JsonPeerStore again(dir.path);
  again.open();
  auto all = again.load_recent_activity(10000);
  CHECK(all.size() == JsonPeerStore::MAX_ACTIVITY);
  CHECK(all.back().details == "5");
}

TEST_CASE("A corrupt file is treated as empty and replaced on the next write") {
  TempDir dir;
  REQUIRE(write_file_atomic(dir.path / "peers.json", "{ this is not json"));

  JsonPeerStore store(dir.path);
  store.open();
  CHECK(store.load_peers().empty());
  CHECK(store.save_peer(make_peer("C", "Charlie")));

  JsonPeerStore again(dir.path);
  again.open();
  CHECK(again.load_peers().size() == 1);
}

TEST_CASE("Signal read from disk is clamped to the 0..5 scale") {
  TempDir dir;
  REQUIRE(write_file_atomic(dir.path / "peers.json",
      R"({"hi":{"name":"Hi","signal":300},"lo":{"name":"Lo","signal":-2},"ok":{"name":"Ok","signal":4}})"));

  JsonPeerStore store(dir.path);
  store.open();
  auto peers = store.load_peers();
  REQUIRE(peers.size() == 3);
  CHECK(peers[0].peer_id == "hi");
  CHECK(peers[0].signal_strength == 5);
  CHECK(peers[1].signal_strength == 0);
  CHECK(peers[2].signal_strength == 4);
}
