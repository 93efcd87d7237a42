#include <doctest/doctest.h>
#include "beacon/config.hpp"
#include "beacon/paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <random>

using namespace beacon;
namespace fs = std::filesystem;

namespace {

fs::path temp_file() {
  std::random_device rd;
  return fs::temp_directory_path() / ("beacon-cfg-" + std::to_string(rd()) + std::to_string(rd()))
         / "config.json";
}

struct Cleanup {
  fs::path p;
  ~Cleanup() { std::error_code ec; fs::remove_all(p.parent_path(), ec); }
};

} // namespace

TEST_CASE("Missing config file leaves defaults") {
  SessionConfig cfg;
  CHECK(load_config(temp_file(), cfg));
  CHECK(cfg.tcp_port == 8888);
  CHECK(cfg.udp_port == 8889);
  CHECK(cfg.connect_timeout_ms == 5000);
  CHECK(cfg.retry_attempts == 3);
  CHECK(cfg.device_id.empty());
}

TEST_CASE("Values from file apply; bad ones keep their defaults") {
  auto path = temp_file();
  Cleanup c{path};
  REQUIRE(write_file_atomic(path, R"({
    "deviceName": "Rescue 7",
    "emergency": true,
    "tcpPort": 9000,
    "udpPort": 70000,
    "connectTimeoutMs": "soon",
    "retryAttempts": 0,
    "logLevel": "chatty",
    "somethingElse": [1, 2]
  })"));

  SessionConfig cfg;
  REQUIRE(load_config(path, cfg));
  CHECK(cfg.device_name == "Rescue 7");
  CHECK(cfg.emergency);
  CHECK(cfg.tcp_port == 9000);
  CHECK(cfg.udp_port == 8889);
  CHECK(cfg.connect_timeout_ms == 5000);
  CHECK(cfg.retry_attempts == 3);
  CHECK(cfg.log_level == log::Level::Info);
}

TEST_CASE("A config that is not a JSON object is an error") {
  auto path = temp_file();
  Cleanup c{path};
  REQUIRE(write_file_atomic(path, "[1,2,3]"));
  SessionConfig cfg;
  CHECK_FALSE(load_config(path, cfg));
}

TEST_CASE("A generated device id is persisted and reused") {
  auto path = temp_file();
  Cleanup c{path};

  SessionConfig first;
  REQUIRE(ensure_device_id(path, first));
  CHECK(first.device_id.rfind("bcn-", 0) == 0);
  CHECK(first.device_id.size() == 16);

  SessionConfig second;
  REQUIRE(load_config(path, second));
  CHECK(second.device_id == first.device_id);
  REQUIRE(ensure_device_id(path, second));
  CHECK(second.device_id == first.device_id);
}

TEST_CASE("Config directory follows XDG_CONFIG_HOME") {
  const char* old = std::getenv("XDG_CONFIG_HOME");
  std::string saved = old ? old : "";
  ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
  CHECK(default_config_path() == fs::path("/tmp/xdg-test/beacon/config.json"));
  if (old) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
  else     ::unsetenv("XDG_CONFIG_HOME");
}
