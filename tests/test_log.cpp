#include <doctest/doctest.h>
#include "beacon/log.hpp"

#include <sstream>

using namespace beacon;

namespace {

// Capture log output for one test; restores stderr and the level afterwards.
struct Capture {
  std::ostringstream os;
  log::Level saved = log::level();
  Capture() { log::set_stream(&os); }
  ~Capture() { log::set_stream(nullptr); log::set_level(saved); }
};

} // namespace

TEST_CASE("Lines carry level, component and key=value pairs") {
  Capture cap;
  log::set_level(log::Level::Debug);
  log::Line(log::Level::Warn, "negotiator").kv("status", "retry").kv("attempt", 2).kv("up", true);
  CHECK(cap.os.str() == "level=warn comp=negotiator status=retry attempt=2 up=1\n");
}

TEST_CASE("Values with spaces, quotes or newlines are quoted and escaped") {
  Capture cap;
  log::set_level(log::Level::Debug);
  log::Line(log::Level::Info, "t").kv("a", std::string("two words")).kv("b", "say \"hi\"\nbye").kv("c", "");
  CHECK(cap.os.str() == "level=info comp=t a=\"two words\" b=\"say \\\"hi\\\"\\nbye\" c=\"\"\n");
}

TEST_CASE("Lines below the level are dropped; off silences everything") {
  Capture cap;
  log::set_level(log::Level::Warn);
  log::Line(log::Level::Info, "t").kv("x", 1);
  CHECK(cap.os.str().empty());

  log::set_level(log::Level::Off);
  log::Line(log::Level::Error, "t").kv("x", 1);
  CHECK(cap.os.str().empty());
}

TEST_CASE("Level names parse both ways") {
  log::Level l = log::Level::Info;
  CHECK(log::parse_level("debug", l));
  CHECK(l == log::Level::Debug);
  CHECK_FALSE(log::parse_level("verbose", l));
  CHECK(l == log::Level::Debug);
  CHECK(std::string(log::level_name(log::Level::Error)) == "error");
}
