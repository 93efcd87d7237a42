#include <doctest/doctest.h>
#include "beacon/envelope.hpp"

#include "nlohmann/json.hpp"

using namespace beacon;

static envelope::DecodeContext ctx() {
  envelope::DecodeContext c;
  c.remote_peer_id = "aa:bb:cc:dd:ee:ff";
  c.remote_address = "192.168.49.1:8888";
  c.received_ms    = 1700000005000ull;
  return c;
}

TEST_CASE("Encoded envelope decodes to the same message") {
  Message m;
  m.sender_id     = "bcn-000000000001";
  m.sender_name   = "Medic \"Two\" \xC3\xA9";
  m.text          = "Water at the school gym\nbring cups";
  m.timestamp_ms  = 1700000000123ull;
  m.envelope_type = Message::EnvelopeType::Chat;

  Error err = Error::MalformedEnvelope;
  Message back = envelope::decode(envelope::encode(m), ctx(), &err);

  CHECK(err == Error::None);
  CHECK(back.sender_timestamp);
  CHECK(back.sender_id == m.sender_id);
  CHECK(back.sender_name == m.sender_name);
  CHECK(back.text == m.text);
  CHECK(back.timestamp_ms == m.timestamp_ms);
  CHECK(back.envelope_type == Message::EnvelopeType::Chat);
  CHECK(back.direction == Message::Direction::Inbound);
}

TEST_CASE("Encoded envelope is one line with the wire field names") {
  Message m;
  m.sender_id = "x";
  m.sender_name = "X";
  m.text = "a\nb";
  m.timestamp_ms = 0;
  m.envelope_type = Message::EnvelopeType::Control;

  const std::string wire = envelope::encode(m);
  CHECK(wire.find('\n') == std::string::npos);

  auto j = nlohmann::json::parse(wire);
  CHECK(j["type"] == "control");
  CHECK(j["senderId"] == "x");
  CHECK(j["senderName"] == "X");
  CHECK(j["timestamp"] == "1970-01-01T00:00:00.000Z");
  CHECK(j["text"] == "a\nb");
}

TEST_CASE("Non-JSON payload becomes a raw text message from the remote peer") {
  Error err = Error::None;
  Message m = envelope::decode("not-json", ctx(), &err);

  CHECK(err == Error::MalformedEnvelope);
  CHECK(m.text == "not-json");
  CHECK(m.sender_id == "aa:bb:cc:dd:ee:ff");
  CHECK(!m.sender_name.empty());
  CHECK(m.timestamp_ms == 1700000005000ull);
  CHECK_FALSE(m.sender_timestamp);
  CHECK(m.envelope_type == Message::EnvelopeType::Chat);
}

TEST_CASE("JSON that is not an envelope falls back to raw text") {
  for (const char* raw : {"[1,2,3]", "42", "\"hello\"", R"({"text":"no type"})",
                          R"({"type":"weather","text":"x"})", R"({"type":7})"}) {
    Error err = Error::None;
    Message m = envelope::decode(raw, ctx(), &err);
    CHECK(err == Error::MalformedEnvelope);
    CHECK(m.text == raw);
  }
}

TEST_CASE("Raw fallback sender uses address when the peer id is unknown") {
  envelope::DecodeContext c;
  c.remote_address = "10.0.0.7:40122";
  Message m = envelope::decode("plain", c);
  CHECK(m.sender_id == "10.0.0.7:40122");

  envelope::DecodeContext none;
  CHECK(envelope::decode("plain", none).sender_id == "unknown");
}

TEST_CASE("Missing optional fields take their defaults") {
  Error err = Error::MalformedEnvelope;
  Message m = envelope::decode(R"({"type":"chat","extra":true})", ctx(), &err);

  CHECK(err == Error::None);
  CHECK(m.sender_id == "aa:bb:cc:dd:ee:ff");
  CHECK(m.sender_name == "Unknown");
  CHECK(m.text == "");
  CHECK(m.timestamp_ms == 1700000005000ull);
}

TEST_CASE("Unparsable timestamp uses receipt time") {
  Message m = envelope::decode(R"({"type":"chat","timestamp":"yesterday","text":"hi"})", ctx());
  CHECK(m.timestamp_ms == 1700000005000ull);
  CHECK_FALSE(m.sender_timestamp);
  CHECK(m.text == "hi");
}

TEST_CASE("ISO-8601 parsing accepts common producer variants") {
  uint64_t ms = 0;
  REQUIRE(envelope::parse_iso8601("2023-11-14T22:13:20.123Z", ms));
  CHECK(ms == 1700000000123ull);

  REQUIRE(envelope::parse_iso8601("2023-11-14T22:13:20Z", ms));
  CHECK(ms == 1700000000000ull);

  REQUIRE(envelope::parse_iso8601("2023-11-14T22:13:20.123456", ms));   // no zone: UTC
  CHECK(ms == 1700000000123ull);

  REQUIRE(envelope::parse_iso8601("2023-11-15T00:13:20.5+02:00", ms));
  CHECK(ms == 1700000000500ull);

  REQUIRE(envelope::parse_iso8601("2023-11-14 17:13:20-0500", ms));
  CHECK(ms == 1700000000000ull);

  CHECK_FALSE(envelope::parse_iso8601("", ms));
  CHECK_FALSE(envelope::parse_iso8601("2023-13-01T00:00:00Z", ms));
  CHECK_FALSE(envelope::parse_iso8601("2023-11-14T22:13:20Zjunk", ms));
  CHECK_FALSE(envelope::parse_iso8601("2023-11-14T22:13:20.Z", ms));
}

TEST_CASE("format_iso8601 always writes milliseconds and Z") {
  CHECK(envelope::format_iso8601(1700000000123ull) == "2023-11-14T22:13:20.123Z");
  CHECK(envelope::format_iso8601(1700000000000ull) == "2023-11-14T22:13:20.000Z");
}
