// ============================================================================
// envelope.cpp - implementation for envelope.hpp
// For the wire shape and tolerance rules see the matching .hpp.
// ============================================================================

#include "beacon/envelope.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace beacon {
namespace envelope {

namespace {

const char* type_token(Message::EnvelopeType t) {
  return t == Message::EnvelopeType::Control ? "control" : "chat";
}

// String member or fallback; wrong JSON type counts as missing.
std::string string_field(const json& j, const char* key, const std::string& fallback) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return fallback;
  return it->get<std::string>();
}

Message raw_text_message(const std::string& raw, const DecodeContext& ctx) {
  Message m;
  m.text          = raw;
  m.sender_id     = fallback_sender_id(ctx);
  m.sender_name   = sender_name_from_address(ctx.remote_address.empty() ? m.sender_id
                                                                        : ctx.remote_address);
  m.timestamp_ms  = ctx.received_ms;
  m.direction     = Message::Direction::Inbound;
  m.envelope_type = Message::EnvelopeType::Chat;
  m.delivery      = Message::Delivery::Received;
  return m;
}

bool read_digits(const std::string& s, size_t& pos, size_t count, int& out) {
  if (pos + count > s.size()) return false;
  int v = 0;
  for (size_t i = 0; i < count; ++i) {
    char c = s[pos + i];
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  pos += count;
  out = v;
  return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
  if (pos >= s.size() || s[pos] != c) return false;
  ++pos;
  return true;
}

} // namespace

std::string encode(const Message& msg) {
  json j;
  j["type"]       = type_token(msg.envelope_type);
  j["senderId"]   = msg.sender_id;
  j["senderName"] = msg.sender_name;
  j["timestamp"]  = format_iso8601(msg.timestamp_ms);
  j["text"]       = msg.text;
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

Message decode(const std::string& raw, const DecodeContext& ctx, Error* err) {
  if (err) *err = Error::MalformedEnvelope;   // until proven otherwise

  json j;
  try {
    j = json::parse(raw);
  } catch (const json::exception&) {
    return raw_text_message(raw, ctx);        // not JSON at all
  }
  if (!j.is_object()) return raw_text_message(raw, ctx);

  // The discriminator is what separates an envelope from stray JSON text.
  const std::string type = string_field(j, "type", "");
  Message m;
  if      (type == "chat")    m.envelope_type = Message::EnvelopeType::Chat;
  else if (type == "control") m.envelope_type = Message::EnvelopeType::Control;
  else return raw_text_message(raw, ctx);

  m.sender_id = string_field(j, "senderId", "");
  if (m.sender_id.empty()) m.sender_id = fallback_sender_id(ctx);
  m.sender_name = string_field(j, "senderName", "Unknown");
  m.text        = string_field(j, "text", "");

  uint64_t ts = 0;
  m.sender_timestamp = parse_iso8601(string_field(j, "timestamp", ""), ts);
  m.timestamp_ms     = m.sender_timestamp ? ts : ctx.received_ms;

  m.direction = Message::Direction::Inbound;
  m.delivery  = Message::Delivery::Received;
  if (err) *err = Error::None;
  return m;
}

std::string fallback_sender_id(const DecodeContext& ctx) {
  if (!ctx.remote_peer_id.empty()) return ctx.remote_peer_id;
  if (!ctx.remote_address.empty()) return ctx.remote_address;
  return "unknown";
}

std::string sender_name_from_address(const std::string& address) {
  auto slash = address.rfind('/');
  if (slash != std::string::npos && slash + 1 < address.size()) return address.substr(slash + 1);
  if (!address.empty()) return address;
  return "Unknown Device";
}

std::string format_iso8601(uint64_t epoch_ms) {
  std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
  unsigned    ms   = static_cast<unsigned>(epoch_ms % 1000);
  std::tm tm{};
  gmtime_r(&secs, &tm);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
  return buf;
}

bool parse_iso8601(const std::string& s, uint64_t& epoch_ms) {
  size_t pos = 0;
  int year = 0, mon = 0, day = 0, hh = 0, mm = 0, ss = 0;

  if (!read_digits(s, pos, 4, year) || !expect(s, pos, '-')) return false;
  if (!read_digits(s, pos, 2, mon)  || !expect(s, pos, '-')) return false;
  if (!read_digits(s, pos, 2, day)) return false;
  if (pos >= s.size() || (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ')) return false;
  ++pos;
  if (!read_digits(s, pos, 2, hh) || !expect(s, pos, ':')) return false;
  if (!read_digits(s, pos, 2, mm) || !expect(s, pos, ':')) return false;
  if (!read_digits(s, pos, 2, ss)) return false;

  if (mon < 1 || mon > 12 || day < 1 || day > 31 || hh > 23 || mm > 59 || ss > 60) return false;

  // Fraction: keep the first three digits, accept any length.
  unsigned millis = 0;
  if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
    ++pos;
    size_t digits = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      if (digits < 3) millis = millis * 10 + static_cast<unsigned>(s[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0) return false;
    for (size_t d = digits; d < 3; ++d) millis *= 10;
  }

  // Zone designator; none means UTC.
  long offset_s = 0;
  if (pos < s.size()) {
    char z = s[pos];
    if (z == 'Z' || z == 'z') {
      ++pos;
    } else if (z == '+' || z == '-') {
      ++pos;
      int oh = 0, om = 0;
      if (!read_digits(s, pos, 2, oh)) return false;
      if (pos < s.size() && s[pos] == ':') ++pos;
      if (pos < s.size() && !read_digits(s, pos, 2, om)) return false;
      if (oh > 23 || om > 59) return false;
      offset_s = (oh * 3600L + om * 60L) * (z == '-' ? -1 : 1);
    } else {
      return false;
    }
  }
  if (pos != s.size()) return false;

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon  = mon - 1;
  tm.tm_mday = day;
  tm.tm_hour = hh;
  tm.tm_min  = mm;
  tm.tm_sec  = ss;
  const long long secs = static_cast<long long>(timegm(&tm)) - offset_s;
  if (secs < 0) return false;

  epoch_ms = static_cast<uint64_t>(secs) * 1000ull + millis;
  return true;
}

} // namespace envelope
} // namespace beacon
