// ============================================================================
// log.cpp - implementation for log.hpp
// ============================================================================

#include "beacon/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace beacon {
namespace log {

namespace {
std::atomic<uint8_t> g_level{static_cast<uint8_t>(Level::Info)};
std::ostream*        g_stream = nullptr;   // nullptr => std::cerr
std::mutex           g_mutex;

bool needs_quotes(const std::string& v) {
  if (v.empty()) return true;
  for (char c : v) {
    if (c == ' ' || c == '\t' || c == '"' || c == '=' || c == '\n') return true;
  }
  return false;
}
} // namespace

void set_level(Level lvl) { g_level.store(static_cast<uint8_t>(lvl)); }

Level level() { return static_cast<Level>(g_level.load()); }

bool enabled(Level lvl) {
  return lvl != Level::Off && static_cast<uint8_t>(lvl) >= g_level.load();
}

void set_stream(std::ostream* os) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_stream = os;
}

bool parse_level(const std::string& s, Level& out) {
  if      (s == "debug") out = Level::Debug;
  else if (s == "info")  out = Level::Info;
  else if (s == "warn")  out = Level::Warn;
  else if (s == "error") out = Level::Error;
  else if (s == "off")   out = Level::Off;
  else return false;
  return true;
}

const char* level_name(Level lvl) {
  switch (lvl) {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    case Level::Off:   return "off";
  }
  return "?";
}

Line::Line(Level lvl, const char* component)
: on_(enabled(lvl)) {
  if (on_) os_ << "level=" << level_name(lvl) << " comp=" << component;
}

Line::~Line() {
  if (!on_) return;
  os_ << '\n';
  std::lock_guard<std::mutex> lock(g_mutex);
  std::ostream& out = g_stream ? *g_stream : std::cerr;
  out << os_.str();
  out.flush();
}

Line& Line::kv(const char* key, const std::string& value) {
  if (!on_) return *this;
  os_ << ' ' << key << '=';
  if (!needs_quotes(value)) { os_ << value; return *this; }
  os_ << '"';
  for (char c : value) {
    if (c == '"' || c == '\\') os_ << '\\';
    if (c == '\n') { os_ << "\\n"; continue; }
    os_ << c;
  }
  os_ << '"';
  return *this;
}

Line& Line::kv(const char* key, const char* value) {
  return kv(key, std::string(value ? value : ""));
}

Line& Line::kv(const char* key, bool value) {
  if (on_) os_ << ' ' << key << '=' << (value ? 1 : 0);
  return *this;
}

} // namespace log
} // namespace beacon
