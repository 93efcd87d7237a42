#pragma once
/**
 * @file log.hpp
 * @brief Key=value diagnostic lines on stderr, with a level filter.
 *
 * @details
 * Beacon Link reports what it is doing the same way the rest of our Linux
 * tooling does: one line per event, `key=value` tokens, readable by eye and
 * trivially grep-able in the field.
 *
 * @code
 *   log::Line(log::Level::Warn, "negotiator")
 *       .kv("status", "retry").kv("attempt", 2).kv("delay_ms", 2000);
 *   // level=warn comp=negotiator status=retry attempt=2 delay_ms=2000
 * @endcode
 *
 * Values containing spaces, quotes or '=' are double-quoted. A Line below the
 * active level costs one comparison and formats nothing.
 *
 * The output stream defaults to std::cerr and may be swapped (tests capture
 * it with a std::ostringstream). Emission is serialized with a mutex, so a
 * bridge running its own thread may log safely.
 */

#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>

namespace beacon {
namespace log {

enum class Level : uint8_t { Debug = 0, Info, Warn, Error, Off };

void  set_level(Level lvl);
Level level();
bool  enabled(Level lvl);

/// Redirect output; nullptr restores std::cerr. The stream must outlive its use.
void set_stream(std::ostream* os);

/// "debug" | "info" | "warn" | "error" | "off". Returns false on anything else.
bool parse_level(const std::string& s, Level& out);
const char* level_name(Level lvl);

/**
 * @brief One log line, emitted when the object goes out of scope.
 */
class Line {
public:
  Line(Level lvl, const char* component);
  ~Line();

  Line(const Line&) = delete;
  Line& operator=(const Line&) = delete;

  Line& kv(const char* key, const std::string& value);
  Line& kv(const char* key, const char* value);
  Line& kv(const char* key, bool value);

  template <typename T>
  Line& kv(const char* key, const T& value) {
    if (on_) os_ << ' ' << key << '=' << value;
    return *this;
  }

private:
  bool on_;
  std::ostringstream os_;
};

} // namespace log
} // namespace beacon
