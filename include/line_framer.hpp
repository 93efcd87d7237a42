/**
 * @page beacon-line-framer Newline Framing for the Transport Socket
 * @file line_framer.hpp
 * @brief Header-only newline framing: one payload per line on a TCP byte stream.
 *
 * @details
 * PURPOSE
 * -------
 * TCP gives us a byte stream, not messages. The envelope layer needs exact
 * boundaries: one JSON object per logical write. We delimit with a single
 * `\n`, which is what the handset builds already speak (they write with a
 * line-oriented writer and read with readLine()).
 *
 * JSON produced by the envelope codec never contains a raw newline (string
 * newlines are escaped as `\n`), so no escaping layer is needed.
 *
 * DECODER RULES
 * -------------
 * - Bytes accumulate across reads. A payload split over any number of reads
 *   yields exactly one line.
 * - A trailing `\r` is stripped, so CRLF peers work unchanged.
 * - Empty lines carry no bytes and are skipped.
 * - A line longer than MAX_LINE is handed up in MAX_LINE chunks instead of
 *   being discarded. The receiving side will see raw text, never silence.
 * - At end of stream, flush() hands up whatever partial line is left.
 *
 * @code
 *   beacon::line_framer fr;
 *   std::vector<std::string> lines;
 *   fr.feed(buf, n, lines);         // zero or more complete lines
 *   for (auto& l : lines) handle(l);
 * @endcode
 */
#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace beacon {

/// Frame one payload for the wire.
inline std::string encode_line(const std::string& payload) {
  std::string out;
  out.reserve(payload.size() + 1);
  out.append(payload);
  out.push_back('\n');
  return out;
}

struct line_framer {
  static constexpr size_t MAX_LINE = 64 * 1024;

  std::string buf;   ///< Bytes of the line in progress.

  /**
   * @brief Feed one byte; returns true when @p line received a complete payload.
   */
  bool feed(char c, std::string& line) {
    if (c == '\n') {
      if (!buf.empty() && buf.back() == '\r') buf.pop_back();
      if (buf.empty()) return false;             // blank line, nothing to deliver
      line.swap(buf);
      buf.clear();
      return true;
    }
    buf.push_back(c);
    if (buf.size() >= MAX_LINE) {                // oversize: hand up a chunk
      line.swap(buf);
      buf.clear();
      return true;
    }
    return false;
  }

  /// Feed a buffer; appends each completed line to @p lines. Returns the count added.
  size_t feed(const char* data, size_t n, std::vector<std::string>& lines) {
    size_t added = 0;
    std::string line;
    for (size_t i = 0; i < n; ++i) {
      if (feed(data[i], line)) {
        lines.push_back(std::move(line));
        line.clear();
        ++added;
      }
    }
    return added;
  }

  /// End of stream: deliver any partial line. Returns false when nothing was pending.
  bool flush(std::string& line) {
    if (!buf.empty() && buf.back() == '\r') buf.pop_back();
    if (buf.empty()) return false;
    line.swap(buf);
    buf.clear();
    return true;
  }

  void reset() { buf.clear(); }
};

} // namespace beacon
