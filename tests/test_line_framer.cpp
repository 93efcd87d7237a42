#include <doctest/doctest.h>
#include "line_framer.hpp"

#include <cstring>

using namespace beacon;

TEST_CASE("Lines split across feeds come out whole") {
  line_framer fr;
  std::vector<std::string> lines;

  CHECK(fr.feed("{\"type\":\"ch", 11, lines) == 0);
  CHECK(fr.feed("at\"}\n{\"a\"", 9, lines) == 1);
  CHECK(fr.feed(":1}\n", 4, lines) == 1);

  REQUIRE(lines.size() == 2);
  CHECK(lines[0] == "{\"type\":\"chat\"}");
  CHECK(lines[1] == "{\"a\":1}");
}

TEST_CASE("CRLF endings are stripped and blank lines skipped") {
  line_framer fr;
  std::vector<std::string> lines;
  const char* in = "one\r\n\r\n\ntwo\n";
  fr.feed(in, std::strlen(in), lines);
  CHECK(lines == std::vector<std::string>{"one", "two"});
}

TEST_CASE("Trailing bytes without a newline are handed up by flush") {
  line_framer fr;
  std::vector<std::string> lines;
  fr.feed("abc", 3, lines);
  CHECK(lines.empty());

  std::string tail;
  REQUIRE(fr.flush(tail));
  CHECK(tail == "abc");
  CHECK_FALSE(fr.flush(tail));
}

TEST_CASE("An oversize line is delivered in MAX_LINE chunks") {
  line_framer fr;
  std::vector<std::string> lines;
  std::string big(line_framer::MAX_LINE + 10, 'x');
  big.push_back('\n');
  fr.feed(big.data(), big.size(), lines);

  REQUIRE(lines.size() == 2);
  CHECK(lines[0].size() == line_framer::MAX_LINE);
  CHECK(lines[1].size() == 10);
}

TEST_CASE("encode_line appends exactly one newline") {
  CHECK(encode_line("hi") == "hi\n");
}
