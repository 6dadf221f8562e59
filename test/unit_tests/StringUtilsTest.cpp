#include "Headers.hpp"
#include "TestHeaders.hpp"

using namespace st;

TEST_CASE("split keeps empty fields", "[StringUtils]") {
  REQUIRE(split("riot/board", '/') == vector<string>({"riot", "board"}));
  REQUIRE(split("/riot//ver", '/') ==
          vector<string>({"", "riot", "", "ver"}));
  REQUIRE(split("", '/').empty());
}

TEST_CASE("replaceAll replaces all occurrences", "[StringUtils]") {
  std::string str = "</a>,</b>,</c>";
  int count = replaceAll(str, ",<", "\n<");

  REQUIRE(count == 2);
  REQUIRE(str == "</a>\n</b>\n</c>");
}

TEST_CASE("replaceAll returns 0 for empty pattern", "[StringUtils]") {
  std::string str = "hello world";
  int count = replaceAll(str, "", "hi");

  REQUIRE(count == 0);
  REQUIRE(str == "hello world");
}

TEST_CASE("replaceAll handles overlapping replacement", "[StringUtils]") {
  std::string str = "xxx";
  int count = replaceAll(str, "x", "yx");

  REQUIRE(count == 3);
  REQUIRE(str == "yxyxyx");
}

TEST_CASE("toHex separates bytes", "[StringUtils]") {
  REQUIRE(toHex("") == "");
  REQUIRE(toHex(string("\xc0\x00\xdb", 3)) == "c0 00 db");
}
