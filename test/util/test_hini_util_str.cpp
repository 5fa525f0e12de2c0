#include <hini/util/str.hpp>
#include <catch2/catch.hpp>

#include <limits>
#include <vector>

using namespace std::literals;

TEST_CASE("trim_whitespace -- positive tests", "[str][trim]")
{
  // Test that things that should be trimmed actually get trimmed
  auto fee = "    J a c k"s;
  auto fi = "\ra\nd"s;
  auto fo = "\fthe   "s;
  auto fum = " \t\r\n\v\f Beanstalk\n\n\n\t\r\f\v   \n\n\r\f\f\f\f\v"s;
  for (auto* s: {&fee, &fi, &fo, &fum})
    *s = hini::trim_whitespace(*s);

  REQUIRE( fee == "J a c k" );
  REQUIRE( fi == "a\nd" );
  REQUIRE( fo == "the" );
  REQUIRE( fum == "Beanstalk" );
}

TEST_CASE("trim_whitespace -- negative tests", "[str][trim]")
{
  // Test that things that shouldn't be trimmed don't get trimmed
  auto c = GENERATE(range(std::numeric_limits<char>::min(), std::numeric_limits<char>::max()));
  std::string plant = c + "bean"s + c;
  plant = hini::trim_whitespace(plant);
  if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v')
    REQUIRE( plant == "bean" );
  else
  {
    REQUIRE( plant.size() == 6 );
    REQUIRE( plant.substr(1, 4) == "bean" );
  }
}

TEST_CASE("one-sided trimming", "[str][trim]")
{
  CHECK( hini::trim_left("  a b  ") == "a b  " );
  CHECK( hini::trim_right("  a b  ") == "  a b" );
  CHECK( hini::trim_left(" \t ").empty() );
  CHECK( hini::trim_right(" \t ").empty() );
  CHECK( hini::trim_whitespace("").empty() );
}

TEST_CASE("truthy string values", "[str][truthy]") {
  auto val = GENERATE("true", "TruE", "yes", "yeS", "yES", "yes", "YES", "1", "on", "oN", "ON");
  REQUIRE( hini::is_true_value(val) );
}

TEST_CASE("falsey string values", "[str][falsey]") {
  auto val = GENERATE("false", "FalSe", "no", "NO", "No", "nO", "0", "off", "OFF");
  REQUIRE( hini::is_false_value(val) );
}

TEST_CASE("neither true nor false string values", "[str][nottruefalse]") {
  auto val = GENERATE("false y", "maybe", "not on", "2", "yesno", "YESNO", "-1", "default", "OMG");
  REQUIRE( !hini::is_true_value(val) );
  REQUIRE( !hini::is_false_value(val) );
}

TEST_CASE("split dotted paths", "[str][split]") {
  auto splits = hini::split("foo.bar.baz", ".");
  REQUIRE(splits.size() == 3);
  REQUIRE(splits[0] == "foo");
  REQUIRE(splits[1] == "bar");
  REQUIRE(splits[2] == "baz");
}

TEST_CASE("split keeps empty pieces unless trimming", "[str][split]") {
  auto splits = hini::split(".a..b.", ".");
  REQUIRE(splits == std::vector<std::string_view>{"", "a", "", "b", ""});

  splits = hini::split(".a..b.", ".", true);
  REQUIRE(splits == std::vector<std::string_view>{"a", "", "b"});
}

TEST_CASE("split empty string", "[str][split]") {
  REQUIRE(hini::split("", ".") == std::vector<std::string_view>{""});
  REQUIRE(hini::split("", ".", true).empty());
}

TEST_CASE("join pieces", "[str][join]") {
  std::vector<std::string_view> parts{"a", "b", "c"};
  CHECK(hini::join(".", parts) == "a.b.c");
  CHECK(hini::join(".", parts.rbegin(), parts.rend()) == "c.b.a");
  CHECK(hini::join(".", std::vector<std::string>{}) == "");
}

TEST_CASE("parse_int requires the whole string", "[str][int]") {
  int value = -1;
  CHECK(hini::parse_int("151", value));
  CHECK(value == 151);
  CHECK_FALSE(hini::parse_int("151x", value));
  CHECK_FALSE(hini::parse_int("", value));
  CHECK(value == 151);
}
