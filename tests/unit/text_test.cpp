#include <catch2/catch_all.hpp>
#include <tessera/core/text.hpp>

#include <string>

using tessera::core::prefix_successor;

TEST_CASE("prefix successor increments the last byte", "[text]") {
  REQUIRE(prefix_successor("abc") == std::string("abd"));
  REQUIRE(prefix_successor("a") == std::string("b"));
}

TEST_CASE("prefix successor drops trailing 0xFF bytes", "[text]") {
  const std::string p{'a', static_cast<char>(0xFF), static_cast<char>(0xFF)};
  REQUIRE(prefix_successor(p) == std::string("b"));
}

TEST_CASE("prefix successor is unbounded for empty or all-0xFF prefixes", "[text]") {
  REQUIRE_FALSE(prefix_successor("").has_value());
  const std::string p(3, static_cast<char>(0xFF));
  REQUIRE_FALSE(prefix_successor(p).has_value());
}

TEST_CASE("every string with the prefix sorts below the successor", "[text]") {
  const std::string prefix = "ab";
  const std::string upper = *prefix_successor(prefix);
  for (const std::string s : {"ab", "abz", "ab\xff\xff", "ab\x7f"}) {
    REQUIRE(s < upper);
    REQUIRE(s >= prefix);
  }
  REQUIRE_FALSE(std::string("ac") < upper);
}
