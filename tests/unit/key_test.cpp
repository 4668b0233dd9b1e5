#include <catch2/catch_all.hpp>
#include <tessera/core/key.hpp>

#include <sstream>
#include <unordered_set>

using tessera::Key;

TEST_CASE("key round-trips through u64", "[key]") {
  const Key k = Key::unsafe_from_u64(42);
  REQUIRE(k.as_u64() == 42u);
  REQUIRE(k == Key{42});
}

TEST_CASE("keys are totally ordered and hashable", "[key]") {
  const Key a = Key::unsafe_from_u64(1);
  const Key b = Key::unsafe_from_u64(2);
  REQUIRE(a < b);
  REQUIRE(b > a);
  REQUIRE(a != b);

  std::unordered_set<Key> set{a, b, Key::unsafe_from_u64(1)};
  REQUIRE(set.size() == 2);
}

TEST_CASE("key prints its id", "[key]") {
  std::ostringstream oss;
  oss << Key::unsafe_from_u64(7);
  REQUIRE(oss.str() == "Key(7)");
}
