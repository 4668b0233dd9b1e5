#include <catch2/catch_all.hpp>
#include <tessera/query_result.hpp>

#include <array>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

using namespace tessera;

namespace {
auto times_ten = [](Key k) -> std::uint64_t { return k.as_u64() * 10; };
}

TEST_CASE("resolution preserves the shape of the answer", "[query]") {
  auto f = times_ten;

  REQUIRE(query_result<Key>::map(Key{2}, f) == 20u);

  std::optional<Key> some = Key{3};
  REQUIRE(query_result<std::optional<Key>>::map(some, f) == std::optional<std::uint64_t>(30));
  REQUIRE_FALSE(query_result<std::optional<Key>>::map(std::nullopt, f).has_value());

  std::vector<Key> many{Key{1}, Key{1}, Key{2}};
  REQUIRE(query_result<std::vector<Key>>::map(many, f) == std::vector<std::uint64_t>{10, 10, 20});

  std::array<std::optional<Key>, 2> arr{Key{4}, std::nullopt};
  auto arr_out = query_result<decltype(arr)>::map(arr, f);
  REQUIRE(arr_out[0] == std::optional<std::uint64_t>(40));
  REQUIRE_FALSE(arr_out[1].has_value());

  auto tup = std::make_tuple(Key{1}, UniqueKeys{{Key{2}, Key{3}}}, std::optional<Key>{});
  auto tup_out = query_result<decltype(tup)>::map(tup, f);
  REQUIRE(std::get<0>(tup_out) == 10u);
  REQUIRE(std::get<1>(tup_out) == std::vector<std::uint64_t>{20, 30});
  REQUIRE_FALSE(std::get<2>(tup_out).has_value());
}

TEST_CASE("results without keys pass through", "[query]") {
  auto f = times_ten;
  REQUIRE(query_result<int>::map(7, f) == 7);
  REQUIRE(query_result<double>::map(1.5, f) == 1.5);
  REQUIRE(query_result<bool>::map(true, f));
  REQUIRE(query_result<std::string>::map("abc", f) == "abc");
  REQUIRE(query_result<Plain<std::vector<int>>>::map(Plain<std::vector<int>>{{1, 2}}, f) ==
          std::vector<int>{1, 2});
}

TEST_CASE("UnsafeDistinct keeps the wrapped shape", "[query]") {
  auto f = times_ten;
  UnsafeDistinct<std::vector<Key>> wrapped{{Key{5}}};
  REQUIRE(query_result<decltype(wrapped)>::map(wrapped, f) == std::vector<std::uint64_t>{50});
  STATIC_REQUIRE(is_distinct_result_v<decltype(wrapped)>);
}
