#include <catch2/catch_all.hpp>
#include <tessera/collection.hpp>
#include <tessera/index/keys.hpp>

#include <tests/support/reference_model.hpp>

using namespace tessera;

TEST_CASE("keys tracks live records only", "[keys]") {
  Collection<int, index::Keys<>> db;
  const Key a = db.insert(1);
  const Key b = db.insert(2);
  db.adjust_by_key(a, [](const int& v) { return v + 1; });
  REQUIRE(db.index().count() == 2);
  REQUIRE(db.index().contains(a));
  db.delete_by_key(a);
  REQUIRE_FALSE(db.index().contains(a));
  REQUIRE(test_support::sorted(db.index().all()) == std::vector<Key>{b});
}

TEST_CASE("keys matches the reference model", "[keys][property]") {
  Collection<int, index::Keys<keyset::ordered_set>> db;
  test_support::run_reference_ops(
      db, 3, 300, [](std::mt19937& rng) { return static_cast<int>(rng() % 10); },
      [](const auto& db, const test_support::reference_map<int>& ref) {
        REQUIRE(db.index().count() == ref.size());
        REQUIRE(test_support::sorted(db.index().all()) ==
                test_support::keys_where(ref, [](int) { return true; }));
      });
}
